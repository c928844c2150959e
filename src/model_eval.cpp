#include "induct/model_eval.hpp"

#include <algorithm>
#include <cmath>
#include <random>

#include "induct/errors.hpp"

namespace induct {

static std::array<std::vector<int>, 2> by_class(const std::vector<int>& y)
{
    std::array<std::vector<int>, 2> cls;
    for (std::size_t i = 0; i < y.size(); ++i) {
        if (y[i] != 0 && y[i] != 1) throw InputError("labels must be 0 or 1");
        cls[static_cast<std::size_t>(y[i])].push_back(static_cast<int>(i));
    }
    return cls;
}

int minority_count(const std::vector<int>& y)
{
    long pos = std::count(y.begin(), y.end(), 1);
    long neg = static_cast<long>(y.size()) - pos;
    return static_cast<int>(std::min(pos, neg));
}

Split stratified_split(const std::vector<int>& y, double test_ratio, uint32_t seed)
{
    Split s;
    auto cls = by_class(y);
    if (cls[0].size() < 2 || cls[1].size() < 2) {
        s.stratified = false;
        for (std::size_t i = 0; i < y.size(); ++i) {
            s.train.push_back(static_cast<int>(i));
            s.test.push_back(static_cast<int>(i));
        }
        return s;
    }

    std::mt19937 rng(seed);
    for (auto& c : cls) {
        std::shuffle(c.begin(), c.end(), rng);
        /* at least one row per side for every class */
        std::size_t n_test = static_cast<std::size_t>(std::lround(test_ratio * static_cast<double>(c.size())));
        n_test = std::max<std::size_t>(1, std::min(n_test, c.size() - 1));
        s.test.insert(s.test.end(), c.begin(), c.begin() + static_cast<long>(n_test));
        s.train.insert(s.train.end(), c.begin() + static_cast<long>(n_test), c.end());
    }
    std::sort(s.train.begin(), s.train.end());
    std::sort(s.test.begin(), s.test.end());
    return s;
}

std::vector<int> stratified_folds(const std::vector<int>& y, int k, uint32_t seed)
{
    if (k < 2) throw InputError("need at least 2 folds");
    auto cls = by_class(y);
    std::mt19937 rng(seed);
    std::vector<int> fold(y.size(), 0);
    int next = 0;
    for (auto& c : cls) {
        std::shuffle(c.begin(), c.end(), rng);
        for (int i : c) { fold[static_cast<std::size_t>(i)] = next; next = (next + 1) % k; }
    }
    return fold;
}

std::array<std::array<long, 2>, 2> confusion_matrix(const std::vector<int>& y,
                                                    const std::vector<int>& pred)
{
    std::array<std::array<long, 2>, 2> cm{};
    for (std::size_t i = 0; i < y.size() && i < pred.size(); ++i)
        ++cm[static_cast<std::size_t>(y[i])][static_cast<std::size_t>(pred[i])];
    return cm;
}

double accuracy(const std::vector<int>& y, const std::vector<int>& pred)
{
    if (y.empty()) return 0.0;
    std::size_t hit = 0;
    for (std::size_t i = 0; i < y.size(); ++i) hit += (y[i] == pred[i]);
    return static_cast<double>(hit) / static_cast<double>(y.size());
}

} // namespace induct
