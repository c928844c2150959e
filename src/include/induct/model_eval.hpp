/*───────────────────────────────────────────────────────────
 *  model_eval.hpp   –  splits, folds and binary metrics
 *───────────────────────────────────────────────────────────*/
#pragma once

#include <array>
#include <cstdint>
#include <vector>

namespace induct {

struct Split {
    std::vector<int> train;
    std::vector<int> test;
    bool             stratified = true;
};

/* per-class shuffle, round(ratio*n_c) of each class to the test side.
   A class with < 2 members ⇒ both sides get every row, stratified=false. */
Split stratified_split(const std::vector<int>& y, double test_ratio, uint32_t seed);

/* fold id per row; classes are dealt round-robin after a shuffle */
std::vector<int> stratified_folds(const std::vector<int>& y, int k, uint32_t seed);

/* [actual][predicted] */
std::array<std::array<long, 2>, 2> confusion_matrix(const std::vector<int>& y,
                                                    const std::vector<int>& pred);

double accuracy(const std::vector<int>& y, const std::vector<int>& pred);

int minority_count(const std::vector<int>& y);

} // namespace induct
