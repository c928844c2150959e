#include "induct/category_registry.hpp"

#include "induct/common.hpp"
#include "induct/errors.hpp"
#include "induct/train_record.hpp"

namespace induct {

CategoryRegistry::CategoryRegistry()
{
    labels_.push_back(kUnknownDepot);
    codes_.emplace(kUnknownDepot, kUnknownCode);
}

int CategoryRegistry::learn(const std::string& label)
{
    const std::string key = trim_copy(label);
    if (key.empty()) return kUnknownCode;
    auto it = codes_.find(key);
    if (it != codes_.end()) return it->second;

    const int code = static_cast<int>(labels_.size());
    labels_.push_back(key);
    codes_.emplace(key, code);
    return code;
}

int CategoryRegistry::code_of(const std::string& label) const
{
    auto it = codes_.find(trim_copy(label));
    return it == codes_.end() ? kUnknownCode : it->second;
}

bool CategoryRegistry::contains(const std::string& label) const
{
    return codes_.count(trim_copy(label)) != 0;
}

nlohmann::json CategoryRegistry::to_json() const
{
    return nlohmann::json(labels_);
}

CategoryRegistry CategoryRegistry::from_json(const nlohmann::json& j)
{
    if (!j.is_array() || j.empty())
        throw ModelLoadError("category registry must be a non-empty array");

    CategoryRegistry reg;
    for (std::size_t i = 0; i < j.size(); ++i) {
        if (!j[i].is_string())
            throw ModelLoadError("category label is not a string");
        const std::string label = j[i].get<std::string>();
        if (i == 0) {
            if (label != kUnknownDepot)
                throw ModelLoadError("category registry does not start with Unknown");
            continue;
        }
        if (reg.contains(label) || trim_copy(label).empty())
            throw ModelLoadError("duplicate or empty category label '" + label + "'");
        reg.learn(label);
    }
    return reg;
}

} // namespace induct
