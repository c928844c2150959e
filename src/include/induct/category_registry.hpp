/*───────────────────────────────────────────────────────────
 *  category_registry.hpp   –  append-only label → code map
 *───────────────────────────────────────────────────────────*/
#pragma once

#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

namespace induct {

/* Code 0 is always "Unknown".  Labels only ever get appended, so a code
 * handed out once keeps its meaning for the lifetime of the registry
 * (and of any model trained against it).                              */
class CategoryRegistry {
public:
    static constexpr int kUnknownCode = 0;

    CategoryRegistry();

    /* returns the label's code, appending it when new;
       empty labels and "Unknown" map to kUnknownCode          */
    int learn(const std::string& label);

    /* lookup only: unseen labels map to kUnknownCode */
    int code_of(const std::string& label) const;

    bool contains(const std::string& label) const;
    std::size_t size() const { return labels_.size(); }
    const std::vector<std::string>& labels() const { return labels_; }

    nlohmann::json to_json() const;
    /* throws ModelLoadError unless labels[0]=="Unknown" and all unique */
    static CategoryRegistry from_json(const nlohmann::json& j);

private:
    std::vector<std::string>             labels_;
    std::unordered_map<std::string, int> codes_;
};

} // namespace induct
