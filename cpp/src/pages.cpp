// cpp/src/pages.cpp
#include "pcapfin/pages.h"

#include <stdexcept>
#include <string>

namespace pcapfin {

const std::filesystem::path& ResultPages::page(size_t i) const {
    if (i >= pages_.size()) {
        throw std::out_of_range("page " + std::to_string(i) + " out of range, size=" +
                                std::to_string(pages_.size()));
    }
    return pages_[i];
}

nlohmann::json to_json(const ResultPages& pages) {
    nlohmann::json j;
    j["size"] = pages.size();

    nlohmann::json arr = nlohmann::json::array();
    for (const auto& p : pages) {
        arr.push_back(p.string());
    }
    j["pages"] = std::move(arr);
    return j;
}

} // namespace pcapfin
