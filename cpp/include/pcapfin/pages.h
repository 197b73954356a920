// cpp/include/pcapfin/pages.h
#pragma once
#include <cstddef>
#include <filesystem>
#include <vector>
#include <nlohmann/json.hpp>

namespace pcapfin {

// Final output files of one job, one page per file, in file-name order.
class ResultPages {
public:
    using const_iterator = std::vector<std::filesystem::path>::const_iterator;

    ResultPages() = default;
    explicit ResultPages(std::vector<std::filesystem::path> pages) : pages_(std::move(pages)) {}

    size_t size() const { return pages_.size(); }
    bool empty() const { return pages_.empty(); }

    // 0-based; throws std::out_of_range
    const std::filesystem::path& page(size_t i) const;

    const std::vector<std::filesystem::path>& paths() const { return pages_; }

    const_iterator begin() const { return pages_.begin(); }
    const_iterator end() const { return pages_.end(); }

private:
    std::vector<std::filesystem::path> pages_;
};

nlohmann::json to_json(const ResultPages& pages);

} // namespace pcapfin
