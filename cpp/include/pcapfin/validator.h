// cpp/include/pcapfin/validator.h
#pragma once
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include "pcapfin/pages.h"

namespace pcapfin {

class FileSystem;

struct ValidationResult {
    bool ok{false};
    uint64_t packets{0};
    std::vector<std::string> errors;
};

ValidationResult validate_pcap_file(const FileSystem& fs, const std::filesystem::path& p);

ValidationResult validate_pages(const FileSystem& fs, const ResultPages& pages);

} // namespace pcapfin
