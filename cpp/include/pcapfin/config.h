#pragma once
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>

#include <nlohmann/json.hpp>

namespace pcapfin {

class FileSystem;

constexpr uint32_t kNumRecordsPerFileDefault = 10000;
constexpr const char* kFinalizerThreadpoolSizeDefault = "1";

struct FinalizerConfig {
    std::shared_ptr<FileSystem> fs;   // holds interim results (and REST output)

    std::filesystem::path interim_result_path;
    std::filesystem::path final_output_path;

    uint32_t num_records_per_file{kNumRecordsPerFileDefault};
    std::string finalizer_threadpool_size{kFinalizerThreadpoolSizeDefault}; // "N" or "NC"

    // path templates
    std::string final_filename_prefix; // cli
    std::string username;              // rest
    std::string job_id;                // rest
};

// Throws JobException(ConfigurationError) naming the offending key and value.
FinalizerConfig load_finalizer_config(const nlohmann::json& j, std::shared_ptr<FileSystem> fs);

FinalizerConfig load_finalizer_config_file(const std::filesystem::path& p, std::shared_ptr<FileSystem> fs);

nlohmann::json to_json(const FinalizerConfig& cfg);

} // namespace pcapfin
