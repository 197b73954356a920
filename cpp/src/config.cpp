// cpp/src/config.cpp
#include "pcapfin/config.h"
#include "pcapfin/errors.h"
#include "pcapfin/format.h"

#include <fstream>
#include <limits>

using json = nlohmann::json;

namespace pcapfin {

namespace {

[[noreturn]] static void bad_key(const std::string& key, const std::string& why) {
    throw JobException(ErrorCode::ConfigurationError, "config '" + key + "': " + why);
}

static std::string required_string(const json& j, const char* key) {
    if (!j.contains(key) || j[key].is_null()) bad_key(key, "missing required key");
    const auto& v = j[key];
    if (!v.is_string()) bad_key(key, "expected string, got " + v.dump());
    std::string s = v.get<std::string>();
    if (s.empty()) bad_key(key, "must not be empty");
    return s;
}

static std::string optional_string(const json& j, const char* key, const std::string& defv) {
    if (!j.contains(key) || j[key].is_null()) return defv;
    const auto& v = j[key];
    if (!v.is_string()) bad_key(key, "expected string, got " + v.dump());
    return v.get<std::string>();
}

} // namespace

FinalizerConfig load_finalizer_config(const json& j, std::shared_ptr<FileSystem> fs) {
    if (!j.is_object()) {
        throw JobException(ErrorCode::ConfigurationError, "finalizer config is not a JSON object: " + j.dump());
    }
    if (!fs) bad_key("filesystem", "missing filesystem handle");

    FinalizerConfig cfg;
    cfg.fs = std::move(fs);
    cfg.interim_result_path = required_string(j, "interim_result_path");
    cfg.final_output_path = required_string(j, "final_output_path");

    if (j.contains("num_records_per_file") && !j["num_records_per_file"].is_null()) {
        const auto& v = j["num_records_per_file"];
        if (!v.is_number_integer()) bad_key("num_records_per_file", "expected integer, got " + v.dump());
        const auto n = v.get<int64_t>();
        if (n < 1 || n > (int64_t)std::numeric_limits<uint32_t>::max()) {
            bad_key("num_records_per_file", "must be positive, got " + v.dump());
        }
        cfg.num_records_per_file = (uint32_t)n;
    }

    // either "4", "2C" or a bare number
    if (j.contains("finalizer_threadpool_size") && !j["finalizer_threadpool_size"].is_null()) {
        const auto& v = j["finalizer_threadpool_size"];
        if (v.is_string()) {
            cfg.finalizer_threadpool_size = v.get<std::string>();
        } else if (v.is_number_integer()) {
            cfg.finalizer_threadpool_size = std::to_string(v.get<int64_t>());
        } else {
            bad_key("finalizer_threadpool_size", "expected string or integer, got " + v.dump());
        }
    }

    cfg.final_filename_prefix = optional_string(j, "final_filename_prefix", utc_now_compact());
    cfg.username = optional_string(j, "username", "");
    cfg.job_id = optional_string(j, "job_id", "");
    return cfg;
}

FinalizerConfig load_finalizer_config_file(const std::filesystem::path& p, std::shared_ptr<FileSystem> fs) {
    std::ifstream in(p);
    if (!in) throw JobException(ErrorCode::ConfigurationError, "cannot open config " + p.string());

    json j = json::parse(in, nullptr, false);
    if (j.is_discarded()) {
        throw JobException(ErrorCode::ConfigurationError, "failed parsing config " + p.string());
    }
    return load_finalizer_config(j, std::move(fs));
}

json to_json(const FinalizerConfig& cfg) {
    json j;
    j["interim_result_path"] = cfg.interim_result_path.string();
    j["final_output_path"] = cfg.final_output_path.string();
    j["num_records_per_file"] = cfg.num_records_per_file;
    j["finalizer_threadpool_size"] = cfg.finalizer_threadpool_size;
    j["final_filename_prefix"] = cfg.final_filename_prefix;
    j["username"] = cfg.username;
    j["job_id"] = cfg.job_id;
    return j;
}

} // namespace pcapfin
