// cpp/src/finalizer.cpp
#include "pcapfin/finalizer.h"
#include "pcapfin/errors.h"
#include "pcapfin/filesystem.h"
#include "pcapfin/interim_reader.h"
#include "pcapfin/parallel_writer.h"
#include "pcapfin/partitioner.h"
#include "pcapfin/results_writer.h"
#include "pcapfin/thread_budget.h"

#include <cstdio>
#include <iostream>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

namespace pcapfin {

namespace {

// Feeds partitions to the parallel writer as they are cut from the stream.
class PartitionTaskSource final : public WriteTaskSource {
public:
    PartitionTaskSource(Partitioner& parts,
                        Partition first,
                        const OutputPathFn& output_path,
                        const FinalizerConfig& cfg)
        : parts_(parts), pending_(std::move(first)), has_pending_(true),
          output_path_(output_path), cfg_(cfg) {}

    bool next(WriteTask& out) override {
        Partition p;
        if (has_pending_) {
            p = std::move(pending_);
            has_pending_ = false;
        } else if (!parts_.next(p)) {
            return false;
        }
        out.path = output_path_(cfg_, p.index);
        out.records = std::move(p.records);
        return true;
    }

private:
    Partitioner& parts_;
    Partition pending_;
    bool has_pending_{false};
    const OutputPathFn& output_path_;
    const FinalizerConfig& cfg_;
};

static void require_non_empty(const std::string& v, const char* key, const char* target) {
    if (v.empty()) {
        throw JobException(ErrorCode::ConfigurationError,
                           std::string("config '") + key + "' is required by the " + target + " target");
    }
}

} // namespace

const char* finalizer_state_name(FinalizerState s) {
    switch (s) {
        case FinalizerState::Idle: return "idle";
        case FinalizerState::Reading: return "reading";
        case FinalizerState::Partitioning: return "partitioning";
        case FinalizerState::Writing: return "writing";
        case FinalizerState::CleaningUp: return "cleaning_up";
        case FinalizerState::Done: return "done";
        case FinalizerState::Failed: return "failed";
    }
    return "unknown";
}

FinalizeStrategy cli_strategy() {
    FinalizeStrategy s;
    s.name = "cli";
    s.output_path = [](const FinalizerConfig& cfg, uint32_t partition) {
        require_non_empty(cfg.final_filename_prefix, "final_filename_prefix", "cli");
        char suffix[32];
        std::snprintf(suffix, sizeof(suffix), "+%04u.pcap", (unsigned)partition);
        return cfg.final_output_path / ("pcap-data-" + cfg.final_filename_prefix + suffix);
    };
    s.write = [](const FinalizerConfig&, const RecordGroup& records, const fs::path& out) {
        LocalFileSystem local;
        PcapResultsWriter().write(local, records, out);
    };
    return s;
}

FinalizeStrategy rest_strategy() {
    FinalizeStrategy s;
    s.name = "rest";
    s.output_path = [](const FinalizerConfig& cfg, uint32_t partition) {
        require_non_empty(cfg.username, "username", "rest");
        require_non_empty(cfg.job_id, "job_id", "rest");
        return cfg.final_output_path / cfg.username / cfg.job_id /
               ("page-" + std::to_string(partition) + ".pcap");
    };
    s.write = [](const FinalizerConfig& cfg, const RecordGroup& records, const fs::path& out) {
        PcapResultsWriter().write(*cfg.fs, records, out);
    };
    return s;
}

Finalizer::Finalizer(FinalizeStrategy strategy) : strategy_(std::move(strategy)) {
    if (!strategy_.output_path || !strategy_.write) {
        throw JobException(ErrorCode::ConfigurationError,
                           "finalize strategy '" + strategy_.name + "' is incomplete");
    }
}

ResultPages Finalizer::finalize_job(const FinalizerConfig& cfg) {
    state_ = FinalizerState::Reading;
    // stage that threw, when the failure is seen after cleanup has run
    FinalizerState failed_in = FinalizerState::Idle;
    try {
        if (!cfg.fs) throw JobException(ErrorCode::ConfigurationError, "config 'filesystem': missing filesystem handle");
        if (cfg.num_records_per_file == 0) {
            throw JobException(ErrorCode::ConfigurationError, "config 'num_records_per_file': must be positive, got 0");
        }

        const unsigned parallelism = resolve_thread_budget(cfg.finalizer_threadpool_size);
        // path template keys must be complete before the interim set is touched
        strategy_.output_path(cfg, 1);
        std::cerr << "[pcapfin] Finalizer (" << strategy_.name << ") running with parallelism set to "
                  << parallelism << "\n";

        // no cleanup if this throws: nothing is known to be there
        InterimResultSet interim = InterimResultSet::discover(*cfg.fs, cfg.interim_result_path);

        std::vector<fs::path> out_files;
        {
            InterimCleanupGuard cleanup(interim);
            try {
                state_ = FinalizerState::Partitioning;
                auto records = interim.records();
                Partitioner parts(*records, cfg.num_records_per_file);

                Partition first;
                if (!parts.next(first)) {
                    std::cerr << "[pcapfin] No results returned.\n";
                } else {
                    state_ = FinalizerState::Writing;
                    PartitionTaskSource src(parts, std::move(first), strategy_.output_path, cfg);
                    const WriteGroupFn write_fn = [&](const RecordGroup& g, const fs::path& p) {
                        strategy_.write(cfg, g, p);
                    };
                    try {
                        out_files = write_parallel(src, write_fn, parallelism);
                    } catch (const JobException& e) {
                        if (e.code() != ErrorCode::WriteError) throw;
                        throw JobException(ErrorCode::WriteError, std::string("Failed to finalize results: ") + e.what());
                    }
                }
            } catch (const std::exception&) {
                failed_in = state_;
                state_ = FinalizerState::CleaningUp;
                cleanup.run();
                throw;
            }

            state_ = FinalizerState::CleaningUp;
            cleanup.run();
        }

        state_ = FinalizerState::Done;
        std::cerr << "[pcapfin] Done finalizing results, pages=" << out_files.size() << "\n";
        return ResultPages(std::move(out_files));
    } catch (const JobException&) {
        state_ = FinalizerState::Failed;
        throw;
    } catch (const std::exception& e) {
        const FinalizerState at = failed_in != FinalizerState::Idle ? failed_in : state_;
        state_ = FinalizerState::Failed;
        throw JobException(at == FinalizerState::Writing ? ErrorCode::WriteError : ErrorCode::ReadError,
                           std::string("Failed to finalize results: ") + e.what());
    }
}

} // namespace pcapfin
