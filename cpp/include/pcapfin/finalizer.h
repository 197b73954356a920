// cpp/include/pcapfin/finalizer.h
#pragma once
#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>

#include "pcapfin/config.h"
#include "pcapfin/format.h"
#include "pcapfin/pages.h"

namespace pcapfin {

enum class FinalizerState {
    Idle = 0,
    Reading,
    Partitioning,
    Writing,
    CleaningUp,
    Done,
    Failed,
};

const char* finalizer_state_name(FinalizerState s);

// Output location of the 1-based partition.
using OutputPathFn = std::function<std::filesystem::path(const FinalizerConfig&, uint32_t partition)>;

// Writes one partition into its final container.
using TargetWriteFn =
    std::function<void(const FinalizerConfig&, const RecordGroup&, const std::filesystem::path&)>;

// What distinguishes one finalization target from another.
struct FinalizeStrategy {
    std::string name;
    OutputPathFn output_path;
    TargetWriteFn write;
};

// <final_output_path>/pcap-data-<prefix>+0001.pcap, written to the local filesystem.
FinalizeStrategy cli_strategy();

// <final_output_path>/<username>/<job_id>/page-1.pcap, written through cfg.fs.
FinalizeStrategy rest_strategy();

// Turns the interim results of a finished job into final pcap pages:
// discover -> stream -> partition -> parallel write -> sort, with interim cleanup on
// every path once discovery succeeded. All failures are JobException.
class Finalizer {
public:
    explicit Finalizer(FinalizeStrategy strategy);

    ResultPages finalize_job(const FinalizerConfig& cfg);

    FinalizerState state() const { return state_; }
    const std::string& target() const { return strategy_.name; }

private:
    FinalizeStrategy strategy_;
    FinalizerState state_{FinalizerState::Idle};
};

} // namespace pcapfin
