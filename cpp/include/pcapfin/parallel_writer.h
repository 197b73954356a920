// cpp/include/pcapfin/parallel_writer.h
#pragma once
#include <filesystem>
#include <functional>
#include <map>
#include <vector>

#include "pcapfin/format.h"

namespace pcapfin {

// Serializes one group into its container at the given path. Throws on failure.
using WriteGroupFn = std::function<void(const RecordGroup&, const std::filesystem::path&)>;

// path -> records of one partition
using OutputAssignment = std::map<std::filesystem::path, RecordGroup>;

struct WriteTask {
    std::filesystem::path path;
    RecordGroup records;
};

// Lazily produces write tasks; lets the writer overlap reading with writing.
class WriteTaskSource {
public:
    virtual ~WriteTaskSource() = default;
    virtual bool next(WriteTask& out) = 0;
};

// Writes every non-empty group with at most `degree` worker threads. Empty groups are
// skipped and never reach write_fn. Returns the written paths sorted by file name.
//
// The first failing write stops the run: queued tasks are dropped, writes already in
// flight finish, files already written stay. It is reported as JobException(WriteError).
// An exception from the task source is rethrown after the workers are joined.
std::vector<std::filesystem::path> write_parallel(WriteTaskSource& source,
                                                  const WriteGroupFn& write_fn,
                                                  unsigned degree);

std::vector<std::filesystem::path> write_parallel(OutputAssignment assignment,
                                                  const WriteGroupFn& write_fn,
                                                  unsigned degree);

// Ascending by file name, full path as tie-break.
void sort_by_file_name(std::vector<std::filesystem::path>& paths);

} // namespace pcapfin
