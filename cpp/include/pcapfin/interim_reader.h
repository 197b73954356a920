// cpp/include/pcapfin/interim_reader.h
#pragma once
#include <cstddef>
#include <filesystem>
#include <istream>
#include <memory>
#include <vector>

#include "pcapfin/format.h"

namespace pcapfin {

class FileSystem;

// Forward-only, single-pass sequence of records.
class RecordSource {
public:
    virtual ~RecordSource() = default;

    // false at end of stream. Failures throw JobException(ReadError).
    virtual bool next(Record& out) = 0;
};

// Streams the records of a list of interim files, opening one file at a time.
class InterimRecordCursor final : public RecordSource {
public:
    InterimRecordCursor(const FileSystem& fs, std::vector<std::filesystem::path> files);

    bool next(Record& out) override;

    uint64_t records_read() const { return records_read_; }

private:
    bool open_next_file();

    const FileSystem& fs_;
    std::vector<std::filesystem::path> files_;
    size_t file_idx_{0};
    std::unique_ptr<std::istream> in_;
    uint64_t records_read_{0};
};

// Interim output of one job: the sorted data files found under the result directory.
class InterimResultSet {
public:
    // Lists `dir` non-recursively. Completion sentinels are deleted here and never
    // become part of the set. Throws JobException(ReadError).
    static InterimResultSet discover(FileSystem& fs, const std::filesystem::path& dir);

    const std::filesystem::path& dir() const { return dir_; }
    const std::vector<std::filesystem::path>& files() const { return files_; }
    bool empty() const { return files_.empty(); }

    // Only one cursor may be taken per set.
    std::unique_ptr<RecordSource> records();

    // Deletes every discovered file. Already-absent files are fine, so repeated calls are
    // harmless. Throws JobException(CleanupError) listing the files it could not delete.
    void cleanup();

private:
    InterimResultSet(FileSystem& fs, std::filesystem::path dir, std::vector<std::filesystem::path> files);

    FileSystem* fs_{nullptr};
    std::filesystem::path dir_;
    std::vector<std::filesystem::path> files_;
    bool streamed_{false};
};

// Runs InterimResultSet::cleanup() exactly once: explicitly via run(), or on scope exit.
// Cleanup failures are logged, never thrown.
class InterimCleanupGuard {
public:
    explicit InterimCleanupGuard(InterimResultSet& set) : set_(set) {}
    ~InterimCleanupGuard();

    InterimCleanupGuard(const InterimCleanupGuard&) = delete;
    InterimCleanupGuard& operator=(const InterimCleanupGuard&) = delete;

    // true if cleanup succeeded
    bool run();

    bool done() const { return done_; }

private:
    InterimResultSet& set_;
    bool done_{false};
};

} // namespace pcapfin
