// cpp/src/parallel_writer.cpp
#include "pcapfin/parallel_writer.h"
#include "pcapfin/bounded_queue.h"
#include "pcapfin/env.h"
#include "pcapfin/errors.h"

#include <algorithm>
#include <atomic>
#include <exception>
#include <iostream>
#include <mutex>
#include <system_error>
#include <thread>

namespace fs = std::filesystem;

namespace pcapfin {

namespace {

// append-only, shared by all workers
class WrittenPaths {
public:
    void add(const fs::path& p) {
        std::lock_guard<std::mutex> lk(mu_);
        paths_.push_back(p);
    }

    std::vector<fs::path> take() {
        std::lock_guard<std::mutex> lk(mu_);
        return std::move(paths_);
    }

private:
    std::mutex mu_;
    std::vector<fs::path> paths_;
};

class AssignmentTaskSource final : public WriteTaskSource {
public:
    explicit AssignmentTaskSource(OutputAssignment& a) : it_(a.begin()), end_(a.end()) {}

    bool next(WriteTask& out) override {
        if (it_ == end_) return false;
        out.path = it_->first;
        out.records = std::move(it_->second);
        ++it_;
        return true;
    }

private:
    OutputAssignment::iterator it_;
    OutputAssignment::iterator end_;
};

} // namespace

void sort_by_file_name(std::vector<fs::path>& paths) {
    std::sort(paths.begin(), paths.end(), [](const fs::path& a, const fs::path& b) {
        const auto an = a.filename().string();
        const auto bn = b.filename().string();
        if (an != bn) return an < bn;
        return a.string() < b.string();
    });
}

std::vector<fs::path> write_parallel(WriteTaskSource& source,
                                     const WriteGroupFn& write_fn,
                                     unsigned degree) {
    if (degree == 0) {
        throw JobException(ErrorCode::ConfigurationError, "parallelism degree must be positive");
    }

    // at most `degree` groups queued plus `degree` in flight
    BoundedQueue<WriteTask> q(degree);
    WrittenPaths written;

    std::atomic<bool> stop{false};
    std::mutex err_mu;
    std::string first_error;

    auto fail = [&](const std::string& msg) {
        {
            std::lock_guard<std::mutex> lk(err_mu);
            if (first_error.empty()) first_error = msg;
        }
        stop.store(true, std::memory_order_relaxed);
        q.close();
    };

    auto worker = [&]() {
        WriteTask t;
        while (q.pop(t)) {
            if (stop.load(std::memory_order_relaxed)) continue; // rejected after a failure
            try {
                write_fn(t.records, t.path);
            } catch (const std::exception& e) {
                fail("Failed to write results to path '" + t.path.string() + "': " + e.what());
                continue;
            }
            written.add(t.path);
            if (debug_logging()) {
                std::cerr << "[pcapfin] wrote " << t.records.size() << " records to " << t.path << "\n";
            }
        }
    };

    std::vector<std::thread> workers;
    std::exception_ptr source_error;
    uint64_t skipped = 0;

    try {
        WriteTask t;
        while (!stop.load(std::memory_order_relaxed) && source.next(t)) {
            if (t.records.empty()) {
                ++skipped;
                continue;
            }
            if (workers.size() < degree) {
                try {
                    workers.emplace_back(worker);
                } catch (const std::system_error& e) {
                    fail(std::string("Error finalizing results: ") + e.what());
                    break;
                }
            }
            if (!q.push(std::move(t))) break;
            t = WriteTask{};
        }
    } catch (const JobException&) {
        source_error = std::current_exception();
    } catch (const std::exception& e) {
        source_error = std::make_exception_ptr(
            JobException(ErrorCode::ReadError, std::string("Error reading results to finalize: ") + e.what()));
    }

    q.close();
    for (auto& th : workers) th.join();

    if (!first_error.empty()) throw JobException(ErrorCode::WriteError, first_error);
    if (source_error) std::rethrow_exception(source_error);

    if (skipped > 0 && debug_logging()) {
        std::cerr << "[pcapfin] skipped " << skipped << " empty partition(s)\n";
    }

    auto out = written.take();
    sort_by_file_name(out);
    return out;
}

std::vector<fs::path> write_parallel(OutputAssignment assignment,
                                     const WriteGroupFn& write_fn,
                                     unsigned degree) {
    AssignmentTaskSource src(assignment);
    return write_parallel(src, write_fn, degree);
}

} // namespace pcapfin
