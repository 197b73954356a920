// cpp/src/interim_reader.cpp
#include "pcapfin/interim_reader.h"
#include "pcapfin/env.h"
#include "pcapfin/errors.h"
#include "pcapfin/filesystem.h"

#include <algorithm>
#include <iostream>
#include <sstream>

namespace fs = std::filesystem;

namespace pcapfin {

// --------------------
// cursor
// --------------------

InterimRecordCursor::InterimRecordCursor(const FileSystem& fs, std::vector<fs::path> files)
    : fs_(fs), files_(std::move(files)) {}

bool InterimRecordCursor::open_next_file() {
    in_.reset();
    if (file_idx_ >= files_.size()) return false;

    const fs::path& p = files_[file_idx_++];
    try {
        in_ = fs_.open_read(p);
    } catch (const IoException& e) {
        throw JobException(ErrorCode::ReadError, std::string("cannot read interim file: ") + e.what());
    }

    InterimHeader h{};
    if (!read_interim_header(*in_, h)) {
        throw JobException(ErrorCode::ReadError, "invalid header or version in " + p.string());
    }
    if (debug_logging()) {
        std::cerr << "[pcapfin] reading interim file " << p << "\n";
    }
    return true;
}

bool InterimRecordCursor::next(Record& out) {
    while (true) {
        if (!in_ && !open_next_file()) return false;

        const fs::path& p = files_[file_idx_ - 1];

        uint32_t len = 0;
        in_->read(reinterpret_cast<char*>(&len), sizeof(len));
        const std::streamsize got = in_->gcount();
        if (got == 0 && in_->eof()) {
            in_.reset(); // clean end of this file
            continue;
        }
        if (got != (std::streamsize)sizeof(len)) {
            throw JobException(ErrorCode::ReadError, "truncated record frame in " + p.string());
        }
        if (len > kMaxInterimRecordBytes) {
            throw JobException(ErrorCode::ReadError,
                               "record length " + std::to_string(len) + " exceeds limit in " + p.string());
        }

        out.resize(len);
        if (len > 0) {
            in_->read(&out[0], (std::streamsize)len);
            if (in_->gcount() != (std::streamsize)len) {
                throw JobException(ErrorCode::ReadError, "truncated record in " + p.string());
            }
        }
        ++records_read_;
        return true;
    }
}

// --------------------
// result set
// --------------------

InterimResultSet::InterimResultSet(FileSystem& fs, fs::path dir, std::vector<fs::path> files)
    : fs_(&fs), dir_(std::move(dir)), files_(std::move(files)) {}

InterimResultSet InterimResultSet::discover(FileSystem& fs, const fs::path& dir) {
    std::vector<fs::path> files;
    try {
        for (const auto& e : fs.list(dir)) {
            if (e.path.filename().string() == kSuccessSentinel) {
                fs.remove(e.path);
                continue;
            }
            files.push_back(e.path);
        }
    } catch (const IoException& e) {
        throw JobException(ErrorCode::ReadError,
                           std::string("Unable to read interim job results while finalizing: ") + e.what());
    }

    if (files.empty()) {
        std::cerr << "[pcapfin] No interim files to process under " << dir << "\n";
    } else {
        if (debug_logging()) {
            std::cerr << "[pcapfin] Interim results path=" << dir << " files=" << files.size() << "\n";
        }
        std::sort(files.begin(), files.end(), [](const fs::path& a, const fs::path& b) {
            const auto an = a.filename().string();
            const auto bn = b.filename().string();
            if (an != bn) return an < bn;
            return a.string() < b.string();
        });
    }
    return InterimResultSet(fs, dir, std::move(files));
}

std::unique_ptr<RecordSource> InterimResultSet::records() {
    if (streamed_) {
        throw JobException(ErrorCode::ReadError, "interim results under " + dir_.string() + " already consumed");
    }
    streamed_ = true;
    return std::make_unique<InterimRecordCursor>(*fs_, files_);
}

void InterimResultSet::cleanup() {
    std::vector<std::string> failed;
    for (const auto& p : files_) {
        try {
            fs_->remove(p);
        } catch (const IoException& e) {
            failed.push_back(e.what());
        }
    }
    if (failed.empty()) return;

    std::ostringstream oss;
    oss << "Unable to cleanup " << failed.size() << " interim file(s) under " << dir_.string();
    for (const auto& f : failed) oss << "; " << f;
    throw JobException(ErrorCode::CleanupError, oss.str());
}

// --------------------
// guard
// --------------------

bool InterimCleanupGuard::run() {
    if (done_) return true;
    done_ = true;
    try {
        set_.cleanup();
        return true;
    } catch (const std::exception& e) {
        std::cerr << "[pcapfin] WARN unable to cleanup interim files: " << e.what() << "\n";
        return false;
    }
}

InterimCleanupGuard::~InterimCleanupGuard() {
    run();
}

} // namespace pcapfin
