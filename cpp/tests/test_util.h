// shared helpers for the self-checking test executables
#pragma once
#include <atomic>
#include <cstdint>
#include <cstring>
#include <ctime>
#include <filesystem>
#include <functional>
#include <istream>
#include <memory>
#include <mutex>
#include <random>
#include <string>
#include <vector>

#include "pcapfin/errors.h"
#include "pcapfin/filesystem.h"
#include "pcapfin/format.h"

inline std::filesystem::path mk_tmp_dir(const char* tag) {
    std::random_device rd;
    auto base = std::filesystem::temp_directory_path();
    auto p = base / ("pcapfin_test_" + std::string(tag) + "_" +
                     std::to_string((uint64_t)std::time(nullptr)) + "_" + std::to_string(rd()));
    std::filesystem::create_directories(p);
    return p;
}

// one pcap packet record: 16-byte record header + payload
inline pcapfin::Record make_packet(uint32_t seq, uint32_t payload_len = 32) {
    pcapfin::Record r(pcapfin::kPcapRecordHeaderBytes + payload_len, '\0');
    const uint32_t hdr[4] = {seq, 0, payload_len, payload_len};
    for (int i = 0; i < 4; ++i) {
        std::memcpy(&r[(size_t)i * 4], &hdr[i], sizeof(uint32_t));
    }
    for (uint32_t i = 0; i < payload_len; ++i) {
        r[pcapfin::kPcapRecordHeaderBytes + i] = (char)((seq + i) & 0xFF);
    }
    return r;
}

inline std::vector<pcapfin::Record> make_packets(uint32_t first_seq, size_t n) {
    std::vector<pcapfin::Record> out;
    for (size_t i = 0; i < n; ++i) out.push_back(make_packet(first_seq + (uint32_t)i));
    return out;
}

inline uint32_t packet_seq(const pcapfin::Record& r) {
    uint32_t seq = 0;
    std::memcpy(&seq, r.data(), sizeof(seq));
    return seq;
}

// LocalFileSystem that counts calls and fails on demand.
class FaultyFileSystem final : public pcapfin::FileSystem {
public:
    std::string fail_write_containing;   // open_write of a matching path throws
    std::string fail_remove_containing;  // remove of a matching path throws
    bool fail_list{false};
    std::function<void(const std::filesystem::path&)> on_remove; // called before each remove

    std::atomic<int> writes{0};
    mutable std::atomic<int> lists{0};

    std::vector<pcapfin::FileEntry> list(const std::filesystem::path& dir) const override {
        ++lists;
        if (fail_list) throw pcapfin::IoException("injected list failure: " + dir.string());
        return local_.list(dir);
    }

    bool remove(const std::filesystem::path& p) override {
        {
            std::lock_guard<std::mutex> lk(mu_);
            removed_.push_back(p);
        }
        if (on_remove) on_remove(p);
        if (!fail_remove_containing.empty() && p.string().find(fail_remove_containing) != std::string::npos) {
            throw pcapfin::IoException("injected delete failure: " + p.string());
        }
        return local_.remove(p);
    }

    std::unique_ptr<std::istream> open_read(const std::filesystem::path& p) const override {
        return local_.open_read(p);
    }

    std::unique_ptr<std::ostream> open_write(const std::filesystem::path& p) override {
        ++writes;
        if (!fail_write_containing.empty() && p.string().find(fail_write_containing) != std::string::npos) {
            throw pcapfin::IoException("injected write failure: " + p.string());
        }
        return local_.open_write(p);
    }

    void rename(const std::filesystem::path& from, const std::filesystem::path& to) override {
        local_.rename(from, to);
    }

    int removes_of(const std::filesystem::path& p) {
        std::lock_guard<std::mutex> lk(mu_);
        int n = 0;
        for (const auto& r : removed_) {
            if (r == p) ++n;
        }
        return n;
    }

private:
    pcapfin::LocalFileSystem local_;
    std::mutex mu_;
    std::vector<std::filesystem::path> removed_;
};
