// cpp/src/format.cpp
#include "pcapfin/format.h"
#include "pcapfin/errors.h"
#include "pcapfin/filesystem.h"

#include <chrono>
#include <cstring>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace pcapfin {

namespace {

static uint32_t bswap32(uint32_t v) {
    return ((v & 0x000000FFu) << 24) | ((v & 0x0000FF00u) << 8) |
           ((v & 0x00FF0000u) >> 8)  | ((v & 0xFF000000u) >> 24);
}

static uint16_t bswap16(uint16_t v) {
    return (uint16_t)(((v & 0x00FFu) << 8) | ((v & 0xFF00u) >> 8));
}

} // namespace

bool read_interim_header(std::istream& in, InterimHeader& out) {
    in.read(out.magic, 4);
    if (!in) return false;

    in.read(reinterpret_cast<char*>(&out.version), sizeof(out.version));
    in.read(reinterpret_cast<char*>(&out.flags), sizeof(out.flags));
    if (!in) return false;

    if (std::memcmp(out.magic, "PCIM", 4) != 0) return false;
    if (out.version != kInterimVersion) return false;
    return true;
}

bool write_interim_header(std::ostream& out, const InterimHeader& h) {
    out.write(h.magic, 4);
    out.write(reinterpret_cast<const char*>(&h.version), sizeof(h.version));
    out.write(reinterpret_cast<const char*>(&h.flags), sizeof(h.flags));
    return (bool)out;
}

InterimHeader make_interim_header() {
    InterimHeader h{};
    h.magic[0] = 'P'; h.magic[1] = 'C'; h.magic[2] = 'I'; h.magic[3] = 'M';
    h.version = kInterimVersion;
    h.flags = 0;
    return h;
}

void write_interim_file(FileSystem& fs,
                        const std::filesystem::path& p,
                        const std::vector<Record>& records) {
    auto out = fs.open_write(p);
    if (!write_interim_header(*out, make_interim_header())) {
        throw IoException("write interim header failed: " + p.string());
    }
    for (const auto& r : records) {
        if (r.size() > kMaxInterimRecordBytes) {
            throw IoException("interim record too large: " + std::to_string(r.size()));
        }
        const uint32_t len = (uint32_t)r.size();
        out->write(reinterpret_cast<const char*>(&len), sizeof(len));
        out->write(r.data(), (std::streamsize)r.size());
    }
    out->flush();
    if (!*out) throw IoException("interim write failed: " + p.string());
}

bool read_pcap_global_header(std::istream& in, PcapGlobalHeader& out, bool& swapped) {
    in.read(reinterpret_cast<char*>(&out.magic), sizeof(out.magic));
    in.read(reinterpret_cast<char*>(&out.version_major), sizeof(out.version_major));
    in.read(reinterpret_cast<char*>(&out.version_minor), sizeof(out.version_minor));
    in.read(reinterpret_cast<char*>(&out.thiszone), sizeof(out.thiszone));
    in.read(reinterpret_cast<char*>(&out.sigfigs), sizeof(out.sigfigs));
    in.read(reinterpret_cast<char*>(&out.snaplen), sizeof(out.snaplen));
    in.read(reinterpret_cast<char*>(&out.network), sizeof(out.network));
    if (!in) return false;

    if (out.magic == kPcapMagic) {
        swapped = false;
    } else if (out.magic == kPcapMagicSwapped) {
        swapped = true;
        out.magic = kPcapMagic;
        out.version_major = bswap16(out.version_major);
        out.version_minor = bswap16(out.version_minor);
        out.thiszone = (int32_t)bswap32((uint32_t)out.thiszone);
        out.sigfigs = bswap32(out.sigfigs);
        out.snaplen = bswap32(out.snaplen);
        out.network = bswap32(out.network);
    } else {
        return false;
    }
    return true;
}

bool write_pcap_global_header(std::ostream& out, const PcapGlobalHeader& h) {
    out.write(reinterpret_cast<const char*>(&h.magic), sizeof(h.magic));
    out.write(reinterpret_cast<const char*>(&h.version_major), sizeof(h.version_major));
    out.write(reinterpret_cast<const char*>(&h.version_minor), sizeof(h.version_minor));
    out.write(reinterpret_cast<const char*>(&h.thiszone), sizeof(h.thiszone));
    out.write(reinterpret_cast<const char*>(&h.sigfigs), sizeof(h.sigfigs));
    out.write(reinterpret_cast<const char*>(&h.snaplen), sizeof(h.snaplen));
    out.write(reinterpret_cast<const char*>(&h.network), sizeof(h.network));
    return (bool)out;
}

bool read_pcap_record_header(std::istream& in, PcapRecordHeader& out, bool swapped) {
    in.read(reinterpret_cast<char*>(&out.ts_sec), sizeof(out.ts_sec));
    in.read(reinterpret_cast<char*>(&out.ts_usec), sizeof(out.ts_usec));
    in.read(reinterpret_cast<char*>(&out.incl_len), sizeof(out.incl_len));
    in.read(reinterpret_cast<char*>(&out.orig_len), sizeof(out.orig_len));
    if (!in) return false;

    if (swapped) {
        out.ts_sec = bswap32(out.ts_sec);
        out.ts_usec = bswap32(out.ts_usec);
        out.incl_len = bswap32(out.incl_len);
        out.orig_len = bswap32(out.orig_len);
    }
    return true;
}

bool starts_with_pcap_global_header(const Record& r) {
    if (r.size() < kPcapGlobalHeaderBytes) return false;
    uint32_t magic = 0;
    std::memcpy(&magic, r.data(), sizeof(magic));
    return magic == kPcapMagic || magic == kPcapMagicSwapped;
}

std::string utc_now_compact() {
    using namespace std::chrono;
    const auto now = system_clock::now();
    const std::time_t t = system_clock::to_time_t(now);
    std::tm tm{};
#if defined(_WIN32)
    gmtime_s(&tm, &t);
#else
    gmtime_r(&t, &tm);
#endif
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y%m%d_%H%M%S");
    return oss.str();
}

} // namespace pcapfin
