#pragma once

#include <cstdint>
#include <filesystem>
#include <istream>
#include <ostream>
#include <string>
#include <vector>

namespace pcapfin {

class FileSystem;

// One opaque binary record (a captured packet as produced by the job).
using Record = std::string;

// Records of one partition, in stream order.
using RecordGroup = std::vector<Record>;

constexpr const char* kSuccessSentinel = "_SUCCESS";

// --------------------
// interim container: header + (u32 len, bytes)*
// --------------------
constexpr uint32_t kInterimVersion = 1;
constexpr uint32_t kMaxInterimRecordBytes = 256u * 1024u * 1024u;

struct InterimHeader {
    char     magic[4];      // "PCIM"
    uint32_t version;       // 1
    uint32_t flags;         // 0
};

// Written/read field by field, not sizeof(struct).
bool read_interim_header(std::istream& in, InterimHeader& out);
bool write_interim_header(std::ostream& out, const InterimHeader& h);

InterimHeader make_interim_header();

void write_interim_file(FileSystem& fs,
                        const std::filesystem::path& p,
                        const std::vector<Record>& records);

// --------------------
// pcap output container
// --------------------
constexpr uint32_t kPcapMagic = 0xa1b2c3d4u;
constexpr uint32_t kPcapMagicSwapped = 0xd4c3b2a1u;
constexpr uint32_t kPcapGlobalHeaderBytes = 24;
constexpr uint32_t kPcapRecordHeaderBytes = 16;
// libpcap MAXIMUM_SNAPLEN; larger captured lengths are treated as corruption
constexpr uint32_t kPcapMaxRecordBytes = 262144;

struct PcapGlobalHeader {
    uint32_t magic{kPcapMagic};
    uint16_t version_major{2};
    uint16_t version_minor{4};
    int32_t  thiszone{0};
    uint32_t sigfigs{0};
    uint32_t snaplen{65535};
    uint32_t network{1}; // LINKTYPE_ETHERNET
};

struct PcapRecordHeader {
    uint32_t ts_sec{0};
    uint32_t ts_usec{0};
    uint32_t incl_len{0};
    uint32_t orig_len{0};
};

bool read_pcap_global_header(std::istream& in, PcapGlobalHeader& out, bool& swapped);
bool write_pcap_global_header(std::ostream& out, const PcapGlobalHeader& h);

bool read_pcap_record_header(std::istream& in, PcapRecordHeader& out, bool swapped);

// true if the record begins with a pcap global header (either byte order)
bool starts_with_pcap_global_header(const Record& r);

std::string utc_now_compact();

} // namespace pcapfin
