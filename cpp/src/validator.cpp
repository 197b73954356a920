// cpp/src/validator.cpp
#include "pcapfin/validator.h"
#include "pcapfin/errors.h"
#include "pcapfin/filesystem.h"
#include "pcapfin/format.h"

#include <sstream>

namespace pcapfin {

ValidationResult validate_pcap_file(const FileSystem& fs, const std::filesystem::path& p) {
    ValidationResult vr;

    std::unique_ptr<std::istream> in;
    try {
        in = fs.open_read(p);
    } catch (const IoException& e) {
        vr.errors.push_back(e.what());
        return vr;
    }

    PcapGlobalHeader gh{};
    bool swapped = false;
    if (!read_pcap_global_header(*in, gh, swapped)) {
        vr.errors.push_back("invalid pcap global header in " + p.string());
        return vr;
    }
    if (gh.version_major != 2 || gh.version_minor != 4) {
        std::ostringstream oss;
        oss << "unsupported pcap version " << gh.version_major << "." << gh.version_minor;
        vr.errors.push_back(oss.str());
    }

    uint64_t offset = kPcapGlobalHeaderBytes;
    std::string payload;
    while (true) {
        if (in->peek() == std::char_traits<char>::eof()) break;

        PcapRecordHeader rh{};
        if (!read_pcap_record_header(*in, rh, swapped)) {
            vr.errors.push_back("truncated record header at offset " + std::to_string(offset));
            break;
        }
        if (rh.incl_len > kPcapMaxRecordBytes) {
            vr.errors.push_back("record at offset " + std::to_string(offset) + " has implausible incl_len=" +
                                std::to_string(rh.incl_len));
            break;
        }
        if (rh.incl_len > gh.snaplen) {
            vr.errors.push_back("record at offset " + std::to_string(offset) + " exceeds snaplen: incl_len=" +
                                std::to_string(rh.incl_len) + " snaplen=" + std::to_string(gh.snaplen));
            break;
        }
        if (rh.incl_len > rh.orig_len) {
            vr.errors.push_back("record at offset " + std::to_string(offset) + " has incl_len > orig_len");
        }

        payload.resize(rh.incl_len);
        if (rh.incl_len > 0) {
            in->read(&payload[0], (std::streamsize)rh.incl_len);
            if (in->gcount() != (std::streamsize)rh.incl_len) {
                vr.errors.push_back("truncated packet data at offset " + std::to_string(offset));
                break;
            }
        }
        offset += kPcapRecordHeaderBytes + rh.incl_len;
        ++vr.packets;
    }

    vr.ok = vr.errors.empty();
    return vr;
}

ValidationResult validate_pages(const FileSystem& fs, const ResultPages& pages) {
    ValidationResult vr;
    for (const auto& p : pages) {
        auto r = validate_pcap_file(fs, p);
        vr.packets += r.packets;
        if (!r.ok) {
            for (auto& e : r.errors) {
                vr.errors.push_back(p.string() + ": " + e);
            }
        }
    }
    vr.ok = vr.errors.empty();
    return vr;
}

} // namespace pcapfin
