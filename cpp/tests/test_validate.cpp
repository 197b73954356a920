#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>

#include "pcapfin/errors.h"
#include "pcapfin/results_writer.h"
#include "pcapfin/validator.h"
#include "test_util.h"

namespace fs = std::filesystem;

// what the capture side stores per packet: global header + record
static pcapfin::Record with_global_header(const pcapfin::Record& r) {
    std::ostringstream oss;
    pcapfin::write_pcap_global_header(oss, pcapfin::PcapGlobalHeader{});
    return oss.str() + r;
}

int main() {
    pcapfin::LocalFileSystem local;
    auto dir = mk_tmp_dir("validate");

    // plain records and records carrying their own global header merge the same way
    {
        auto plain = make_packets(0, 6);
        pcapfin::RecordGroup headed;
        for (const auto& r : plain) headed.push_back(with_global_header(r));

        pcapfin::PcapResultsWriter w;
        w.write(local, plain, dir / "plain.pcap");
        w.write(local, headed, dir / "headed.pcap");
        assert(!fs::exists(dir / "plain.pcap.tmp"));

        auto a = pcapfin::validate_pcap_file(local, dir / "plain.pcap");
        auto b = pcapfin::validate_pcap_file(local, dir / "headed.pcap");
        assert(a.ok && a.packets == 6);
        assert(b.ok && b.packets == 6);
        assert(fs::file_size(dir / "plain.pcap") == fs::file_size(dir / "headed.pcap"));
        assert(fs::file_size(dir / "plain.pcap") ==
               pcapfin::kPcapGlobalHeaderBytes + 6 * (pcapfin::kPcapRecordHeaderBytes + 32));
    }

    // a cut-off file is detected
    {
        pcapfin::PcapResultsWriter().write(local, make_packets(0, 3), dir / "cut.pcap");
        fs::resize_file(dir / "cut.pcap", fs::file_size(dir / "cut.pcap") - 10);
        auto vr = pcapfin::validate_pcap_file(local, dir / "cut.pcap");
        assert(!vr.ok);
        assert(vr.packets == 2);
    }

    // not a pcap file at all
    {
        {
            std::ofstream out(dir / "junk.pcap", std::ios::binary);
            out << "this is not a capture file";
        }
        auto vr = pcapfin::validate_pcap_file(local, dir / "junk.pcap");
        assert(!vr.ok);
        assert(!vr.errors.empty());
    }

    // absurd captured length is reported, not allocated
    {
        pcapfin::PcapGlobalHeader gh;
        gh.snaplen = 0xFFFFFFFFu;
        pcapfin::PcapRecordHeader rh;
        rh.incl_len = 0xFFFFFFF0u;
        rh.orig_len = 0xFFFFFFF0u;
        {
            std::ofstream out(dir / "huge.pcap", std::ios::binary);
            pcapfin::write_pcap_global_header(out, gh);
            out.write(reinterpret_cast<const char*>(&rh), sizeof(rh));
            out << "tiny";
        }
        auto vr = pcapfin::validate_pcap_file(local, dir / "huge.pcap");
        assert(!vr.ok);
        assert(vr.packets == 0);
        assert(vr.errors[0].find("incl_len") != std::string::npos);
    }

    // header only is a valid empty capture
    {
        pcapfin::PcapResultsWriter().write(local, {}, dir / "empty.pcap");
        auto vr = pcapfin::validate_pcap_file(local, dir / "empty.pcap");
        assert(vr.ok && vr.packets == 0);
    }

    // failed write leaves neither the final file nor the temp file behind
    {
        FaultyFileSystem faulty;
        faulty.fail_write_containing = "never.pcap";
        bool threw = false;
        try {
            pcapfin::PcapResultsWriter().write(faulty, make_packets(0, 1), dir / "never.pcap");
        } catch (const pcapfin::IoException&) {
            threw = true;
        }
        assert(threw);
        assert(!fs::exists(dir / "never.pcap"));
        assert(!fs::exists(dir / "never.pcap.tmp"));
    }

    {
        pcapfin::ResultPages pages({dir / "plain.pcap", dir / "cut.pcap", dir / "missing.pcap"});
        auto vr = pcapfin::validate_pages(local, pages);
        assert(!vr.ok);
        assert(vr.errors.size() >= 2);
        assert(vr.errors[0].find("cut.pcap") != std::string::npos);
    }

    std::cout << "OK\n";
    return 0;
}
