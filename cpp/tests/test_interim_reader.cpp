#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>

#include "pcapfin/errors.h"
#include "pcapfin/interim_reader.h"
#include "test_util.h"

namespace fs = std::filesystem;

static void touch(const fs::path& p) {
    std::ofstream out(p, std::ios::binary);
}

static pcapfin::ErrorCode read_all_code(pcapfin::InterimResultSet& set) {
    try {
        auto src = set.records();
        pcapfin::Record r;
        while (src->next(r)) {
        }
    } catch (const pcapfin::JobException& e) {
        return e.code();
    }
    return pcapfin::ErrorCode::Ok;
}

int main() {
    pcapfin::LocalFileSystem local;

    // discovery: sentinel deleted, files sorted by name, stream spans all files
    {
        auto dir = mk_tmp_dir("interim_discover");
        pcapfin::write_interim_file(local, dir / "part-r-00001", make_packets(100, 3));
        pcapfin::write_interim_file(local, dir / "part-r-00000", make_packets(0, 4));
        touch(dir / pcapfin::kSuccessSentinel);

        auto set = pcapfin::InterimResultSet::discover(local, dir);
        assert(!fs::exists(dir / pcapfin::kSuccessSentinel));
        assert(set.files().size() == 2);
        assert(set.files()[0].filename().string() == "part-r-00000");
        assert(set.files()[1].filename().string() == "part-r-00001");

        auto src = set.records();
        std::vector<uint32_t> seqs;
        pcapfin::Record r;
        while (src->next(r)) seqs.push_back(packet_seq(r));
        const std::vector<uint32_t> expect = {0, 1, 2, 3, 100, 101, 102};
        assert(seqs == expect);

        // single pass only
        bool threw = false;
        try {
            set.records();
        } catch (const pcapfin::JobException& e) {
            threw = (e.code() == pcapfin::ErrorCode::ReadError);
        }
        assert(threw);

        set.cleanup();
        assert(!fs::exists(dir / "part-r-00000"));
        assert(!fs::exists(dir / "part-r-00001"));

        // already gone: no error
        set.cleanup();
    }

    // empty records and empty files are fine
    {
        auto dir = mk_tmp_dir("interim_empty_records");
        pcapfin::write_interim_file(local, dir / "a", {pcapfin::Record(), make_packet(7)});
        pcapfin::write_interim_file(local, dir / "b", {});

        auto set = pcapfin::InterimResultSet::discover(local, dir);
        auto src = set.records();
        pcapfin::Record r;
        assert(src->next(r) && r.empty());
        assert(src->next(r) && packet_seq(r) == 7);
        assert(!src->next(r));
        assert(!src->next(r));
        set.cleanup();
    }

    // sentinel only: nothing to stream, cleanup of nothing is fine
    {
        auto dir = mk_tmp_dir("interim_sentinel_only");
        touch(dir / pcapfin::kSuccessSentinel);

        auto set = pcapfin::InterimResultSet::discover(local, dir);
        assert(set.empty());
        assert(!fs::exists(dir / pcapfin::kSuccessSentinel));
        auto src = set.records();
        pcapfin::Record r;
        assert(!src->next(r));
        set.cleanup();
        set.cleanup();
    }

    // unreadable directory
    {
        auto dir = mk_tmp_dir("interim_missing") / "does_not_exist";
        bool threw = false;
        try {
            pcapfin::InterimResultSet::discover(local, dir);
        } catch (const pcapfin::JobException& e) {
            threw = (e.code() == pcapfin::ErrorCode::ReadError);
        }
        assert(threw);
    }

    // corrupt interim files
    {
        auto dir = mk_tmp_dir("interim_corrupt");
        {
            std::ofstream out(dir / "bad_magic", std::ios::binary);
            out << "NOPE0000000000";
        }
        auto set = pcapfin::InterimResultSet::discover(local, dir);
        assert(read_all_code(set) == pcapfin::ErrorCode::ReadError);
    }
    {
        auto dir = mk_tmp_dir("interim_truncated");
        pcapfin::write_interim_file(local, dir / "a", make_packets(0, 2));
        const auto size = fs::file_size(dir / "a");
        fs::resize_file(dir / "a", size - 5);

        auto set = pcapfin::InterimResultSet::discover(local, dir);
        assert(read_all_code(set) == pcapfin::ErrorCode::ReadError);
    }

    // cleanup failures are reported once through the guard, never thrown
    {
        auto dir = mk_tmp_dir("interim_cleanup_fail");
        FaultyFileSystem faulty;
        pcapfin::write_interim_file(faulty, dir / "keep_me", make_packets(0, 1));
        pcapfin::write_interim_file(faulty, dir / "other", make_packets(1, 1));
        faulty.fail_remove_containing = "keep_me";

        auto set = pcapfin::InterimResultSet::discover(faulty, dir);

        bool threw = false;
        try {
            set.cleanup();
        } catch (const pcapfin::JobException& e) {
            threw = (e.code() == pcapfin::ErrorCode::CleanupError);
            assert(std::string(e.what()).find("keep_me") != std::string::npos);
        }
        assert(threw);
        assert(!fs::exists(dir / "other"));

        {
            pcapfin::InterimCleanupGuard guard(set);
            assert(!guard.run());
            assert(guard.done());
        }
        // run() once plus the explicit cleanup() above
        assert(faulty.removes_of(dir / "keep_me") == 2);
    }

    std::cout << "OK\n";
    return 0;
}
