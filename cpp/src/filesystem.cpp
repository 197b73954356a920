// cpp/src/filesystem.cpp
#include "pcapfin/filesystem.h"
#include "pcapfin/errors.h"

#include <fstream>

namespace fs = std::filesystem;

namespace pcapfin {

std::vector<FileEntry> LocalFileSystem::list(const fs::path& dir) const {
    std::error_code ec;
    fs::directory_iterator it(dir, ec);
    if (ec) throw IoException("cannot list " + dir.string() + " err=" + ec.message());

    std::vector<FileEntry> out;
    for (; it != fs::directory_iterator(); it.increment(ec)) {
        if (ec) break;
        std::error_code ec2;
        if (!it->is_regular_file(ec2) || ec2) continue;

        FileEntry e;
        e.path = it->path();
        e.size = (uint64_t)it->file_size(ec2);
        if (ec2) e.size = 0;
        out.push_back(std::move(e));
    }
    if (ec) throw IoException("cannot list " + dir.string() + " err=" + ec.message());
    return out;
}

bool LocalFileSystem::remove(const fs::path& p) {
    std::error_code ec;
    const bool removed = fs::remove(p, ec);
    if (ec) throw IoException("cannot delete " + p.string() + " err=" + ec.message());
    return removed;
}

std::unique_ptr<std::istream> LocalFileSystem::open_read(const fs::path& p) const {
    auto in = std::make_unique<std::ifstream>(p, std::ios::binary);
    if (!*in) throw IoException("cannot open " + p.string());
    return in;
}

std::unique_ptr<std::ostream> LocalFileSystem::open_write(const fs::path& p) {
    std::error_code ec;
    if (p.has_parent_path()) {
        fs::create_directories(p.parent_path(), ec);
        if (ec) throw IoException("cannot create " + p.parent_path().string() + " err=" + ec.message());
    }
    auto out = std::make_unique<std::ofstream>(p, std::ios::binary | std::ios::trunc);
    if (!*out) throw IoException("cannot open for write " + p.string());
    return out;
}

void LocalFileSystem::rename(const fs::path& from, const fs::path& to) {
    std::error_code ec;
    fs::rename(from, to, ec);
    if (!ec) return;

    // some platforms refuse to rename over an existing file
    fs::remove(to, ec);
    ec.clear();
    fs::rename(from, to, ec);
    if (ec) {
        throw IoException("cannot rename " + from.string() + " -> " + to.string() +
                          " err=" + ec.message());
    }
}

} // namespace pcapfin
