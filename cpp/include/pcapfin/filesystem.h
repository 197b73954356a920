#pragma once
#include <cstdint>
#include <filesystem>
#include <istream>
#include <memory>
#include <ostream>
#include <string>
#include <vector>

namespace pcapfin {

struct FileEntry {
    std::filesystem::path path;
    uint64_t size{0};
};

// Minimal contract of the filesystem holding interim and final results.
// All failures are reported as IoException.
class FileSystem {
public:
    virtual ~FileSystem() = default;

    // Non-recursive; regular files only.
    virtual std::vector<FileEntry> list(const std::filesystem::path& dir) const = 0;

    // false if the path was already absent.
    virtual bool remove(const std::filesystem::path& p) = 0;

    virtual std::unique_ptr<std::istream> open_read(const std::filesystem::path& p) const = 0;

    // Creates parent directories; truncates an existing file.
    virtual std::unique_ptr<std::ostream> open_write(const std::filesystem::path& p) = 0;

    // Replaces `to` if it exists.
    virtual void rename(const std::filesystem::path& from, const std::filesystem::path& to) = 0;
};

class LocalFileSystem final : public FileSystem {
public:
    std::vector<FileEntry> list(const std::filesystem::path& dir) const override;
    bool remove(const std::filesystem::path& p) override;
    std::unique_ptr<std::istream> open_read(const std::filesystem::path& p) const override;
    std::unique_ptr<std::ostream> open_write(const std::filesystem::path& p) override;
    void rename(const std::filesystem::path& from, const std::filesystem::path& to) override;
};

} // namespace pcapfin
