#pragma once
#include <filesystem>
#include <ostream>

#include "pcapfin/format.h"

namespace pcapfin {

class FileSystem;

// Writes a partition as one pcap file: a single global header, then each record.
// A record that carries its own global header has it stripped first.
class PcapResultsWriter {
public:
    PcapResultsWriter() = default;
    explicit PcapResultsWriter(PcapGlobalHeader header) : header_(header) {}

    // Streams into `<out>.tmp` and renames onto `out` once flushed, so a file under
    // the final name is always complete. Throws IoException.
    void write(FileSystem& fs, const RecordGroup& records, const std::filesystem::path& out) const;

    void merge_pcap(const RecordGroup& records, std::ostream& out) const;

private:
    PcapGlobalHeader header_{};
};

} // namespace pcapfin
