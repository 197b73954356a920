#include "pcapfin/results_writer.h"
#include "pcapfin/errors.h"
#include "pcapfin/filesystem.h"

#include <iostream>

namespace fs = std::filesystem;

namespace pcapfin {

void PcapResultsWriter::merge_pcap(const RecordGroup& records, std::ostream& out) const {
    if (!write_pcap_global_header(out, header_)) throw IoException("write pcap header failed");

    for (const auto& r : records) {
        if (starts_with_pcap_global_header(r)) {
            out.write(r.data() + kPcapGlobalHeaderBytes,
                      (std::streamsize)(r.size() - kPcapGlobalHeaderBytes));
        } else {
            out.write(r.data(), (std::streamsize)r.size());
        }
        if (!out) throw IoException("write pcap record failed");
    }
}

void PcapResultsWriter::write(FileSystem& fs,
                              const RecordGroup& records,
                              const fs::path& out_path) const {
    fs::path tmp = out_path;
    tmp += ".tmp";

    try {
        {
            auto out = fs.open_write(tmp);
            merge_pcap(records, *out);
            out->flush();
            if (!*out) throw IoException("write failed " + tmp.string());
        }
        fs.rename(tmp, out_path);
    } catch (const IoException&) {
        try {
            fs.remove(tmp);
        } catch (const IoException& e2) {
            std::cerr << "[pcapfin] WARN cannot remove " << tmp << ": " << e2.what() << "\n";
        }
        throw;
    }
}

} // namespace pcapfin
