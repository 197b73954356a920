#include "pcapfin/partitioner.h"
#include "pcapfin/errors.h"

namespace pcapfin {

Partitioner::Partitioner(RecordSource& source, size_t records_per_file)
    : source_(source), records_per_file_(records_per_file) {
    if (records_per_file_ == 0) {
        throw JobException(ErrorCode::ConfigurationError, "records per file must be positive");
    }
}

bool Partitioner::next(Partition& out) {
    out.records.clear();
    if (exhausted_) return false;

    // grow on demand: records_per_file may be far larger than the stream
    Record r;
    while (out.records.size() < records_per_file_) {
        if (!source_.next(r)) {
            exhausted_ = true;
            break;
        }
        out.records.push_back(std::move(r));
    }

    if (out.records.empty()) return false;
    out.index = next_index_++;
    return true;
}

} // namespace pcapfin
