#pragma once
#include <cstddef>
#include <cstdint>

#include "pcapfin/format.h"
#include "pcapfin/interim_reader.h"

namespace pcapfin {

struct Partition {
    uint32_t index{0};   // 1-based, in stream order
    RecordGroup records;
};

// Cuts a record stream into consecutive groups of at most records_per_file records.
// Only the last group may be short; an empty stream yields no groups.
class Partitioner {
public:
    Partitioner(RecordSource& source, size_t records_per_file);

    bool next(Partition& out);

    uint32_t partitions_emitted() const { return next_index_ - 1; }

private:
    RecordSource& source_;
    size_t records_per_file_;
    uint32_t next_index_{1};
    bool exhausted_{false};
};

} // namespace pcapfin
