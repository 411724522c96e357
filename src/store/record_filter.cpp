// =============================================================================
// alnstore - Record Filters Implementation
// =============================================================================

#include "aln/store/record_filter.h"

#include <utility>

namespace aln::store::filters {

RecordFilter all() {
    return [](const codec::AlignmentRecord&) { return true; };
}

RecordFilter requireFlags(std::uint16_t mask) {
    return [mask](const codec::AlignmentRecord& record) { return (record.flag & mask) == mask; };
}

RecordFilter excludeFlags(std::uint16_t mask) {
    return [mask](const codec::AlignmentRecord& record) { return (record.flag & mask) == 0; };
}

RecordFilter mapped() {
    return excludeFlags(codec::flags::kUnmapped);
}

RecordFilter properlyPaired() {
    return requireFlags(codec::flags::kPaired | codec::flags::kProperPair);
}

RecordFilter firstOfProperPair() {
    return requireFlags(codec::flags::kPaired | codec::flags::kProperPair |
                        codec::flags::kFirstOfPair);
}

RecordFilter both(RecordFilter first, RecordFilter second) {
    return [first = std::move(first), second = std::move(second)](
               const codec::AlignmentRecord& record) {
        return accepts(first, record) && accepts(second, record);
    };
}

}  // namespace aln::store::filters
