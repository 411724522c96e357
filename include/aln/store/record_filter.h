// =============================================================================
// alnstore - Record Filters
// =============================================================================
// Caller-supplied predicates applied while iterating, plus builders for the
// common flag masks.
// =============================================================================

#ifndef ALN_STORE_RECORD_FILTER_H
#define ALN_STORE_RECORD_FILTER_H

#include <cstdint>
#include <functional>

#include "aln/codec/alignment_record.h"

namespace aln::store {

/// @brief Keep a record when the predicate returns true. Empty keeps everything.
using RecordFilter = std::function<bool(const codec::AlignmentRecord&)>;

namespace filters {

/// @brief Keep everything.
[[nodiscard]] RecordFilter all();

/// @brief Keep records with every bit of @p mask set (samtools -f).
[[nodiscard]] RecordFilter requireFlags(std::uint16_t mask);

/// @brief Drop records with any bit of @p mask set (samtools -F).
[[nodiscard]] RecordFilter excludeFlags(std::uint16_t mask);

/// @brief Records without the unmapped flag (-F 4).
[[nodiscard]] RecordFilter mapped();

/// @brief Paired reads in a proper pair (-f 3).
[[nodiscard]] RecordFilter properlyPaired();

/// @brief First mate of a proper pair (-f 67).
[[nodiscard]] RecordFilter firstOfProperPair();

/// @brief Keep records accepted by both filters.
[[nodiscard]] RecordFilter both(RecordFilter first, RecordFilter second);

}  // namespace filters

/// @brief Apply @p filter, treating an empty filter as "keep".
[[nodiscard]] inline bool accepts(const RecordFilter& filter,
                                  const codec::AlignmentRecord& record) {
    return !filter || filter(record);
}

}  // namespace aln::store

#endif  // ALN_STORE_RECORD_FILTER_H
