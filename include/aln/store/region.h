// =============================================================================
// alnstore - Genomic Region
// =============================================================================
// Region strings use 1-based inclusive coordinates with optional thousands
// separators:
//
//   chr1              the whole reference
//   chr1:1,000        from base 1000 to the end of the reference
//   chr1:1,000-2,000  bases 1000..2000
//
// A parsed Region is 0-based half-open.
// =============================================================================

#ifndef ALN_STORE_REGION_H
#define ALN_STORE_REGION_H

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "aln/common/error.h"

namespace aln::store {

struct Region {
    std::string referenceName;

    /// @brief 0-based inclusive start.
    std::int64_t begin = 0;

    /// @brief 0-based exclusive end, std::nullopt for the end of the reference.
    std::optional<std::int64_t> end;

    /// @brief Parse a region string. The name ends at the last ':'.
    /// @return kInvalidArgument for an empty name, non-numeric or zero
    ///         coordinates, or an end before the start.
    [[nodiscard]] static Result<Region> parse(std::string_view text);

    /// @brief Whole-reference region.
    [[nodiscard]] static Region whole(std::string referenceName) {
        return Region{std::move(referenceName), 0, std::nullopt};
    }

    /// @brief Back to 1-based inclusive text.
    [[nodiscard]] std::string toString() const;

    bool operator==(const Region&) const = default;
};

}  // namespace aln::store

#endif  // ALN_STORE_REGION_H
