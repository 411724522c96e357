// =============================================================================
// alnstore - Hierarchical Binning Scheme
// =============================================================================
// The UCSC/BAM binning scheme with a minimum shift of 14 and depth 5:
//
//   level 0: bin 0          one bin over [0, 512 Mb)
//   level 1: bins 1..8      64 Mb each
//   level 2: bins 9..72     8 Mb each
//   level 3: bins 73..584   1 Mb each
//   level 4: bins 585..4680 128 Kb each
//   level 5: bins 4681..    16 Kb each
//
// All coordinates are 0-based half-open. Coordinates at or beyond 2^29 are
// clamped into the last bin of each level.
// =============================================================================

#ifndef ALN_INDEX_BIN_SCHEME_H
#define ALN_INDEX_BIN_SCHEME_H

#include <algorithm>
#include <array>
#include <cstdint>
#include <utility>
#include <vector>

namespace aln::index {

inline constexpr int kMinShift = 14;
inline constexpr int kDepth = 5;

/// @brief Exclusive upper bound of indexable coordinates (2^29).
inline constexpr std::int64_t kMaxCoordinate = std::int64_t{1} << (kMinShift + 3 * kDepth);

/// @brief First bin id of each level, level 0 first.
inline constexpr std::array<std::uint32_t, kDepth + 1> kLevelOffsets = {0, 1, 9, 73, 585, 4681};

/// @brief Total number of bins (37449).
inline constexpr std::uint32_t kBinCount = (1U << (3 * (kDepth + 1))) / 7;

/// @brief Bin of an unplaced record (reg2bin(-1, 0)).
inline constexpr std::uint16_t kUnplacedBin = 4680;

/// @brief Clamp a 0-based half-open interval into [0, kMaxCoordinate).
/// @note The result always spans at least one base.
[[nodiscard]] constexpr std::pair<std::int64_t, std::int64_t> clampInterval(
    std::int64_t begin, std::int64_t end) noexcept {
    begin = std::clamp<std::int64_t>(begin, 0, kMaxCoordinate - 1);
    end = std::clamp<std::int64_t>(end, begin + 1, kMaxCoordinate);
    return {begin, end};
}

/// @brief Smallest bin fully containing [begin, end).
[[nodiscard]] constexpr std::uint32_t regionToBin(std::int64_t begin, std::int64_t end) noexcept {
    auto [beg, last] = clampInterval(begin, end);
    --last;
    for (int level = kDepth; level > 0; --level) {
        const int shift = kMinShift + 3 * (kDepth - level);
        if ((beg >> shift) == (last >> shift)) {
            return kLevelOffsets[level] + static_cast<std::uint32_t>(beg >> shift);
        }
    }
    return 0;
}

/// @brief Every bin that may hold a record overlapping [begin, end).
/// @note Empty when the interval is empty. Intervals at or beyond 2^29 visit
/// the last bin of each level, where regionToBin() places such records.
[[nodiscard]] inline std::vector<std::uint32_t> regionToBins(std::int64_t begin,
                                                             std::int64_t end) {
    std::vector<std::uint32_t> bins;
    if (end <= begin || end <= 0) {
        return bins;
    }
    auto [beg, last] = clampInterval(begin, end);
    --last;
    bins.push_back(0);
    for (int level = 1; level <= kDepth; ++level) {
        const int shift = kMinShift + 3 * (kDepth - level);
        for (auto k = kLevelOffsets[level] + static_cast<std::uint32_t>(beg >> shift);
             k <= kLevelOffsets[level] + static_cast<std::uint32_t>(last >> shift); ++k) {
            bins.push_back(k);
        }
    }
    return bins;
}

/// @brief Level of a bin id, 0 for the root.
[[nodiscard]] constexpr int binLevel(std::uint32_t bin) noexcept {
    for (int level = kDepth; level > 0; --level) {
        if (bin >= kLevelOffsets[level]) {
            return level;
        }
    }
    return 0;
}

static_assert(kMaxCoordinate == 536870912, "binning covers 512 Mb");
static_assert(kBinCount == 37449, "BAM-compatible bin count");
static_assert(regionToBin(0, 1) == 4681, "first 16 Kb bin");
static_assert(regionToBin(0, std::int64_t{1} << 14) == 4681, "bin holds a full 16 Kb window");
static_assert(regionToBin(16383, 16385) == 585, "straddling record moves up a level");
static_assert(regionToBin(0, kMaxCoordinate) == 0, "whole range maps to the root bin");
static_assert(regionToBin(kMaxCoordinate + 10, kMaxCoordinate + 20) == kBinCount - 1,
              "coordinates past 2^29 land in the last leaf bin");

}  // namespace aln::index

#endif  // ALN_INDEX_BIN_SCHEME_H
