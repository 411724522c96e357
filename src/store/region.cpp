// =============================================================================
// alnstore - Genomic Region Implementation
// =============================================================================

#include "aln/store/region.h"

#include <charconv>
#include <limits>

#include <fmt/format.h>

namespace aln::store {

namespace {

Result<Region> invalidRegion(std::string_view text, std::string_view reason) {
    return makeError<Region>(ErrorCode::kInvalidArgument,
                             fmt::format("invalid region '{}': {}", text, reason));
}

/// Parse a 1-based coordinate, ignoring ',' separators.
std::optional<std::int64_t> parseCoordinate(std::string_view text) {
    std::string digits;
    digits.reserve(text.size());
    for (char c : text) {
        if (c != ',') {
            digits.push_back(c);
        }
    }

    std::int64_t value = 0;
    const char* last = digits.data() + digits.size();
    auto [ptr, ec] = std::from_chars(digits.data(), last, value);
    if (digits.empty() || ec != std::errc{} || ptr != last || value < 1 ||
        value > std::numeric_limits<std::int32_t>::max()) {
        return std::nullopt;
    }
    return value;
}

}  // namespace

Result<Region> Region::parse(std::string_view text) {
    const auto colon = text.rfind(':');
    if (colon == std::string_view::npos) {
        if (text.empty()) {
            return invalidRegion(text, "empty reference name");
        }
        return Region::whole(std::string(text));
    }

    Region region;
    region.referenceName = std::string(text.substr(0, colon));
    if (region.referenceName.empty()) {
        return invalidRegion(text, "empty reference name");
    }

    auto range = text.substr(colon + 1);
    const auto dash = range.find('-');

    auto start = parseCoordinate(range.substr(0, dash));
    if (!start) {
        return invalidRegion(text, "bad start coordinate");
    }
    region.begin = *start - 1;

    if (dash != std::string_view::npos && dash + 1 < range.size()) {
        auto stop = parseCoordinate(range.substr(dash + 1));
        if (!stop) {
            return invalidRegion(text, "bad end coordinate");
        }
        if (*stop < *start) {
            return invalidRegion(text, "end before start");
        }
        region.end = *stop;
    }
    return region;
}

std::string Region::toString() const {
    if (!end) {
        if (begin == 0) {
            return referenceName;
        }
        return fmt::format("{}:{}", referenceName, begin + 1);
    }
    return fmt::format("{}:{}-{}", referenceName, begin + 1, *end);
}

}  // namespace aln::store
