// =============================================================================
// alnstore - Alignment Record Implementation
// =============================================================================

#include "aln/codec/alignment_record.h"

#include <algorithm>
#include <cctype>
#include <limits>

#include <fmt/format.h>

namespace aln::codec {

namespace {

constexpr std::size_t kMaxQueryNameLength = 254;
constexpr std::size_t kMaxCigarOps = std::numeric_limits<std::uint16_t>::max();

VoidResult malformed(std::string message) {
    return makeVoidError(ErrorCode::kMalformedRecord, std::move(message));
}

bool isPrintable(char c) noexcept {
    return c >= '!' && c <= '~';
}

/// Reference names: printable, no leading '*' or '=' unless exactly "*".
bool isValidReferenceName(std::string_view name) noexcept {
    if (name.empty()) {
        return false;
    }
    if (name == kMissingField) {
        return true;
    }
    if (name.front() == '*' || name.front() == '=') {
        return false;
    }
    return std::all_of(name.begin(), name.end(), isPrintable);
}

bool fitsSubtype(char subtype, std::int64_t value) noexcept {
    switch (subtype) {
        case 'c':
            return value >= std::numeric_limits<std::int8_t>::min() &&
                   value <= std::numeric_limits<std::int8_t>::max();
        case 'C':
            return value >= 0 && value <= std::numeric_limits<std::uint8_t>::max();
        case 's':
            return value >= std::numeric_limits<std::int16_t>::min() &&
                   value <= std::numeric_limits<std::int16_t>::max();
        case 'S':
            return value >= 0 && value <= std::numeric_limits<std::uint16_t>::max();
        case 'i':
            return value >= std::numeric_limits<std::int32_t>::min() &&
                   value <= std::numeric_limits<std::int32_t>::max();
        case 'I':
            return value >= 0 && value <= std::numeric_limits<std::uint32_t>::max();
        default:
            return false;
    }
}

}  // namespace

// =============================================================================
// Tag
// =============================================================================

VoidResult Tag::validate() const {
    if (key.size() != 2 || std::isalpha(static_cast<unsigned char>(key[0])) == 0 ||
        std::isalnum(static_cast<unsigned char>(key[1])) == 0) {
        return malformed(fmt::format("invalid tag key '{}'", key));
    }

    switch (type) {
        case 'A': {
            const auto* c = std::get_if<char>(&value);
            if (c == nullptr || !isPrintable(*c)) {
                return malformed(fmt::format("tag {}: type A needs one printable character", key));
            }
            break;
        }
        case 'i': {
            const auto* v = std::get_if<std::int64_t>(&value);
            if (v == nullptr || *v < std::numeric_limits<std::int32_t>::min() ||
                *v > static_cast<std::int64_t>(std::numeric_limits<std::uint32_t>::max())) {
                return malformed(fmt::format("tag {}: integer out of range", key));
            }
            break;
        }
        case 'f':
            if (!std::holds_alternative<float>(value)) {
                return malformed(fmt::format("tag {}: type f needs a float", key));
            }
            break;
        case 'Z': {
            const auto* s = std::get_if<std::string>(&value);
            if (s == nullptr ||
                !std::all_of(s->begin(), s->end(), [](char c) { return c >= ' ' && c <= '~'; })) {
                return malformed(fmt::format("tag {}: invalid string value", key));
            }
            break;
        }
        case 'H': {
            const auto* s = std::get_if<std::string>(&value);
            if (s == nullptr || s->size() % 2 != 0 ||
                !std::all_of(s->begin(), s->end(), [](char c) {
                    return std::isxdigit(static_cast<unsigned char>(c)) != 0;
                })) {
                return malformed(fmt::format("tag {}: invalid hex value", key));
            }
            break;
        }
        case 'B': {
            const auto* array = std::get_if<TagArray>(&value);
            if (array == nullptr) {
                return malformed(fmt::format("tag {}: type B needs an array", key));
            }
            if (array->subtype == 'f') {
                if (!array->integers.empty()) {
                    return malformed(fmt::format("tag {}: float array holds integers", key));
                }
                break;
            }
            if (std::string_view("cCsSiI").find(array->subtype) == std::string_view::npos) {
                return malformed(
                    fmt::format("tag {}: unknown array subtype '{}'", key, array->subtype));
            }
            if (!array->floats.empty()) {
                return malformed(fmt::format("tag {}: integer array holds floats", key));
            }
            for (auto v : array->integers) {
                if (!fitsSubtype(array->subtype, v)) {
                    return malformed(fmt::format("tag {}: value {} does not fit subtype {}", key,
                                                 v, array->subtype));
                }
            }
            break;
        }
        default:
            return malformed(fmt::format("tag {}: unknown type '{}'", key, type));
    }
    return makeVoidSuccess();
}

// =============================================================================
// AlignmentRecord
// =============================================================================

std::int64_t referenceSpan(const Cigar& cigar) noexcept {
    std::int64_t span = 0;
    for (const auto& element : cigar) {
        if (consumesReference(element.op)) {
            span += element.length;
        }
    }
    return std::max<std::int64_t>(span, 1);
}

std::int64_t AlignmentRecord::referenceSpan() const noexcept {
    return codec::referenceSpan(cigar);
}

std::int64_t AlignmentRecord::cigarQueryLength() const noexcept {
    std::int64_t length = 0;
    for (const auto& element : cigar) {
        if (consumesQuery(element.op)) {
            length += element.length;
        }
    }
    return length;
}

const Tag* AlignmentRecord::findTag(std::string_view key) const noexcept {
    auto it = std::find_if(tags.begin(), tags.end(), [key](const Tag& t) { return t.key == key; });
    return it == tags.end() ? nullptr : &*it;
}

VoidResult AlignmentRecord::validate() const {
    if (queryName.empty() || queryName.size() > kMaxQueryNameLength ||
        !std::all_of(queryName.begin(), queryName.end(),
                     [](char c) { return isPrintable(c) && c != '@'; })) {
        return malformed(fmt::format("QNAME: invalid query name '{}'", queryName));
    }

    if (!isValidReferenceName(referenceName)) {
        return malformed(fmt::format("RNAME: invalid reference name '{}'", referenceName));
    }

    if (position < 0 || position > kMaxPosition) {
        return malformed(fmt::format("POS: {} out of range", position));
    }

    if (!isValidReferenceName(mateReferenceName)) {
        return malformed(
            fmt::format("RNEXT: invalid mate reference name '{}'", mateReferenceName));
    }

    if (matePosition < 0 || matePosition > kMaxPosition) {
        return malformed(fmt::format("PNEXT: {} out of range", matePosition));
    }

    if (templateLength < std::numeric_limits<std::int32_t>::min() ||
        templateLength > std::numeric_limits<std::int32_t>::max()) {
        return malformed(fmt::format("TLEN: {} does not fit 32 bits", templateLength));
    }

    if (cigar.size() > kMaxCigarOps) {
        return malformed(fmt::format("CIGAR: {} operations exceed the limit", cigar.size()));
    }
    for (const auto& element : cigar) {
        if (element.length == 0 || element.length > kMaxCigarLength) {
            return malformed(fmt::format("CIGAR: invalid length {}", element.length));
        }
        if (static_cast<std::size_t>(element.op) >= kCigarOpChars.size()) {
            return malformed("CIGAR: invalid operation");
        }
    }
    if (!cigar.empty() && !sequence.empty() &&
        cigarQueryLength() != static_cast<std::int64_t>(sequence.size())) {
        return malformed(fmt::format("CIGAR: query length {} differs from sequence length {}",
                                     cigarQueryLength(), sequence.size()));
    }

    auto badBase = std::find_if_not(sequence.begin(), sequence.end(), isSequenceChar);
    if (badBase != sequence.end()) {
        return malformed(fmt::format("SEQ: invalid base '{}'", *badBase));
    }

    if (quality.empty()) {
        return malformed("QUAL: empty, use '*' when unavailable");
    }
    if (hasQuality()) {
        if (quality.size() != sequence.size()) {
            return malformed(fmt::format("QUAL: length {} differs from sequence length {}",
                                         quality.size(), sequence.size()));
        }
        if (!std::all_of(quality.begin(), quality.end(), isQualityChar)) {
            return malformed("QUAL: character outside '!'..'~'");
        }
    }

    for (std::size_t i = 0; i < tags.size(); ++i) {
        if (auto result = tags[i].validate(); !result) {
            return result;
        }
        for (std::size_t j = 0; j < i; ++j) {
            if (tags[j].key == tags[i].key) {
                return malformed(fmt::format("duplicate tag {}", tags[i].key));
            }
        }
    }

    return makeVoidSuccess();
}

}  // namespace aln::codec
