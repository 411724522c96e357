// =============================================================================
// alnstore - Text Record Codec Implementation
// =============================================================================

#include "aln/codec/text_codec.h"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <iterator>
#include <limits>
#include <vector>

#include <fmt/format.h>

namespace aln::codec {

namespace {

template <typename T>
Result<T> malformed(std::string message) {
    return makeError<T>(ErrorCode::kMalformedRecord, std::move(message));
}

/// Parse the whole of @p text as an integer in [lo, hi].
std::optional<std::int64_t> parseInteger(std::string_view text, std::int64_t lo,
                                         std::int64_t hi) {
    std::int64_t value = 0;
    const char* first = text.data();
    const char* last = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (text.empty() || ec != std::errc{} || ptr != last || value < lo || value > hi) {
        return std::nullopt;
    }
    return value;
}

std::optional<float> parseFloat(std::string_view text) {
    float value = 0.0F;
    const char* last = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(text.data(), last, value);
    if (text.empty() || ec != std::errc{} || ptr != last) {
        return std::nullopt;
    }
    return value;
}

std::vector<std::string_view> splitFields(std::string_view line, char delimiter) {
    std::vector<std::string_view> fields;
    std::size_t start = 0;
    while (true) {
        auto pos = line.find(delimiter, start);
        if (pos == std::string_view::npos) {
            fields.push_back(line.substr(start));
            break;
        }
        fields.push_back(line.substr(start, pos - start));
        start = pos + 1;
    }
    return fields;
}

Result<TagArray> parseTagArray(std::string_view key, std::string_view text) {
    auto parts = splitFields(text, ',');
    TagArray array;
    if (parts.front().size() != 1) {
        return malformed<TagArray>(fmt::format("tag {}: missing array subtype", key));
    }
    array.subtype = parts.front().front();
    for (std::size_t i = 1; i < parts.size(); ++i) {
        if (array.subtype == 'f') {
            auto value = parseFloat(parts[i]);
            if (!value) {
                return malformed<TagArray>(
                    fmt::format("tag {}: invalid array element '{}'", key, parts[i]));
            }
            array.floats.push_back(*value);
        } else {
            auto value = parseInteger(parts[i], std::numeric_limits<std::int64_t>::min(),
                                      std::numeric_limits<std::int64_t>::max());
            if (!value) {
                return malformed<TagArray>(
                    fmt::format("tag {}: invalid array element '{}'", key, parts[i]));
            }
            array.integers.push_back(*value);
        }
    }
    return array;
}

}  // namespace

// =============================================================================
// CIGAR
// =============================================================================

Result<Cigar> parseCigar(std::string_view text) {
    Cigar cigar;
    if (text == kMissingField) {
        return cigar;
    }
    if (text.empty()) {
        return malformed<Cigar>("CIGAR: empty");
    }

    std::size_t i = 0;
    while (i < text.size()) {
        std::size_t digitsEnd = i;
        while (digitsEnd < text.size() && std::isdigit(static_cast<unsigned char>(text[digitsEnd]))) {
            ++digitsEnd;
        }
        if (digitsEnd == i || digitsEnd == text.size()) {
            return malformed<Cigar>(fmt::format("CIGAR: invalid syntax '{}'", text));
        }
        auto length = parseInteger(text.substr(i, digitsEnd - i), 1, kMaxCigarLength);
        auto op = cigarOpFromChar(text[digitsEnd]);
        if (!length || !op) {
            return malformed<Cigar>(fmt::format("CIGAR: invalid element in '{}'", text));
        }
        cigar.push_back({static_cast<std::uint32_t>(*length), *op});
        i = digitsEnd + 1;
    }
    return cigar;
}

std::string formatCigar(const Cigar& cigar) {
    if (cigar.empty()) {
        return std::string(kMissingField);
    }
    std::string out;
    for (const auto& element : cigar) {
        fmt::format_to(std::back_inserter(out), "{}{}", element.length, cigarOpToChar(element.op));
    }
    return out;
}

// =============================================================================
// Tags
// =============================================================================

Result<Tag> parseTag(std::string_view text) {
    if (text.size() < 5 || text[2] != ':' || text[4] != ':') {
        return malformed<Tag>(fmt::format("TAG: invalid field '{}'", text));
    }

    Tag tag;
    tag.key = std::string(text.substr(0, 2));
    tag.type = text[3];
    std::string_view value = text.substr(5);

    switch (tag.type) {
        case 'A':
            if (value.size() != 1) {
                return malformed<Tag>(fmt::format("tag {}: type A needs one character", tag.key));
            }
            tag.value = value.front();
            break;
        case 'i': {
            auto parsed = parseInteger(value, std::numeric_limits<std::int64_t>::min(),
                                       std::numeric_limits<std::int64_t>::max());
            if (!parsed) {
                return malformed<Tag>(fmt::format("tag {}: invalid integer '{}'", tag.key, value));
            }
            tag.value = *parsed;
            break;
        }
        case 'f': {
            auto parsed = parseFloat(value);
            if (!parsed) {
                return malformed<Tag>(fmt::format("tag {}: invalid float '{}'", tag.key, value));
            }
            tag.value = *parsed;
            break;
        }
        case 'Z':
        case 'H':
            tag.value = std::string(value);
            break;
        case 'B': {
            auto array = parseTagArray(tag.key, value);
            if (!array) {
                return std::unexpected(array.error());
            }
            tag.value = std::move(*array);
            break;
        }
        default:
            return malformed<Tag>(fmt::format("tag {}: unknown type '{}'", tag.key, tag.type));
    }

    if (auto valid = tag.validate(); !valid) {
        return std::unexpected(valid.error());
    }
    return tag;
}

std::string formatTag(const Tag& tag) {
    std::string out = fmt::format("{}:{}:", tag.key, tag.type);
    auto sink = std::back_inserter(out);

    if (const auto* c = std::get_if<char>(&tag.value)) {
        out.push_back(*c);
    } else if (const auto* i = std::get_if<std::int64_t>(&tag.value)) {
        fmt::format_to(sink, "{}", *i);
    } else if (const auto* f = std::get_if<float>(&tag.value)) {
        fmt::format_to(sink, "{}", *f);
    } else if (const auto* s = std::get_if<std::string>(&tag.value)) {
        out += *s;
    } else if (const auto* array = std::get_if<TagArray>(&tag.value)) {
        out.push_back(array->subtype);
        if (array->subtype == 'f') {
            for (float v : array->floats) {
                fmt::format_to(sink, ",{}", v);
            }
        } else {
            for (std::int64_t v : array->integers) {
                fmt::format_to(sink, ",{}", v);
            }
        }
    }
    return out;
}

// =============================================================================
// TextCodec
// =============================================================================

Result<AlignmentRecord> TextCodec::decode(std::string_view line) {
    while (!line.empty() && (line.back() == '\n' || line.back() == '\r')) {
        line.remove_suffix(1);
    }

    auto fields = splitFields(line, '\t');
    if (fields.size() < kMandatoryColumns) {
        return malformed<AlignmentRecord>(
            fmt::format("expected at least {} columns, got {}", kMandatoryColumns, fields.size()));
    }

    AlignmentRecord record;
    record.queryName = std::string(fields[0]);

    auto flag = parseInteger(fields[1], 0, std::numeric_limits<std::uint16_t>::max());
    if (!flag) {
        return malformed<AlignmentRecord>(fmt::format("FLAG: invalid value '{}'", fields[1]));
    }
    record.flag = static_cast<std::uint16_t>(*flag);

    record.referenceName = std::string(fields[2]);

    auto position = parseInteger(fields[3], 0, kMaxPosition);
    if (!position) {
        return malformed<AlignmentRecord>(fmt::format("POS: invalid value '{}'", fields[3]));
    }
    record.position = *position;

    auto mapq = parseInteger(fields[4], 0, std::numeric_limits<std::uint8_t>::max());
    if (!mapq) {
        return malformed<AlignmentRecord>(fmt::format("MAPQ: invalid value '{}'", fields[4]));
    }
    record.mappingQuality = static_cast<std::uint8_t>(*mapq);

    auto cigar = parseCigar(fields[5]);
    if (!cigar) {
        return std::unexpected(cigar.error());
    }
    record.cigar = std::move(*cigar);

    record.mateReferenceName =
        fields[6] == "=" ? record.referenceName : std::string(fields[6]);

    auto matePosition = parseInteger(fields[7], 0, kMaxPosition);
    if (!matePosition) {
        return malformed<AlignmentRecord>(fmt::format("PNEXT: invalid value '{}'", fields[7]));
    }
    record.matePosition = *matePosition;

    auto templateLength = parseInteger(fields[8], std::numeric_limits<std::int32_t>::min(),
                                       std::numeric_limits<std::int32_t>::max());
    if (!templateLength) {
        return malformed<AlignmentRecord>(fmt::format("TLEN: invalid value '{}'", fields[8]));
    }
    record.templateLength = *templateLength;

    if (fields[9] != kMissingField) {
        record.sequence = std::string(fields[9]);
        std::transform(record.sequence.begin(), record.sequence.end(), record.sequence.begin(),
                       [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    }

    record.quality = std::string(fields[10]);

    for (std::size_t i = kMandatoryColumns; i < fields.size(); ++i) {
        auto tag = parseTag(fields[i]);
        if (!tag) {
            return std::unexpected(tag.error());
        }
        record.tags.push_back(std::move(*tag));
    }

    if (auto valid = record.validate(); !valid) {
        return std::unexpected(valid.error());
    }
    return record;
}

void TextCodec::encodeTo(const AlignmentRecord& record, std::string& out) {
    const bool sameReference = record.mateReferenceName != kMissingField &&
                               record.mateReferenceName == record.referenceName;

    fmt::format_to(std::back_inserter(out), "{}\t{}\t{}\t{}\t{}\t{}\t{}\t{}\t{}\t{}\t{}",
                   record.queryName, record.flag, record.referenceName, record.position,
                   record.mappingQuality, formatCigar(record.cigar),
                   sameReference ? std::string_view("=") : std::string_view(record.mateReferenceName),
                   record.matePosition, record.templateLength,
                   record.sequence.empty() ? kMissingField : std::string_view(record.sequence),
                   record.quality);

    for (const auto& tag : record.tags) {
        out.push_back('\t');
        out += formatTag(tag);
    }
}

std::string TextCodec::encode(const AlignmentRecord& record) {
    std::string out;
    encodeTo(record, out);
    return out;
}

}  // namespace aln::codec
