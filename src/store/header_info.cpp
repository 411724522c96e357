// =============================================================================
// alnstore - Header Metadata Implementation
// =============================================================================

#include "aln/store/header_info.h"

#include <charconv>
#include <limits>

#include <fmt/format.h>

namespace aln::store {

namespace {

constexpr std::string_view kReferenceLinePrefix = "@SQ";
constexpr std::string_view kCommentLinePrefix = "@CO\t";

std::string_view trimLineEnd(std::string_view line) {
    while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) {
        line.remove_suffix(1);
    }
    return line;
}

bool isReferenceLine(std::string_view line) {
    return line.starts_with(kReferenceLinePrefix) &&
           (line.size() == kReferenceLinePrefix.size() ||
            line[kReferenceLinePrefix.size()] == '\t');
}

struct ReferenceFields {
    std::string name;
    std::uint32_t length = 0;
};

Result<ReferenceFields> parseReferenceLine(std::string_view line) {
    std::optional<std::string_view> name;
    std::optional<std::string_view> length;

    std::size_t start = kReferenceLinePrefix.size();
    while (start < line.size()) {
        ++start;  // tab
        auto end = line.find('\t', start);
        if (end == std::string_view::npos) {
            end = line.size();
        }
        auto field = line.substr(start, end - start);
        if (field.starts_with("SN:")) {
            name = field.substr(3);
        } else if (field.starts_with("LN:")) {
            length = field.substr(3);
        }
        start = end;
    }

    if (!name || name->empty()) {
        return makeError<ReferenceFields>(ErrorCode::kInvalidArgument,
                                          fmt::format("@SQ line without SN: '{}'", line));
    }
    if (!length) {
        return makeError<ReferenceFields>(ErrorCode::kInvalidArgument,
                                          fmt::format("@SQ line without LN: '{}'", line));
    }

    std::int64_t value = 0;
    const char* last = length->data() + length->size();
    auto [ptr, ec] = std::from_chars(length->data(), last, value);
    if (length->empty() || ec != std::errc{} || ptr != last || value < 1 ||
        value > std::numeric_limits<std::int32_t>::max()) {
        return makeError<ReferenceFields>(
            ErrorCode::kInvalidArgument,
            fmt::format("@SQ {}: invalid LN '{}'", *name, *length));
    }
    return ReferenceFields{std::string(*name), static_cast<std::uint32_t>(value)};
}

}  // namespace

Result<HeaderInfo> HeaderInfo::fromText(std::string_view text) {
    HeaderInfo header;
    std::size_t start = 0;
    while (start < text.size()) {
        auto end = text.find('\n', start);
        if (end == std::string_view::npos) {
            end = text.size();
        }
        if (auto added = header.addLine(text.substr(start, end - start)); !added) {
            return std::unexpected(added.error());
        }
        start = end + 1;
    }
    return header;
}

VoidResult HeaderInfo::addLine(std::string_view line) {
    line = trimLineEnd(line);
    if (line.empty()) {
        return makeVoidSuccess();
    }

    if (!line.starts_with('@')) {
        lines_.push_back(std::string(kCommentLinePrefix) + std::string(line));
        return makeVoidSuccess();
    }

    if (isReferenceLine(line)) {
        auto fields = parseReferenceLine(line);
        if (!fields) {
            return std::unexpected(fields.error());
        }
        if (auto id = references_.add(std::move(fields->name), fields->length); !id) {
            return std::unexpected(id.error());
        }
    }

    lines_.emplace_back(line);
    return makeVoidSuccess();
}

VoidResult HeaderInfo::addReference(std::string name, std::uint32_t length) {
    if (length == 0 || length > static_cast<std::uint32_t>(std::numeric_limits<std::int32_t>::max())) {
        return makeVoidError(ErrorCode::kInvalidArgument,
                             fmt::format("reference {}: invalid length {}", name, length));
    }
    auto line = fmt::format("@SQ\tSN:{}\tLN:{}", name, length);
    if (auto id = references_.add(std::move(name), length); !id) {
        return std::unexpected(id.error());
    }
    lines_.push_back(std::move(line));
    return makeVoidSuccess();
}

std::string HeaderInfo::toText() const {
    std::string text;
    for (const auto& line : lines_) {
        text += line;
        text += '\n';
    }
    return text;
}

}  // namespace aln::store
