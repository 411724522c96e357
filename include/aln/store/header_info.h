// =============================================================================
// alnstore - Header Metadata
// =============================================================================
// Header lines in their original order plus the reference table derived from
// the @SQ lines. Every stored line starts with '@'; free text is kept as an
// @CO comment.
// =============================================================================

#ifndef ALN_STORE_HEADER_INFO_H
#define ALN_STORE_HEADER_INFO_H

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "aln/codec/reference_dictionary.h"
#include "aln/common/error.h"
#include "aln/common/types.h"

namespace aln::store {

class HeaderInfo {
public:
    HeaderInfo() = default;

    /// @brief Parse newline-separated header text.
    /// @return kInvalidArgument for an @SQ line without a valid SN or LN, or
    ///         for a reference named twice.
    [[nodiscard]] static Result<HeaderInfo> fromText(std::string_view text);

    /// @brief Append one line. Empty lines are ignored.
    [[nodiscard]] VoidResult addLine(std::string_view line);

    /// @brief Append a reference and its @SQ line.
    [[nodiscard]] VoidResult addReference(std::string name, std::uint32_t length);

    /// @brief Lines in original order, each starting with '@'.
    [[nodiscard]] const std::vector<std::string>& lines() const noexcept { return lines_; }

    /// @brief Lines joined with '\n', each newline-terminated.
    [[nodiscard]] std::string toText() const;

    [[nodiscard]] const codec::ReferenceDictionary& references() const noexcept {
        return references_;
    }

    [[nodiscard]] std::optional<ReferenceId> referenceId(std::string_view name) const {
        return references_.find(name);
    }

    [[nodiscard]] bool empty() const noexcept { return lines_.empty(); }

    bool operator==(const HeaderInfo& other) const { return lines_ == other.lines_; }

private:
    std::vector<std::string> lines_;
    codec::ReferenceDictionary references_;
};

}  // namespace aln::store

#endif  // ALN_STORE_HEADER_INFO_H
