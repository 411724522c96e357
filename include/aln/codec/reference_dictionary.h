// =============================================================================
// alnstore - Reference Dictionary
// =============================================================================
// Ordered reference sequences (name, length). The position of a reference in
// the dictionary is its ReferenceId in binary records and in the index.
// =============================================================================

#ifndef ALN_CODEC_REFERENCE_DICTIONARY_H
#define ALN_CODEC_REFERENCE_DICTIONARY_H

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "aln/common/error.h"
#include "aln/common/types.h"

namespace aln::codec {

struct ReferenceSequence {
    std::string name;
    std::uint32_t length = 0;

    bool operator==(const ReferenceSequence&) const = default;
};

class ReferenceDictionary {
public:
    ReferenceDictionary() = default;

    /// @brief Append a reference.
    /// @return Its id, or kInvalidArgument for a duplicate or invalid name.
    Result<ReferenceId> add(std::string name, std::uint32_t length);

    /// @brief Id of @p name, if present.
    [[nodiscard]] std::optional<ReferenceId> find(std::string_view name) const;

    /// @brief Reference at @p id, or nullptr when out of range.
    [[nodiscard]] const ReferenceSequence* at(ReferenceId id) const noexcept;

    [[nodiscard]] std::size_t size() const noexcept { return entries_.size(); }
    [[nodiscard]] bool empty() const noexcept { return entries_.empty(); }

    [[nodiscard]] const std::vector<ReferenceSequence>& entries() const noexcept {
        return entries_;
    }

    bool operator==(const ReferenceDictionary& other) const { return entries_ == other.entries_; }

private:
    std::vector<ReferenceSequence> entries_;
    std::unordered_map<std::string, ReferenceId> byName_;
};

}  // namespace aln::codec

#endif  // ALN_CODEC_REFERENCE_DICTIONARY_H
