// =============================================================================
// alnstore - Reference Dictionary Implementation
// =============================================================================

#include "aln/codec/reference_dictionary.h"

#include <algorithm>
#include <limits>

#include <fmt/format.h>

namespace aln::codec {

Result<ReferenceId> ReferenceDictionary::add(std::string name, std::uint32_t length) {
    if (name.empty() || name == "*" || name.front() == '=' ||
        std::any_of(name.begin(), name.end(), [](char c) { return c < '!' || c > '~'; })) {
        return makeError<ReferenceId>(ErrorCode::kInvalidArgument,
                                      fmt::format("invalid reference name '{}'", name));
    }
    if (byName_.contains(name)) {
        return makeError<ReferenceId>(ErrorCode::kInvalidArgument,
                                      fmt::format("duplicate reference name '{}'", name));
    }
    if (entries_.size() >= static_cast<std::size_t>(std::numeric_limits<ReferenceId>::max())) {
        return makeError<ReferenceId>(ErrorCode::kInvalidArgument, "too many references");
    }

    auto id = static_cast<ReferenceId>(entries_.size());
    byName_.emplace(name, id);
    entries_.push_back({std::move(name), length});
    return id;
}

std::optional<ReferenceId> ReferenceDictionary::find(std::string_view name) const {
    auto it = byName_.find(std::string(name));
    if (it == byName_.end()) {
        return std::nullopt;
    }
    return it->second;
}

const ReferenceSequence* ReferenceDictionary::at(ReferenceId id) const noexcept {
    if (id < 0 || static_cast<std::size_t>(id) >= entries_.size()) {
        return nullptr;
    }
    return &entries_[static_cast<std::size_t>(id)];
}

}  // namespace aln::codec
