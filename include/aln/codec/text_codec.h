// =============================================================================
// alnstore - Text Record Codec
// =============================================================================
// Tab-delimited text form of an alignment record (one line per record):
//
//   QNAME FLAG RNAME POS MAPQ CIGAR RNEXT PNEXT TLEN SEQ QUAL [TAG:TYPE:VALUE]...
//
// Decoding normalises RNEXT "=" to the reference name and lowercase bases to
// uppercase. Encoding writes "=" back when the mate is on the same reference.
// =============================================================================

#ifndef ALN_CODEC_TEXT_CODEC_H
#define ALN_CODEC_TEXT_CODEC_H

#include <string>
#include <string_view>

#include "aln/codec/alignment_record.h"
#include "aln/common/error.h"

namespace aln::codec {

/// @brief Number of mandatory tab-separated columns.
inline constexpr std::size_t kMandatoryColumns = 11;

/// @brief Parse a CIGAR string. "*" yields an empty CIGAR.
[[nodiscard]] Result<Cigar> parseCigar(std::string_view text);

/// @brief Format a CIGAR. An empty CIGAR yields "*".
[[nodiscard]] std::string formatCigar(const Cigar& cigar);

/// @brief Parse one optional field, e.g. "NM:i:3" or "ZB:B:s,1,-2".
[[nodiscard]] Result<Tag> parseTag(std::string_view text);

/// @brief Format one optional field.
[[nodiscard]] std::string formatTag(const Tag& tag);

/// @brief Text line codec.
class TextCodec {
public:
    /// @brief Decode one line. Trailing CR/LF are ignored.
    /// @return The record, or kMalformedRecord naming the offending column.
    [[nodiscard]] static Result<AlignmentRecord> decode(std::string_view line);

    /// @brief Encode a record as one line without the trailing newline.
    [[nodiscard]] static std::string encode(const AlignmentRecord& record);

    /// @brief Append the encoded line to @p out.
    static void encodeTo(const AlignmentRecord& record, std::string& out);
};

}  // namespace aln::codec

#endif  // ALN_CODEC_TEXT_CODEC_H
