// =============================================================================
// alnstore - Block Compression Primitives
// =============================================================================
// Pluggable compression for block payloads. Each block records the CodecId
// it was written with, so a reader can decode blocks from any codec.
//
// Implementations:
// - RawCompressor     (kRaw)     stores bytes unchanged
// - ZstdCompressor    (kZstd)    one Zstandard frame per block
// - DeflateCompressor (kDeflate) raw deflate stream, no zlib/gzip wrapper
// =============================================================================

#ifndef ALN_CODEC_COMPRESSOR_H
#define ALN_CODEC_COMPRESSOR_H

#include <cstdint>
#include <memory>
#include <span>
#include <string_view>
#include <vector>

#include "aln/common/error.h"
#include "aln/common/types.h"

namespace aln::codec {

/// @brief Compression primitive used for block payloads.
/// @note Implementations are stateless and safe to share across threads.
class Compressor {
public:
    virtual ~Compressor() = default;

    /// @brief Codec id written into each block header.
    [[nodiscard]] virtual CodecId id() const noexcept = 0;

    /// @brief Compress @p data as one independent unit.
    [[nodiscard]] virtual Result<std::vector<std::uint8_t>> compress(
        std::span<const std::uint8_t> data) const = 0;

    /// @brief Decompress a unit produced by compress().
    /// @param uncompressedSize Exact size recorded at compression time.
    /// @return kCorruptBlock if the payload cannot be decoded to that size.
    [[nodiscard]] virtual Result<std::vector<std::uint8_t>> decompress(
        std::span<const std::uint8_t> data, std::size_t uncompressedSize) const = 0;

    [[nodiscard]] std::string_view name() const noexcept { return codecIdToString(id()); }
};

class RawCompressor final : public Compressor {
public:
    [[nodiscard]] CodecId id() const noexcept override { return CodecId::kRaw; }

    [[nodiscard]] Result<std::vector<std::uint8_t>> compress(
        std::span<const std::uint8_t> data) const override;

    [[nodiscard]] Result<std::vector<std::uint8_t>> decompress(
        std::span<const std::uint8_t> data, std::size_t uncompressedSize) const override;
};

class ZstdCompressor final : public Compressor {
public:
    explicit ZstdCompressor(CompressionLevel level = kDefaultZstdLevel) : level_(level) {}

    [[nodiscard]] CodecId id() const noexcept override { return CodecId::kZstd; }

    [[nodiscard]] Result<std::vector<std::uint8_t>> compress(
        std::span<const std::uint8_t> data) const override;

    [[nodiscard]] Result<std::vector<std::uint8_t>> decompress(
        std::span<const std::uint8_t> data, std::size_t uncompressedSize) const override;

    [[nodiscard]] CompressionLevel level() const noexcept { return level_; }

private:
    CompressionLevel level_;
};

class DeflateCompressor final : public Compressor {
public:
    explicit DeflateCompressor(CompressionLevel level = kDefaultDeflateLevel) : level_(level) {}

    [[nodiscard]] CodecId id() const noexcept override { return CodecId::kDeflate; }

    [[nodiscard]] Result<std::vector<std::uint8_t>> compress(
        std::span<const std::uint8_t> data) const override;

    [[nodiscard]] Result<std::vector<std::uint8_t>> decompress(
        std::span<const std::uint8_t> data, std::size_t uncompressedSize) const override;

    [[nodiscard]] CompressionLevel level() const noexcept { return level_; }

private:
    CompressionLevel level_;
};

/// @brief Create the built-in compressor for @p id.
/// @param level Codec level, 0 for the codec default.
/// @return kUnsupportedCodec for unknown ids.
[[nodiscard]] Result<std::shared_ptr<const Compressor>> makeCompressor(CodecId id,
                                                                       CompressionLevel level = 0);

/// @brief Resolve a codec byte read from a file.
[[nodiscard]] Result<std::shared_ptr<const Compressor>> compressorForStoredId(std::uint8_t id);

}  // namespace aln::codec

#endif  // ALN_CODEC_COMPRESSOR_H
