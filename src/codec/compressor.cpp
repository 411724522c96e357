// =============================================================================
// alnstore - Block Compression Primitives Implementation
// =============================================================================

#include "aln/codec/compressor.h"

#include <limits>

#include <fmt/format.h>
#include <zlib.h>
#include <zstd.h>

namespace aln::codec {

namespace {

Result<std::vector<std::uint8_t>> corrupt(std::string message) {
    return makeError<std::vector<std::uint8_t>>(ErrorCode::kCorruptBlock, std::move(message));
}

}  // namespace

// =============================================================================
// Raw
// =============================================================================

Result<std::vector<std::uint8_t>> RawCompressor::compress(
    std::span<const std::uint8_t> data) const {
    return std::vector<std::uint8_t>(data.begin(), data.end());
}

Result<std::vector<std::uint8_t>> RawCompressor::decompress(std::span<const std::uint8_t> data,
                                                            std::size_t uncompressedSize) const {
    if (data.size() != uncompressedSize) {
        return corrupt(fmt::format("raw payload holds {} bytes, expected {}", data.size(),
                                   uncompressedSize));
    }
    return std::vector<std::uint8_t>(data.begin(), data.end());
}

// =============================================================================
// Zstd
// =============================================================================

Result<std::vector<std::uint8_t>> ZstdCompressor::compress(
    std::span<const std::uint8_t> data) const {
    std::size_t compressBound = ZSTD_compressBound(data.size());
    std::vector<std::uint8_t> compressed(compressBound);

    std::size_t compressedSize =
        ZSTD_compress(compressed.data(), compressed.size(), data.data(), data.size(), level_);

    if (ZSTD_isError(compressedSize)) {
        return makeError<std::vector<std::uint8_t>>(
            ErrorCode::kIOError,
            fmt::format("Zstd compression failed: {}", ZSTD_getErrorName(compressedSize)));
    }

    compressed.resize(compressedSize);
    return compressed;
}

Result<std::vector<std::uint8_t>> ZstdCompressor::decompress(
    std::span<const std::uint8_t> data, std::size_t uncompressedSize) const {
    auto frameSize = ZSTD_getFrameContentSize(data.data(), data.size());
    if (frameSize == ZSTD_CONTENTSIZE_ERROR || frameSize == ZSTD_CONTENTSIZE_UNKNOWN) {
        return corrupt("invalid Zstd frame");
    }
    if (frameSize != uncompressedSize) {
        return corrupt(fmt::format("Zstd frame holds {} bytes, expected {}", frameSize,
                                   uncompressedSize));
    }

    std::vector<std::uint8_t> buffer(uncompressedSize);
    std::size_t actualSize =
        ZSTD_decompress(buffer.data(), buffer.size(), data.data(), data.size());

    if (ZSTD_isError(actualSize)) {
        return corrupt(fmt::format("Zstd decompression failed: {}", ZSTD_getErrorName(actualSize)));
    }
    if (actualSize != uncompressedSize) {
        return corrupt(fmt::format("Zstd produced {} bytes, expected {}", actualSize,
                                   uncompressedSize));
    }
    return buffer;
}

// =============================================================================
// Deflate
// =============================================================================

Result<std::vector<std::uint8_t>> DeflateCompressor::compress(
    std::span<const std::uint8_t> data) const {
    if (data.size() > std::numeric_limits<uInt>::max()) {
        return makeError<std::vector<std::uint8_t>>(ErrorCode::kInvalidArgument,
                                                    "block too large for deflate");
    }

    z_stream stream{};
    // Negative window bits select a raw deflate stream.
    int ret = deflateInit2(&stream, level_, Z_DEFLATED, -MAX_WBITS, 8, Z_DEFAULT_STRATEGY);
    if (ret != Z_OK) {
        return makeError<std::vector<std::uint8_t>>(
            ErrorCode::kIOError, fmt::format("deflateInit2 failed: {}", ret));
    }

    std::vector<std::uint8_t> compressed(deflateBound(&stream, static_cast<uLong>(data.size())));
    stream.next_in = const_cast<Bytef*>(data.data());
    stream.avail_in = static_cast<uInt>(data.size());
    stream.next_out = compressed.data();
    stream.avail_out = static_cast<uInt>(compressed.size());

    ret = deflate(&stream, Z_FINISH);
    const auto produced = stream.total_out;
    deflateEnd(&stream);

    if (ret != Z_STREAM_END) {
        return makeError<std::vector<std::uint8_t>>(
            ErrorCode::kIOError, fmt::format("deflate failed: {}", ret));
    }
    compressed.resize(produced);
    return compressed;
}

Result<std::vector<std::uint8_t>> DeflateCompressor::decompress(
    std::span<const std::uint8_t> data, std::size_t uncompressedSize) const {
    if (data.size() > std::numeric_limits<uInt>::max() ||
        uncompressedSize > std::numeric_limits<uInt>::max()) {
        return corrupt("deflate payload too large");
    }

    z_stream stream{};
    int ret = inflateInit2(&stream, -MAX_WBITS);
    if (ret != Z_OK) {
        return makeError<std::vector<std::uint8_t>>(
            ErrorCode::kIOError, fmt::format("inflateInit2 failed: {}", ret));
    }

    std::vector<std::uint8_t> buffer(uncompressedSize);
    stream.next_in = const_cast<Bytef*>(data.data());
    stream.avail_in = static_cast<uInt>(data.size());
    stream.next_out = buffer.data();
    stream.avail_out = static_cast<uInt>(buffer.size());

    ret = inflate(&stream, Z_FINISH);
    const auto produced = stream.total_out;
    inflateEnd(&stream);

    if (ret != Z_STREAM_END) {
        return corrupt(fmt::format("inflate failed: {}", ret));
    }
    if (produced != uncompressedSize) {
        return corrupt(
            fmt::format("inflate produced {} bytes, expected {}", produced, uncompressedSize));
    }
    return buffer;
}

// =============================================================================
// Factory
// =============================================================================

Result<std::shared_ptr<const Compressor>> makeCompressor(CodecId id, CompressionLevel level) {
    switch (id) {
        case CodecId::kRaw:
            return std::make_shared<const RawCompressor>();
        case CodecId::kZstd:
            return std::make_shared<const ZstdCompressor>(level == 0 ? kDefaultZstdLevel : level);
        case CodecId::kDeflate:
            return std::make_shared<const DeflateCompressor>(level == 0 ? kDefaultDeflateLevel
                                                                        : level);
    }
    return makeError<std::shared_ptr<const Compressor>>(
        ErrorCode::kUnsupportedCodec,
        fmt::format("unsupported codec: 0x{:02x}", static_cast<unsigned>(id)));
}

Result<std::shared_ptr<const Compressor>> compressorForStoredId(std::uint8_t id) {
    if (!isKnownCodec(id)) {
        return makeError<std::shared_ptr<const Compressor>>(
            ErrorCode::kUnsupportedCodec, fmt::format("unsupported codec: 0x{:02x}", id));
    }
    return makeCompressor(static_cast<CodecId>(id));
}

}  // namespace aln::codec
