// =============================================================================
// alnstore - Store Options Validation
// =============================================================================

#include "aln/common/types.h"

#include <fmt/format.h>

namespace aln {

CompressionLevel StoreOptions::effectiveLevel() const noexcept {
    if (compressionLevel != 0) {
        return compressionLevel;
    }
    switch (codec) {
        case CodecId::kZstd:
            return kDefaultZstdLevel;
        case CodecId::kDeflate:
            return kDefaultDeflateLevel;
        case CodecId::kRaw:
            break;
    }
    return 0;
}

VoidResult StoreOptions::validate() const {
    if (blockThreshold < kMinBlockThreshold || blockThreshold > kMaxBlockThreshold) {
        return makeVoidError(
            ErrorCode::kInvalidArgument,
            fmt::format("block threshold {} outside [{}, {}]", blockThreshold,
                        kMinBlockThreshold, kMaxBlockThreshold));
    }

    if (compressionLevel < 0) {
        return makeVoidError(ErrorCode::kInvalidArgument,
                             fmt::format("negative compression level {}", compressionLevel));
    }

    // A custom compressor carries its own level.
    if (compressor) {
        return makeVoidSuccess();
    }

    switch (codec) {
        case CodecId::kZstd:
            if (compressionLevel > kMaxZstdLevel) {
                return makeVoidError(ErrorCode::kInvalidArgument,
                                     fmt::format("zstd level {} above {}", compressionLevel,
                                                 kMaxZstdLevel));
            }
            break;
        case CodecId::kDeflate:
            if (compressionLevel > kMaxDeflateLevel) {
                return makeVoidError(ErrorCode::kInvalidArgument,
                                     fmt::format("deflate level {} above {}", compressionLevel,
                                                 kMaxDeflateLevel));
            }
            break;
        case CodecId::kRaw:
            break;
        default:
            return makeVoidError(ErrorCode::kUnsupportedCodec,
                                 fmt::format("unknown codec id {}",
                                             static_cast<unsigned>(codec)));
    }
    return makeVoidSuccess();
}

}  // namespace aln
