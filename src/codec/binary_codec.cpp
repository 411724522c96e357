// =============================================================================
// alnstore - Binary Record Codec Implementation
// =============================================================================

#include "aln/codec/binary_codec.h"

#include <algorithm>
#include <bit>
#include <limits>

#include <fmt/format.h>

#include "aln/common/byte_io.h"
#include "aln/index/bin_scheme.h"

namespace aln::codec {

namespace {

constexpr std::uint8_t kQualityUnavailable = 0xFF;
constexpr std::uint8_t kPhredOffset = 33;

template <typename T>
Result<T> malformed(std::string message) {
    return makeError<T>(ErrorCode::kMalformedRecord, std::move(message));
}

template <typename T>
Result<T> truncated(std::string message) {
    return makeError<T>(ErrorCode::kTruncatedRecord, std::move(message));
}

std::uint8_t baseCode(char base) noexcept {
    auto pos = kSequenceAlphabet.find(base);
    return pos == std::string_view::npos ? 15 : static_cast<std::uint8_t>(pos);
}

std::size_t subtypeSize(char subtype) noexcept {
    switch (subtype) {
        case 'c':
        case 'C':
            return 1;
        case 's':
        case 'S':
            return 2;
        case 'i':
        case 'I':
        case 'f':
            return 4;
        default:
            return 0;
    }
}

/// Smallest integer subtype holding @p value.
char integerSubtype(std::int64_t value) noexcept {
    if (value < 0) {
        if (value >= std::numeric_limits<std::int8_t>::min()) {
            return 'c';
        }
        if (value >= std::numeric_limits<std::int16_t>::min()) {
            return 's';
        }
        return 'i';
    }
    if (value <= std::numeric_limits<std::uint8_t>::max()) {
        return 'C';
    }
    if (value <= std::numeric_limits<std::uint16_t>::max()) {
        return 'S';
    }
    return 'I';
}

void appendInteger(std::vector<std::uint8_t>& out, char subtype, std::int64_t value) {
    switch (subtype) {
        case 'c':
            appendLE(out, static_cast<std::int8_t>(value));
            break;
        case 'C':
            appendLE(out, static_cast<std::uint8_t>(value));
            break;
        case 's':
            appendLE(out, static_cast<std::int16_t>(value));
            break;
        case 'S':
            appendLE(out, static_cast<std::uint16_t>(value));
            break;
        case 'i':
            appendLE(out, static_cast<std::int32_t>(value));
            break;
        default:
            appendLE(out, static_cast<std::uint32_t>(value));
            break;
    }
}

std::int64_t loadInteger(const std::uint8_t* data, char subtype) noexcept {
    switch (subtype) {
        case 'c':
            return loadLE<std::int8_t>(data);
        case 'C':
            return loadLE<std::uint8_t>(data);
        case 's':
            return loadLE<std::int16_t>(data);
        case 'S':
            return loadLE<std::uint16_t>(data);
        case 'i':
            return loadLE<std::int32_t>(data);
        default:
            return loadLE<std::uint32_t>(data);
    }
}

void appendTag(std::vector<std::uint8_t>& out, const Tag& tag) {
    out.push_back(static_cast<std::uint8_t>(tag.key[0]));
    out.push_back(static_cast<std::uint8_t>(tag.key[1]));

    if (const auto* c = std::get_if<char>(&tag.value)) {
        out.push_back('A');
        out.push_back(static_cast<std::uint8_t>(*c));
    } else if (const auto* i = std::get_if<std::int64_t>(&tag.value)) {
        char subtype = integerSubtype(*i);
        out.push_back(static_cast<std::uint8_t>(subtype));
        appendInteger(out, subtype, *i);
    } else if (const auto* f = std::get_if<float>(&tag.value)) {
        out.push_back('f');
        appendLE(out, std::bit_cast<std::uint32_t>(*f));
    } else if (const auto* s = std::get_if<std::string>(&tag.value)) {
        out.push_back(static_cast<std::uint8_t>(tag.type));
        out.insert(out.end(), s->begin(), s->end());
        out.push_back(0);
    } else if (const auto* array = std::get_if<TagArray>(&tag.value)) {
        out.push_back('B');
        out.push_back(static_cast<std::uint8_t>(array->subtype));
        appendLE(out, static_cast<std::uint32_t>(array->size()));
        if (array->subtype == 'f') {
            for (float v : array->floats) {
                appendLE(out, std::bit_cast<std::uint32_t>(v));
            }
        } else {
            for (std::int64_t v : array->integers) {
                appendInteger(out, array->subtype, v);
            }
        }
    }
}

/// Bounds-checked cursor over one record body.
class Cursor {
public:
    Cursor(std::span<const std::uint8_t> body, std::size_t recordOffset)
        : body_(body), recordOffset_(recordOffset) {}

    [[nodiscard]] bool has(std::size_t n) const noexcept { return n <= body_.size() - pos_; }
    [[nodiscard]] bool atEnd() const noexcept { return pos_ == body_.size(); }
    [[nodiscard]] const std::uint8_t* data() const noexcept { return body_.data() + pos_; }
    [[nodiscard]] std::size_t remaining() const noexcept { return body_.size() - pos_; }
    void skip(std::size_t n) noexcept { pos_ += n; }

    template <typename T>
    T read() noexcept {
        T value = loadLE<T>(data());
        pos_ += sizeof(T);
        return value;
    }

    [[nodiscard]] std::string where() const {
        return fmt::format("record at offset {}, byte {}", recordOffset_,
                           pos_ + kBinarySizePrefix);
    }

private:
    std::span<const std::uint8_t> body_;
    std::size_t recordOffset_;
    std::size_t pos_ = 0;
};

Result<Tag> readTag(Cursor& cursor) {
    if (!cursor.has(3)) {
        return truncated<Tag>(fmt::format("tag header truncated ({})", cursor.where()));
    }
    Tag tag;
    tag.key = std::string(reinterpret_cast<const char*>(cursor.data()), 2);
    cursor.skip(2);
    char type = static_cast<char>(cursor.read<std::uint8_t>());

    switch (type) {
        case 'A':
            if (!cursor.has(1)) {
                return truncated<Tag>(fmt::format("tag {} truncated", tag.key));
            }
            tag.type = 'A';
            tag.value = static_cast<char>(cursor.read<std::uint8_t>());
            break;
        case 'c':
        case 'C':
        case 's':
        case 'S':
        case 'i':
        case 'I':
            if (!cursor.has(subtypeSize(type))) {
                return truncated<Tag>(fmt::format("tag {} truncated", tag.key));
            }
            tag.type = 'i';
            tag.value = loadInteger(cursor.data(), type);
            cursor.skip(subtypeSize(type));
            break;
        case 'f':
            if (!cursor.has(4)) {
                return truncated<Tag>(fmt::format("tag {} truncated", tag.key));
            }
            tag.type = 'f';
            tag.value = std::bit_cast<float>(cursor.read<std::uint32_t>());
            break;
        case 'Z':
        case 'H': {
            const auto* begin = cursor.data();
            const auto* end = begin + cursor.remaining();
            const auto* nul = std::find(begin, end, std::uint8_t{0});
            if (nul == end) {
                return truncated<Tag>(fmt::format("tag {} missing NUL terminator", tag.key));
            }
            tag.type = type;
            tag.value = std::string(reinterpret_cast<const char*>(begin),
                                    static_cast<std::size_t>(nul - begin));
            cursor.skip(static_cast<std::size_t>(nul - begin) + 1);
            break;
        }
        case 'B': {
            if (!cursor.has(5)) {
                return truncated<Tag>(fmt::format("tag {} truncated", tag.key));
            }
            TagArray array;
            array.subtype = static_cast<char>(cursor.read<std::uint8_t>());
            auto count = cursor.read<std::uint32_t>();
            auto width = subtypeSize(array.subtype);
            if (width == 0) {
                return malformed<Tag>(
                    fmt::format("tag {}: unknown array subtype '{}'", tag.key, array.subtype));
            }
            if (count > cursor.remaining() / width) {
                return truncated<Tag>(fmt::format("tag {}: {} elements declared, {} bytes left",
                                                  tag.key, count, cursor.remaining()));
            }
            for (std::uint32_t i = 0; i < count; ++i) {
                if (array.subtype == 'f') {
                    array.floats.push_back(std::bit_cast<float>(cursor.read<std::uint32_t>()));
                } else {
                    array.integers.push_back(loadInteger(cursor.data(), array.subtype));
                    cursor.skip(width);
                }
            }
            tag.type = 'B';
            tag.value = std::move(array);
            break;
        }
        default:
            return malformed<Tag>(
                fmt::format("tag {}: unknown type 0x{:02x}", tag.key, static_cast<unsigned char>(type)));
    }
    return tag;
}

struct Core {
    std::int32_t referenceId;
    std::int32_t position;
    std::uint8_t nameLength;
    std::uint8_t mappingQuality;
    std::uint16_t cigarCount;
    std::uint16_t flag;
    std::uint32_t sequenceLength;
    std::int32_t mateReferenceId;
    std::int32_t matePosition;
    std::int32_t templateLength;
};

/// Validate the size prefix and return the record body.
Result<std::span<const std::uint8_t>> recordBody(std::span<const std::uint8_t> data,
                                                 std::size_t offset) {
    if (offset > data.size() || data.size() - offset < kBinarySizePrefix) {
        return truncated<std::span<const std::uint8_t>>(
            fmt::format("size prefix truncated at offset {}", offset));
    }
    auto blockSize = loadLE<std::uint32_t>(data.data() + offset);
    auto available = data.size() - offset - kBinarySizePrefix;
    if (blockSize > available) {
        return truncated<std::span<const std::uint8_t>>(fmt::format(
            "record at offset {} declares {} bytes, {} available", offset, blockSize, available));
    }
    if (blockSize < kBinaryCoreSize) {
        return truncated<std::span<const std::uint8_t>>(fmt::format(
            "record at offset {} declares {} bytes, core needs {}", offset, blockSize,
            kBinaryCoreSize));
    }
    return data.subspan(offset + kBinarySizePrefix, blockSize);
}

Core readCore(Cursor& cursor) noexcept {
    Core core{};
    core.referenceId = cursor.read<std::int32_t>();
    core.position = cursor.read<std::int32_t>();
    core.nameLength = cursor.read<std::uint8_t>();
    core.mappingQuality = cursor.read<std::uint8_t>();
    cursor.skip(sizeof(std::uint16_t));  // bin
    core.cigarCount = cursor.read<std::uint16_t>();
    core.flag = cursor.read<std::uint16_t>();
    core.sequenceLength = cursor.read<std::uint32_t>();
    core.mateReferenceId = cursor.read<std::int32_t>();
    core.matePosition = cursor.read<std::int32_t>();
    core.templateLength = cursor.read<std::int32_t>();
    return core;
}

}  // namespace

BinaryCodec::BinaryCodec(ReferenceDictionary references) : references_(std::move(references)) {}

Result<ReferenceId> BinaryCodec::referenceId(std::string_view name) const {
    if (name == kMissingField) {
        return kNoReference;
    }
    auto id = references_.find(name);
    if (!id) {
        return malformed<ReferenceId>(fmt::format("reference '{}' not in dictionary", name));
    }
    return *id;
}

Result<RecordSpan> BinaryCodec::spanOf(const AlignmentRecord& record) const {
    auto id = referenceId(record.referenceName);
    if (!id) {
        return std::unexpected(id.error());
    }
    RecordSpan span;
    if (record.isUnmapped() || *id == kNoReference) {
        return span;
    }
    span.referenceId = *id;
    span.begin = record.position - 1;
    span.end = span.begin + record.referenceSpan();
    return span;
}

VoidResult BinaryCodec::encode(const AlignmentRecord& record,
                               std::vector<std::uint8_t>& out) const {
    auto refId = referenceId(record.referenceName);
    if (!refId) {
        return std::unexpected(refId.error());
    }
    auto mateId = referenceId(record.mateReferenceName);
    if (!mateId) {
        return std::unexpected(mateId.error());
    }
    if (record.queryName.empty() || record.queryName.size() > 254) {
        return makeVoidError(ErrorCode::kMalformedRecord, "QNAME: length outside 1..254");
    }
    if (record.cigar.size() > std::numeric_limits<std::uint16_t>::max()) {
        return makeVoidError(ErrorCode::kMalformedRecord, "CIGAR: too many operations");
    }

    const std::size_t start = out.size();
    appendLE<std::uint32_t>(out, 0);

    const std::int32_t position = static_cast<std::int32_t>(record.position - 1);
    std::uint16_t bin = index::kUnplacedBin;
    if (*refId != kNoReference && record.position > 0) {
        bin = static_cast<std::uint16_t>(
            index::regionToBin(position, position + record.referenceSpan()));
    }

    appendLE(out, *refId);
    appendLE(out, position);
    appendLE(out, static_cast<std::uint8_t>(record.queryName.size() + 1));
    appendLE(out, record.mappingQuality);
    appendLE(out, bin);
    appendLE(out, static_cast<std::uint16_t>(record.cigar.size()));
    appendLE(out, record.flag);
    appendLE(out, static_cast<std::uint32_t>(record.sequence.size()));
    appendLE(out, *mateId);
    appendLE(out, static_cast<std::int32_t>(record.matePosition - 1));
    appendLE(out, static_cast<std::int32_t>(record.templateLength));

    out.insert(out.end(), record.queryName.begin(), record.queryName.end());
    out.push_back(0);

    for (const auto& element : record.cigar) {
        appendLE(out, (element.length << 4) | static_cast<std::uint32_t>(element.op));
    }

    const auto& sequence = record.sequence;
    for (std::size_t i = 0; i < sequence.size(); i += 2) {
        std::uint8_t packed = static_cast<std::uint8_t>(baseCode(sequence[i]) << 4);
        if (i + 1 < sequence.size()) {
            packed |= baseCode(sequence[i + 1]);
        }
        out.push_back(packed);
    }

    if (record.hasQuality()) {
        for (char q : record.quality) {
            out.push_back(static_cast<std::uint8_t>(q - kPhredOffset));
        }
    } else {
        out.insert(out.end(), sequence.size(), kQualityUnavailable);
    }

    for (const auto& tag : record.tags) {
        appendTag(out, tag);
    }

    storeLE(out, start, static_cast<std::uint32_t>(out.size() - start - kBinarySizePrefix));
    return makeVoidSuccess();
}

Result<std::vector<std::uint8_t>> BinaryCodec::encode(const AlignmentRecord& record) const {
    std::vector<std::uint8_t> out;
    if (auto result = encode(record, out); !result) {
        return std::unexpected(result.error());
    }
    return out;
}

Result<AlignmentRecord> BinaryCodec::decode(std::span<const std::uint8_t> data,
                                            std::size_t& offset) const {
    auto body = recordBody(data, offset);
    if (!body) {
        return std::unexpected(body.error());
    }

    Cursor cursor(*body, offset);
    Core core = readCore(cursor);
    AlignmentRecord record;

    if (core.nameLength == 0 || !cursor.has(core.nameLength)) {
        return truncated<AlignmentRecord>(fmt::format("query name truncated ({})", cursor.where()));
    }
    if (cursor.data()[core.nameLength - 1] != 0) {
        return malformed<AlignmentRecord>(
            fmt::format("query name not NUL-terminated ({})", cursor.where()));
    }
    record.queryName.assign(reinterpret_cast<const char*>(cursor.data()), core.nameLength - 1U);
    cursor.skip(core.nameLength);

    auto resolve = [this](std::int32_t id, const char* column) -> Result<std::string> {
        if (id == kNoReference) {
            return std::string(kMissingField);
        }
        const auto* reference = references_.at(id);
        if (reference == nullptr) {
            return malformed<std::string>(fmt::format("{}: unknown reference id {}", column, id));
        }
        return reference->name;
    };

    auto referenceName = resolve(core.referenceId, "RNAME");
    if (!referenceName) {
        return std::unexpected(referenceName.error());
    }
    auto mateReferenceName = resolve(core.mateReferenceId, "RNEXT");
    if (!mateReferenceName) {
        return std::unexpected(mateReferenceName.error());
    }
    if (core.position < -1 || core.matePosition < -1) {
        return malformed<AlignmentRecord>(fmt::format("negative position ({})", cursor.where()));
    }

    record.flag = core.flag;
    record.referenceName = std::move(*referenceName);
    record.position = static_cast<std::int64_t>(core.position) + 1;
    record.mappingQuality = core.mappingQuality;
    record.mateReferenceName = std::move(*mateReferenceName);
    record.matePosition = static_cast<std::int64_t>(core.matePosition) + 1;
    record.templateLength = core.templateLength;

    if (!cursor.has(std::size_t{core.cigarCount} * 4)) {
        return truncated<AlignmentRecord>(fmt::format("CIGAR truncated ({})", cursor.where()));
    }
    record.cigar.reserve(core.cigarCount);
    for (std::uint16_t i = 0; i < core.cigarCount; ++i) {
        auto packed = cursor.read<std::uint32_t>();
        auto op = packed & 0xFU;
        if (op >= kCigarOpChars.size()) {
            return malformed<AlignmentRecord>(
                fmt::format("CIGAR: unknown op code {} ({})", op, cursor.where()));
        }
        record.cigar.push_back({packed >> 4, static_cast<CigarOp>(op)});
    }

    const std::size_t length = core.sequenceLength;
    const std::size_t packedLength = (length + 1) / 2;
    if (packedLength > cursor.remaining() || length > cursor.remaining() - packedLength) {
        return truncated<AlignmentRecord>(
            fmt::format("sequence of {} bases truncated ({})", length, cursor.where()));
    }
    record.sequence.resize(length);
    for (std::size_t i = 0; i < length; ++i) {
        std::uint8_t packed = cursor.data()[i / 2];
        std::uint8_t code = (i % 2 == 0) ? (packed >> 4) : (packed & 0xF);
        record.sequence[i] = kSequenceAlphabet[code];
    }
    cursor.skip(packedLength);

    if (length > 0 && cursor.data()[0] != kQualityUnavailable) {
        record.quality.resize(length);
        for (std::size_t i = 0; i < length; ++i) {
            record.quality[i] = static_cast<char>(cursor.data()[i] + kPhredOffset);
        }
    }
    cursor.skip(length);

    while (!cursor.atEnd()) {
        auto tag = readTag(cursor);
        if (!tag) {
            return std::unexpected(tag.error());
        }
        record.tags.push_back(std::move(*tag));
    }

    offset += kBinarySizePrefix + body->size();
    return record;
}

Result<AlignmentRecord> BinaryCodec::decode(std::span<const std::uint8_t> data) const {
    std::size_t offset = 0;
    return decode(data, offset);
}

Result<RecordSpan> BinaryCodec::decodeSpan(std::span<const std::uint8_t> data,
                                           std::size_t& offset) const {
    auto body = recordBody(data, offset);
    if (!body) {
        return std::unexpected(body.error());
    }

    Cursor cursor(*body, offset);
    Core core = readCore(cursor);
    if (!cursor.has(core.nameLength) ||
        !cursor.has(core.nameLength + std::size_t{core.cigarCount} * 4)) {
        return truncated<RecordSpan>(fmt::format("CIGAR truncated ({})", cursor.where()));
    }
    if (core.referenceId != kNoReference && references_.at(core.referenceId) == nullptr) {
        return malformed<RecordSpan>(
            fmt::format("RNAME: unknown reference id {}", core.referenceId));
    }
    cursor.skip(core.nameLength);

    Cigar cigar;
    cigar.reserve(core.cigarCount);
    for (std::uint16_t i = 0; i < core.cigarCount; ++i) {
        auto packed = cursor.read<std::uint32_t>();
        if ((packed & 0xFU) >= kCigarOpChars.size()) {
            return malformed<RecordSpan>(fmt::format("CIGAR: unknown op code {}", packed & 0xFU));
        }
        cigar.push_back({packed >> 4, static_cast<CigarOp>(packed & 0xFU)});
    }

    offset += kBinarySizePrefix + body->size();

    RecordSpan span;
    if (core.referenceId == kNoReference || core.position < 0 ||
        (core.flag & flags::kUnmapped) != 0) {
        return span;
    }
    span.referenceId = core.referenceId;
    span.begin = core.position;
    span.end = span.begin + referenceSpan(cigar);
    return span;
}

}  // namespace aln::codec
