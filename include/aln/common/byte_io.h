// =============================================================================
// alnstore - Little-Endian Byte Helpers
// =============================================================================
// Every multi-byte integer on disk and in binary records is little-endian.
// =============================================================================

#ifndef ALN_COMMON_BYTE_IO_H
#define ALN_COMMON_BYTE_IO_H

#include <bit>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <type_traits>
#include <vector>

namespace aln {

/// @brief Swap to or from little-endian on big-endian hosts.
template <typename T>
[[nodiscard]] constexpr T toLittleEndian(T value) noexcept {
    static_assert(std::is_trivially_copyable_v<T>, "Type must be trivially copyable");
    if constexpr (std::endian::native == std::endian::big) {
        if constexpr (sizeof(T) == 2) {
            value = std::bit_cast<T>(__builtin_bswap16(std::bit_cast<std::uint16_t>(value)));
        } else if constexpr (sizeof(T) == 4) {
            value = std::bit_cast<T>(__builtin_bswap32(std::bit_cast<std::uint32_t>(value)));
        } else if constexpr (sizeof(T) == 8) {
            value = std::bit_cast<T>(__builtin_bswap64(std::bit_cast<std::uint64_t>(value)));
        }
    }
    return value;
}

/// @brief Append @p value to @p out in little-endian order.
template <typename T>
void appendLE(std::vector<std::uint8_t>& out, T value) {
    value = toLittleEndian(value);
    const auto* bytes = reinterpret_cast<const std::uint8_t*>(&value);
    out.insert(out.end(), bytes, bytes + sizeof(T));
}

/// @brief Read a little-endian value from @p data. Caller checks bounds.
template <typename T>
[[nodiscard]] T loadLE(const std::uint8_t* data) noexcept {
    T value;
    std::memcpy(&value, data, sizeof(T));
    return toLittleEndian(value);
}

/// @brief Overwrite sizeof(T) bytes at @p offset of @p out.
template <typename T>
void storeLE(std::vector<std::uint8_t>& out, std::size_t offset, T value) noexcept {
    value = toLittleEndian(value);
    std::memcpy(out.data() + offset, &value, sizeof(T));
}

}  // namespace aln

#endif  // ALN_COMMON_BYTE_IO_H
