#pragma once

#include <bit>
#include <concepts>
#include <cstdint>
#include <type_traits>

namespace Bert {

/**
 * @brief Converts a value to/from Big Endian byte order.
 *
 * All multi-byte integers on the wire are big-endian regardless of host byte
 * order.
 *
 * @tparam T The type of the value to convert. Must be an integral type or enum.
 * @param value The value to convert.
 * @return The converted value.
 */
template <typename T>
    requires std::integral<T> || std::is_enum_v<T>
[[nodiscard]] constexpr T BigEndian(T value) noexcept {
    if constexpr (std::endian::native == std::endian::big) {
        return value;
    } else if constexpr (std::integral<T>) {
        return std::byteswap(value);
    } else {
        using U = std::underlying_type_t<T>;
        return static_cast<T>(std::byteswap(static_cast<U>(value)));
    }
}

}  // namespace Bert
