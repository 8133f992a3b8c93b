#pragma once

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <type_traits>

namespace Bert {

/**
 * @brief Concept defining a decoding policy.
 *
 * A DecodePolicy configures the limits and optional features of the decoder.
 * It must provide, as compile-time constants:
 * - `max_depth`: Maximum nesting of tuples and lists.
 * - `max_frame_size`: Largest BURP frame payload accepted, in bytes.
 * - `decode_bignums`: Whether the bignum tags (110, 111) are decoded or
 *   rejected with UnsupportedType.
 */
template <typename Policy>
concept DecodePolicy = requires {
    {
        std::bool_constant<(Policy::max_depth, true)>()
    } -> std::same_as<std::true_type>;
    { Policy::max_depth } -> std::convertible_to<std::size_t>;
    { Policy::max_frame_size } -> std::convertible_to<uint32_t>;
    { Policy::decode_bignums } -> std::convertible_to<bool>;
};

/**
 * @brief Default policy. Bignum tags are rejected on decode, matching the
 * deployed wire protocol.
 */
struct DefaultPolicy {
    static constexpr std::size_t max_depth = 512;
    static constexpr uint32_t max_frame_size = 64U * 1024U * 1024U;
    static constexpr bool decode_bignums = false;
};

/**
 * @brief Policy that decodes small and large bignums, making integer encoding
 * and decoding symmetric.
 */
struct SymmetricBignumPolicy : DefaultPolicy {
    static constexpr bool decode_bignums = true;
};

static_assert(DecodePolicy<DefaultPolicy>);
static_assert(DecodePolicy<SymmetricBignumPolicy>);

}  // namespace Bert
