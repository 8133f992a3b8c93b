#pragma once

#include <concepts>
#include <cstddef>
#include <tuple>
#include <type_traits>

namespace Bert {

/**
 * @brief Macro to declare the wire fields of a record.
 *
 * Generates `get_fields()` methods (const and non-const) returning a tuple
 * of references to the listed members. Records encode as a small tuple of
 * their fields in this order and bind positionally in the same order.
 *
 * @param ... The member variables to include.
 */
#define BERT_RECORD_FIELDS(...)                               \
    auto get_fields() const { return std::tie(__VA_ARGS__); } \
    auto get_fields() { return std::tie(__VA_ARGS__); }

/// @cond INTERNAL
template <typename T>
struct is_std_tuple : std::false_type {};

template <typename... Ts>
struct is_std_tuple<std::tuple<Ts...>> : std::true_type {};
/// @endcond

/**
 * @brief Concept for types declared with BERT_RECORD_FIELDS.
 */
template <typename T>
concept Record =
    std::is_class_v<T> && std::default_initializable<T> &&
    requires(T& t, const T& ct) {
        t.get_fields();
        ct.get_fields();
    } && is_std_tuple<decltype(std::declval<T&>().get_fields())>::value;

/**
 * @brief Number of fields a record declares.
 */
template <Record T>
inline constexpr std::size_t field_count_v =
    std::tuple_size_v<decltype(std::declval<T&>().get_fields())>;

}  // namespace Bert
