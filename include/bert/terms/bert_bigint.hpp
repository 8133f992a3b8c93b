#pragma once

#include <algorithm>
#include <concepts>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

namespace Bert {

/**
 * @brief Arbitrary-precision signed integer.
 *
 * Stored as a sign flag and a little-endian magnitude, which is the layout the
 * bignum tags carry on the wire. The magnitude never has trailing zero bytes
 * and zero is never negative, so equal values compare equal.
 */
class BigInt {
   public:
    BigInt() = default;

    template <std::integral I>
        requires(!std::same_as<I, bool>)
    explicit BigInt(I value) {
        uint64_t magnitude;
        if constexpr (std::is_signed_v<I>) {
            negative_ = value < 0;
            magnitude = negative_ ? ~static_cast<uint64_t>(value) + 1
                                  : static_cast<uint64_t>(value);
        } else {
            magnitude = static_cast<uint64_t>(value);
        }
        while (magnitude != 0) {
            magnitude_.push_back(static_cast<uint8_t>(magnitude & 0xFF));
            magnitude >>= 8;
        }
    }

    /**
     * @brief Builds a value from a sign and a little-endian magnitude.
     */
    [[nodiscard]] static BigInt FromMagnitude(bool negative,
                                              std::vector<uint8_t> magnitude) {
        BigInt result;
        result.magnitude_ = std::move(magnitude);
        result.negative_ = negative;
        result.normalize();
        return result;
    }

    /**
     * @brief Parses decimal text with an optional leading sign.
     * @return The value, or std::nullopt if the text is not a decimal integer.
     */
    [[nodiscard]] static std::optional<BigInt> FromString(
        std::string_view text) {
        bool negative = false;
        if (!text.empty() && (text.front() == '-' || text.front() == '+')) {
            negative = text.front() == '-';
            text.remove_prefix(1);
        }
        if (text.empty()) {
            return std::nullopt;
        }

        BigInt result;
        for (const char c : text) {
            if (c < '0' || c > '9') {
                return std::nullopt;
            }
            // magnitude = magnitude * 10 + digit
            unsigned carry = static_cast<unsigned>(c - '0');
            for (auto& byte : result.magnitude_) {
                const unsigned v = static_cast<unsigned>(byte) * 10U + carry;
                byte = static_cast<uint8_t>(v & 0xFFU);
                carry = v >> 8;
            }
            if (carry != 0) {
                result.magnitude_.push_back(static_cast<uint8_t>(carry));
            }
        }
        result.negative_ = negative;
        result.normalize();
        return result;
    }

    [[nodiscard]] bool negative() const noexcept { return negative_; }

    [[nodiscard]] bool is_zero() const noexcept { return magnitude_.empty(); }

    /**
     * @brief The magnitude in little-endian byte order.
     */
    [[nodiscard]] const std::vector<uint8_t>& magnitude() const noexcept {
        return magnitude_;
    }

    /**
     * @brief Converts to int64_t if the value is in range.
     */
    [[nodiscard]] std::optional<int64_t> to_int64() const noexcept {
        if (magnitude_.size() > sizeof(uint64_t)) {
            return std::nullopt;
        }
        uint64_t magnitude = 0;
        for (auto it = magnitude_.rbegin(); it != magnitude_.rend(); ++it) {
            magnitude = (magnitude << 8) | *it;
        }
        constexpr auto max = static_cast<uint64_t>(
            std::numeric_limits<int64_t>::max());
        if (!negative_) {
            if (magnitude > max) {
                return std::nullopt;
            }
            return static_cast<int64_t>(magnitude);
        }
        if (magnitude > max + 1) {
            return std::nullopt;
        }
        return static_cast<int64_t>(~magnitude + 1);
    }

    /**
     * @brief Renders the value as decimal text.
     */
    [[nodiscard]] std::string ToString() const {
        if (is_zero()) {
            return "0";
        }
        std::vector<uint8_t> work = magnitude_;
        std::string digits;
        while (!work.empty()) {
            // work = work / 10, collecting the remainder
            unsigned remainder = 0;
            for (auto it = work.rbegin(); it != work.rend(); ++it) {
                const unsigned v = (remainder << 8) | *it;
                *it = static_cast<uint8_t>(v / 10U);
                remainder = v % 10U;
            }
            digits.push_back(static_cast<char>('0' + remainder));
            while (!work.empty() && work.back() == 0) {
                work.pop_back();
            }
        }
        if (negative_) {
            digits.push_back('-');
        }
        std::ranges::reverse(digits);
        return digits;
    }

    [[nodiscard]] bool operator==(const BigInt& other) const noexcept =
        default;

   private:
    void normalize() noexcept {
        while (!magnitude_.empty() && magnitude_.back() == 0) {
            magnitude_.pop_back();
        }
        if (magnitude_.empty()) {
            negative_ = false;
        }
    }

    bool negative_{false};
    std::vector<uint8_t> magnitude_;
};

}  // namespace Bert
