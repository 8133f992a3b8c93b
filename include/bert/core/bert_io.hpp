#pragma once

#include <bert/core/bert_endian.hpp>
#include <bert/core/bert_types.hpp>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <expected>
#include <span>
#include <vector>

namespace Bert {

/**
 * @brief Byte sink used by the encoder.
 */
using Bytes = std::vector<std::byte>;

/**
 * @brief Cursor over a contiguous byte source.
 *
 * Every read either returns the complete value and advances the cursor, or
 * fails with UnexpectedEnd and leaves the cursor where it was.
 */
class Reader {
   public:
    constexpr explicit Reader(std::span<const std::byte> input) noexcept
        : input_(input) {}

    [[nodiscard]] constexpr std::size_t offset() const noexcept {
        return offset_;
    }

    [[nodiscard]] constexpr std::size_t remaining() const noexcept {
        return input_.size() - offset_;
    }

    [[nodiscard]] constexpr bool has_bytes(std::size_t n) const noexcept {
        return n <= remaining();
    }

    [[nodiscard]] std::expected<uint8_t, Error> read1() noexcept {
        return read_be<uint8_t>();
    }

    [[nodiscard]] std::expected<uint16_t, Error> read2() noexcept {
        return read_be<uint16_t>();
    }

    [[nodiscard]] std::expected<uint32_t, Error> read4() noexcept {
        return read_be<uint32_t>();
    }

    /**
     * @brief Returns a view of the next n bytes and advances past them.
     *
     * The view aliases the input buffer; callers copy what they keep.
     */
    [[nodiscard]] std::expected<std::span<const std::byte>, Error> read_bytes(
        std::size_t n) noexcept {
        if (!has_bytes(n)) {
            return std::unexpected(Error::unexpected_end(offset_));
        }
        auto view = input_.subspan(offset_, n);
        offset_ += n;
        return view;
    }

   private:
    template <typename T>
    [[nodiscard]] std::expected<T, Error> read_be() noexcept {
        if (!has_bytes(sizeof(T))) {
            return std::unexpected(Error::unexpected_end(offset_));
        }
        T value;
        std::memcpy(&value, input_.data() + offset_, sizeof(T));
        offset_ += sizeof(T);
        return BigEndian(value);
    }

    std::span<const std::byte> input_;
    std::size_t offset_{0};
};

/**
 * @brief Appends big-endian integers and raw bytes to a byte sink.
 */
class Writer {
   public:
    explicit Writer(Bytes& out) noexcept : out_(out) {}

    void write1(uint8_t value) { write_be(value); }
    void write2(uint16_t value) { write_be(value); }
    void write4(uint32_t value) { write_be(value); }

    void write_tag(Tag tag) { write1(static_cast<uint8_t>(tag)); }

    void write_bytes(std::span<const std::byte> bytes) {
        out_.insert(out_.end(), bytes.begin(), bytes.end());
    }

    void write_zeros(std::size_t n) { out_.insert(out_.end(), n, std::byte{0}); }

    [[nodiscard]] std::size_t size() const noexcept { return out_.size(); }

   private:
    template <typename T>
    void write_be(T value) {
        const T be = BigEndian(value);
        const auto* first = reinterpret_cast<const std::byte*>(&be);
        out_.insert(out_.end(), first, first + sizeof(T));
    }

    Bytes& out_;
};

}  // namespace Bert
