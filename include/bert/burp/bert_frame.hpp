#pragma once

#include <bert/bert_detail.hpp>
#include <bert/codec/bert_encoder.hpp>
#include <bert/core/bert_io.hpp>
#include <bert/core/bert_policy.hpp>
#include <bert/core/bert_types.hpp>
#include <bert/records/bert_fields.hpp>
#include <bert/records/bert_record.hpp>
#include <bert/terms/bert_term.hpp>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <limits>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <spdlog/spdlog.h>

/**
 * @brief BURP: length-prefixed request/response envelopes.
 *
 * Every frame is `<4-byte big-endian length><BERT-encoded term>`, the same
 * for requests and responses.
 */
namespace Bert {

namespace atoms {
inline constexpr std::string_view Call = "call";
inline constexpr std::string_view Cast = "cast";
inline constexpr std::string_view Reply = "reply";
inline constexpr std::string_view NoReply = "noreply";
inline constexpr std::string_view Error = "error";
}  // namespace atoms

/**
 * @brief An inbound call: `{Kind, Module, Function, Arguments}`.
 */
struct Request {
    Atom kind;
    Atom module;
    Atom function;
    List arguments;

    BERT_RECORD_FIELDS(kind, module, function, arguments);

    bool operator==(const Request&) const = default;
};

/**
 * @brief A successful response: `{reply, Result}`.
 */
struct Reply {
    Atom kind{atoms::Reply};
    Term result;

    BERT_RECORD_FIELDS(kind, result);

    bool operator==(const Reply&) const = default;
};

/**
 * @brief Error details: `{Type, Code, Class, Detail, Backtrace}`.
 *
 * Type is one of `protocol`, `server`, `user` or `proxy`.
 */
struct ErrorDetail {
    Atom type;
    int64_t code{0};
    std::string error_class;
    std::string detail;
    List backtrace;

    BERT_RECORD_FIELDS(type, code, error_class, detail, backtrace);

    bool operator==(const ErrorDetail&) const = default;
};

/**
 * @brief A failed response: `{error, {Type, Code, Class, Detail, Backtrace}}`.
 */
struct ErrorReply {
    Atom kind{atoms::Error};
    ErrorDetail error;

    BERT_RECORD_FIELDS(kind, error);

    bool operator==(const ErrorReply&) const = default;
};

/**
 * @brief Appends one frame holding value to sink.
 *
 * The value is encoded in full before anything is appended, so on error the
 * sink is unchanged.
 *
 * @param sink The destination byte sink.
 * @param value The value to encode.
 * @return std::nullopt on success, or an Error.
 */
template <typename T>
    requires Encodable<T>
[[nodiscard]] std::optional<Error> WriteFrame(Bytes& sink, const T& value) {
    auto payload = detail::EncodeToBuffer(value);
    if (!payload) {
        return payload.error();
    }
    if (payload->size() > std::numeric_limits<uint32_t>::max()) {
        return Error::value_too_large("frame longer than 4 GiB");
    }
    Writer writer{sink};
    writer.write4(static_cast<uint32_t>(payload->size()));
    writer.write_bytes(*payload);
    return std::nullopt;
}

/**
 * @brief Encodes value as a single frame.
 */
template <typename T>
    requires Encodable<T>
[[nodiscard]] std::expected<Bytes, Error> EncodeFrame(const T& value) {
    Bytes frame;
    if (auto err = WriteFrame(frame, value); err.has_value()) {
        return std::unexpected(*err);
    }
    return frame;
}

/**
 * @brief Decodes the frame at the start of input.
 *
 * Reads the length prefix and decodes exactly that many bytes. Bytes after
 * the frame are left for the next call.
 *
 * @tparam Policy The DecodePolicy; frames above Policy::max_frame_size are
 * rejected with LimitExceeded before any payload is read.
 * @param input The input bytes.
 * @return The term and the total frame size (prefix included), or an Error.
 */
template <DecodePolicy Policy = DefaultPolicy>
[[nodiscard]] std::expected<Decoded<Term>, Error> DecodeFrame(
    std::span<const std::byte> input) {
    Reader reader{input};
    auto length = reader.read4();
    if (!length) {
        return std::unexpected(length.error());
    }
    if (*length > Policy::max_frame_size) {
        spdlog::warn("burp: rejecting frame of {} bytes (limit {})", *length,
                     Policy::max_frame_size);
        return std::unexpected(
            Error::limit_exceeded("frame larger than policy limit"));
    }
    auto payload = reader.read_bytes(*length);
    if (!payload) {
        return std::unexpected(payload.error());
    }

    auto term = detail::DecodeTerm<Policy>(*payload);
    if (!term) {
        Error err = term.error();
        err.offset += FrameHeaderSize;
        return std::unexpected(err);
    }
    if (term->consumed != payload->size()) {
        return std::unexpected(
            Error::trailing_data(FrameHeaderSize + term->consumed));
    }
    return Decoded<Term>{std::move(term->value), reader.offset()};
}

/**
 * @brief Decodes the frame at the start of input and binds it to a record.
 *
 * @tparam R The record type.
 * @tparam Policy The DecodePolicy.
 */
template <Record R, DecodePolicy Policy = DefaultPolicy>
[[nodiscard]] std::expected<Decoded<R>, Error> ReadRecordFrame(
    std::span<const std::byte> input) {
    auto frame = DecodeFrame<Policy>(input);
    if (!frame) {
        return std::unexpected(frame.error());
    }
    auto record = Bind<R>(frame->value);
    if (!record) {
        spdlog::debug("burp: cannot bind {}: {} at field {}",
                      ToString(frame->value), ToString(record.error().code),
                      record.error().field_index);
        return std::unexpected(record.error());
    }
    return Decoded<R>{std::move(*record), frame->consumed};
}

/**
 * @brief Reads one inbound request frame.
 */
template <DecodePolicy Policy = DefaultPolicy>
[[nodiscard]] std::expected<Decoded<Request>, Error> ReadRequest(
    std::span<const std::byte> input) {
    auto request = ReadRecordFrame<Request, Policy>(input);
    if (request) {
        spdlog::debug("burp: {} {}:{}/{}", request->value.kind.name,
                      request->value.module.name, request->value.function.name,
                      request->value.arguments.items.size());
    }
    return request;
}

[[nodiscard]] inline std::optional<Error> WriteRequest(
    Bytes& sink, const Request& request) {
    return WriteFrame(sink, request);
}

[[nodiscard]] inline std::optional<Error> WriteReply(Bytes& sink,
                                                     const Term& result) {
    return WriteFrame(sink, Reply{Atom{atoms::Reply}, result});
}

[[nodiscard]] inline std::optional<Error> WriteErrorReply(
    Bytes& sink, const ErrorDetail& detail) {
    return WriteFrame(sink, ErrorReply{Atom{atoms::Error}, detail});
}

}  // namespace Bert
