/// @file decoder.hpp
/// @brief Structured decoding of note store records.

#pragma once

#include <notetext-cpp/error.hpp>
#include <notetext-cpp/types.hpp>

#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace notetext_cpp {

/// Decompress an optional gzip envelope.
///
/// Returns the input unchanged when it does not start with the gzip magic.
/// Returns std::nullopt when the envelope is present but the stream is
/// corrupt, truncated, or inflates past max_output_size.
auto decompress_note_data(std::span<const std::byte> data,
                          std::size_t max_output_size = std::size_t{64} * 1024 * 1024)
    -> std::optional<std::vector<std::byte>>;

/// Parses a decompressed note record into text and attribute runs.
///
/// The payload is parsed with libprotobuf against proto/notestore.proto.
/// The decoder is a pure structural unmarshal: it does not interpret run
/// semantics. Malformed wire data, a missing required field at any level
/// (document, note, note text, run length, checklist fields), a declared
/// field sent with the wrong wire type, a group and a negative run length
/// are decode failures; the reason is available from error() afterwards.
///
/// @code
/// auto decoder = NoteStoreDecoder{payload};
/// if (auto body = decoder.decode()) {
///     use(body->text, body->runs);
/// } else {
///     log(decoder.error()->message);
/// }
/// @endcode
class NoteStoreDecoder {
public:
    explicit NoteStoreDecoder(std::span<const std::byte> payload)
        : payload_{payload} {}

    /// Decode the payload. Never throws.
    auto decode() -> std::optional<NoteBody>;

    /// The failure reason of the last decode(), if it failed.
    auto error() const -> const std::optional<Error>& { return error_; }

private:
    void fail(std::string message);

    std::span<const std::byte> payload_;
    std::optional<Error> error_;
};

/// Convenience wrapper: decode without keeping the error.
auto decode_note_store(std::span<const std::byte> payload) -> std::optional<NoteBody>;

}  // namespace notetext_cpp
