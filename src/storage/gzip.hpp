#pragma once

// gzip envelope around note payloads.
//
// Current note records are gzip streams (RFC 1952, magic 0x1f 0x8b).
// Older records store the protobuf payload without an envelope, so a
// missing magic means "already plain", not an error.
//
// Internal header, not installed.

#include <array>
#include <cstddef>
#include <optional>
#include <span>
#include <vector>

#include <zlib.h>

namespace notetext_cpp::storage {

inline constexpr std::byte gzip_magic_0{0x1F};
inline constexpr std::byte gzip_magic_1{0x8B};

// 32 KiB window; adding 16 makes zlib read and write the gzip wrapper.
inline constexpr int gzip_window_bits = 15 + 16;

inline constexpr std::size_t default_max_output_size = std::size_t{64} * 1024 * 1024;

inline auto is_gzip(std::span<const std::byte> data) -> bool {
    return data.size() >= 2 && data[0] == gzip_magic_0 && data[1] == gzip_magic_1;
}

// Inflate one gzip member in fixed-size steps.
// nullopt for a bad header, corrupt data, CRC mismatch, truncated input,
// or output that would exceed max_output_size.
inline auto gunzip(std::span<const std::byte> input,
                   std::size_t max_output_size = default_max_output_size)
    -> std::optional<std::vector<std::byte>> {
    if (!is_gzip(input)) return std::nullopt;

    auto stream = z_stream{};
    if (::inflateInit2(&stream, gzip_window_bits) != Z_OK) return std::nullopt;
    stream.next_in = reinterpret_cast<Bytef*>(const_cast<std::byte*>(input.data()));
    stream.avail_in = static_cast<uInt>(input.size());

    auto output = std::vector<std::byte>{};
    auto step = std::array<std::byte, 16 * 1024>{};
    auto status = Z_OK;
    auto over_limit = false;

    // Z_BUF_ERROR ends the loop when the input runs out mid-stream.
    while (status == Z_OK) {
        stream.next_out = reinterpret_cast<Bytef*>(step.data());
        stream.avail_out = static_cast<uInt>(step.size());
        status = ::inflate(&stream, Z_NO_FLUSH);
        if (status != Z_OK && status != Z_STREAM_END) break;

        auto produced = step.size() - stream.avail_out;
        if (produced > max_output_size - output.size()) {
            over_limit = true;
            break;
        }
        output.insert(output.end(), step.begin(), step.begin() + static_cast<std::ptrdiff_t>(produced));
    }
    ::inflateEnd(&stream);

    if (over_limit || status != Z_STREAM_END) return std::nullopt;
    return output;
}

// Undo the optional envelope: gunzip when the magic is present, copy the
// input through otherwise. nullopt only for a corrupt gzip stream.
inline auto decompress_payload(std::span<const std::byte> input,
                               std::size_t max_output_size = default_max_output_size)
    -> std::optional<std::vector<std::byte>> {
    if (!is_gzip(input)) return std::vector<std::byte>(input.begin(), input.end());
    return gunzip(input, max_output_size);
}

}  // namespace notetext_cpp::storage
