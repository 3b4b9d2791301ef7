// Fuzz target for NoteStoreDecoder: arbitrary payloads must either decode
// or fail with a schema error, never crash.

#include <notetext-cpp/decoder.hpp>

#include <cstddef>
#include <cstdint>
#include <span>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const auto span = std::span<const std::byte>(
        reinterpret_cast<const std::byte*>(data), size);

    auto decoder = notetext_cpp::NoteStoreDecoder{span};
    auto body = decoder.decode();
    if (!body && !decoder.error()) __builtin_trap();
    return 0;
}
