#pragma once
#include <array>
#include <cstddef>
#include <span>
#include <string>
#include <string_view>

namespace xorec::util {

    using Digest256 = std::array<std::byte, 32>;

    // One-shot SHA-256 (OpenSSL EVP). Throws std::runtime_error if the
    // OpenSSL digest context cannot be created or driven.
    Digest256 sha256(std::span<const std::byte> data);
    Digest256 sha256(std::string_view s);

    // Lowercase hex, two characters per byte.
    std::string to_hex(std::span<const std::byte> data);

    // Convenience: lowercase hex SHA-256, the form stored in metadata.
    inline std::string sha256_hex(std::span<const std::byte> data) {
        const auto d = sha256(data);
        return to_hex(d);
    }

} // namespace xorec::util
