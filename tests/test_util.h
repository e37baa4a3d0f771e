#pragma once
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <system_error>
#include <vector>
#include <xorec/util/uuid.h>

// Helpers shared by the test suites.
namespace xorec_test {

    inline std::vector<std::byte> to_bytes(const std::string& s) {
        std::vector<std::byte> v(s.size());
        for (size_t i = 0; i < s.size(); ++i) v[i] = std::byte{ static_cast<unsigned char>(s[i]) };
        return v;
    }

    inline unsigned u8(std::byte b) {
        return static_cast<unsigned>(std::to_integer<unsigned char>(b));
    }

    // Deterministic, non-repeating-looking payload.
    inline std::vector<std::byte> pattern(std::size_t len, std::uint32_t salt = 0) {
        std::vector<std::byte> v(len);
        std::uint32_t x = 0x9E3779B9u ^ salt;
        for (size_t i = 0; i < len; ++i) {
            x = x * 1664525u + 1013904223u;
            v[i] = std::byte{ static_cast<unsigned char>(x >> 24) };
        }
        return v;
    }

    // Fresh directory under the system temp dir, removed on scope exit.
    struct TempDir {
        std::filesystem::path path;

        TempDir() : path(std::filesystem::temp_directory_path() / ("xorec_test_" + xorec::util::uuid_v4())) {
            std::filesystem::create_directories(path);
        }
        ~TempDir() {
            std::error_code ec;
            std::filesystem::remove_all(path, ec);
        }
        TempDir(const TempDir&) = delete;
        TempDir& operator=(const TempDir&) = delete;
    };

} // namespace xorec_test
