#pragma once
#include <array>
#include <chrono>
#include <cstdint>
#include <string>
#include <xorec/sim/rng.h>
#include <xorec/util/sha256.h>

namespace xorec::util {

    // UUID v4 for run ids: steady_clock + address entropy through XorShift32.
    // Not cryptographic.
    inline std::string uuid_v4() {
        using clock = std::chrono::steady_clock;
        auto now = static_cast<std::uint64_t>(clock::now().time_since_epoch().count());
        const void* self = static_cast<const void*>(&now);
        now ^= reinterpret_cast<std::uintptr_t>(self) * 0x9E3779B97F4A7C15ull;

        xorec::sim::XorShift32 rng(static_cast<std::uint32_t>(now ^ (now >> 32)));

        std::array<std::byte, 16> b{};
        for (auto& v : b) v = static_cast<std::byte>(rng.next_u32() & 0xFF);

        // Version 4, variant 10xx.
        b[6] = (b[6] & std::byte{ 0x0F }) | std::byte{ 0x40 };
        b[8] = (b[8] & std::byte{ 0x3F }) | std::byte{ 0x80 };

        const std::string hex = to_hex(b);
        return hex.substr(0, 8) + '-' + hex.substr(8, 4) + '-' + hex.substr(12, 4) + '-'
            + hex.substr(16, 4) + '-' + hex.substr(20, 12);
    }

} // namespace xorec::util
