#pragma once
#include <cstddef>
#include <cstdint>
#include <utility>
#include <vector>

namespace xorec::sim {

    // xorshift32 (13, 17, 5). A given --seed yields the same loss pattern on
    // every platform, which std::mt19937 distributions do not guarantee.
    class XorShift32 {
    public:
        explicit XorShift32(std::uint32_t seed) noexcept
            : state_(seed != 0 ? seed : k_zero_seed_substitute) {}

        std::uint32_t next_u32() noexcept {
            state_ ^= state_ << 13;
            state_ ^= state_ >> 17;
            state_ ^= state_ << 5;
            return state_;
        }

        // [0,1) from the top 24 bits.
        double next_unit() noexcept {
            return static_cast<double>(next_u32() >> 8) / static_cast<double>(1u << 24);
        }

        // [0, n); 0 when n == 0.
        std::uint32_t next_below(std::uint32_t n) noexcept {
            return n == 0 ? 0u : next_u32() % n;
        }

    private:
        // Zero is a fixed point of xorshift.
        static constexpr std::uint32_t k_zero_seed_substitute = 0xA3C59AC3u;

        std::uint32_t state_;
    };

    // Fisher-Yates over the whole vector.
    template <typename T>
    void shuffle(std::vector<T>& v, XorShift32& rng) noexcept {
        for (std::size_t i = v.size(); i > 1; --i) {
            const auto j = static_cast<std::size_t>(rng.next_below(static_cast<std::uint32_t>(i)));
            std::swap(v[i - 1], v[j]);
        }
    }

} // namespace xorec::sim
