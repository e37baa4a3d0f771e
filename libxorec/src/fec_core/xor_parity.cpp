#include <xorec/fec_core/xor_parity.h>
#include <xorec/codec/errors.h>
#include <algorithm>

namespace xorec::fec_core {

    using codec::codec_errc;

    void xor_into(std::span<std::byte> acc, std::span<const std::byte> src) noexcept
    {
        const std::size_t len = std::min(acc.size(), src.size());
        for (std::size_t i = 0; i < len; ++i) {
            acc[i] ^= src[i];
        }
    }

    std::error_code compute_parity(std::span<const std::span<const std::byte>> chunks,
        std::vector<std::byte>& out_parity)
    {
        if (chunks.empty()) {
            return codec_errc::invalid_parameter;
        }
        const std::size_t len = chunks[0].size();
        if (len == 0) {
            return codec_errc::invalid_parameter;
        }
        for (const auto& c : chunks) {
            if (c.size() != len) return codec_errc::invalid_parameter;
        }

        // Start with zeros, then fold every chunk in.
        std::vector<std::byte> parity(len, std::byte{ 0 });
        for (const auto& c : chunks) {
            xor_into(parity, c);
        }
        out_parity = std::move(parity);
        return {};
    }

    std::error_code recover_missing(std::span<const KnownChunk> known,
        std::span<const std::byte> parity,
        int k,
        int missing_index,
        std::vector<std::byte>& out_recovered)
    {
        if (k <= 0 || missing_index < 0 || missing_index >= k) {
            return codec_errc::invalid_parameter;
        }

        std::vector<bool> seen(static_cast<std::size_t>(k), false);
        for (const auto& kc : known) {
            if (kc.index < 0 || kc.index >= k || kc.index == missing_index) {
                return codec_errc::invalid_parameter;
            }
            auto&& slot = seen[static_cast<std::size_t>(kc.index)];
            if (slot) return codec_errc::invalid_parameter; // duplicate
            slot = true;
        }

        // Two or more unknowns cannot be separated from one XOR equation.
        if (known.size() + 1 < static_cast<std::size_t>(k)) {
            return codec_errc::insufficient_fragments;
        }
        if (parity.empty()) {
            return codec_errc::insufficient_fragments;
        }

        const std::size_t len = parity.size();
        for (const auto& kc : known) {
            if (kc.bytes.size() != len) return codec_errc::invalid_parameter;
        }

        // Start with parity, then XOR all present chunks.
        std::vector<std::byte> rec(parity.begin(), parity.end());
        for (const auto& kc : known) {
            xor_into(rec, kc.bytes);
        }
        out_recovered = std::move(rec);
        return {};
    }

} // namespace xorec::fec_core
