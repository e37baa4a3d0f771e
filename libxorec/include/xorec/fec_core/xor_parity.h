#pragma once
#include <cstddef>
#include <cstdint>
#include <span>
#include <system_error>
#include <vector>

// XOR parity over equal-length chunks (single-erasure code).
//
// Limitation: parity = c0 ^ c1 ^ ... ^ c(k-1) is one linear equation, so it
// can solve for exactly one unknown chunk. Producing more parity fragments of
// the same XOR does not let a part survive a second data erasure.
namespace xorec::fec_core {

    // acc[i] ^= src[i] for i < min(acc.size(), src.size()).
    void xor_into(std::span<std::byte> acc, std::span<const std::byte> src) noexcept;

    // Byte-wise XOR of all chunks into out_parity (resized to the chunk length).
    // Every chunk must have the same non-zero length; a mismatch is
    // codec_errc::invalid_parameter instead of silently XORing misaligned data.
    std::error_code compute_parity(std::span<const std::span<const std::byte>> chunks,
        std::vector<std::byte>& out_parity);

    struct KnownChunk {
        int index{ 0 };                    // data index in [0, k)
        std::span<const std::byte> bytes;
    };

    // Rebuild the single missing data chunk: missing = parity ^ (all known).
    // - known:         the k-1 data chunks that are present (any order)
    // - parity:        XOR parity of all k chunks; empty means "not available"
    // - missing_index: index in [0, k) absent from `known`
    // Errors:
    //   insufficient_fragments - parity unavailable, or more than one chunk missing
    //   invalid_parameter      - bad k/index, duplicate index, length mismatch
    std::error_code recover_missing(std::span<const KnownChunk> known,
        std::span<const std::byte> parity,
        int k,
        int missing_index,
        std::vector<std::byte>& out_recovered);

} // namespace xorec::fec_core
