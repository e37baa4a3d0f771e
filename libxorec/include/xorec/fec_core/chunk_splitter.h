#pragma once
#include <cstddef>
#include <span>
#include <system_error>
#include <vector>

namespace xorec::fec_core {

    // Split `data` into exactly k chunks of chunk_size = ceil(len/k) bytes.
    // The last chunk is zero padded on the right when len % k != 0.
    // - out_chunks:     resized to k, each chunk_size bytes
    // - out_chunk_size: chunk_size
    // Returns codec_errc::invalid_parameter for k <= 0 or empty data;
    // outputs are untouched on failure.
    std::error_code split_chunks(std::span<const std::byte> data,
        int k,
        std::vector<std::vector<std::byte>>& out_chunks,
        std::size_t& out_chunk_size);

    // Concatenate chunks in index order and truncate to original_length
    // (drops the padding added by split_chunks).
    std::vector<std::byte> join_chunks(std::span<const std::span<const std::byte>> chunks,
        std::size_t original_length);
    std::vector<std::byte> join_chunks(const std::vector<std::vector<std::byte>>& chunks,
        std::size_t original_length);

    // ceil(len / k); 0 when k <= 0.
    inline std::size_t chunk_size_for(std::size_t len, int k) noexcept {
        if (k <= 0) return 0;
        const auto kk = static_cast<std::size_t>(k);
        return (len + kk - 1) / kk;
    }

} // namespace xorec::fec_core
