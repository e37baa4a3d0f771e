#include <xorec/fec_core/chunk_splitter.h>
#include <xorec/codec/errors.h>
#include <algorithm>

namespace xorec::fec_core {

    using codec::codec_errc;

    std::error_code split_chunks(std::span<const std::byte> data,
        int k,
        std::vector<std::vector<std::byte>>& out_chunks,
        std::size_t& out_chunk_size)
    {
        if (k <= 0 || data.empty()) {
            return codec_errc::invalid_parameter;
        }

        const std::size_t chunk_size = chunk_size_for(data.size(), k);

        std::vector<std::vector<std::byte>> chunks(static_cast<std::size_t>(k));
        for (std::size_t i = 0; i < chunks.size(); ++i) {
            auto& c = chunks[i];
            c.assign(chunk_size, std::byte{ 0 });

            // Chunks past the end of data stay all-zero (possible when k > len).
            const std::size_t start = i * chunk_size;
            if (start >= data.size()) continue;
            const std::size_t n = std::min(chunk_size, data.size() - start);
            std::copy_n(data.begin() + static_cast<std::ptrdiff_t>(start), n, c.begin());
        }

        out_chunks = std::move(chunks);
        out_chunk_size = chunk_size;
        return {};
    }

    std::vector<std::byte> join_chunks(std::span<const std::span<const std::byte>> chunks,
        std::size_t original_length)
    {
        std::vector<std::byte> out;
        out.reserve(original_length);
        for (const auto& c : chunks) {
            if (out.size() >= original_length) break;
            const std::size_t n = std::min(c.size(), original_length - out.size());
            out.insert(out.end(), c.begin(), c.begin() + static_cast<std::ptrdiff_t>(n));
        }
        return out;
    }

    std::vector<std::byte> join_chunks(const std::vector<std::vector<std::byte>>& chunks,
        std::size_t original_length)
    {
        std::vector<std::span<const std::byte>> views(chunks.begin(), chunks.end());
        return join_chunks(std::span<const std::span<const std::byte>>(views), original_length);
    }

} // namespace xorec::fec_core
