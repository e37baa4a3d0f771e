#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace xorec::codec {

    // One stored unit of a part: a data chunk (index 0..k-1) or a parity
    // chunk (index k..k+m-1). bytes.size() == chunk_size of the part.
    struct Fragment {
        std::uint32_t part_index{ 0 };
        std::uint32_t fragment_index{ 0 };
        std::vector<std::byte> bytes;
        std::string digest;                 // hex SHA-256 of bytes; may be empty when read back from storage

        bool is_parity(int k) const noexcept {
            return k >= 0 && fragment_index >= static_cast<std::uint32_t>(k);
        }
    };

} // namespace xorec::codec
