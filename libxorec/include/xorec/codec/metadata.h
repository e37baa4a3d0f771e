#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace xorec::codec {

    // Codec configuration, fully enumerated at the FileCodec boundary.
    struct CodecConfig {
        int num_parts{ 1 };
        int k{ 4 };
        int m{ 1 };
    };

    // Per-part record produced by encode_part, consumed by decode_part.
    struct PartMetadata {
        std::uint64_t original_length{ 0 };
        std::uint64_t chunk_size{ 0 };
        int k{ 0 };
        int m{ 0 };
        int num_fragments{ 0 };             // always k + m
        std::string data_hash;              // hex SHA-256 of the unpadded part bytes
        std::vector<std::string> fragment_hashes; // optional; one per fragment index

        bool operator==(const PartMetadata&) const = default;
    };

    // Root record for one encoded file. parts[i] belongs to part index i.
    struct FileMetadata {
        std::string original_filename;
        std::uint64_t original_size{ 0 };
        std::string original_hash;
        int num_parts{ 0 };
        int k{ 0 };
        int m{ 0 };
        std::vector<PartMetadata> parts;

        bool operator==(const FileMetadata&) const = default;
    };

} // namespace xorec::codec
