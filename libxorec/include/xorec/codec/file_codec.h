#pragma once
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <system_error>
#include <vector>
#include <xorec/codec/part_codec.h>

namespace xorec::codec {

    struct FileEncoding {
        std::vector<std::vector<Fragment>> parts;   // [part_index][fragment_index]
        FileMetadata metadata;
    };

    // Byte ranges of the parts: every part but the last gets size / num_parts
    // bytes, the last one absorbs the remainder.
    struct PartRange {
        std::size_t offset{ 0 };
        std::size_t length{ 0 };
    };
    std::vector<PartRange> plan_parts(std::size_t size, int num_parts);

    // Split `data` into cfg.num_parts parts and encode each with cfg.k / cfg.m.
    // Errors: invalid_parameter (num_parts < 1, data shorter than num_parts,
    // k <= 0, m < 1, empty data).
    std::error_code encode_file(std::span<const std::byte> data,
        const std::string& filename,
        const CodecConfig& cfg,
        FileEncoding& out);

    // Consistency of a FileMetadata record and of every part inside it.
    std::error_code validate_file_metadata(const FileMetadata& meta) noexcept;

    // Decode every part from subsets[part_index] and concatenate in part order.
    // Any part failure aborts with that error; no partial output. The joined
    // bytes are checked against meta.original_hash (integrity_error).
    // reports, when given, receives one DecodeReport per part.
    std::error_code decode_file(const std::vector<std::vector<Fragment>>& subsets,
        const FileMetadata& meta,
        std::vector<std::byte>& out,
        std::vector<DecodeReport>* reports = nullptr);

} // namespace xorec::codec
