#pragma once
#include <string>
#include <string_view>
#include <system_error>
#include <xorec/codec/metadata.h>

namespace xorec::storage {

    // Default file name used by the tools next to the fragment directory.
    inline constexpr std::string_view k_metadata_filename = "reconstruction_metadata.json";

    // Render FileMetadata as JSON (two-space indent, integers unquoted).
    std::string to_json(const codec::FileMetadata& meta);

    // Parse JSON produced by to_json (or an equivalent record). Unknown keys
    // are ignored; "fragment_hashes" is optional per part.
    // Errors: codec_errc::invalid_parameter for malformed JSON, missing or
    // ill-typed fields. `out` is only written on success.
    std::error_code from_json(std::string_view text, codec::FileMetadata& out);

    // File helpers. I/O failures come back as std::errc codes.
    std::error_code save_metadata(const std::string& filepath, const codec::FileMetadata& meta);
    std::error_code load_metadata(const std::string& filepath, codec::FileMetadata& out);

} // namespace xorec::storage
