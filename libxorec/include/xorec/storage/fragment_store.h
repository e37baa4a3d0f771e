#pragma once
#include <cstdint>
#include <filesystem>
#include <span>
#include <string>
#include <system_error>
#include <vector>
#include <xorec/codec/fragment.h>

namespace xorec::storage {

    // Directory-backed blob store: one file per (part_index, fragment_index),
    // named part_<p>_frag_<f>.bin, holding the raw chunk bytes.
    class FragmentStore {
    public:
        explicit FragmentStore(std::filesystem::path dir) : dir_(std::move(dir)) {}

        // Create the directory if needed.
        std::error_code prepare() const;

        std::filesystem::path path_for(std::uint32_t part_index, std::uint32_t fragment_index) const;
        static std::string blob_name(std::uint32_t part_index, std::uint32_t fragment_index);

        // Overwrites an existing blob.
        std::error_code put(const codec::Fragment& f) const;
        std::error_code put_all(const std::vector<std::vector<codec::Fragment>>& parts) const;

        // Reads one blob. out.digest is left empty: verification happens in
        // decode against the metadata's fragment hashes.
        std::error_code get(std::uint32_t part_index, std::uint32_t fragment_index, codec::Fragment& out) const;

        // Deleting a blob that does not exist is not an error.
        std::error_code remove(std::uint32_t part_index, std::uint32_t fragment_index) const;

        // Fragment indices in [0, num_fragments) present on disk, ascending.
        std::vector<std::uint32_t> available(std::uint32_t part_index, int num_fragments) const;

        // Read the listed fragments of one part, in the given order.
        std::error_code load_part(std::uint32_t part_index,
            std::span<const std::uint32_t> indices,
            std::vector<codec::Fragment>& out) const;

        const std::filesystem::path& dir() const noexcept { return dir_; }

    private:
        std::filesystem::path dir_;
    };

} // namespace xorec::storage
