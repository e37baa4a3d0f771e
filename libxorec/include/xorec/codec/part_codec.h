#pragma once
#include <cstddef>
#include <cstdint>
#include <span>
#include <system_error>
#include <vector>
#include <xorec/codec/errors.h>
#include <xorec/codec/fragment.h>
#include <xorec/codec/metadata.h>

namespace xorec::codec {

    // Result of encoding one part: k data fragments followed by m parity
    // fragments, in fragment-index order.
    struct PartEncoding {
        std::vector<Fragment> fragments;
        PartMetadata metadata;
    };

    enum class DecodePath : std::uint8_t {
        direct,     // all k data fragments present, parity unused
        recovered,  // one data fragment rebuilt from parity
    };

    // What decode_part did (for tools and tests).
    struct DecodeReport {
        DecodePath path{ DecodePath::direct };
        int recovered_index{ -1 };          // data index rebuilt, -1 if direct
        int parity_index{ -1 };             // fragment index of the parity used, -1 if direct
        std::size_t fragments_supplied{ 0 };
    };

    // Encode one part into k data + m XOR parity fragments.
    // Every parity fragment holds the same XOR of all data chunks, so m > 1
    // adds copies, not extra recoverable erasures.
    // Errors: invalid_parameter (k <= 0, m < 1, empty data).
    std::error_code encode_part(std::span<const std::byte> data,
        int k,
        int m,
        std::uint32_t part_index,
        PartEncoding& out);

    // Structural checks on a PartMetadata record:
    // k >= 1, m >= 1, num_fragments == k + m, original_length > 0,
    // chunk_size == ceil(original_length / k), fragment_hashes empty or k + m long.
    std::error_code validate_part_metadata(const PartMetadata& meta) noexcept;

    // Rebuild one part from a caller-selected subset of its fragments.
    //   1. bad index / duplicate                         -> invalid_parameter
    //      fragment digest mismatch                      -> integrity_error
    //      wrong length (no digest to check)             -> invalid_parameter
    //   2. two or more data fragments missing            -> unrecoverable_part
    //      fewer than k fragments                        -> insufficient_fragments
    //   3. all k data present                            -> direct join
    //      k-1 data present and any parity present       -> XOR recovery
    //   4. SHA-256 of the result != metadata.data_hash   -> integrity_error
    // `out` is only written on success.
    std::error_code decode_part(std::span<const Fragment> fragments,
        const PartMetadata& meta,
        std::vector<std::byte>& out,
        DecodeReport* report = nullptr);

} // namespace xorec::codec
