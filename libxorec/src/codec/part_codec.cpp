#include <xorec/codec/part_codec.h>
#include <xorec/fec_core/chunk_splitter.h>
#include <xorec/fec_core/xor_parity.h>
#include <xorec/util/sha256.h>
#include <algorithm>

namespace xorec::codec {

    std::error_code encode_part(std::span<const std::byte> data,
        int k,
        int m,
        std::uint32_t part_index,
        PartEncoding& out)
    {
        if (k <= 0 || m < 1 || data.empty()) {
            return codec_errc::invalid_parameter;
        }

        std::vector<std::vector<std::byte>> chunks;
        std::size_t chunk_size = 0;
        if (auto ec = fec_core::split_chunks(data, k, chunks, chunk_size); ec) {
            return ec;
        }

        std::vector<std::span<const std::byte>> views(chunks.begin(), chunks.end());
        std::vector<std::byte> parity;
        if (auto ec = fec_core::compute_parity(views, parity); ec) {
            return ec;
        }

        PartEncoding enc;
        const auto total = static_cast<std::size_t>(k) + static_cast<std::size_t>(m);
        enc.fragments.reserve(total);

        for (std::size_t i = 0; i < chunks.size(); ++i) {
            Fragment f;
            f.part_index = part_index;
            f.fragment_index = static_cast<std::uint32_t>(i);
            f.digest = util::sha256_hex(chunks[i]);
            f.bytes = std::move(chunks[i]);
            enc.fragments.push_back(std::move(f));
        }

        const std::string parity_digest = util::sha256_hex(parity);
        for (int j = 0; j < m; ++j) {
            Fragment f;
            f.part_index = part_index;
            f.fragment_index = static_cast<std::uint32_t>(k + j);
            f.bytes = parity;
            f.digest = parity_digest;
            enc.fragments.push_back(std::move(f));
        }

        auto& meta = enc.metadata;
        meta.original_length = data.size();
        meta.chunk_size = chunk_size;
        meta.k = k;
        meta.m = m;
        meta.num_fragments = k + m;
        meta.data_hash = util::sha256_hex(data);
        meta.fragment_hashes.reserve(total);
        for (const auto& f : enc.fragments) meta.fragment_hashes.push_back(f.digest);

        out = std::move(enc);
        return {};
    }

    std::error_code validate_part_metadata(const PartMetadata& meta) noexcept
    {
        if (meta.k <= 0 || meta.m < 1) return codec_errc::invalid_parameter;
        if (meta.num_fragments != meta.k + meta.m) return codec_errc::invalid_parameter;
        if (meta.original_length == 0) return codec_errc::invalid_parameter;

        // chunk_size * k covers the part and the padding is shorter than k bytes.
        const auto k = static_cast<std::uint64_t>(meta.k);
        if (meta.chunk_size != (meta.original_length + k - 1) / k) {
            return codec_errc::invalid_parameter;
        }
        if (!meta.fragment_hashes.empty()
            && meta.fragment_hashes.size() != static_cast<std::size_t>(meta.num_fragments)) {
            return codec_errc::invalid_parameter;
        }
        return {};
    }

    std::error_code decode_part(std::span<const Fragment> fragments,
        const PartMetadata& meta,
        std::vector<std::byte>& out,
        DecodeReport* report)
    {
        if (auto ec = validate_part_metadata(meta); ec) {
            return ec;
        }
        const int k = meta.k;

        // 1. Per-fragment checks, classifying into data slots and parity.
        std::vector<const Fragment*> data(static_cast<std::size_t>(k), nullptr);
        std::vector<const Fragment*> parity;
        std::vector<bool> seen(static_cast<std::size_t>(meta.num_fragments), false);

        for (const auto& f : fragments) {
            if (f.fragment_index >= static_cast<std::uint32_t>(meta.num_fragments)) {
                return codec_errc::invalid_parameter;
            }
            auto&& slot = seen[f.fragment_index];
            if (slot) return codec_errc::invalid_parameter;
            slot = true;

            // A blob resized on disk fails its digest before its length.
            const std::string& expected = meta.fragment_hashes.empty()
                ? f.digest
                : meta.fragment_hashes[f.fragment_index];
            if (!expected.empty() && util::sha256_hex(f.bytes) != expected) {
                return codec_errc::integrity_error;
            }
            if (f.bytes.size() != meta.chunk_size) {
                return codec_errc::invalid_parameter;
            }

            if (f.is_parity(k)) parity.push_back(&f);
            else data[f.fragment_index] = &f;
        }

        std::sort(parity.begin(), parity.end(), [](const Fragment* a, const Fragment* b) {
            return a->fragment_index < b->fragment_index;
        });

        // 2. Shape, then cardinality. Two missing data chunks are unrecoverable
        // whatever parity is present.
        const auto missing_count = std::count(data.begin(), data.end(), nullptr);
        if (missing_count >= 2) {
            return codec_errc::unrecoverable_part;
        }
        if (fragments.size() < static_cast<std::size_t>(k)) {
            return codec_errc::insufficient_fragments;
        }

        // 3. Direct path or single-erasure recovery.
        DecodeReport rep;
        rep.fragments_supplied = fragments.size();
        std::vector<std::byte> recovered;

        if (missing_count == 1 && !parity.empty()) {
            const auto missing_it = std::find(data.begin(), data.end(), nullptr);
            const int missing = static_cast<int>(missing_it - data.begin());

            std::vector<fec_core::KnownChunk> known;
            known.reserve(static_cast<std::size_t>(k - 1));
            for (int i = 0; i < k; ++i) {
                const Fragment* f = data[static_cast<std::size_t>(i)];
                if (f) known.push_back({ i, f->bytes });
            }

            const Fragment* p = parity.front();
            if (auto ec = fec_core::recover_missing(known, p->bytes, k, missing, recovered); ec) {
                return ec;
            }
            rep.path = DecodePath::recovered;
            rep.recovered_index = missing;
            rep.parity_index = static_cast<int>(p->fragment_index);
        }
        else if (missing_count != 0) {
            return codec_errc::unrecoverable_part;
        }

        std::vector<std::span<const std::byte>> ordered;
        ordered.reserve(data.size());
        for (const Fragment* f : data) {
            if (f) ordered.emplace_back(f->bytes);
            else ordered.emplace_back(recovered);
        }

        // 4. Strip padding and verify against the part hash.
        auto bytes = fec_core::join_chunks(std::span<const std::span<const std::byte>>(ordered),
            static_cast<std::size_t>(meta.original_length));
        if (util::sha256_hex(bytes) != meta.data_hash) {
            return codec_errc::integrity_error;
        }

        out = std::move(bytes);
        if (report) *report = rep;
        return {};
    }

} // namespace xorec::codec
