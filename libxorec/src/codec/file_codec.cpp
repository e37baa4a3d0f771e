#include <xorec/codec/file_codec.h>
#include <xorec/util/sha256.h>

namespace xorec::codec {

    std::vector<PartRange> plan_parts(std::size_t size, int num_parts)
    {
        std::vector<PartRange> ranges;
        if (num_parts <= 0) return ranges;

        const auto n = static_cast<std::size_t>(num_parts);
        const std::size_t base = size / n;
        ranges.reserve(n);
        for (std::size_t i = 0; i < n; ++i) {
            PartRange r;
            r.offset = i * base;
            r.length = (i + 1 == n) ? size - r.offset : base;
            ranges.push_back(r);
        }
        return ranges;
    }

    std::error_code encode_file(std::span<const std::byte> data,
        const std::string& filename,
        const CodecConfig& cfg,
        FileEncoding& out)
    {
        if (cfg.num_parts < 1 || cfg.k <= 0 || cfg.m < 1) {
            return codec_errc::invalid_parameter;
        }
        // Every part must be non-empty.
        if (data.empty() || data.size() < static_cast<std::size_t>(cfg.num_parts)) {
            return codec_errc::invalid_parameter;
        }

        FileEncoding enc;
        auto& meta = enc.metadata;
        meta.original_filename = filename;
        meta.original_size = data.size();
        meta.original_hash = util::sha256_hex(data);
        meta.num_parts = cfg.num_parts;
        meta.k = cfg.k;
        meta.m = cfg.m;

        const auto ranges = plan_parts(data.size(), cfg.num_parts);
        enc.parts.reserve(ranges.size());
        meta.parts.reserve(ranges.size());

        for (std::size_t i = 0; i < ranges.size(); ++i) {
            PartEncoding pe;
            const auto slice = data.subspan(ranges[i].offset, ranges[i].length);
            if (auto ec = encode_part(slice, cfg.k, cfg.m, static_cast<std::uint32_t>(i), pe); ec) {
                return ec;
            }
            enc.parts.push_back(std::move(pe.fragments));
            meta.parts.push_back(std::move(pe.metadata));
        }

        out = std::move(enc);
        return {};
    }

    std::error_code validate_file_metadata(const FileMetadata& meta) noexcept
    {
        if (meta.num_parts < 1 || meta.k <= 0 || meta.m < 1) {
            return codec_errc::invalid_parameter;
        }
        if (meta.parts.size() != static_cast<std::size_t>(meta.num_parts)) {
            return codec_errc::invalid_parameter;
        }

        std::uint64_t total = 0;
        for (const auto& p : meta.parts) {
            if (p.k != meta.k || p.m != meta.m) return codec_errc::invalid_parameter;
            if (auto ec = validate_part_metadata(p); ec) return ec;
            total += p.original_length;
        }
        if (total != meta.original_size) {
            return codec_errc::invalid_parameter;
        }
        return {};
    }

    std::error_code decode_file(const std::vector<std::vector<Fragment>>& subsets,
        const FileMetadata& meta,
        std::vector<std::byte>& out,
        std::vector<DecodeReport>* reports)
    {
        if (auto ec = validate_file_metadata(meta); ec) {
            return ec;
        }
        if (subsets.size() != meta.parts.size()) {
            return codec_errc::invalid_parameter;
        }

        // Grows part by part; original_size is not trusted for allocation.
        std::vector<std::byte> joined;
        std::vector<DecodeReport> reps;
        reps.reserve(meta.parts.size());

        // Ascending part order is the only ordering the output depends on.
        for (std::size_t i = 0; i < meta.parts.size(); ++i) {
            for (const auto& f : subsets[i]) {
                if (f.part_index != i) return codec_errc::invalid_parameter;
            }

            std::vector<std::byte> part;
            DecodeReport rep;
            if (auto ec = decode_part(subsets[i], meta.parts[i], part, &rep); ec) {
                return ec;
            }
            joined.insert(joined.end(), part.begin(), part.end());
            reps.push_back(rep);
        }

        if (util::sha256_hex(joined) != meta.original_hash) {
            return codec_errc::integrity_error;
        }

        out = std::move(joined);
        if (reports) *reports = std::move(reps);
        return {};
    }

} // namespace xorec::codec
