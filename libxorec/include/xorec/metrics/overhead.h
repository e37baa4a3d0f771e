#pragma once
#include <cstdint>
#include <xorec/codec/metadata.h>

namespace xorec::metrics {

    // Storage cost of an encoding: stored = sum over parts of chunk_size * (k + m).
    struct StorageOverhead {
        std::uint64_t original_bytes{ 0 };
        std::uint64_t stored_bytes{ 0 };
        double overhead_pct{ 0.0 };     // (stored - original) / original * 100
        double efficiency_pct{ 0.0 };   // original / stored * 100
    };

    inline StorageOverhead storage_overhead(const codec::FileMetadata& meta) noexcept {
        StorageOverhead s;
        s.original_bytes = meta.original_size;
        for (const auto& p : meta.parts) {
            s.stored_bytes += p.chunk_size * static_cast<std::uint64_t>(p.num_fragments);
        }
        if (s.original_bytes > 0) {
            s.overhead_pct = (static_cast<double>(s.stored_bytes) - static_cast<double>(s.original_bytes))
                / static_cast<double>(s.original_bytes) * 100.0;
        }
        if (s.stored_bytes > 0) {
            s.efficiency_pct = static_cast<double>(s.original_bytes) / static_cast<double>(s.stored_bytes) * 100.0;
        }
        return s;
    }

} // namespace xorec::metrics
