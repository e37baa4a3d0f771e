#include <xorec/sim/selection.h>
#include <algorithm>

namespace xorec::sim {

    bool BernoulliLoss::drop(XorShift32& rng) noexcept
    {
        const double p = std::clamp(p_loss, 0.0, 1.0);
        if (p <= 0.0) return false;
        if (p >= 1.0) return true;
        return rng.next_unit() < p;
    }

    static std::uint32_t total_of(int k, int m) noexcept
    {
        return (k > 0 && m >= 0) ? static_cast<std::uint32_t>(k + m) : 0u;
    }

    std::vector<std::uint32_t> select_bernoulli(int k, int m, BernoulliLoss loss, XorShift32& rng)
    {
        std::vector<std::uint32_t> kept;
        const auto n = total_of(k, m);
        for (std::uint32_t i = 0; i < n; ++i) {
            if (!loss.drop(rng)) kept.push_back(i);
        }
        return kept;
    }

    std::vector<std::uint32_t> select_recoverable(int k, int m, XorShift32& rng)
    {
        const auto n = total_of(k, m);
        if (n == 0) return {};

        std::vector<std::uint32_t> order(n);
        for (std::uint32_t i = 0; i < n; ++i) order[i] = i;
        shuffle(order, rng);

        const auto kk = static_cast<std::uint32_t>(k);
        std::vector<std::uint32_t> kept;
        kept.reserve(kk);
        std::uint32_t data_kept = 0;

        for (const auto idx : order) {
            if (kept.size() >= kk) break;
            if (idx < kk) {
                kept.push_back(idx);
                ++data_kept;
            }
            else if (data_kept + 1 >= kk) {
                // Parity only helps once at most one data fragment is missing.
                kept.push_back(idx);
            }
        }

        // A parity fragment may have been skipped early; fill with data.
        for (std::uint32_t i = 0; i < kk && kept.size() < kk; ++i) {
            if (std::find(kept.begin(), kept.end(), i) == kept.end()) kept.push_back(i);
        }

        std::sort(kept.begin(), kept.end());
        return kept;
    }

    std::vector<std::uint32_t> drop_indices(int k, int m, std::span<const std::uint32_t> lost)
    {
        std::vector<std::uint32_t> kept;
        const auto n = total_of(k, m);
        for (std::uint32_t i = 0; i < n; ++i) {
            if (std::find(lost.begin(), lost.end(), i) == lost.end()) kept.push_back(i);
        }
        return kept;
    }

    std::vector<std::uint32_t> lost_indices(int k, int m, std::span<const std::uint32_t> kept)
    {
        return drop_indices(k, m, kept);
    }

} // namespace xorec::sim
