#pragma once
#include <cstdint>
#include <span>
#include <vector>
#include <xorec/sim/rng.h>

// Fragment-availability simulation. The codec never decides which fragments
// survive; these helpers produce the subsets the tools and tests feed to it.
namespace xorec::sim {

    // Bernoulli loss: drop with probability p_loss each trial.
    struct BernoulliLoss {
        double p_loss{ 0.0 }; // in [0,1]
        bool drop(XorShift32& rng) noexcept;
    };

    // Indices of k + m fragments that survive independent Bernoulli loss, ascending.
    std::vector<std::uint32_t> select_bernoulli(int k, int m, BernoulliLoss loss, XorShift32& rng);

    // Pick exactly k surviving fragments that are always decodable: visit all
    // indices in random order, keep data fragments, and accept a parity
    // fragment only once k-1 data fragments are already kept. Ascending.
    std::vector<std::uint32_t> select_recoverable(int k, int m, XorShift32& rng);

    // All indices in [0, k + m) except the ones in `lost`, ascending.
    std::vector<std::uint32_t> drop_indices(int k, int m, std::span<const std::uint32_t> lost);

    // Complement of `kept` within [0, k + m), ascending.
    std::vector<std::uint32_t> lost_indices(int k, int m, std::span<const std::uint32_t> kept);

} // namespace xorec::sim
