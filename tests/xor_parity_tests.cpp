#include <boost/test/unit_test.hpp>  // NOTE: not the included runner here
#include <xorec/fec_core/xor_parity.h>
#include <xorec/codec/errors.h>
#include "test_util.h"

using namespace xorec::fec_core;
using xorec::codec::codec_errc;
using xorec_test::to_bytes;
using xorec_test::u8;

using Views = std::vector<std::span<const std::byte>>;

BOOST_AUTO_TEST_SUITE(xor_parity_suite)

BOOST_AUTO_TEST_CASE(xor_parity_basic) {
    const auto f0 = to_bytes("Hello ");
    const auto f1 = to_bytes("world!");
    const auto f2 = to_bytes("ABCDE!");

    std::vector<std::byte> parity;
    const Views all{ f0, f1, f2 };
    BOOST_REQUIRE(!compute_parity(all, parity));
    BOOST_REQUIRE_EQUAL(parity.size(), f0.size());

    // Verify bytewise parity
    for (size_t i = 0; i < parity.size(); ++i) {
        const auto x = f0[i] ^ f1[i] ^ f2[i];
        BOOST_TEST(u8(parity[i]) == u8(x));
    }
}

BOOST_AUTO_TEST_CASE(mismatched_lengths_rejected) {
    const auto f0 = to_bytes("abcdef");
    const auto f1 = to_bytes("ghijk");
    std::vector<std::byte> parity;
    const Views v{ f0, f1 };
    BOOST_TEST((compute_parity(v, parity) == codec_errc::invalid_parameter));
    BOOST_TEST(parity.empty());

    const Views none;
    BOOST_TEST((compute_parity(none, parity) == codec_errc::invalid_parameter));
}

BOOST_AUTO_TEST_CASE(recover_each_missing_index) {
    const auto f0 = to_bytes("alpha__");
    const auto f1 = to_bytes("beta___");
    const auto f2 = to_bytes("gamma__");
    const auto f3 = to_bytes("delta__");
    const std::vector<std::vector<std::byte>> frames{ f0, f1, f2, f3 };

    std::vector<std::byte> parity;
    const Views all(frames.begin(), frames.end());
    BOOST_REQUIRE(!compute_parity(all, parity));

    for (int missing = 0; missing < 4; ++missing) {
        std::vector<KnownChunk> known;
        for (int i = 0; i < 4; ++i) {
            if (i != missing) known.push_back({ i, frames[static_cast<size_t>(i)] });
        }
        std::vector<std::byte> rec;
        BOOST_REQUIRE(!recover_missing(known, parity, 4, missing, rec));
        BOOST_TEST((rec == frames[static_cast<size_t>(missing)]));
    }
}

BOOST_AUTO_TEST_CASE(two_missing_or_no_parity_is_insufficient) {
    const auto f0 = to_bytes("abcdef");
    const auto f1 = to_bytes("ghijkl");
    const auto f2 = to_bytes("mnopqr");
    std::vector<std::byte> parity;
    const Views all{ f0, f1, f2 };
    BOOST_REQUIRE(!compute_parity(all, parity));

    std::vector<std::byte> out;
    const std::vector<KnownChunk> only0{ { 0, f0 } };
    BOOST_TEST((recover_missing(only0, parity, 3, 1, out) == codec_errc::insufficient_fragments));

    const std::vector<KnownChunk> two{ { 0, f0 }, { 2, f2 } };
    BOOST_TEST((recover_missing(two, std::span<const std::byte>{}, 3, 1, out) == codec_errc::insufficient_fragments));
    BOOST_TEST(out.empty());
}

BOOST_AUTO_TEST_CASE(inconsistent_known_set_is_invalid) {
    const auto f0 = to_bytes("abcd");
    const auto f1 = to_bytes("efgh");
    const auto shorter = to_bytes("ijk");
    const auto parity = to_bytes("zzzz");
    std::vector<std::byte> out;

    const std::vector<KnownChunk> dup{ { 0, f0 }, { 0, f1 } };
    BOOST_TEST((recover_missing(dup, parity, 3, 2, out) == codec_errc::invalid_parameter));

    const std::vector<KnownChunk> has_missing{ { 0, f0 }, { 2, f1 } };
    BOOST_TEST((recover_missing(has_missing, parity, 3, 2, out) == codec_errc::invalid_parameter));

    const std::vector<KnownChunk> bad_len{ { 0, f0 }, { 1, shorter } };
    BOOST_TEST((recover_missing(bad_len, parity, 3, 2, out) == codec_errc::invalid_parameter));

    const std::vector<KnownChunk> ok{ { 0, f0 }, { 1, f1 } };
    BOOST_TEST((recover_missing(ok, parity, 3, 3, out) == codec_errc::invalid_parameter));
    BOOST_TEST((recover_missing(ok, parity, 0, 0, out) == codec_errc::invalid_parameter));
}

BOOST_AUTO_TEST_CASE(k1_parity_is_the_chunk) {
    const auto f0 = to_bytes("solo");
    std::vector<std::byte> parity;
    const Views one{ f0 };
    BOOST_REQUIRE(!compute_parity(one, parity));
    BOOST_TEST((parity == f0));

    std::vector<std::byte> rec;
    BOOST_REQUIRE(!recover_missing(std::span<const KnownChunk>{}, parity, 1, 0, rec));
    BOOST_TEST((rec == f0));
}

BOOST_AUTO_TEST_SUITE_END()
