#include <boost/test/unit_test.hpp>  // not the included runner
#include <xorec/fec_core/chunk_splitter.h>
#include <xorec/codec/errors.h>
#include "test_util.h"

using namespace xorec::fec_core;
using xorec::codec::codec_errc;
using xorec_test::pattern;
using xorec_test::to_bytes;
using xorec_test::u8;

BOOST_AUTO_TEST_SUITE(chunk_splitter_suite)

BOOST_AUTO_TEST_CASE(even_split_has_no_padding) {
    const auto data = to_bytes("abcdefgh");
    std::vector<std::vector<std::byte>> chunks;
    std::size_t cs = 0;
    BOOST_REQUIRE(!split_chunks(data, 4, chunks, cs));

    BOOST_TEST(cs == 2u);
    BOOST_REQUIRE_EQUAL(chunks.size(), 4u);
    BOOST_TEST(u8(chunks[0][0]) == unsigned('a'));
    BOOST_TEST(u8(chunks[3][1]) == unsigned('h'));
}

BOOST_AUTO_TEST_CASE(last_chunk_zero_padded) {
    const auto data = to_bytes("Short message"); // 13 bytes
    std::vector<std::vector<std::byte>> chunks;
    std::size_t cs = 0;
    BOOST_REQUIRE(!split_chunks(data, 4, chunks, cs));

    BOOST_TEST(cs == 4u);
    for (const auto& c : chunks) BOOST_TEST(c.size() == 4u);
    // 13 = 4 + 4 + 4 + 1; three bytes of padding in the last chunk
    BOOST_TEST(u8(chunks[3][0]) == unsigned('e'));
    BOOST_TEST(u8(chunks[3][1]) == 0u);
    BOOST_TEST(u8(chunks[3][2]) == 0u);
    BOOST_TEST(u8(chunks[3][3]) == 0u);
}

BOOST_AUTO_TEST_CASE(k_larger_than_data_yields_all_padding_chunks) {
    const auto data = to_bytes("xyz");
    std::vector<std::vector<std::byte>> chunks;
    std::size_t cs = 0;
    BOOST_REQUIRE(!split_chunks(data, 5, chunks, cs));
    BOOST_TEST(cs == 1u);
    BOOST_REQUIRE_EQUAL(chunks.size(), 5u);
    BOOST_TEST(u8(chunks[2][0]) == unsigned('z'));
    BOOST_TEST(u8(chunks[3][0]) == 0u);
    BOOST_TEST(u8(chunks[4][0]) == 0u);
}

BOOST_AUTO_TEST_CASE(invalid_inputs_leave_outputs_untouched) {
    std::vector<std::vector<std::byte>> chunks(2);
    std::size_t cs = 77;
    const auto data = to_bytes("abc");

    BOOST_TEST((split_chunks(data, 0, chunks, cs) == codec_errc::invalid_parameter));
    BOOST_TEST((split_chunks(data, -3, chunks, cs) == codec_errc::invalid_parameter));
    BOOST_TEST((split_chunks(std::span<const std::byte>{}, 4, chunks, cs) == codec_errc::invalid_parameter));
    BOOST_TEST(cs == 77u);
    BOOST_TEST(chunks.size() == 2u);
}

BOOST_AUTO_TEST_CASE(join_strips_padding) {
    for (std::size_t len : { 1u, 7u, 13u, 250u, 1000u, 1001u }) {
        for (int k : { 1, 2, 3, 4, 7 }) {
            const auto data = pattern(len, static_cast<std::uint32_t>(len * 31 + k));
            std::vector<std::vector<std::byte>> chunks;
            std::size_t cs = 0;
            BOOST_REQUIRE(!split_chunks(data, k, chunks, cs));
            BOOST_TEST(cs * static_cast<std::size_t>(k) >= len);
            BOOST_TEST((join_chunks(chunks, len) == data));
        }
    }
}

BOOST_AUTO_TEST_CASE(chunk_size_rounds_up) {
    BOOST_TEST(chunk_size_for(1000, 4) == 250u);
    BOOST_TEST(chunk_size_for(1001, 4) == 251u);
    BOOST_TEST(chunk_size_for(2350, 4) == 588u);
    BOOST_TEST(chunk_size_for(10, 0) == 0u);
}

BOOST_AUTO_TEST_SUITE_END()
