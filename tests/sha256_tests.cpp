#include <boost/test/unit_test.hpp>   // NOTE: not "included/unit_test.hpp"
#include <xorec/util/sha256.h>
#include <xorec/util/uuid.h>
#include <string>
#include "test_util.h"

using namespace xorec::util;

BOOST_AUTO_TEST_SUITE(sha256_suite)

BOOST_AUTO_TEST_CASE(empty_input) {
    const auto d = sha256(std::string_view{});
    BOOST_TEST(to_hex(d) == "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

BOOST_AUTO_TEST_CASE(known_vector_abc) {
    const auto d = sha256(std::string_view{ "abc" });
    BOOST_TEST(to_hex(d) == "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

BOOST_AUTO_TEST_CASE(hex_helper_matches_string_overload) {
    const std::string s = "Hello, this is a test file for erasure coding! ";
    const auto bytes = xorec_test::to_bytes(s);
    BOOST_TEST(sha256_hex(bytes) == to_hex(sha256(s)));
    BOOST_TEST(sha256_hex(bytes).size() == 64u);
}

BOOST_AUTO_TEST_CASE(to_hex_lowercase_two_chars_per_byte) {
    const std::byte raw[3] = { std::byte{ 0x00 }, std::byte{ 0xAB }, std::byte{ 0x0F } };
    BOOST_TEST(to_hex(raw) == "00ab0f");
}

BOOST_AUTO_TEST_CASE(uuid_v4_shape) {
    const std::string u = uuid_v4();
    BOOST_TEST(u.size() == 36u);
    BOOST_TEST(u[8] == '-');
    BOOST_TEST(u[13] == '-');
    BOOST_TEST(u[18] == '-');
    BOOST_TEST(u[23] == '-');
    BOOST_TEST(u[14] == '4');
    const char variant = u[19];
    BOOST_TEST((variant == '8' || variant == '9' || variant == 'a' || variant == 'b'));
}

BOOST_AUTO_TEST_SUITE_END()
