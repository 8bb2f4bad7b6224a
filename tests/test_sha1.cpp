#include <catch2/catch.hpp>
#include <uidkit/sha1.hpp>

using namespace uidkit;

TEST_CASE("SHA1 empty string", "[sha1]") {
    REQUIRE(SHA1::hash_hex("") == "da39a3ee5e6b4b0d3255bfef95601890afd80709");
}

TEST_CASE("SHA1 'abc' (NIST vector)", "[sha1]") {
    REQUIRE(SHA1::hash_hex("abc") == "a9993e364706816aba3e25717850c26c9cd0d89d");
}

TEST_CASE("SHA1 448-bit message (NIST vector)", "[sha1]") {
    REQUIRE(SHA1::hash_hex("abcdbcdecdefdefgefghfghighijhijkijkljklmklmnlmnomnopnopq")
            == "84983e441c3bd26ebaae4aa1f95129e5e54670f1");
}

TEST_CASE("SHA1 quick brown fox", "[sha1]") {
    REQUIRE(SHA1::hash_hex("The quick brown fox jumps over the lazy dog")
            == "2fd4e1c67a2d28fced849ee1bb76e7391b93eb12");
}

TEST_CASE("SHA1 one million 'a'", "[sha1]") {
    std::string input(1000000, 'a');
    REQUIRE(SHA1::hash_hex(input) == "34aa973cd4c4daa4f61eeb2bdbad27316534016f");
}

TEST_CASE("SHA1 incremental update matches one-shot", "[sha1]") {
    SHA1 ctx;
    ctx.update(reinterpret_cast<const uint8_t*>("a"), 1);
    ctx.update(reinterpret_cast<const uint8_t*>("b"), 1);
    ctx.update(reinterpret_cast<const uint8_t*>("c"), 1);
    REQUIRE(SHA1::bytes_to_hex(ctx.finalize()) == "a9993e364706816aba3e25717850c26c9cd0d89d");
}
