#include <catch2/catch.hpp>
#include "encoding.hpp"
#include "test_helpers.hpp"

using paperback::Bytes;

TEST_CASE("sha256_hex matches known digests") {
    REQUIRE(paperback::sha256_hex(Bytes()) == "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    REQUIRE(paperback::sha256_hex(testutil::bytes_of("abc")) == "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    REQUIRE(paperback::sha256(testutil::bytes_of("abc")).size() == 32);
}

TEST_CASE("is_sha256_hex checks length and alphabet") {
    std::string h = paperback::sha256_hex(testutil::bytes_of("x"));
    REQUIRE(paperback::is_sha256_hex(h));
    REQUIRE_FALSE(paperback::is_sha256_hex(h.substr(1)));
    REQUIRE_FALSE(paperback::is_sha256_hex(std::string(63, 'a') + "g"));
    REQUIRE_FALSE(paperback::is_sha256_hex(""));
}

TEST_CASE("base64 encodes without line breaks") {
    REQUIRE(paperback::base64_encode(std::string("hello world")) == "aGVsbG8gd29ybGQ=");
    REQUIRE(paperback::base64_encode(std::string("")) == "");
    REQUIRE(paperback::base64_encode(std::string("f")) == "Zg==");
    std::string big = paperback::base64_encode(testutil::random_bytes(1500, 7));
    REQUIRE(big.size() == 2000);
    REQUIRE(big.find('\n') == std::string::npos);
    REQUIRE(paperback::base64_length(1500) == 2000);
}

TEST_CASE("base64_decode strips padding bytes") {
    Bytes out;
    REQUIRE(paperback::base64_decode("aGVsbG8gd29ybGQ=", out));
    REQUIRE(std::string(out.begin(), out.end()) == "hello world");
    REQUIRE(paperback::base64_decode("Zg==", out));
    REQUIRE(out.size() == 1);
    REQUIRE(out[0] == 'f');
    REQUIRE(paperback::base64_decode("Zm8=", out));
    REQUIRE(out.size() == 2);
    REQUIRE(paperback::base64_decode("", out));
    REQUIRE(out.empty());
}

TEST_CASE("base64_decode rejects non-canonical text") {
    Bytes out;
    REQUIRE_FALSE(paperback::base64_decode("aGVsbG8", out));      // length
    REQUIRE_FALSE(paperback::base64_decode("aGV|", out));         // alphabet
    REQUIRE_FALSE(paperback::base64_decode("a===", out));         // too much padding
    REQUIRE_FALSE(paperback::base64_decode("aG==bG8=", out));     // padding inside
    REQUIRE_FALSE(paperback::base64_decode("aGVs\nbG8", out));    // whitespace
    REQUIRE(out.empty());
}
