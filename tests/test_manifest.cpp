#include <catch2/catch.hpp>
#include "errors.hpp"
#include "manifest.hpp"
#include "test_helpers.hpp"

using paperback::BackupManifest;

TEST_CASE("chunk size must be a multiple of 50 within 50..1500") {
    REQUIRE(paperback::valid_chunk_size(50));
    REQUIRE(paperback::valid_chunk_size(700));
    REQUIRE(paperback::valid_chunk_size(1500));
    REQUIRE_FALSE(paperback::valid_chunk_size(0));
    REQUIRE_FALSE(paperback::valid_chunk_size(5));
    REQUIRE_FALSE(paperback::valid_chunk_size(75));
    REQUIRE_FALSE(paperback::valid_chunk_size(1550));
    REQUIRE_THROWS_AS(paperback::validate_chunk_size(49), paperback::InvalidConfig);
    REQUIRE_NOTHROW(paperback::validate_chunk_size(100));
}

TEST_CASE("parse_chunk_size accepts only valid decimal sizes") {
    REQUIRE(paperback::parse_chunk_size("50") == 50);
    REQUIRE(paperback::parse_chunk_size("1500") == 1500);
    REQUIRE_THROWS_AS(paperback::parse_chunk_size(""), paperback::InvalidConfig);
    REQUIRE_THROWS_AS(paperback::parse_chunk_size("-50"), paperback::InvalidConfig);
    REQUIRE_THROWS_AS(paperback::parse_chunk_size("100k"), paperback::InvalidConfig);
    REQUIRE_THROWS_AS(paperback::parse_chunk_size("75"), paperback::InvalidConfig);
    // 2^32 + 50 and 2^64 + 50 must not wrap into the valid range
    REQUIRE_THROWS_AS(paperback::parse_chunk_size("4294967346"), paperback::InvalidConfig);
    REQUIRE_THROWS_AS(paperback::parse_chunk_size("18446744073709551666"), paperback::InvalidConfig);
}

TEST_CASE("chunk_count_for rounds up and never returns zero") {
    REQUIRE(paperback::chunk_count_for(0, 50) == 1);
    REQUIRE(paperback::chunk_count_for(1, 50) == 1);
    REQUIRE(paperback::chunk_count_for(50, 50) == 1);
    REQUIRE(paperback::chunk_count_for(51, 50) == 2);
    REQUIRE(paperback::chunk_count_for(3000, 1500) == 2);
    REQUIRE_THROWS_AS(paperback::chunk_count_for(10, 59), paperback::InvalidConfig);
}

TEST_CASE("from_data derives hash, length and count") {
    paperback::Bytes data = testutil::random_bytes(1234, 1);
    BackupManifest m = BackupManifest::from_data(data, "tax records 2025", 500);
    REQUIRE(m.identifier == "tax records 2025");
    REQUIRE(m.content_hash == paperback::sha256_hex(data));
    REQUIRE(m.total_length == 1234);
    REQUIRE(m.chunk_size == 500);
    REQUIRE(m.chunk_count == 3);

    BackupManifest empty = BackupManifest::from_data(paperback::Bytes(), "", 50);
    REQUIRE(empty.identifier.empty());
    REQUIRE(empty.chunk_count == 1);
    REQUIRE(empty.total_length == 0);

    REQUIRE_THROWS_AS(BackupManifest::from_data(data, "", 2000), paperback::InvalidConfig);
}

TEST_CASE("matches compares identifier, hash and count only") {
    paperback::Bytes data = testutil::bytes_of(std::string(300, 'q'));
    BackupManifest a = BackupManifest::from_data(data, "id", 100);

    SECTION("chunk size and length are ignored") {
        BackupManifest b = a;
        b.chunk_size = 0;
        b.total_length = 0;
        REQUIRE(a.matches(b));
    }
    SECTION("identifier differs") {
        BackupManifest b = a;
        b.identifier = "other";
        REQUIRE_FALSE(a.matches(b));
    }
    SECTION("hash differs") {
        BackupManifest b = BackupManifest::from_data(testutil::bytes_of(std::string(300, 'r')), "id", 100);
        REQUIRE(b.chunk_count == a.chunk_count);
        REQUIRE_FALSE(a.matches(b));
    }
    SECTION("count differs") {
        BackupManifest b = a;
        b.chunk_count = a.chunk_count + 1;
        REQUIRE_FALSE(a.matches(b));
    }
}
