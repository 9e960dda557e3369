#include <catch2/catch.hpp>
#include <strata/sha256.hpp>

using namespace strata;

TEST_CASE("SHA256 empty string", "[sha256]") {
    REQUIRE(Sha256::hash_hex("") ==
        "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST_CASE("SHA256 'abc' (NIST vector)", "[sha256]") {
    REQUIRE(Sha256::hash_hex("abc") ==
        "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST_CASE("SHA256 448-bit message (NIST vector)", "[sha256]") {
    REQUIRE(Sha256::hash_hex("abcdbcdecdefdefgefghfghighijhijkijkljklmklmnlmnomnopnopq") ==
        "248d6a61d20638b8e5c026930c3e6039a33ce45964ff2167f6ecedd419db06c1");
}

TEST_CASE("SHA256 incremental update matches one-shot", "[sha256]") {
    Sha256 ctx;
    ctx.update(reinterpret_cast<const uint8_t*>("a"), 1);
    ctx.update(std::string("b"));
    ctx.update(reinterpret_cast<const uint8_t*>("c"), 1);
    REQUIRE(Sha256::to_hex(ctx.finalize()) ==
        "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST_CASE("SHA256 across block boundaries", "[sha256]") {
    std::string million(1000000, 'a');
    REQUIRE(Sha256::hash_hex(million) ==
        "cdc76e5c9914fb9281a1c7e284d73e67f1809a48a497200e046d39ccc7112cd0");
}

TEST_CASE("update_field keeps field boundaries", "[sha256]") {
    Sha256 a;
    a.update_field("ab");
    a.update_field("c");

    Sha256 b;
    b.update_field("a");
    b.update_field("bc");

    REQUIRE(a.finalize_hex() != b.finalize_hex());
}

TEST_CASE("update_flag distinguishes true and false", "[sha256]") {
    Sha256 a;
    a.update_flag(true);
    Sha256 b;
    b.update_flag(false);
    REQUIRE(a.finalize_hex() != b.finalize_hex());
}
