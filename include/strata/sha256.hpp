#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>

namespace strata {

using Sha256Digest = std::array<uint8_t, 32>;

// Streaming SHA-256 (FIPS 180-4).
class Sha256 {
public:
    Sha256();

    void update(const uint8_t* data, size_t len);
    void update(const std::string& s);

    // Feed a length-delimited field: 8-byte big-endian length, then bytes.
    // Keeps ("ab","c") and ("a","bc") distinct in a field stream.
    void update_field(const std::string& s);
    void update_flag(bool b);

    // Finish the digest. The object must not be fed again afterwards.
    Sha256Digest finalize();
    std::string finalize_hex();

    static std::string hash_hex(const std::string& input);
    static std::string to_hex(const Sha256Digest& digest);

private:
    void compress(const uint8_t* block);

    std::array<uint32_t, 8> h_;
    std::array<uint8_t, 64> pending_;
    size_t pending_len_ = 0;
    uint64_t length_ = 0;
};

} // namespace strata
