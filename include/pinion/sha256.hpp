#pragma once

#include <pinion/result.hpp>

#include <array>
#include <cstdint>
#include <cstddef>
#include <string>
#include <filesystem>

namespace pinion {

// Streaming SHA-256 (FIPS 180-4), used for tarball checksum validation.
class SHA256 {
public:
    using Digest = std::array<uint8_t, 32>;

    SHA256();

    void update(const uint8_t* data, size_t len);
    void update(const std::string& s);

    // Pads and returns the digest; the hasher is reset afterwards.
    Digest finalize();

    static std::string hash_hex(const std::string& input);
    static Result<std::string> hash_file(const std::filesystem::path& path);
    static std::string to_hex(const Digest& digest);

    // Case-insensitive comparison of two hex digests
    static bool hex_equal(const std::string& a, const std::string& b);

private:
    void reset();
    void compress(const uint8_t* block);

    std::array<uint32_t, 8> h_;
    std::array<uint8_t, 64> pending_;
    size_t pending_len_ = 0;
    uint64_t length_ = 0;
};

} // namespace pinion
