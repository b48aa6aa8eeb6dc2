#pragma once

#include <stacy/result.hpp>
#include <array>
#include <cstdint>
#include <cstddef>
#include <string>
#include <filesystem>

namespace stacy {

// Streaming SHA-256 (FIPS 180-4). Used for package digests and the
// manifest hash recorded in the lockfile.
class SHA256 {
public:
    using Digest = std::array<uint8_t, 32>;

    SHA256();

    void update(const uint8_t* data, size_t len);
    void update(const std::string& s);

    // Finalize and return the digest. The object is reset afterwards and
    // may be reused for a new message.
    Digest finalize();
    std::string finalize_hex();

    static std::string hash_hex(const std::string& input);
    static Result<std::string> hash_file(const std::filesystem::path& path);
    static std::string to_hex(const Digest& bytes);

private:
    void reset();
    void compress(const uint8_t* block);

    std::array<uint32_t, 8> h_;
    std::array<uint8_t, 64> pending_;
    size_t pending_len_ = 0;
    uint64_t length_ = 0;
};

} // namespace stacy
