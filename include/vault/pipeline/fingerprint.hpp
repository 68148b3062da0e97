#pragma once

#include "vault/core/result.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace vault::pipeline {

struct Fingerprint {
    std::string sha256;                  // 64 lowercase hex characters
    std::optional<std::string> phash;    // 16 lowercase hex characters, images only
};

/**
 * @brief Content fingerprints for dedup
 *
 * SHA-256 is streamed through OpenSSL EVP in 1 MiB blocks. The perceptual
 * hash is the 64-bit DCT hash: grayscale, 32x32 resize, 2-D DCT, keep the
 * top-left 8x8 block, set a bit for every coefficient above the block
 * median. Bits are rendered most significant first in row-major order.
 */
class FingerprintEngine {
public:
    static constexpr std::size_t kReadBlockSize = 1024 * 1024;

    /**
     * @brief Fingerprint a local file
     *
     * The phash is attempted for image/* only; an undecodable image yields
     * phash = nullopt rather than an error. An unreadable file is Io.
     */
    Result<Fingerprint> fingerprint(const std::filesystem::path& path, const std::string& mime_type) const;

    static Result<std::string> sha256_file(const std::filesystem::path& path);
    static std::string sha256_bytes(const std::vector<std::uint8_t>& bytes);

    /// DCT hash of an image file, nullopt when it cannot be decoded.
    static std::optional<std::string> phash_file(const std::filesystem::path& path);
};

/// Number of differing bits between two 16-hex-char hashes, -1 when malformed.
int hamming_distance(const std::string& a, const std::string& b);

} // namespace vault::pipeline
