#include "vault/pipeline/fingerprint.hpp"

#include "vault/model/types.hpp"

#include <openssl/evp.h>
#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <bitset>
#include <fstream>
#include <iomanip>
#include <memory>
#include <sstream>

namespace vault::pipeline {
namespace {

struct EvpMdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};
using EvpMdCtxPtr = std::unique_ptr<EVP_MD_CTX, EvpMdCtxDeleter>;

std::string to_hex(const unsigned char* data, unsigned int len) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (unsigned int i = 0; i < len; ++i) {
        oss << std::setw(2) << static_cast<int>(data[i]);
    }
    return oss.str();
}

Result<EvpMdCtxPtr> new_sha256_context() {
    EvpMdCtxPtr ctx(EVP_MD_CTX_new());
    if (!ctx) {
        return fail<EvpMdCtxPtr>(ErrorCode::Internal, "EVP_MD_CTX_new failed");
    }
    if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        return fail<EvpMdCtxPtr>(ErrorCode::Internal, "EVP_DigestInit_ex failed");
    }
    return Ok(std::move(ctx));
}

Result<std::string> finish(EVP_MD_CTX* ctx) {
    unsigned char out[EVP_MAX_MD_SIZE];
    unsigned int out_len = 0;
    if (EVP_DigestFinal_ex(ctx, out, &out_len) != 1) {
        return fail<std::string>(ErrorCode::Internal, "EVP_DigestFinal_ex failed");
    }
    return Ok(to_hex(out, out_len));
}

int hex_nibble(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // namespace

Result<Fingerprint> FingerprintEngine::fingerprint(const std::filesystem::path& path,
                                                   const std::string& mime_type) const {
    auto digest = sha256_file(path);
    if (digest.is_error()) {
        return Err<Fingerprint>(digest.error());
    }

    Fingerprint result;
    result.sha256 = std::move(digest.value());
    if (model::media_kind_from_mime(mime_type) == model::MediaKind::Image) {
        result.phash = phash_file(path);
        if (!result.phash) {
            spdlog::warn("Perceptual hash unavailable for {}", path.string());
        }
    }
    return Ok(result);
}

Result<std::string> FingerprintEngine::sha256_file(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return fail<std::string>(ErrorCode::Io, "cannot open " + path.string());
    }

    auto ctx = new_sha256_context();
    if (ctx.is_error()) {
        return Err<std::string>(ctx.error());
    }

    std::vector<char> buffer(kReadBlockSize);
    while (in) {
        in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        const auto n = in.gcount();
        if (n > 0 && EVP_DigestUpdate(ctx.value().get(), buffer.data(), static_cast<size_t>(n)) != 1) {
            return fail<std::string>(ErrorCode::Internal, "EVP_DigestUpdate failed");
        }
    }
    if (in.bad()) {
        return fail<std::string>(ErrorCode::Io, "read error on " + path.string());
    }
    return finish(ctx.value().get());
}

std::string FingerprintEngine::sha256_bytes(const std::vector<std::uint8_t>& bytes) {
    unsigned char out[EVP_MAX_MD_SIZE];
    unsigned int out_len = 0;
    if (EVP_Digest(bytes.data(), bytes.size(), out, &out_len, EVP_sha256(), nullptr) != 1) {
        return {};
    }
    return to_hex(out, out_len);
}

std::optional<std::string> FingerprintEngine::phash_file(const std::filesystem::path& path) {
    try {
        cv::Mat gray = cv::imread(path.string(), cv::IMREAD_GRAYSCALE);
        if (gray.empty()) {
            return std::nullopt;
        }

        cv::Mat resized;
        cv::resize(gray, resized, cv::Size(32, 32), 0, 0, cv::INTER_AREA);

        cv::Mat float_image;
        resized.convertTo(float_image, CV_32F);

        cv::Mat dct_image;
        cv::dct(float_image, dct_image);
        cv::Mat block = dct_image(cv::Rect(0, 0, 8, 8)).clone();

        std::vector<float> values(block.begin<float>(), block.end<float>());
        std::vector<float> sorted = values;
        std::sort(sorted.begin(), sorted.end());
        const float median = (sorted[31] + sorted[32]) / 2.0f;

        std::uint64_t bits = 0;
        for (float value : values) {
            bits = (bits << 1) | (value > median ? 1u : 0u);
        }

        std::ostringstream oss;
        oss << std::hex << std::setfill('0') << std::setw(16) << bits;
        return oss.str();
    } catch (const cv::Exception& e) {
        spdlog::warn("OpenCV failed to hash {}: {}", path.string(), e.what());
        return std::nullopt;
    }
}

int hamming_distance(const std::string& a, const std::string& b) {
    if (a.size() != b.size() || a.empty()) {
        return -1;
    }
    int distance = 0;
    for (size_t i = 0; i < a.size(); ++i) {
        const int x = hex_nibble(a[i]);
        const int y = hex_nibble(b[i]);
        if (x < 0 || y < 0) {
            return -1;
        }
        distance += static_cast<int>(std::bitset<4>(static_cast<unsigned>(x ^ y)).count());
    }
    return distance;
}

} // namespace vault::pipeline
