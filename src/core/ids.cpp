#include "vault/core/ids.hpp"

#include <cstdint>
#include <iomanip>
#include <mutex>
#include <random>
#include <sstream>

namespace vault {
namespace {

std::mt19937_64& generator() {
    static std::mt19937_64 engine{std::random_device{}()};
    return engine;
}

std::mutex& generator_mutex() {
    static std::mutex mutex;
    return mutex;
}

bool to_utc(std::time_t when, std::tm& out) {
    return gmtime_r(&when, &out) != nullptr;
}

} // namespace

std::string random_hex(std::size_t length) {
    static const char digits[] = "0123456789abcdef";
    std::string out;
    out.reserve(length);

    std::lock_guard lock(generator_mutex());
    std::uniform_int_distribution<int> dist(0, 15);
    for (std::size_t i = 0; i < length; ++i) {
        out.push_back(digits[dist(generator())]);
    }
    return out;
}

std::string generate_uuid() {
    std::uint64_t high = 0;
    std::uint64_t low = 0;
    {
        std::lock_guard lock(generator_mutex());
        high = generator()();
        low = generator()();
    }

    // Version 4, variant 10xx
    high = (high & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    low = (low & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

    std::ostringstream oss;
    oss << std::hex << std::setfill('0')
        << std::setw(8) << static_cast<std::uint32_t>(high >> 32) << '-'
        << std::setw(4) << static_cast<std::uint32_t>((high >> 16) & 0xFFFF) << '-'
        << std::setw(4) << static_cast<std::uint32_t>(high & 0xFFFF) << '-'
        << std::setw(4) << static_cast<std::uint32_t>(low >> 48) << '-'
        << std::setw(12) << (low & 0xFFFFFFFFFFFFULL);
    return oss.str();
}

std::string format_iso8601(std::time_t when) {
    if (when == 0) {
        return {};
    }
    std::tm tm{};
    if (!to_utc(when, tm)) {
        return {};
    }
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

std::time_t parse_iso8601(const std::string& text) {
    if (text.empty()) {
        return 0;
    }
    std::tm tm{};
    std::istringstream iss(text);
    iss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if (iss.fail()) {
        return 0;
    }
    return timegm(&tm);
}

std::string format_compact_timestamp(std::time_t when) {
    std::tm tm{};
    if (!to_utc(when, tm)) {
        return "00000000_000000";
    }
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y%m%d_%H%M%S");
    return oss.str();
}

} // namespace vault
