#include "vault/pipeline/exif_reader.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <fstream>

namespace vault::pipeline {

namespace {

constexpr std::uint16_t kExifIfdPointer = 0x8769;
constexpr std::uint16_t kGpsIfdPointer = 0x8825;
constexpr std::uint16_t kDateTimeOriginal = 0x9003;
constexpr std::uint16_t kGpsLatitudeRef = 0x0001;
constexpr std::uint16_t kGpsLatitude = 0x0002;
constexpr std::uint16_t kGpsLongitudeRef = 0x0003;
constexpr std::uint16_t kGpsLongitude = 0x0004;

constexpr std::uint16_t kTypeAscii = 2;
constexpr std::uint16_t kTypeLong = 4;
constexpr std::uint16_t kTypeRational = 5;

constexpr std::size_t kEntrySize = 12;
constexpr std::size_t kMaxEntries = 1024;

/// Bounds-checked reader over the TIFF payload.
class TiffView {
public:
    explicit TiffView(const std::vector<std::uint8_t>& bytes)
        : bytes_(bytes) {
    }

    bool set_byte_order() {
        if (bytes_.size() < 8) {
            return false;
        }
        if (bytes_[0] == 'I' && bytes_[1] == 'I') {
            little_ = true;
        } else if (bytes_[0] == 'M' && bytes_[1] == 'M') {
            little_ = false;
        } else {
            return false;
        }
        std::uint16_t magic = 0;
        return u16(2, magic) && magic == 42;
    }

    bool u16(std::size_t offset, std::uint16_t& out) const {
        if (offset + 2 > bytes_.size()) {
            return false;
        }
        const std::uint16_t a = bytes_[offset];
        const std::uint16_t b = bytes_[offset + 1];
        out = little_ ? static_cast<std::uint16_t>(a | (b << 8)) : static_cast<std::uint16_t>((a << 8) | b);
        return true;
    }

    bool u32(std::size_t offset, std::uint32_t& out) const {
        if (offset + 4 > bytes_.size()) {
            return false;
        }
        out = 0;
        for (std::size_t i = 0; i < 4; ++i) {
            const std::uint32_t byte = bytes_[offset + (little_ ? 3 - i : i)];
            out = (out << 8) | byte;
        }
        return true;
    }

    bool text(std::size_t offset, std::size_t count, std::string& out) const {
        if (offset + count > bytes_.size()) {
            return false;
        }
        out.assign(bytes_.begin() + offset, bytes_.begin() + offset + count);
        const auto nul = out.find('\0');
        if (nul != std::string::npos) {
            out.resize(nul);
        }
        return true;
    }

    std::size_t size() const { return bytes_.size(); }

private:
    const std::vector<std::uint8_t>& bytes_;
    bool little_ = true;
};

struct Entry {
    std::uint16_t tag = 0;
    std::uint16_t type = 0;
    std::uint32_t count = 0;
    std::size_t value_offset = 0;   // where the value bytes start
};

std::size_t type_size(std::uint16_t type) {
    switch (type) {
        case 1: case 2: case 6: case 7: return 1;
        case 3: case 8: return 2;
        case 4: case 9: case 11: return 4;
        case 5: case 10: case 12: return 8;
        default: return 0;
    }
}

bool read_ifd(const TiffView& tiff, std::uint32_t offset, std::vector<Entry>& entries) {
    std::uint16_t count = 0;
    if (!tiff.u16(offset, count) || count > kMaxEntries) {
        return false;
    }
    for (std::size_t i = 0; i < count; ++i) {
        const std::size_t at = offset + 2 + i * kEntrySize;
        Entry entry;
        std::uint32_t inline_or_offset = 0;
        if (!tiff.u16(at, entry.tag) || !tiff.u16(at + 2, entry.type) ||
            !tiff.u32(at + 4, entry.count) || !tiff.u32(at + 8, inline_or_offset)) {
            return false;
        }
        const std::size_t bytes = type_size(entry.type) * entry.count;
        entry.value_offset = bytes <= 4 ? at + 8 : inline_or_offset;
        entries.push_back(entry);
    }
    return true;
}

const Entry* find_tag(const std::vector<Entry>& entries, std::uint16_t tag) {
    for (const auto& entry : entries) {
        if (entry.tag == tag) {
            return &entry;
        }
    }
    return nullptr;
}

std::optional<std::string> ascii_value(const TiffView& tiff, const Entry* entry) {
    std::string value;
    if (entry == nullptr || entry->type != kTypeAscii || !tiff.text(entry->value_offset, entry->count, value)) {
        return std::nullopt;
    }
    return value;
}

std::optional<std::uint32_t> pointer_value(const TiffView& tiff, const Entry* entry) {
    std::uint32_t value = 0;
    if (entry == nullptr || entry->type != kTypeLong || entry->count != 1 || !tiff.u32(entry->value_offset, value)) {
        return std::nullopt;
    }
    return value;
}

/// Degrees, minutes, seconds as three rationals.
std::optional<double> degrees_value(const TiffView& tiff, const Entry* entry) {
    if (entry == nullptr || entry->type != kTypeRational || entry->count != 3) {
        return std::nullopt;
    }
    double parts[3] = {0.0, 0.0, 0.0};
    for (std::size_t i = 0; i < 3; ++i) {
        std::uint32_t num = 0;
        std::uint32_t den = 0;
        if (!tiff.u32(entry->value_offset + i * 8, num) || !tiff.u32(entry->value_offset + i * 8 + 4, den)) {
            return std::nullopt;
        }
        if (den == 0) {
            return std::nullopt;
        }
        parts[i] = static_cast<double>(num) / static_cast<double>(den);
    }
    return parts[0] + parts[1] / 60.0 + parts[2] / 3600.0;
}

std::optional<double> signed_coordinate(const TiffView& tiff, const std::vector<Entry>& gps,
                                        std::uint16_t value_tag, std::uint16_t ref_tag,
                                        char negative_ref, double limit) {
    auto degrees = degrees_value(tiff, find_tag(gps, value_tag));
    if (!degrees || *degrees > limit) {
        return std::nullopt;
    }
    auto ref = ascii_value(tiff, find_tag(gps, ref_tag));
    if (ref && !ref->empty() && std::toupper(static_cast<unsigned char>((*ref)[0])) == negative_ref) {
        return -*degrees;
    }
    return degrees;
}

Result<ExifInfo> corrupt(const std::string& what) {
    return fail<ExifInfo>(ErrorCode::InvalidArgument, "corrupt EXIF: " + what);
}

} // namespace

Result<ExifInfo> parse_exif_tiff(const std::vector<std::uint8_t>& bytes) {
    TiffView tiff(bytes);
    if (!tiff.set_byte_order()) {
        return corrupt("bad TIFF header");
    }

    std::uint32_t ifd0_offset = 0;
    std::vector<Entry> ifd0;
    if (!tiff.u32(4, ifd0_offset) || !read_ifd(tiff, ifd0_offset, ifd0)) {
        return corrupt("IFD0 out of range");
    }

    ExifInfo info;

    if (auto exif_offset = pointer_value(tiff, find_tag(ifd0, kExifIfdPointer))) {
        std::vector<Entry> exif;
        if (!read_ifd(tiff, *exif_offset, exif)) {
            return corrupt("Exif IFD out of range");
        }
        auto date = ascii_value(tiff, find_tag(exif, kDateTimeOriginal));
        if (date && !date->empty()) {
            info.date_taken = *date;
        }
    }

    if (auto gps_offset = pointer_value(tiff, find_tag(ifd0, kGpsIfdPointer))) {
        std::vector<Entry> gps;
        if (!read_ifd(tiff, *gps_offset, gps)) {
            return corrupt("GPS IFD out of range");
        }
        auto lat = signed_coordinate(tiff, gps, kGpsLatitude, kGpsLatitudeRef, 'S', 90.0);
        auto lon = signed_coordinate(tiff, gps, kGpsLongitude, kGpsLongitudeRef, 'W', 180.0);
        // A position needs both halves
        if (lat && lon) {
            info.gps_lat = lat;
            info.gps_lon = lon;
        }
    }

    return Ok(info);
}

Result<ExifInfo> read_exif(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return fail<ExifInfo>(ErrorCode::Io, "cannot open " + path.string());
    }

    auto next = [&in]() -> int { return in.get(); };

    if (next() != 0xFF || next() != 0xD8) {
        return Ok(ExifInfo{});
    }

    while (in) {
        int byte = next();
        if (byte != 0xFF) {
            return Ok(ExifInfo{});
        }
        int marker = next();
        while (marker == 0xFF) {
            marker = next();
        }
        if (marker < 0) {
            break;
        }
        // Standalone markers carry no length
        if (marker == 0x01 || (marker >= 0xD0 && marker <= 0xD7)) {
            continue;
        }
        // Start of scan or end of image: no EXIF ahead
        if (marker == 0xDA || marker == 0xD9) {
            return Ok(ExifInfo{});
        }

        const int hi = next();
        const int lo = next();
        if (hi < 0 || lo < 0) {
            break;
        }
        const std::size_t length = (static_cast<std::size_t>(hi) << 8) | static_cast<std::size_t>(lo);
        if (length < 2) {
            return corrupt("segment length " + std::to_string(length));
        }

        std::vector<std::uint8_t> payload(length - 2);
        if (!payload.empty() && !in.read(reinterpret_cast<char*>(payload.data()),
                                         static_cast<std::streamsize>(payload.size()))) {
            break;
        }

        static const std::uint8_t kExifHeader[6] = {'E', 'x', 'i', 'f', 0, 0};
        if (marker == 0xE1 && payload.size() >= 6 &&
            std::equal(kExifHeader, kExifHeader + 6, payload.begin())) {
            payload.erase(payload.begin(), payload.begin() + 6);
            return parse_exif_tiff(payload);
        }
    }

    spdlog::debug("JPEG {} ended before its image data", path.string());
    return Ok(ExifInfo{});
}

std::optional<std::string> decade_from_exif_date(const std::string& date) {
    if (date.size() < 4) {
        return std::nullopt;
    }
    int year = 0;
    for (std::size_t i = 0; i < 4; ++i) {
        if (!std::isdigit(static_cast<unsigned char>(date[i]))) {
            return std::nullopt;
        }
        year = year * 10 + (date[i] - '0');
    }
    // Cameras with an unset clock write 0000:00:00
    if (year < 1800) {
        return std::nullopt;
    }
    return std::to_string(year / 10 * 10) + "s";
}

} // namespace vault::pipeline
