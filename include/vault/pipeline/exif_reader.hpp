#pragma once

#include "vault/core/result.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace vault::pipeline {

struct ExifInfo {
    std::optional<std::string> date_taken;   // DateTimeOriginal, "YYYY:MM:DD HH:MM:SS"
    std::optional<double> gps_lat;           // decimal degrees, south negative
    std::optional<double> gps_lon;           // decimal degrees, west negative

    bool empty() const { return !date_taken && !gps_lat && !gps_lon; }
};

/// Confidence attached to a decade guessed from the capture date.
constexpr double kExifDecadeConfidence = 0.6;

/**
 * @brief Capture date and position from the EXIF block of a JPEG
 *
 * Walks the markers up to the first APP1 "Exif" segment and reads the
 * TIFF structure inside it, in either byte order:
 * - IFD0 -> Exif IFD (0x8769) -> DateTimeOriginal (0x9003)
 * - IFD0 -> GPS IFD (0x8825) -> latitude/longitude and their N/S/E/W refs
 *
 * A file that is not a JPEG, or a JPEG without EXIF, gives an empty
 * ExifInfo. An unreadable file is Io; a corrupt EXIF block is
 * InvalidArgument.
 */
Result<ExifInfo> read_exif(const std::filesystem::path& path);

/// Parse the TIFF payload of an APP1 segment (after "Exif\0\0").
Result<ExifInfo> parse_exif_tiff(const std::vector<std::uint8_t>& tiff);

/// "1974:07:04 ..." -> "1970s"; nullopt when no plausible year leads the text.
std::optional<std::string> decade_from_exif_date(const std::string& date);

} // namespace vault::pipeline
