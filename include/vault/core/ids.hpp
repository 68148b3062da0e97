#pragma once

#include <cstddef>
#include <ctime>
#include <string>

namespace vault {

/// Random RFC 4122 version 4 identifier, lowercase hex with dashes.
std::string generate_uuid();

/// @p length random lowercase hex characters.
std::string random_hex(std::size_t length);

/// UTC "YYYY-MM-DDTHH:MM:SSZ". Returns an empty string for 0.
std::string format_iso8601(std::time_t when);

/// Inverse of format_iso8601. Returns 0 for empty or malformed input.
std::time_t parse_iso8601(const std::string& text);

/// UTC "YYYYMMDD_HHMMSS", used in batch identifiers.
std::string format_compact_timestamp(std::time_t when);

} // namespace vault
