#pragma once
#include <string>
#include <vector>
#include <cstdint>

namespace prisma {

// Trim whitespace
std::string trim(const std::string& s);

// Split string by delimiter
std::vector<std::string> split(const std::string& s, char delim);

// ASCII lowercase copy
std::string to_lower(std::string s);

// Percent-encode for use in a URL query component (RFC 3986 unreserved kept)
std::string url_encode(const std::string& s);

// Standard base64 with padding
std::string base64_encode(const unsigned char* data, size_t len);

// Parse an RFC 3339 timestamp ("2024-05-01T12:34:56.789+02:00") into Unix
// epoch seconds. Fractional seconds are discarded. Returns false if malformed.
bool parse_rfc3339(const std::string& text, int64_t& epoch);

// Format epoch seconds as local wall-clock "HH:MM"
std::string format_clock(int64_t epoch);

// Number of UTF-8 code points; each invalid byte counts as one.
size_t utf8_length(const std::string& s);

// Make remote text safe to print on a terminal: drops C0 and C1 control
// characters and DEL, turns tabs into spaces and invalid UTF-8 bytes into
// '?'. Newlines are kept.
std::string sanitize_terminal_text(const std::string& s);

// Expand ~ to home directory
std::string expand_home(const std::string& path);

// Write via temp file + rename; creates parent directories.
bool atomic_write_file(const std::string& path, const std::string& content);

} // namespace prisma
