#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace eegmon {

std::string trim(const std::string& s);

// Remove a UTF-8 BOM (0xEF,0xBB,0xBF) from the beginning of a string if present.
// Settings files edited with some Windows tools start with one.
std::string strip_utf8_bom(std::string s);

std::vector<std::string> split(const std::string& s, char delim);

std::string to_lower(std::string s);

bool starts_with(const std::string& s, const std::string& prefix);
bool ends_with(const std::string& s, const std::string& suffix);

// Strict numeric parsing helpers.
//
// These functions trim leading/trailing whitespace and then require that the
// entire remaining string is a valid number (no trailing "abc" fragments).
//
// Notes:
// - to_double() parses numbers using the classic "C" locale so that '.' is
//   treated as the decimal separator regardless of the user's global locale.
// - As a convenience for some locales, to_double() also supports a single
//   decimal comma (e.g., "0,5") when no '.' is present.
int to_int(const std::string& s);
double to_double(const std::string& s);

// Parse a boolean flag value: 1/0, true/false, yes/no, on/off (case-insensitive).
bool to_bool(const std::string& s);

bool file_exists(const std::string& path);
void ensure_directory(const std::string& path);

// Join a directory and a file name (no normalization beyond std::filesystem's).
std::string join_path(const std::string& dir, const std::string& name);

// Write a text file to disk (UTF-8 bytes, best-effort).
//
// Returns true on success, false on failure.
// Parent directories are created (best-effort).
bool write_text_file(const std::string& path, const std::string& content);

// Return a human-readable local timestamp string (best-effort).
//
// Format: ISO-8601 local time with numeric UTC offset, e.g.
//   2026-01-15T13:37:42-05:00
std::string now_string_local();

// Local time formatted for file names: YYYYmmdd-HHMMSS.
std::string now_string_compact();

// Lowercase hex dump with single spaces between bytes, e.g. "0a ff 10".
std::string hex_bytes(const uint8_t* data, size_t n);

// Seconds on a monotonic clock (arbitrary epoch).
double monotonic_seconds();

} // namespace eegmon
