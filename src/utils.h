#pragma once

#include <cstdint>
#include <string>

// String utility functions

// Check if a string starts with a prefix
bool startsWith(const std::string &str, const std::string &prefix);

// Convert string to lowercase (returns a copy)
std::string lowercase_copy(const std::string &s);

// Strip leading/trailing whitespace (returns a copy)
std::string trim_copy(const std::string &s);

// Remove a trailing " - <Tag>" from a file base name ("Movie - 4k" -> "Movie").
// The tag may not contain parentheses, so "Movie - Part (2)" is left alone.
std::string strip_name_tag(const std::string &base);

// Human readable bitrate, e.g. "49.00 Mbps"
std::string format_bitrate(int64_t bitsPerSecond);
