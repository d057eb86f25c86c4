#ifndef PARSE_UTILS_HPP
#define PARSE_UTILS_HPP

#include <cstddef>
#include <string>
#include <chrono>

// Parse an integer from a string.
// Format: decimal with optional '+' or '-'; trailing characters are rejected.
// Bounds: inclusive [min, max].
// Invalid input: conversion failure or out-of-range sets ok=false and returns 0.
int parse_int(const std::string& value, int min, int max, bool& ok);

// Parse an unsigned integer from a string.
// Format: decimal digits only.
// Bounds: inclusive [min, max].
// Invalid input: conversion failure or out-of-range sets ok=false and returns 0.
unsigned int parse_uint(const std::string& value, unsigned int min, unsigned int max, bool& ok);

// Parse a size_t from a string.
// Format: decimal digits only.
// Bounds: inclusive [min, max].
// Invalid input: conversion failure or out-of-range sets ok=false and returns 0.
size_t parse_size_t(const std::string& value, size_t min, size_t max, bool& ok);

// Parse byte size from a string with optional unit suffix.
// Format: unsigned integer followed by optional units B, KB, MB or GB (case-insensitive).
// Bounds: inclusive [min, max] bytes.
// Invalid input: bad unit, parse failure, or out-of-range sets ok=false and returns 0.
size_t parse_bytes(const std::string& value, size_t min, size_t max, bool& ok);

// Parse a duration such as "30", "45s", "2m" or "1h".
// Format: non-negative integer optionally followed by s, m or h (seconds by default).
// Invalid input: parse failure sets ok=false and returns 0s.
std::chrono::seconds parse_duration(const std::string& value, bool& ok);

// Check that a byte string is well-formed UTF-8 (no overlongs or surrogates).
bool is_valid_utf8(const std::string& text);

#endif // PARSE_UTILS_HPP
