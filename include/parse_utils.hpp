#ifndef PARSE_UTILS_HPP
#define PARSE_UTILS_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include <chrono>

// Parse a size_t from a string.
// Format: decimal digits only.
// Bounds: inclusive [min, max].
// Invalid input: conversion failure or out-of-range sets ok=false and returns 0.
size_t parse_size_t(const std::string& value, size_t min, size_t max, bool& ok);

// Parse a signed 64-bit integer from a string.
// Format: decimal with optional '+' or '-'; no trailing characters.
// Bounds: inclusive [min, max].
// Invalid input: conversion failure or out-of-range sets ok=false and returns 0.
int64_t parse_int64(const std::string& value, int64_t min, int64_t max, bool& ok);

// Parse byte size from a string with optional unit suffix.
// Format: unsigned integer followed by optional units B, KB, MB, GB (case-insensitive,
// the trailing B may be omitted).
// Bounds: inclusive [min, max] bytes.
// Invalid input: bad unit, parse failure, or out-of-range sets ok=false and returns 0.
size_t parse_bytes(const std::string& value, size_t min, size_t max, bool& ok);

// Parse milliseconds from a string with optional unit suffix.
// Format: non-negative integer optionally suffixed by ms (default), s, or m.
// Invalid input: parse failure sets ok=false and returns 0ms.
std::chrono::milliseconds parse_time_ms(const std::string& value, bool& ok);

// Interpret a config or flag value as a boolean.
// Empty, "1", "true", "yes" and "on" are true (case-insensitive).
bool parse_bool(const std::string& value);

#endif // PARSE_UTILS_HPP
