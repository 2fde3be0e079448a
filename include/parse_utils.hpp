#ifndef PARSE_UTILS_HPP
#define PARSE_UTILS_HPP

#include <chrono>
#include <cstddef>
#include <string>

// Parse an integer from a string.
// Format: decimal with optional '+' or '-'; the whole string must be consumed.
// Bounds: inclusive [min, max].
// Invalid input: conversion failure or out-of-range sets ok=false and returns 0.
int parse_int(const std::string& value, int min, int max, bool& ok);

// Parse a size_t from a string.
// Format: decimal digits only.
// Bounds: inclusive [min, max].
// Invalid input: conversion failure or out-of-range sets ok=false and returns 0.
size_t parse_size_t(const std::string& value, size_t min, size_t max, bool& ok);

// Parse a boolean written as true/false, yes/no, on/off or 1/0 (case-insensitive).
// An empty value counts as true so that a bare flag in a config file enables it.
// Invalid input: anything else sets ok=false and returns false.
bool parse_bool(const std::string& value, bool& ok);

// Parse byte size from a string with optional unit suffix.
// Format: unsigned integer followed by optional units B, K/KB, M/MB, G/GB or T/TB
// (case-insensitive, powers of 1024).
// Invalid input: bad unit, parse failure or overflow sets ok=false and returns 0.
size_t parse_bytes(const std::string& value, bool& ok);

// Parse a duration such as "30m" or "2h".
// Format: non-negative integer followed by s (default), m, h, d or w.
// Invalid input: parse failure sets ok=false and returns 0s.
std::chrono::seconds parse_duration(const std::string& value, bool& ok);

// Parse milliseconds with optional unit suffix.
// Format: non-negative integer optionally suffixed by ms (default), s or m.
// Invalid input: parse failure sets ok=false and returns 0ms.
std::chrono::milliseconds parse_time_ms(const std::string& value, bool& ok);

#endif // PARSE_UTILS_HPP
