#ifndef PARSE_UTILS_HPP
#define PARSE_UTILS_HPP

#include <cstddef>
#include <string>
#include <chrono>
#include <vector>
#include "arg_parser.hpp"

// Parse an unsigned integer from a string.
// Format: decimal digits only.
// Bounds: inclusive [min, max].
// Invalid input: conversion failure or out-of-range sets ok=false and returns 0.
unsigned int parse_uint(const std::string& value, unsigned int min, unsigned int max, bool& ok);

// Parse an unsigned integer flag from the parser.
// Invalid input: missing flag, non-numeric, or out-of-range sets ok=false and returns 0.
unsigned int parse_uint(const ArgParser& parser, const std::string& flag, unsigned int min,
                        unsigned int max, bool& ok);

// Parse byte size from a string with optional unit suffix.
// Format: unsigned integer followed by optional units B, KB, MB or GB (case-insensitive).
// Invalid input: bad unit or parse failure sets ok=false and returns 0.
size_t parse_bytes(const std::string& value, bool& ok);

// Parse byte size flag from the parser.
// Invalid input: missing flag, bad unit, or parse failure sets ok=false and returns 0.
size_t parse_bytes(const ArgParser& parser, const std::string& flag, bool& ok);

// Parse milliseconds from a string with optional unit suffix.
// Format: non-negative integer optionally suffixed by ms (default), s, or m.
// Invalid input: parse failure sets ok=false and returns 0ms.
std::chrono::milliseconds parse_time_ms(const std::string& value, bool& ok);

// Split a command line on whitespace. No quoting rules: use a list in the
// configuration file when an argument contains spaces.
std::vector<std::string> split_command(const std::string& value);

#endif // PARSE_UTILS_HPP
