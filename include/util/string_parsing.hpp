#pragma once

/*
 String Parsing Utilities

 Purpose:
 - Safe parsing of strings to numeric types with validation
 - Centralized input validation for command-line arguments and config files

 Key functions:
 - SafeParseInt: Parse integer with bounds checking
 - SafeParseInt64: Parse 64-bit integer with bounds checking
 - SplitComponents: Split a comma-separated option value

 All parsers validate that the entire input is consumed and return
 std::nullopt on any error (no exceptions thrown).
*/

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace raftwire {
namespace util {

/**
 * Parse integer string with bounds checking
 *
 * @param str String to parse
 * @param min Minimum allowed value (inclusive)
 * @param max Maximum allowed value (inclusive)
 * @return Parsed integer or std::nullopt if invalid
 *
 * Examples:
 *   SafeParseInt("42", 0, 100) -> 42
 *   SafeParseInt("999", 0, 100) -> std::nullopt (out of range)
 *   SafeParseInt("42x", 0, 100) -> std::nullopt (trailing chars)
 */
std::optional<int> SafeParseInt(const std::string& str, int min, int max);

/**
 * Parse int64_t string with bounds checking
 *
 * Examples:
 *   SafeParseInt64("10000", 1, 3600000) -> 10000
 *   SafeParseInt64("-1", 0, 1000000) -> std::nullopt (out of range)
 */
std::optional<int64_t> SafeParseInt64(const std::string& str, int64_t min, int64_t max);

// Split "a,b,c" into {"a", "b", "c"}; empty items are dropped
std::vector<std::string> SplitComponents(const std::string& str, char separator = ',');

} // namespace util
} // namespace raftwire
