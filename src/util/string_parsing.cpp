// Copyright (c) 2025 The Raftwire Developers
// Distributed under the MIT software license

#include "util/string_parsing.hpp"
#include <cctype>

namespace raftwire {
namespace util {

std::optional<int> SafeParseInt(const std::string& str, int min, int max) {
  try {
    // Reject empty or whitespace-only strings
    if (str.empty() || std::isspace(static_cast<unsigned char>(str[0]))) {
      return std::nullopt;
    }

    size_t pos = 0;
    long value = std::stol(str, &pos);

    // Check entire string was consumed
    if (pos != str.size()) {
      return std::nullopt;
    }

    if (value < min || value > max) {
      return std::nullopt;
    }

    return static_cast<int>(value);
  } catch (const std::exception&) {
    return std::nullopt;
  }
}

std::optional<int64_t> SafeParseInt64(const std::string& str, int64_t min, int64_t max) {
  try {
    // Reject empty or whitespace-leading strings
    if (str.empty() || std::isspace(static_cast<unsigned char>(str[0]))) {
      return std::nullopt;
    }

    size_t pos = 0;
    long long value = std::stoll(str, &pos);

    // Check entire string was consumed
    if (pos != str.size()) {
      return std::nullopt;
    }

    if (value < min || value > max) {
      return std::nullopt;
    }

    return static_cast<int64_t>(value);
  } catch (const std::exception&) {
    return std::nullopt;
  }
}

std::vector<std::string> SplitComponents(const std::string& str, char separator) {
  std::vector<std::string> out;
  size_t pos = 0;
  while (pos <= str.length()) {
    size_t next = str.find(separator, pos);
    if (next == std::string::npos) {
      next = str.length();
    }
    if (next > pos) {
      out.push_back(str.substr(pos, next - pos));
    }
    pos = next + 1;
  }
  return out;
}

} // namespace util
} // namespace raftwire
