// Copyright (c) 2025 The Raftwire Developers
// Distributed under the MIT software license

#include "network/transport_config.hpp"
#include "util/logging.hpp"
#include <fstream>
#include <nlohmann/json.hpp>

namespace raftwire {
namespace network {

namespace {

// Reads an optional positive unsigned field into out; false on type/range error
template <typename T>
bool ReadPositive(const nlohmann::json &root, const char *key, T &out) {
  if (!root.contains(key)) {
    return true;
  }
  const auto &value = root[key];
  if (!value.is_number_unsigned()) {
    LOG_NET_WARN("Config key '{}' must be a positive integer", key);
    return false;
  }
  auto raw = value.get<uint64_t>();
  if (raw == 0) {
    LOG_NET_WARN("Config key '{}' must be greater than zero", key);
    return false;
  }
  out = static_cast<T>(raw);
  return true;
}

} // namespace

std::optional<TransportConfig> LoadTransportConfig(const std::string &filepath) {
  using json = nlohmann::json;

  std::ifstream file(filepath);
  if (!file.is_open()) {
    LOG_NET_WARN("Cannot open transport config {}", filepath);
    return std::nullopt;
  }

  json root;
  try {
    file >> root;
  } catch (const json::exception &e) {
    LOG_NET_WARN("Failed to parse transport config {}: {}", filepath, e.what());
    return std::nullopt;
  }

  if (!root.is_object()) {
    LOG_NET_WARN("Transport config {} is not a JSON object", filepath);
    return std::nullopt;
  }

  TransportConfig config;
  uint64_t election_timeout_ms = static_cast<uint64_t>(config.election_timeout.count());
  if (!ReadPositive(root, "election_timeout_ms", election_timeout_ms) ||
      !ReadPositive(root, "io_threads", config.io_threads) ||
      !ReadPositive(root, "max_frame_size", config.max_frame_size) ||
      !ReadPositive(root, "send_queue_limit", config.send_queue_limit)) {
    return std::nullopt;
  }
  config.election_timeout = std::chrono::milliseconds(election_timeout_ms);

  LOG_NET_DEBUG("Loaded transport config from {} (election timeout {} ms, {} io threads)",
                filepath, config.election_timeout.count(), config.io_threads);
  return config;
}

} // namespace network
} // namespace raftwire
