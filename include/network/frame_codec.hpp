// Copyright (c) 2025 The Raftwire Developers
// Distributed under the MIT software license

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace raftwire {
namespace network {

namespace frame {
// "RWFT" little endian
constexpr uint32_t MAGIC = 0x54465752;
// magic(4) + type(1) + correlation id(8) + payload length(4)
constexpr size_t HEADER_SIZE = 17;
} // namespace frame

enum class FrameType : uint8_t {
  REQUEST = 1,
  RESPONSE = 2,
  ERROR = 3, // payload is a UTF-8 error message
};

struct Frame {
  FrameType type = FrameType::REQUEST;
  uint64_t id = 0;
  std::vector<uint8_t> payload;
};

const char *FrameTypeName(FrameType type);

std::vector<uint8_t> EncodeFrame(const Frame &frame);

// Convenience for ERROR frames
Frame MakeErrorFrame(uint64_t id, const std::string &message);
std::string ErrorMessage(const Frame &frame);

/**
 * FrameDecoder - incremental decoder over a byte stream
 *
 * Feed raw chunks as they arrive; complete frames are queued and returned
 * by next(). Any protocol violation (bad magic, unknown type, payload above
 * max_frame_size) puts the decoder into a permanent error state.
 *
 * Not thread-safe: one decoder per stream, fed from the stream's read loop.
 */
class FrameDecoder {
public:
  explicit FrameDecoder(size_t max_frame_size);

  // Returns false once the stream is in error
  bool feed(const std::vector<uint8_t> &data);

  std::optional<Frame> next();

  bool has_error() const { return !error_.empty(); }
  const std::string &error() const { return error_; }

  // Bytes received but not yet part of a complete frame
  size_t buffered_bytes() const { return buffer_.size() - offset_; }

private:
  void parse_frames();
  void compact();

  size_t max_frame_size_;
  std::vector<uint8_t> buffer_;
  size_t offset_ = 0;
  std::vector<Frame> ready_;
  size_t ready_offset_ = 0;
  std::string error_;
};

} // namespace network
} // namespace raftwire
