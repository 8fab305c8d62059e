// Copyright (c) 2025 The Raftwire Developers
// Distributed under the MIT software license

#include "network/frame_codec.hpp"
#include "util/endian.hpp"
#include <algorithm>
#include <limits>

namespace raftwire {
namespace network {

const char *FrameTypeName(FrameType type) {
  switch (type) {
  case FrameType::REQUEST:
    return "request";
  case FrameType::RESPONSE:
    return "response";
  case FrameType::ERROR:
    return "error";
  }
  return "unknown";
}

std::vector<uint8_t> EncodeFrame(const Frame &frame) {
  std::vector<uint8_t> buffer(frame::HEADER_SIZE + frame.payload.size());
  uint8_t *ptr = buffer.data();

  endian::WriteLE32(ptr, frame::MAGIC);
  ptr += 4;
  *ptr = static_cast<uint8_t>(frame.type);
  ptr += 1;
  endian::WriteLE64(ptr, frame.id);
  ptr += 8;
  endian::WriteLE32(ptr, static_cast<uint32_t>(frame.payload.size()));
  ptr += 4;

  if (!frame.payload.empty()) {
    std::copy(frame.payload.begin(), frame.payload.end(), ptr);
  }
  return buffer;
}

Frame MakeErrorFrame(uint64_t id, const std::string &message) {
  Frame frame;
  frame.type = FrameType::ERROR;
  frame.id = id;
  frame.payload.assign(message.begin(), message.end());
  return frame;
}

std::string ErrorMessage(const Frame &frame) {
  return std::string(frame.payload.begin(), frame.payload.end());
}

FrameDecoder::FrameDecoder(size_t max_frame_size)
    : max_frame_size_(std::min<size_t>(max_frame_size, std::numeric_limits<uint32_t>::max())) {}

bool FrameDecoder::feed(const std::vector<uint8_t> &data) {
  if (has_error()) {
    return false;
  }
  compact();
  buffer_.insert(buffer_.end(), data.begin(), data.end());
  parse_frames();
  return !has_error();
}

std::optional<Frame> FrameDecoder::next() {
  if (ready_offset_ >= ready_.size()) {
    ready_.clear();
    ready_offset_ = 0;
    return std::nullopt;
  }
  return std::move(ready_[ready_offset_++]);
}

void FrameDecoder::compact() {
  // Drop consumed bytes once they make up half the buffer
  if (offset_ > 0 && offset_ >= buffer_.size() / 2) {
    buffer_.erase(buffer_.begin(), buffer_.begin() + static_cast<std::ptrdiff_t>(offset_));
    offset_ = 0;
    if (buffer_.size() < 1024) {
      buffer_.shrink_to_fit();
    }
  }
}

void FrameDecoder::parse_frames() {
  while (buffer_.size() - offset_ >= frame::HEADER_SIZE) {
    const uint8_t *ptr = buffer_.data() + offset_;

    uint32_t magic = endian::ReadLE32(ptr);
    if (magic != frame::MAGIC) {
      error_ = "bad frame magic";
      return;
    }

    uint8_t raw_type = ptr[4];
    if (raw_type < static_cast<uint8_t>(FrameType::REQUEST) ||
        raw_type > static_cast<uint8_t>(FrameType::ERROR)) {
      error_ = "unknown frame type " + std::to_string(raw_type);
      return;
    }

    uint64_t id = endian::ReadLE64(ptr + 5);
    uint32_t length = endian::ReadLE32(ptr + 13);
    if (length > max_frame_size_) {
      error_ = "frame payload of " + std::to_string(length) +
               " bytes exceeds limit of " + std::to_string(max_frame_size_);
      return;
    }

    size_t total = frame::HEADER_SIZE + length;
    if (buffer_.size() - offset_ < total) {
      return; // wait for the rest
    }

    Frame decoded;
    decoded.type = static_cast<FrameType>(raw_type);
    decoded.id = id;
    decoded.payload.assign(ptr + frame::HEADER_SIZE, ptr + total);
    ready_.push_back(std::move(decoded));

    offset_ += total;
  }
}

} // namespace network
} // namespace raftwire
