#pragma once

#include <cstddef>
#include <cstdint>
#include <istream>
#include <ostream>
#include <string>
#include <vector>

namespace transport {

// Frame = uint32 little-endian payload length + payload.
constexpr uint32_t kMaxFrameBytes = 1024u * 1024u;
constexpr std::size_t kFrameHeaderBytes = 4;

// Reads exactly n bytes. False if the stream ends or fails first.
bool read_exact(std::istream &in, uint8_t *buf, std::size_t n);

// Reads one frame into out.
// Returns false with err empty on clean EOF (no header byte available), and
// false with err set on a truncated frame or an invalid length.
bool read_frame(std::istream &in, std::vector<uint8_t> &out, std::string &err,
                uint32_t max_len = kMaxFrameBytes);

// Writes one frame and flushes. Empty and oversized payloads are refused.
bool write_frame(std::ostream &out, const uint8_t *data, std::size_t len,
                 std::string &err, uint32_t max_len = kMaxFrameBytes);

// Convenience overload for serialized protobuf messages.
bool write_frame(std::ostream &out, const std::string &payload,
                 std::string &err, uint32_t max_len = kMaxFrameBytes);

} // namespace transport
