#include "core/transport/framed_stdio.hpp"

namespace transport {

namespace {

uint32_t load_u32_le(const uint8_t *b) {
  return static_cast<uint32_t>(b[0]) | (static_cast<uint32_t>(b[1]) << 8) |
         (static_cast<uint32_t>(b[2]) << 16) |
         (static_cast<uint32_t>(b[3]) << 24);
}

void store_u32_le(uint32_t v, uint8_t *b) {
  for (std::size_t i = 0; i < kFrameHeaderBytes; ++i) {
    b[i] = static_cast<uint8_t>((v >> (8 * i)) & 0xFFu);
  }
}

bool check_length(std::size_t len, uint32_t max_len, std::string &err) {
  if (len == 0) {
    err = "invalid frame length: 0";
    return false;
  }
  if (len > max_len) {
    err = "frame length " + std::to_string(len) + " exceeds max " +
          std::to_string(max_len);
    return false;
  }
  return true;
}

} // namespace

bool read_exact(std::istream &in, uint8_t *buf, std::size_t n) {
  std::size_t got = 0;
  while (got < n) {
    in.read(reinterpret_cast<char *>(buf + got),
            static_cast<std::streamsize>(n - got));
    const std::streamsize count = in.gcount();
    if (count <= 0) {
      return false;
    }
    got += static_cast<std::size_t>(count);
  }
  return true;
}

bool read_frame(std::istream &in, std::vector<uint8_t> &out, std::string &err,
                uint32_t max_len) {
  err.clear();

  uint8_t header[kFrameHeaderBytes] = {0, 0, 0, 0};

  // First byte separately: nothing at all is a clean EOF, a partial header
  // is not
  in.read(reinterpret_cast<char *>(header), 1);
  if (in.gcount() == 0) {
    return false;
  }
  if (!read_exact(in, header + 1, kFrameHeaderBytes - 1)) {
    err = "unexpected EOF while reading frame header";
    return false;
  }

  const uint32_t len = load_u32_le(header);
  if (!check_length(len, max_len, err)) {
    return false;
  }

  out.assign(len, 0);
  if (!read_exact(in, out.data(), len)) {
    err = "unexpected EOF while reading frame payload";
    return false;
  }
  return true;
}

bool write_frame(std::ostream &out, const uint8_t *data, std::size_t len,
                 std::string &err, uint32_t max_len) {
  err.clear();
  if (!check_length(len, max_len, err)) {
    return false;
  }

  uint8_t header[kFrameHeaderBytes];
  store_u32_le(static_cast<uint32_t>(len), header);

  out.write(reinterpret_cast<const char *>(header), kFrameHeaderBytes);
  out.write(reinterpret_cast<const char *>(data),
            static_cast<std::streamsize>(len));
  out.flush();
  if (!out.good()) {
    err = "failed writing frame";
    return false;
  }
  return true;
}

bool write_frame(std::ostream &out, const std::string &payload,
                 std::string &err, uint32_t max_len) {
  return write_frame(out, reinterpret_cast<const uint8_t *>(payload.data()),
                     payload.size(), err, max_len);
}

} // namespace transport
