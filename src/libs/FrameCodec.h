#ifndef FRAME_CODEC_H
#define FRAME_CODEC_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>

#include "LiTimeProtocol.h"
#include "StatusReading.h"

typedef std::array<uint8_t, LITIME_COMMAND_LENGTH> CommandFrame;

enum DecodeResult {
  DECODE_OK = 0,
  DECODE_FRAME_TOO_SHORT,
};

const char* decodeResultName(DecodeResult result);

/**
 * @brief Bounds-checked little-endian reader over a received frame
 *
 * Every accessor returns false instead of touching memory past the end of
 * the buffer.
 */
class FrameReader {
public:
  FrameReader(const uint8_t* data, size_t length) : data_(data), length_(length) {}

  bool u16(size_t offset, uint16_t& out) const;
  bool s16(size_t offset, int16_t& out) const;
  bool u32(size_t offset, uint32_t& out) const;
  bool s32(size_t offset, int32_t& out) const;

  size_t length() const { return length_; }

private:
  bool fits(size_t offset, size_t width) const;

  const uint8_t* data_;
  size_t length_;
};

// {0x00, 0x00, 0x04, 0x01, opcode, 0x55, 0xAA, 0x05 + opcode}
CommandFrame buildCommand(uint8_t opcode);

// Parse a complete status response; out is only written on DECODE_OK
DecodeResult decodeStatus(const uint8_t* data, size_t length, StatusReading& out);

std::string decodeProtectionFlags(uint32_t flags);
std::string decodeFailureFlags(uint32_t flags);

#endif // FRAME_CODEC_H
