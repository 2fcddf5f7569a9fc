#ifndef __TPOD_FRAME_H__
#define __TPOD_FRAME_H__

#include "Headers.hpp"

namespace tpod {
/** @brief Largest payload a single frame may carry (4 MiB). */
const size_t MAX_FRAME_LEN = 4 * 1024 * 1024;

/**
 * @brief A single length-framed protocol message: one type byte followed by a
 * big-endian u32 length and the payload.
 */
class Frame {
 public:
  /** @brief Size of the type byte plus the length field. */
  static const int HEADER_SIZE = 5;

  /** @brief Constructs an empty frame with an invalid header. */
  Frame() : header(0) {}
  /**
   * @brief Builds a frame from a header/payload tuple.
   */
  Frame(uint8_t _header, const string& _payload)
      : header(_header), payload(_payload) {}

  /**
   * @brief Builds a resize frame carrying cols then rows as big-endian u16.
   */
  static Frame resize(uint16_t cols, uint16_t rows) {
    string s(4, '\0');
    s[0] = char((cols >> 8) & 0xff);
    s[1] = char(cols & 0xff);
    s[2] = char((rows >> 8) & 0xff);
    s[3] = char(rows & 0xff);
    return Frame(FRAME_RESIZE, s);
  }

  /** @brief Retrieves the frame type byte. */
  uint8_t getHeader() const { return header; }
  /** @brief Returns the payload bytes. */
  const string& getPayload() const { return payload; }

  /** @brief Returns the serialized byte count including the header. */
  size_t length() const { return HEADER_SIZE + payload.length(); }

  /**
   * @brief Decodes a resize payload.
   * @return false when the payload is shorter than four bytes.
   */
  bool parseResize(uint16_t* cols, uint16_t* rows) const {
    if (payload.length() < 4) {
      return false;
    }
    const unsigned char* p = (const unsigned char*)payload.data();
    *cols = uint16_t((p[0] << 8) | p[1]);
    *rows = uint16_t((p[2] << 8) | p[3]);
    return true;
  }

  /**
   * @brief Serializes the frame into its wire format.
   * @return Byte string ready to be written to a socket.
   */
  string serialize() const {
    uint32_t len = uint32_t(payload.length());
    string s(HEADER_SIZE, '\0');
    s[0] = char(header);
    s[1] = char((len >> 24) & 0xff);
    s[2] = char((len >> 16) & 0xff);
    s[3] = char((len >> 8) & 0xff);
    s[4] = char(len & 0xff);
    s.append(payload);
    return s;
  }

 protected:
  /** @brief Frame type, usually one of the FrameType enum values. */
  uint8_t header;
  /** @brief Message body. */
  string payload;
};
}  // namespace tpod

#endif  // __TPOD_FRAME_H__
