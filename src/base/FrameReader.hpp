#ifndef __TPOD_FRAME_READER_H__
#define __TPOD_FRAME_READER_H__

#include "Frame.hpp"
#include "Headers.hpp"

namespace tpod {
/**
 * @brief Incrementally reassembles frames from an arbitrary split byte stream.
 *
 * Bytes are pushed with feed() as they arrive from a socket. Partial headers
 * and payloads are retained between calls. A frame whose declared length is
 * larger than the configured maximum is skipped without buffering its payload.
 */
class FrameReader {
 public:
  explicit FrameReader(size_t _maxPayload = MAX_FRAME_LEN);

  /**
   * @brief Consumes a chunk of the stream.
   * @return Every frame completed by this chunk, in arrival order.
   */
  vector<Frame> feed(const char* data, size_t n);

  /** @brief Discards any partially received frame. */
  void reset();

  /** @brief True when a header or payload is partially received. */
  bool hasPartialFrame() const;

  /** @brief Number of oversize frames skipped so far. */
  int64_t getDroppedFrames() const { return droppedFrames; }

 protected:
  size_t maxPayload;
  char headerBytes[Frame::HEADER_SIZE];
  size_t headerFill;
  uint8_t currentType;
  uint32_t remaining;
  bool inPayload;
  bool skipping;
  string payload;
  int64_t droppedFrames;
};
}  // namespace tpod

#endif  // __TPOD_FRAME_READER_H__
