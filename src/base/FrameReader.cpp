#include "FrameReader.hpp"

namespace tpod {
FrameReader::FrameReader(size_t _maxPayload)
    : maxPayload(_maxPayload),
      headerFill(0),
      currentType(0),
      remaining(0),
      inPayload(false),
      skipping(false),
      droppedFrames(0) {}

vector<Frame> FrameReader::feed(const char* data, size_t n) {
  vector<Frame> frames;
  size_t pos = 0;
  while (pos < n) {
    if (!inPayload) {
      size_t toCopy = min(size_t(Frame::HEADER_SIZE) - headerFill, n - pos);
      memcpy(headerBytes + headerFill, data + pos, toCopy);
      headerFill += toCopy;
      pos += toCopy;
      if (headerFill < size_t(Frame::HEADER_SIZE)) {
        break;
      }

      const unsigned char* h = (const unsigned char*)headerBytes;
      currentType = h[0];
      remaining = (uint32_t(h[1]) << 24) | (uint32_t(h[2]) << 16) |
                  (uint32_t(h[3]) << 8) | uint32_t(h[4]);
      headerFill = 0;
      payload.clear();
      skipping = remaining > maxPayload;
      if (skipping) {
        LOG(WARNING) << "Skipping oversize frame of type " << int(currentType)
                     << " with length " << remaining;
        ++droppedFrames;
      } else {
        payload.reserve(remaining);
      }
      if (remaining == 0) {
        if (!skipping) {
          frames.push_back(Frame(currentType, payload));
        }
        continue;
      }
      inPayload = true;
      continue;
    }

    size_t toTake = min(size_t(remaining), n - pos);
    if (!skipping) {
      payload.append(data + pos, toTake);
    }
    pos += toTake;
    remaining -= uint32_t(toTake);
    if (remaining == 0) {
      inPayload = false;
      if (!skipping) {
        frames.push_back(Frame(currentType, payload));
        payload.clear();
      }
      skipping = false;
    }
  }
  return frames;
}

void FrameReader::reset() {
  headerFill = 0;
  currentType = 0;
  remaining = 0;
  inPayload = false;
  skipping = false;
  payload.clear();
}

bool FrameReader::hasPartialFrame() const {
  return headerFill > 0 || inPayload;
}
}  // namespace tpod
