#include "FrameReader.hpp"
#include "TestHeaders.hpp"

using namespace tpod;

TEST_CASE("Frame wire format", "[Frame]") {
  Frame frame(FRAME_INPUT, "hi");
  string wire = frame.serialize();
  REQUIRE(wire.length() == 7);
  REQUIRE(wire[0] == char(FRAME_INPUT));
  REQUIRE(wire.substr(1, 4) == string("\x00\x00\x00\x02", 4));
  REQUIRE(wire.substr(5) == "hi");
  REQUIRE(frame.length() == wire.length());
}

TEST_CASE("Resize payload is big endian", "[Frame]") {
  Frame frame = Frame::resize(80, 24);
  REQUIRE(frame.getHeader() == FRAME_RESIZE);
  REQUIRE(frame.getPayload() == string("\x00\x50\x00\x18", 4));

  uint16_t cols = 0, rows = 0;
  REQUIRE(frame.parseResize(&cols, &rows));
  REQUIRE(cols == 80);
  REQUIRE(rows == 24);

  Frame wide = Frame::resize(300, 1000);
  REQUIRE(wide.parseResize(&cols, &rows));
  REQUIRE(cols == 300);
  REQUIRE(rows == 1000);

  Frame shortFrame(FRAME_RESIZE, string("\x00\x50\x00", 3));
  REQUIRE(!shortFrame.parseResize(&cols, &rows));
}

TEST_CASE("Frames split byte by byte reassemble", "[FrameReader]") {
  string wire = Frame(FRAME_OUTPUT, "hello").serialize() +
                Frame(FRAME_BACKLOG_END, "").serialize() +
                Frame(FRAME_INPUT, string(1000, 'x')).serialize();

  FrameReader reader;
  vector<Frame> frames;
  for (size_t i = 0; i < wire.length(); i++) {
    auto newFrames = reader.feed(&wire[i], 1);
    frames.insert(frames.end(), newFrames.begin(), newFrames.end());
    if (i + 1 < wire.length()) {
      REQUIRE(reader.hasPartialFrame());
    }
  }
  REQUIRE(!reader.hasPartialFrame());
  REQUIRE(frames.size() == 3);
  REQUIRE(frames[0].getHeader() == FRAME_OUTPUT);
  REQUIRE(frames[0].getPayload() == "hello");
  REQUIRE(frames[1].getHeader() == FRAME_BACKLOG_END);
  REQUIRE(frames[1].getPayload().empty());
  REQUIRE(frames[2].getHeader() == FRAME_INPUT);
  REQUIRE(frames[2].getPayload() == string(1000, 'x'));
}

TEST_CASE("Many frames in one chunk", "[FrameReader]") {
  string wire;
  for (int i = 0; i < 50; i++) {
    wire += Frame(FRAME_OUTPUT, to_string(i)).serialize();
  }
  // Leave half of a header dangling at the end.
  string tail = Frame(FRAME_INPUT, "tail").serialize();
  wire += tail.substr(0, 3);

  FrameReader reader;
  auto frames = reader.feed(wire.data(), wire.length());
  REQUIRE(frames.size() == 50);
  for (int i = 0; i < 50; i++) {
    REQUIRE(frames[i].getPayload() == to_string(i));
  }
  REQUIRE(reader.hasPartialFrame());

  frames = reader.feed(tail.data() + 3, tail.length() - 3);
  REQUIRE(frames.size() == 1);
  REQUIRE(frames[0].getHeader() == FRAME_INPUT);
  REQUIRE(frames[0].getPayload() == "tail");
}

TEST_CASE("Oversize frames are skipped", "[FrameReader]") {
  FrameReader reader(8);
  string wire = Frame(FRAME_OUTPUT, "this payload is too long").serialize() +
                Frame(FRAME_INPUT, "ok").serialize();

  vector<Frame> frames;
  // Feed in uneven chunks so the skip spans several calls.
  size_t pos = 0;
  size_t chunk = 3;
  while (pos < wire.length()) {
    size_t n = min(chunk, wire.length() - pos);
    auto newFrames = reader.feed(wire.data() + pos, n);
    frames.insert(frames.end(), newFrames.begin(), newFrames.end());
    pos += n;
    chunk += 2;
  }

  REQUIRE(reader.getDroppedFrames() == 1);
  REQUIRE(frames.size() == 1);
  REQUIRE(frames[0].getHeader() == FRAME_INPUT);
  REQUIRE(frames[0].getPayload() == "ok");
}

TEST_CASE("Unknown frame types pass through", "[FrameReader]") {
  FrameReader reader;
  string wire = Frame(200, "opaque").serialize();
  auto frames = reader.feed(wire.data(), wire.length());
  REQUIRE(frames.size() == 1);
  REQUIRE(frames[0].getHeader() == 200);
  REQUIRE(frames[0].getPayload() == "opaque");
}

TEST_CASE("reset drops partial state", "[FrameReader]") {
  FrameReader reader;
  string first = Frame(FRAME_OUTPUT, "abcdef").serialize();
  reader.feed(first.data(), 7);
  REQUIRE(reader.hasPartialFrame());

  reader.reset();
  REQUIRE(!reader.hasPartialFrame());

  string second = Frame(FRAME_INPUT, "xyz").serialize();
  auto frames = reader.feed(second.data(), second.length());
  REQUIRE(frames.size() == 1);
  REQUIRE(frames[0].getPayload() == "xyz");
}
