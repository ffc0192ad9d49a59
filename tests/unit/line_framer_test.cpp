#include <cassert>
#include <iostream>
#include <string>

#include "internal/transport/line_framer.hpp"

namespace {

using meshdispatch::transport::LineFramer;

std::vector<std::string> Feed(LineFramer& framer, const std::string& bytes) {
  return framer.Feed(bytes.data(), bytes.size());
}

void TestSplitsOnNewline() {
  LineFramer framer(64);
  auto       frames = Feed(framer, "{\"a\":1}\n{\"b\":2}\n");
  assert(frames.size() == 2);
  assert(frames[0] == "{\"a\":1}");
  assert(frames[1] == "{\"b\":2}");
}

void TestReassemblesAcrossReads() {
  LineFramer framer(64);
  assert(Feed(framer, "{\"type\":").empty());
  assert(Feed(framer, "\"ack\"").empty());
  auto frames = Feed(framer, "}\n{\"x\"");
  assert(frames.size() == 1);
  assert(frames[0] == "{\"type\":\"ack\"}");

  frames = Feed(framer, ":1}\n");
  assert(frames.size() == 1);
  assert(frames[0] == "{\"x\":1}");
}

void TestDropsCarriageReturnsAndBlankLines() {
  LineFramer framer(64);
  auto       frames = Feed(framer, "\r\n\n{}\r\n\n");
  assert(frames.size() == 1);
  assert(frames[0] == "{}");
}

void TestOversizedLineIsDiscardedUpToNewline() {
  LineFramer framer(8);
  auto       frames = Feed(framer, "0123456789abcdef");
  assert(frames.empty());
  assert(framer.Discarded() == 1);

  frames = Feed(framer, "still garbage\n{\"ok\":1}\n");
  assert(frames.size() == 1);
  assert(frames[0] == "{\"ok\":1}");
  assert(framer.Discarded() == 1);
}

void TestLineOfExactlyMaxIsKept() {
  LineFramer framer(4);
  auto       frames = Feed(framer, "abcd\n");
  assert(frames.size() == 1);
  assert(frames[0] == "abcd");
}

void TestResetDropsPartial() {
  LineFramer framer(64);
  Feed(framer, "{\"half\":");
  framer.Reset();
  auto frames = Feed(framer, "{}\n");
  assert(frames.size() == 1);
  assert(frames[0] == "{}");
}

} // namespace

int main() {
  TestSplitsOnNewline();
  TestReassemblesAcrossReads();
  TestDropsCarriageReturnsAndBlankLines();
  TestOversizedLineIsDiscardedUpToNewline();
  TestLineOfExactlyMaxIsKept();
  TestResetDropsPartial();

  std::cout << "meshdispatch_unit_line_framer: pass\n";
  return 0;
}
