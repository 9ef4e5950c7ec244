#include "shepherd/output_router.hpp"

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace shepherd {
namespace {

struct Collected {
  std::vector<std::string> texts;
  std::vector<Stream> streams;

  LineHandler handler() {
    return [this](const OutputLine& line) {
      texts.push_back(line.text);
      streams.push_back(line.stream);
    };
  }
};

}  // namespace

TEST(SanitizeUtf8Test, ValidTextIsUnchanged) {
  EXPECT_EQ(sanitize_utf8("plain ascii"), "plain ascii");
  EXPECT_EQ(sanitize_utf8("caf\xC3\xA9 \xE2\x82\xAC \xF0\x9F\x98\x80"),
            "caf\xC3\xA9 \xE2\x82\xAC \xF0\x9F\x98\x80");
}

TEST(SanitizeUtf8Test, InvalidBytesBecomeReplacementCharacters) {
  EXPECT_EQ(sanitize_utf8("a\xFF" "b"), "a\xEF\xBF\xBD" "b");
  EXPECT_EQ(sanitize_utf8("\xFF\xFE"), "\xEF\xBF\xBD\xEF\xBF\xBD");
}

TEST(SanitizeUtf8Test, TruncatedSequenceIsOneReplacement) {
  EXPECT_EQ(sanitize_utf8("x\xE2\x82"), "x\xEF\xBF\xBD");
  EXPECT_EQ(sanitize_utf8("\xE2\x82" "A"), "\xEF\xBF\xBD" "A");
}

TEST(SanitizeUtf8Test, OverlongAndSurrogatesAreRejected) {
  EXPECT_EQ(sanitize_utf8("\xC0\xAF"), "\xEF\xBF\xBD\xEF\xBF\xBD");
  EXPECT_EQ(sanitize_utf8("\xED\xA0\x80"), "\xEF\xBF\xBD\xEF\xBF\xBD\xEF\xBF\xBD");
}

TEST(OutputRouterTest, MultiLineChunkDeliversEachLine) {
  OutputRouter router;
  Collected collected;
  router.add_handler(collected.handler());

  router.feed(Stream::stdout_stream, "one\ntwo\nthree\n");
  EXPECT_EQ(collected.texts, (std::vector<std::string>{"one", "two", "three"}));
}

TEST(OutputRouterTest, LineSpanningChunksIsReassembled) {
  OutputRouter router;
  Collected collected;
  router.add_handler(collected.handler());

  router.feed(Stream::stdout_stream, "hel");
  router.feed(Stream::stdout_stream, "lo wor");
  EXPECT_TRUE(collected.texts.empty());
  router.feed(Stream::stdout_stream, "ld\nnext");
  EXPECT_EQ(collected.texts, (std::vector<std::string>{"hello world"}));
}

TEST(OutputRouterTest, FinishFlushesTrailingPartialLine) {
  OutputRouter router;
  Collected collected;
  router.add_handler(collected.handler());

  router.feed(Stream::stdout_stream, "done\ntail");
  router.feed(Stream::stderr_stream, "warn");
  router.finish();
  EXPECT_EQ(collected.texts, (std::vector<std::string>{"done", "tail", "warn"}));
  EXPECT_EQ(collected.streams.back(), Stream::stderr_stream);

  router.finish();
  EXPECT_EQ(collected.texts.size(), 3u);
}

TEST(OutputRouterTest, EmptyLinesArePreserved) {
  OutputRouter router;
  Collected collected;
  router.add_handler(collected.handler());

  router.feed(Stream::stdout_stream, "\n\nx\n");
  EXPECT_EQ(collected.texts, (std::vector<std::string>{"", "", "x"}));
}

TEST(OutputRouterTest, StreamsAreSplitIndependently) {
  OutputRouter router;
  Collected collected;
  router.add_handler(collected.handler());

  router.feed(Stream::stdout_stream, "out-");
  router.feed(Stream::stderr_stream, "err\n");
  router.feed(Stream::stdout_stream, "line\n");
  EXPECT_EQ(collected.texts, (std::vector<std::string>{"err", "out-line"}));
  EXPECT_EQ(collected.streams,
            (std::vector<Stream>{Stream::stderr_stream, Stream::stdout_stream}));
}

TEST(OutputRouterTest, MultibyteCharacterSplitAcrossReadsSurvives) {
  OutputRouter router;
  Collected collected;
  router.add_handler(collected.handler());

  router.feed(Stream::stdout_stream, "caf\xC3");
  router.feed(Stream::stdout_stream, "\xA9\n");
  ASSERT_EQ(collected.texts.size(), 1u);
  EXPECT_EQ(collected.texts[0], "caf\xC3\xA9");
  EXPECT_EQ(router.captured(Stream::stdout_stream), "caf\xC3\xA9\n");
}

TEST(OutputRouterTest, ThrowingHandlerDoesNotStopOthers) {
  OutputRouter router;
  Collected before;
  Collected after;
  router.add_handler(before.handler());
  router.add_handler([](const OutputLine&) { throw std::runtime_error("ui went away"); });
  router.add_handler(after.handler());

  router.feed(Stream::stdout_stream, "a\nb\n");
  EXPECT_EQ(before.texts.size(), 2u);
  EXPECT_EQ(after.texts.size(), 2u);
  EXPECT_EQ(router.handler_failures(), 2u);
}

TEST(OutputRouterTest, NonStandardThrowIsContained) {
  OutputRouter router;
  Collected after;
  router.add_handler([](const OutputLine&) { throw 42; });
  router.add_handler(after.handler());

  EXPECT_NO_THROW(router.feed(Stream::stderr_stream, "x\ny\n"));
  EXPECT_NO_THROW(router.feed(Stream::stdout_stream, "tail"));
  EXPECT_NO_THROW(router.finish());
  EXPECT_EQ(after.texts, (std::vector<std::string>{"x", "y", "tail"}));
  EXPECT_EQ(router.handler_failures(), 3u);
}

TEST(OutputRouterTest, CaptureIsCompleteAndRepaired) {
  OutputRouter router;
  std::string big(200000, 'x');
  router.feed(Stream::stdout_stream, big);
  router.feed(Stream::stdout_stream, "\n\xFF");
  router.finish();

  auto captured = router.captured(Stream::stdout_stream);
  EXPECT_EQ(captured.size(), big.size() + 1 + 3);
  EXPECT_EQ(captured.substr(captured.size() - 3), "\xEF\xBF\xBD");
  EXPECT_TRUE(router.captured(Stream::stderr_stream).empty());
}

TEST(DisplayBufferTest, DropsOldestBeyondCapacity) {
  DisplayBuffer buffer(3);
  for (int i = 0; i < 5; ++i) {
    buffer.append(OutputLine{.text = std::to_string(i)});
  }
  auto lines = buffer.lines();
  ASSERT_EQ(lines.size(), 3u);
  EXPECT_EQ(lines.front().text, "2");
  EXPECT_EQ(lines.back().text, "4");
  EXPECT_EQ(buffer.dropped(), 2u);

  buffer.clear();
  EXPECT_EQ(buffer.size(), 0u);
  EXPECT_EQ(buffer.dropped(), 0u);
}

TEST(DisplayBufferTest, CapacityIsAtLeastOne) {
  DisplayBuffer buffer(0);
  EXPECT_EQ(buffer.capacity(), 1u);
  buffer.append(OutputLine{.text = "a"});
  buffer.append(OutputLine{.text = "b"});
  ASSERT_EQ(buffer.size(), 1u);
  EXPECT_EQ(buffer.lines()[0].text, "b");
}

TEST(DisplayBufferTest, RouterFeedsDisplayWhileCaptureKeepsEverything) {
  DisplayBuffer buffer(DisplayBuffer::kDefaultCapacity);
  OutputRouter router;
  router.add_handler(buffer.handler());

  std::string chunk;
  for (int i = 0; i < 1500; ++i) {
    chunk += "line " + std::to_string(i) + "\n";
  }
  router.feed(Stream::stdout_stream, chunk);

  EXPECT_EQ(buffer.size(), DisplayBuffer::kDefaultCapacity);
  EXPECT_EQ(buffer.dropped(), 500u);
  EXPECT_EQ(buffer.lines().front().text, "line 500");
  EXPECT_EQ(router.captured(Stream::stdout_stream), chunk);
}

TEST(DisplayBufferTest, ConcurrentReadersSeeConsistentSnapshots) {
  DisplayBuffer buffer(10);
  std::thread writer([&]() {
    for (int i = 0; i < 1000; ++i) {
      buffer.append(OutputLine{.text = std::to_string(i)});
    }
  });
  for (int i = 0; i < 100; ++i) {
    EXPECT_LE(buffer.lines().size(), 10u);
  }
  writer.join();
  EXPECT_EQ(buffer.size(), 10u);
  EXPECT_EQ(buffer.lines().back().text, "999");
}

}  // namespace shepherd
