#include <gtest/gtest.h>

#include "net/http_client.hpp"
#include "net/sse_parser.hpp"

using namespace streamagent::net;

// --- SseParserTest ---

TEST(SseParserTest, SingleEvent) {
  SseParser parser;
  auto events = parser.feed("data: {\"a\":1}\n\n");
  ASSERT_EQ(events.size(), 1);
  EXPECT_EQ(events[0].data, "{\"a\":1}");
  EXPECT_TRUE(events[0].event.empty());
}

TEST(SseParserTest, EventSplitAcrossReads) {
  SseParser parser;
  EXPECT_TRUE(parser.feed("da").empty());
  EXPECT_TRUE(parser.feed("ta: hel").empty());
  EXPECT_TRUE(parser.feed("lo\n").empty());
  auto events = parser.feed("\n");
  ASSERT_EQ(events.size(), 1);
  EXPECT_EQ(events[0].data, "hello");
}

TEST(SseParserTest, CrlfLineEndings) {
  SseParser parser;
  auto events = parser.feed("event: delta\r\nid: 7\r\ndata: x\r\n\r\ndata: y\r\n\r\n");
  ASSERT_EQ(events.size(), 2);
  EXPECT_EQ(events[0].event, "delta");
  EXPECT_EQ(events[0].id, "7");
  EXPECT_EQ(events[0].data, "x");
  EXPECT_EQ(events[1].data, "y");
  EXPECT_TRUE(events[1].event.empty());
}

TEST(SseParserTest, MultiLineDataJoinedWithNewline) {
  SseParser parser;
  auto events = parser.feed("data: first\ndata:second\n\n");
  ASSERT_EQ(events.size(), 1);
  EXPECT_EQ(events[0].data, "first\nsecond");
}

TEST(SseParserTest, CommentsAndEmptyEventsIgnored) {
  SseParser parser;
  auto events = parser.feed(": keep-alive\n\nevent: ping\n\ndata: [DONE]\n\n");
  ASSERT_EQ(events.size(), 1);
  EXPECT_EQ(events[0].data, "[DONE]");
}

TEST(SseParserTest, ResetDropsPartialInput) {
  SseParser parser;
  parser.feed("data: stale");
  parser.reset();
  auto events = parser.feed("data: fresh\n\n");
  ASSERT_EQ(events.size(), 1);
  EXPECT_EQ(events[0].data, "fresh");
}

// --- ChunkedDecoderTest ---

TEST(ChunkedDecoderTest, DecodesWholeBody) {
  ChunkedDecoder decoder;
  auto out = decoder.feed("5\r\nhello\r\n6\r\n world\r\n0\r\n\r\n");
  EXPECT_EQ(out, "hello world");
  EXPECT_TRUE(decoder.done());
  EXPECT_FALSE(decoder.failed());
}

TEST(ChunkedDecoderTest, ByteAtATime) {
  const std::string body = "a\r\n0123456789\r\n3;ext=1\r\nabc\r\n0\r\nX-Trailer: 1\r\n\r\n";
  ChunkedDecoder decoder;
  std::string out;
  for (char c : body) {
    out += decoder.feed(std::string_view(&c, 1));
  }
  EXPECT_EQ(out, "0123456789abc");
  EXPECT_TRUE(decoder.done());
}

TEST(ChunkedDecoderTest, PartialBodyIsNotDone) {
  ChunkedDecoder decoder;
  EXPECT_EQ(decoder.feed("4\r\nda"), "da");
  EXPECT_EQ(decoder.feed("ta\r\n"), "ta");
  EXPECT_FALSE(decoder.done());
  EXPECT_FALSE(decoder.failed());
}

TEST(ChunkedDecoderTest, InvalidSizeLineFails) {
  ChunkedDecoder decoder;
  decoder.feed("zz\r\nhello\r\n");
  EXPECT_TRUE(decoder.failed());
  EXPECT_FALSE(decoder.done());
}

TEST(ChunkedDecoderTest, MissingChunkTerminatorFails) {
  ChunkedDecoder decoder;
  decoder.feed("2\r\nabXY");
  EXPECT_TRUE(decoder.failed());
}

// --- ParsedUrlTest ---

TEST(ParsedUrlTest, HttpsWithPath) {
  auto url = ParsedUrl::parse("https://api.openai.com/v1/chat/completions");
  ASSERT_TRUE(url.has_value());
  EXPECT_TRUE(url->is_https());
  EXPECT_EQ(url->host, "api.openai.com");
  EXPECT_EQ(url->path, "/v1/chat/completions");
  EXPECT_EQ(url->port_or_default(), "443");
}

TEST(ParsedUrlTest, HttpWithPortAndQuery) {
  auto url = ParsedUrl::parse("http://localhost:11434/v1?x=1");
  ASSERT_TRUE(url.has_value());
  EXPECT_FALSE(url->is_https());
  EXPECT_EQ(url->port, "11434");
  EXPECT_EQ(url->port_or_default(), "11434");
  EXPECT_EQ(url->path, "/v1");
  EXPECT_EQ(url->query, "?x=1");
}

TEST(ParsedUrlTest, DefaultsPathAndPort) {
  auto url = ParsedUrl::parse("http://example.com");
  ASSERT_TRUE(url.has_value());
  EXPECT_EQ(url->path, "/");
  EXPECT_EQ(url->port_or_default(), "80");
}

TEST(ParsedUrlTest, RejectsUnsupportedScheme) {
  EXPECT_FALSE(ParsedUrl::parse("ftp://example.com/file").has_value());
  EXPECT_FALSE(ParsedUrl::parse("not a url").has_value());
}

// --- HttpClientTest ---

TEST(HttpClientTest, InvalidUrlCompletesWithError) {
  asio::io_context io_ctx;
  HttpClient client(io_ctx);

  auto future = client.request("nonsense", HttpOptions{});
  io_ctx.run();

  auto response = future.get();
  EXPECT_FALSE(response.ok());
  EXPECT_EQ(response.error, "Invalid URL");
  EXPECT_EQ(response.status_code, 0);
}
