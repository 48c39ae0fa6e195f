#include <gtest/gtest.h>

#include "fake_transport.hpp"
#include "streamagent/llm/chunk_decoder.hpp"

using namespace streamagent;
using namespace streamagent::llm;
using streamagent::fakes::finish_chunk;
using streamagent::fakes::text_chunk;
using streamagent::fakes::tool_chunk;

namespace {

// Records every event of one decoding pass
struct Recorder {
  std::vector<StreamEvent> events;

  StreamCallback callback() {
    return [this](const StreamEvent& e) {
      events.push_back(e);
    };
  }

  template <typename T>
  std::vector<T> all() const {
    std::vector<T> out;
    for (const auto& e : events) {
      if (auto* v = std::get_if<T>(&e)) {
        out.push_back(*v);
      }
    }
    return out;
  }

  size_t terminal_count() const {
    size_t n = 0;
    for (const auto& e : events) {
      if (std::holds_alternative<MessageFinished>(e) || std::holds_alternative<TransportError>(e)) {
        n++;
      }
    }
    return n;
  }
};

std::vector<ToolCallRequest> decode_calls(const std::vector<RawChunk>& chunks) {
  ChunkDecoder decoder;
  Recorder rec;
  for (const auto& chunk : chunks) {
    decoder.feed(chunk, rec.callback());
  }
  decoder.finish(rec.callback());

  std::vector<ToolCallRequest> calls;
  for (const auto& finished : rec.all<ToolCallFinished>()) {
    calls.push_back(finished.call);
  }
  return calls;
}

}  // namespace

// --- ParseToolArgumentsTest ---

TEST(ParseToolArgumentsTest, ParsesObject) {
  EXPECT_EQ(parse_tool_arguments(R"({"a":1,"b":"x"})"), (json{{"a", 1}, {"b", "x"}}));
}

TEST(ParseToolArgumentsTest, EmptyTextIsEmptyObject) {
  EXPECT_EQ(parse_tool_arguments(""), json::object());
}

TEST(ParseToolArgumentsTest, MalformedTextFallsBackToRaw) {
  auto args = parse_tool_arguments(R"({"a":)");
  EXPECT_EQ(args, (json{{"raw_arguments", R"({"a":)"}}));
}

TEST(ParseToolArgumentsTest, NonObjectFallsBackToRaw) {
  EXPECT_EQ(parse_tool_arguments("[1,2]"), (json{{"raw_arguments", "[1,2]"}}));
  EXPECT_EQ(parse_tool_arguments("42"), (json{{"raw_arguments", "42"}}));
}

// --- ChunkDecoderTest ---

TEST(ChunkDecoderTest, TextFragmentsInArrivalOrder) {
  ChunkDecoder decoder;
  Recorder rec;

  decoder.feed(text_chunk("Hel"), rec.callback());
  decoder.feed(text_chunk(""), rec.callback());
  decoder.feed(text_chunk("lo"), rec.callback());
  decoder.finish(rec.callback());

  auto texts = rec.all<TextFragment>();
  ASSERT_EQ(texts.size(), 2);
  EXPECT_EQ(texts[0].text, "Hel");
  EXPECT_EQ(texts[1].text, "lo");
  EXPECT_EQ(rec.terminal_count(), 1);
  EXPECT_TRUE(std::holds_alternative<MessageFinished>(rec.events.back()));
}

TEST(ChunkDecoderTest, LastFinishReasonWinsAndUsageAccumulates) {
  ChunkDecoder decoder;
  Recorder rec;

  decoder.feed(finish_chunk(FinishReason::Length, TokenUsage{10, 1, 11, 0}), rec.callback());
  decoder.feed(finish_chunk(FinishReason::Stop, TokenUsage{0, 4, 4, 3}), rec.callback());
  decoder.finish(rec.callback());

  auto finished = rec.all<MessageFinished>();
  ASSERT_EQ(finished.size(), 1);
  ASSERT_TRUE(finished[0].reason.has_value());
  EXPECT_EQ(*finished[0].reason, FinishReason::Stop);
  ASSERT_TRUE(finished[0].usage.has_value());
  EXPECT_EQ(*finished[0].usage, (TokenUsage{10, 5, 15, 3}));
  EXPECT_FALSE(finished[0].text.has_value());
}

TEST(ChunkDecoderTest, UsageAbsentWhenBackendOmitsIt) {
  ChunkDecoder decoder;
  Recorder rec;
  decoder.feed(text_chunk("x"), rec.callback());
  decoder.finish(rec.callback());

  auto finished = rec.all<MessageFinished>();
  ASSERT_EQ(finished.size(), 1);
  EXPECT_FALSE(finished[0].usage.has_value());
  EXPECT_FALSE(finished[0].reason.has_value());
}

TEST(ChunkDecoderTest, TwoInterleavedToolCalls) {
  ChunkDecoder decoder;
  Recorder rec;

  std::vector<RawChunk> chunks = {
      tool_chunk(0, "call_x", "x", ""),  tool_chunk(1, "call_y", "y", ""),  tool_chunk(0, std::nullopt, "", R"({"a":)"),
      tool_chunk(1, std::nullopt, "", R"({"b":)"), tool_chunk(0, std::nullopt, "", "1"), tool_chunk(1, std::nullopt, "", "2"),
      tool_chunk(0, std::nullopt, "", "}"), tool_chunk(1, std::nullopt, "", "}"), finish_chunk(FinishReason::ToolCalls),
  };
  for (const auto& chunk : chunks) {
    decoder.feed(chunk, rec.callback());
  }
  decoder.finish(rec.callback());

  auto started = rec.all<ToolCallStarted>();
  ASSERT_EQ(started.size(), 2);
  EXPECT_EQ(started[0].name, "x");
  EXPECT_EQ(started[0].call_id, "call_x");
  EXPECT_EQ(started[1].name, "y");

  auto deltas = rec.all<ToolCallArgumentsDelta>();
  EXPECT_EQ(deltas.size(), 6);

  auto finished = rec.all<ToolCallFinished>();
  ASSERT_EQ(finished.size(), 2);
  EXPECT_EQ(finished[0].call.name, "x");
  EXPECT_EQ(finished[0].call.arguments, (json{{"a", 1}}));
  EXPECT_EQ(finished[1].call.name, "y");
  EXPECT_EQ(finished[1].call.arguments, (json{{"b", 2}}));

  // Started events precede every finished event, and the terminal event is last
  auto index_of = [&](auto pred) {
    for (size_t i = 0; i < rec.events.size(); ++i) {
      if (pred(rec.events[i])) return i;
    }
    return rec.events.size();
  };
  auto first_finished = index_of([](const StreamEvent& e) {
    return std::holds_alternative<ToolCallFinished>(e);
  });
  auto second_started = index_of([](const StreamEvent& e) {
    auto* s = std::get_if<ToolCallStarted>(&e);
    return s && s->name == "y";
  });
  EXPECT_LT(second_started, first_finished);
  EXPECT_TRUE(std::holds_alternative<MessageFinished>(rec.events.back()));
  EXPECT_EQ(rec.terminal_count(), 1);
}

TEST(ChunkDecoderTest, FinalizesInAscendingIndexOrderRegardlessOfArrival) {
  auto calls = decode_calls({
      tool_chunk(2, "c2", "third", "{}"),
      tool_chunk(0, "c0", "first", "{}"),
      tool_chunk(1, "c1", "second", "{}"),
  });

  ASSERT_EQ(calls.size(), 3);
  EXPECT_EQ(calls[0].name, "first");
  EXPECT_EQ(calls[1].name, "second");
  EXPECT_EQ(calls[2].name, "third");
}

TEST(ChunkDecoderTest, ArgumentSplitsDoNotChangeTheResult) {
  const std::string args = R"({"path":"src/main.cpp","offset":10,"nested":{"k":[1,2,3]}})";
  auto whole = decode_calls({tool_chunk(0, "call_1", "read_file", args)});
  ASSERT_EQ(whole.size(), 1);

  // Split the name and the argument text at every boundary pair
  for (size_t cut = 1; cut < args.size(); cut += 7) {
    for (size_t cut2 = cut + 1; cut2 < args.size(); cut2 += 11) {
      auto split = decode_calls({
          tool_chunk(0, "call_1", "read_file", ""),
          tool_chunk(0, std::nullopt, "", args.substr(0, cut)),
          tool_chunk(0, std::nullopt, "", args.substr(cut, cut2 - cut)),
          tool_chunk(0, std::nullopt, "", args.substr(cut2)),
      });
      ASSERT_EQ(split.size(), 1);
      EXPECT_EQ(split[0], whole[0]) << "cuts at " << cut << "," << cut2;
    }
  }
}

TEST(ChunkDecoderTest, FirstNameIsFrozen) {
  ChunkDecoder decoder;
  Recorder rec;

  decoder.feed(tool_chunk(0, "call_1", "read_file", ""), rec.callback());
  decoder.feed(tool_chunk(0, std::nullopt, "read_file", "{}"), rec.callback());
  decoder.feed(tool_chunk(0, std::nullopt, "other", ""), rec.callback());
  decoder.finish(rec.callback());

  EXPECT_EQ(rec.all<ToolCallStarted>().size(), 1);
  auto finished = rec.all<ToolCallFinished>();
  ASSERT_EQ(finished.size(), 1);
  EXPECT_EQ(finished[0].call.name, "read_file");
}

TEST(ChunkDecoderTest, NameArrivingAfterArgumentsStillStarts) {
  ChunkDecoder decoder;
  Recorder rec;

  decoder.feed(tool_chunk(0, "call_1", "", R"({"a")"), rec.callback());
  decoder.feed(tool_chunk(0, std::nullopt, "late", ":1}"), rec.callback());
  decoder.finish(rec.callback());

  auto started = rec.all<ToolCallStarted>();
  ASSERT_EQ(started.size(), 1);
  EXPECT_EQ(started[0].name, "late");

  auto finished = rec.all<ToolCallFinished>();
  ASSERT_EQ(finished.size(), 1);
  EXPECT_EQ(finished[0].call.arguments, (json{{"a", 1}}));
}

TEST(ChunkDecoderTest, MissingCallIdIsSynthesized) {
  auto calls = decode_calls({tool_chunk(3, std::nullopt, "x", "{}")});
  ASSERT_EQ(calls.size(), 1);
  EXPECT_EQ(calls[0].call_id, "call_3");
}

TEST(ChunkDecoderTest, MalformedArgumentsReachTheCallerAsData) {
  auto calls = decode_calls({tool_chunk(0, "call_1", "x", R"({"a": tru)")});
  ASSERT_EQ(calls.size(), 1);
  EXPECT_EQ(calls[0].arguments, (json{{"raw_arguments", R"({"a": tru)"}}));
}

TEST(ChunkDecoderTest, FailReplacesTerminalEvent) {
  ChunkDecoder decoder;
  Recorder rec;

  decoder.feed(tool_chunk(0, "call_1", "x", R"({"a":1})"), rec.callback());
  decoder.fail(TransportError{"Connection error: reset", TransportErrorKind::Connectivity}, rec.callback());
  decoder.finish(rec.callback());

  EXPECT_TRUE(rec.all<ToolCallFinished>().empty());
  EXPECT_TRUE(rec.all<MessageFinished>().empty());
  auto errors = rec.all<TransportError>();
  ASSERT_EQ(errors.size(), 1);
  EXPECT_EQ(errors[0].message, "Connection error: reset");
  EXPECT_TRUE(decoder.finished());
}

TEST(ChunkDecoderTest, ReplayEmitsNoPartialEvents) {
  ChatCompletion completion;
  completion.text = "All done";
  completion.tool_calls = {{"call_a", "x", {{"k", 1}}}, {"call_b", "y", json::object()}};
  completion.finish_reason = FinishReason::ToolCalls;
  completion.usage = TokenUsage{3, 4, 7, 0};

  Recorder rec;
  ChunkDecoder::replay(completion, rec.callback());

  EXPECT_TRUE(rec.all<TextFragment>().empty());
  EXPECT_TRUE(rec.all<ToolCallStarted>().empty());
  EXPECT_TRUE(rec.all<ToolCallArgumentsDelta>().empty());

  auto finished = rec.all<ToolCallFinished>();
  ASSERT_EQ(finished.size(), 2);
  EXPECT_EQ(finished[0].call.call_id, "call_a");
  EXPECT_EQ(finished[1].call.call_id, "call_b");

  ASSERT_EQ(rec.terminal_count(), 1);
  auto* message = std::get_if<MessageFinished>(&rec.events.back());
  ASSERT_NE(message, nullptr);
  EXPECT_EQ(message->text, std::optional<std::string>("All done"));
  EXPECT_EQ(message->reason, std::optional<FinishReason>(FinishReason::ToolCalls));
}
