#include <gtest/gtest.h>

#include <thread>

#include "fake_transport.hpp"
#include "streamagent/llm/resilient_client.hpp"

using namespace streamagent;
using namespace streamagent::llm;
using namespace streamagent::fakes;

namespace {

// Collects events and the waits requested between attempts
struct Harness {
  std::shared_ptr<FakeTransport> transport = std::make_shared<FakeTransport>();
  std::vector<std::chrono::milliseconds> delays;
  std::vector<StreamEvent> events;

  ResilientClient make_client(int max_retries = 3) {
    RetryPolicy policy;
    policy.max_retries = max_retries;
    return ResilientClient(transport, policy, [this](std::chrono::milliseconds d) {
      delays.push_back(d);
    });
  }

  StreamCallback sink() {
    return [this](const StreamEvent& e) {
      events.push_back(e);
    };
  }

  std::string text() const {
    std::string out;
    for (const auto& e : events) {
      if (auto* t = std::get_if<TextFragment>(&e)) out += t->text;
    }
    return out;
  }

  size_t terminal_count() const {
    size_t n = 0;
    for (const auto& e : events) {
      if (std::holds_alternative<MessageFinished>(e) || std::holds_alternative<TransportError>(e)) n++;
    }
    return n;
  }

  const TransportError* error() const {
    return events.empty() ? nullptr : std::get_if<TransportError>(&events.back());
  }
};

ChatRequest make_request(bool stream = true) {
  ChatRequest request;
  request.model = "test-model";
  request.messages = {Message::user("hello")};
  request.stream = stream;
  return request;
}

Attempt text_reply(const std::string& text) {
  return Attempt{{text_chunk(text), finish_chunk(FinishReason::Stop)}, std::nullopt, {}};
}

Attempt failing(TransportFailure failure) {
  return Attempt{{}, std::move(failure), {}};
}

}  // namespace

TEST(RetryPolicyTest, DelayDoublesPerAttempt) {
  RetryPolicy policy;
  EXPECT_EQ(policy.delay_for(0), std::chrono::milliseconds(1000));
  EXPECT_EQ(policy.delay_for(1), std::chrono::milliseconds(2000));
  EXPECT_EQ(policy.delay_for(2), std::chrono::milliseconds(4000));
}

TEST(RetryPolicyTest, FromConfigClampsNegativeValues) {
  auto policy = RetryPolicy::from_config(RetryConfig{-2, 250});
  EXPECT_EQ(policy.max_retries, 0);
  EXPECT_EQ(policy.base_delay, std::chrono::milliseconds(250));
}

TEST(DescribeFailureTest, PrefixesByKind) {
  EXPECT_EQ(describe_failure({TransportErrorKind::RateLimited, "slow down", 429}), "Rate limit exceeded: slow down");
  EXPECT_EQ(describe_failure({TransportErrorKind::Connectivity, "reset", 0}), "Connection error: reset");
  EXPECT_EQ(describe_failure({TransportErrorKind::Fatal, "HTTP 401: bad key", 401}), "API error: HTTP 401: bad key");
}

TEST(ResilientClientTest, SuccessOnFirstAttempt) {
  Harness h;
  h.transport->script(text_reply("Hello"));
  auto client = h.make_client();

  client.run(make_request(), h.sink());

  EXPECT_EQ(h.text(), "Hello");
  EXPECT_EQ(h.terminal_count(), 1);
  EXPECT_TRUE(std::holds_alternative<MessageFinished>(h.events.back()));
  EXPECT_EQ(client.attempts(), 1);
  EXPECT_TRUE(h.delays.empty());
}

TEST(ResilientClientTest, RetriedAttemptLooksLikeImmediateSuccess) {
  Harness direct;
  direct.transport->script(text_reply("Hello"));
  auto direct_client = direct.make_client();
  direct_client.run(make_request(), direct.sink());

  Harness retried;
  retried.transport->script(failing(rate_limited()));
  retried.transport->script(text_reply("Hello"));
  auto retried_client = retried.make_client();
  retried_client.run(make_request(), retried.sink());

  EXPECT_EQ(retried.events.size(), direct.events.size());
  EXPECT_EQ(retried.text(), direct.text());
  EXPECT_EQ(retried.terminal_count(), 1);
  EXPECT_EQ(retried_client.attempts(), 2);
  ASSERT_EQ(retried.delays.size(), 1);
  EXPECT_EQ(retried.delays[0], std::chrono::milliseconds(1000));
}

TEST(ResilientClientTest, ConnectivityFailuresAreRetried) {
  Harness h;
  h.transport->script(failing(connection_lost()));
  h.transport->script(failing(connection_lost()));
  h.transport->script(text_reply("ok"));
  auto client = h.make_client();

  client.run(make_request(), h.sink());

  EXPECT_EQ(h.text(), "ok");
  EXPECT_EQ(client.attempts(), 3);
  EXPECT_EQ(h.delays, (std::vector<std::chrono::milliseconds>{std::chrono::milliseconds(1000), std::chrono::milliseconds(2000)}));
}

TEST(ResilientClientTest, ExhaustedBudgetReportsOneError) {
  Harness h;
  for (int i = 0; i < 4; ++i) {
    h.transport->script(failing(rate_limited()));
  }
  auto client = h.make_client();

  client.run(make_request(), h.sink());

  EXPECT_EQ(h.transport->attempts_made(), 4);
  EXPECT_EQ(client.attempts(), 4);
  EXPECT_EQ(h.delays, (std::vector<std::chrono::milliseconds>{std::chrono::milliseconds(1000), std::chrono::milliseconds(2000),
                                                              std::chrono::milliseconds(4000)}));
  ASSERT_EQ(h.events.size(), 1);
  auto* error = h.error();
  ASSERT_NE(error, nullptr);
  EXPECT_EQ(error->kind, TransportErrorKind::RateLimited);
  EXPECT_EQ(error->message.rfind("Rate limit exceeded", 0), 0);
}

TEST(ResilientClientTest, ZeroRetriesMeansOneAttempt) {
  Harness h;
  h.transport->script(failing(connection_lost()));
  h.transport->script(text_reply("never"));
  auto client = h.make_client(0);

  client.run(make_request(), h.sink());

  EXPECT_EQ(h.transport->attempts_made(), 1);
  EXPECT_TRUE(h.delays.empty());
  ASSERT_NE(h.error(), nullptr);
  EXPECT_EQ(h.error()->message, "Connection error: Connection reset by peer");
}

TEST(ResilientClientTest, FatalFailureIsNotRetried) {
  Harness h;
  h.transport->script(failing(fatal_error()));
  h.transport->script(text_reply("never"));
  auto client = h.make_client();

  client.run(make_request(), h.sink());

  EXPECT_EQ(h.transport->attempts_made(), 1);
  EXPECT_TRUE(h.delays.empty());
  ASSERT_EQ(h.events.size(), 1);
  ASSERT_NE(h.error(), nullptr);
  EXPECT_EQ(h.error()->kind, TransportErrorKind::Fatal);
  EXPECT_EQ(h.error()->message, "API error: HTTP 401: Invalid API key");
}

TEST(ResilientClientTest, FailureAfterOutputIsSurfacedWithoutRetry) {
  Harness h;
  h.transport->script(Attempt{{text_chunk("partial")}, connection_lost(), {}});
  h.transport->script(text_reply("never"));
  auto client = h.make_client();

  client.run(make_request(), h.sink());

  EXPECT_EQ(h.transport->attempts_made(), 1);
  EXPECT_TRUE(h.delays.empty());
  EXPECT_EQ(h.text(), "partial");
  EXPECT_EQ(h.terminal_count(), 1);
  ASSERT_NE(h.error(), nullptr);
  EXPECT_EQ(h.error()->kind, TransportErrorKind::Connectivity);
}

TEST(ResilientClientTest, PartialToolCallsOfFailedAttemptAreDiscarded) {
  Harness h;
  // Chunks without a name or text produce no events, so the attempt stays retryable
  h.transport->script(Attempt{{tool_chunk(0, "call_1", "", "")}, connection_lost(), {}});
  h.transport->script(Attempt{{tool_chunk(0, "call_2", "read_file", R"({"path":"a"})"), finish_chunk(FinishReason::ToolCalls)}, std::nullopt, {}});
  auto client = h.make_client();

  client.run(make_request(), h.sink());

  std::vector<ToolCallRequest> calls;
  for (const auto& e : h.events) {
    if (auto* f = std::get_if<ToolCallFinished>(&e)) calls.push_back(f->call);
  }
  ASSERT_EQ(calls.size(), 1);
  EXPECT_EQ(calls[0].call_id, "call_2");
  EXPECT_EQ(client.attempts(), 2);
}

TEST(ResilientClientTest, NonStreamingPathReplaysCompletion) {
  Harness h;
  ChatCompletion completion;
  completion.text = "Full answer";
  completion.finish_reason = FinishReason::Stop;
  h.transport->script(failing(rate_limited()));
  h.transport->script(Attempt{{}, std::nullopt, completion});
  auto client = h.make_client();

  client.run(make_request(false), h.sink());

  EXPECT_EQ(client.attempts(), 2);
  ASSERT_EQ(h.events.size(), 1);
  auto* finished = std::get_if<MessageFinished>(&h.events.back());
  ASSERT_NE(finished, nullptr);
  EXPECT_EQ(finished->text, std::optional<std::string>("Full answer"));
}

TEST(ResilientClientTest, CancelDuringBackoffStopsRetrying) {
  Harness h;
  h.transport->script(failing(rate_limited()));
  h.transport->script(text_reply("never"));

  ResilientClient* self = nullptr;
  ResilientClient client(h.transport, RetryPolicy{}, [&](std::chrono::milliseconds) {
    self->cancel();
  });
  self = &client;

  client.run(make_request(), h.sink());

  EXPECT_EQ(h.transport->attempts_made(), 1);
  EXPECT_EQ(h.transport->cancel_count, 1);
  ASSERT_EQ(h.events.size(), 1);
  ASSERT_NE(h.error(), nullptr);
  EXPECT_EQ(h.error()->message, "Request cancelled");
}

TEST(ResilientClientTest, CancelInterruptsDefaultWait) {
  auto transport = std::make_shared<FakeTransport>();
  transport->script(failing(rate_limited()));
  RetryPolicy policy;
  policy.base_delay = std::chrono::milliseconds(60000);
  ResilientClient client(transport, policy);

  std::vector<StreamEvent> events;
  auto started = std::chrono::steady_clock::now();
  std::thread canceller([&client]() {
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    client.cancel();
  });
  client.run(make_request(), [&](const StreamEvent& e) {
    events.push_back(e);
  });
  canceller.join();

  EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds(30));
  ASSERT_EQ(events.size(), 1);
  auto* error = std::get_if<TransportError>(&events.back());
  ASSERT_NE(error, nullptr);
  EXPECT_EQ(error->message, "Request cancelled");
}

TEST(ResilientClientTest, CancelBeforeRunIsNotLost) {
  Harness h;
  h.transport->script(failing(rate_limited()));
  h.transport->script(text_reply("later"));
  auto client = h.make_client();

  client.cancel();
  client.run(make_request(), h.sink());

  EXPECT_EQ(h.transport->attempts_made(), 0);
  EXPECT_EQ(client.attempts(), 0);
  EXPECT_TRUE(h.delays.empty());
  ASSERT_EQ(h.events.size(), 1);
  ASSERT_NE(h.error(), nullptr);
  EXPECT_EQ(h.error()->message, "Request cancelled");

  h.events.clear();
  client.reset();
  client.run(make_request(), h.sink());

  EXPECT_EQ(client.attempts(), 2);
  EXPECT_EQ(h.text(), "later");
  EXPECT_EQ(h.terminal_count(), 1);
}

TEST(ResilientClientTest, CloseReleasesTransport) {
  Harness h;
  auto client = h.make_client();
  client.close();
  EXPECT_EQ(h.transport->close_count, 1);
}
