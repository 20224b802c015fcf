#include "session/session_queue.hpp"

#include <catch2/catch.hpp>

#include <string>
#include <thread>

using bugreportd::session::SessionInput;
using bugreportd::session::SessionQueue;

TEST_CASE("Session queue preserves posting order", "[session][queue]") {
  SessionQueue queue;
  REQUIRE(queue.Post({.kind = SessionInput::Kind::kStart}));
  REQUIRE(queue.Post({.kind = SessionInput::Kind::kBackendProgress, .progress = 12.5F}));
  REQUIRE(queue.Post({.kind = SessionInput::Kind::kCancel}));
  REQUIRE(queue.posted() == 3U);

  REQUIRE(queue.Pop()->kind == SessionInput::Kind::kStart);
  const auto progress = queue.Pop();
  REQUIRE(progress->kind == SessionInput::Kind::kBackendProgress);
  REQUIRE(progress->progress == 12.5F);
  REQUIRE(queue.Pop()->kind == SessionInput::Kind::kCancel);
}

TEST_CASE("Closing the queue hands back pending inputs", "[session][queue]") {
  SessionQueue queue;
  REQUIRE(queue.Post({.kind = SessionInput::Kind::kBackendFinished}));
  REQUIRE(queue.Post({.kind = SessionInput::Kind::kConsentApproved}));

  const auto pending = queue.Close();
  REQUIRE(pending.size() == 2U);
  REQUIRE(pending[1].kind == SessionInput::Kind::kConsentApproved);
  REQUIRE(queue.closed());
  REQUIRE_FALSE(queue.Post({.kind = SessionInput::Kind::kCancel}));
  REQUIRE_FALSE(queue.Pop().has_value());
}

TEST_CASE("Close wakes a blocked consumer", "[session][queue]") {
  SessionQueue queue;
  bool woke_empty = false;
  std::thread consumer([&]() { woke_empty = !queue.Pop().has_value(); });
  queue.Close();
  consumer.join();
  REQUIRE(woke_empty);
}

TEST_CASE("Session input kinds have stable names", "[session][queue]") {
  REQUIRE(std::string(bugreportd::session::ToString(SessionInput::Kind::kConsentDeadline)) ==
          "consent_deadline");
  REQUIRE(std::string(bugreportd::session::ToString(SessionInput::Kind::kPeerDied)) ==
          "peer_died");
  REQUIRE(std::string(bugreportd::session::ToString(SessionInput::Kind::kBackendFinished)) ==
          "backend_finished");
}
