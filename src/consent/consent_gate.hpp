#pragma once

#include <chrono>

namespace bugreportd::consent {

enum class ConsentDecision {
  kPending,
  kApproved,
  kDenied,
  kTimedOut,
};

// Outcome of an approve/deny attempt.
enum class ConsentUpdate {
  kApplied,
  // A final decision already exists; the attempt changed nothing.
  kAlreadyDecided,
  // The deadline passed before the attempt; the gate is now TimedOut.
  kExpired,
};

const char* ToString(ConsentDecision decision);
const char* ToString(ConsentUpdate update);

// Tracks one session's consent decision. The decision moves from Pending to
// exactly one final value and never changes afterwards.
//
// Not thread-safe: every call happens inside the owning session's serialized
// worker, which is what orders a racing approve/deny against the deadline.
class ConsentGate {
public:
  using Clock = std::chrono::steady_clock;

  ConsentGate() = default;

  // Arms the gate with an absolute deadline. Only meaningful while Pending
  // and not yet armed; returns false otherwise.
  bool Request(Clock::time_point deadline);

  // Marks consent as not required (exempt requester or consent disabled).
  // Only valid before any decision; returns false otherwise.
  bool MarkNotRequired();

  ConsentUpdate Approve(Clock::time_point now);
  ConsentUpdate Deny(Clock::time_point now);

  // True once `now >= deadline` with the decision still Pending; the gate
  // moves to TimedOut as a side effect. Also true for an already TimedOut gate.
  bool IsExpired(Clock::time_point now);

  ConsentDecision decision() const {
    return decision_;
  }

  bool armed() const {
    return armed_;
  }

  bool required() const {
    return required_;
  }

  bool is_final() const {
    return decision_ != ConsentDecision::kPending;
  }

  Clock::time_point deadline() const {
    return deadline_;
  }

private:
  ConsentUpdate Decide(ConsentDecision decision, Clock::time_point now);

  ConsentDecision decision_ = ConsentDecision::kPending;
  Clock::time_point deadline_{};
  bool armed_ = false;
  bool required_ = true;
};

} // namespace bugreportd::consent
