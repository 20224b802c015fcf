#include "consent/consent_gate.hpp"

namespace bugreportd::consent {

const char* ToString(const ConsentDecision decision) {
  switch (decision) {
  case ConsentDecision::kPending:
    return "pending";
  case ConsentDecision::kApproved:
    return "approved";
  case ConsentDecision::kDenied:
    return "denied";
  case ConsentDecision::kTimedOut:
    return "timed_out";
  }
  return "pending";
}

const char* ToString(const ConsentUpdate update) {
  switch (update) {
  case ConsentUpdate::kApplied:
    return "applied";
  case ConsentUpdate::kAlreadyDecided:
    return "already_decided";
  case ConsentUpdate::kExpired:
    return "expired";
  }
  return "applied";
}

bool ConsentGate::Request(const Clock::time_point deadline) {
  if (armed_ || decision_ != ConsentDecision::kPending) {
    return false;
  }
  deadline_ = deadline;
  armed_ = true;
  return true;
}

bool ConsentGate::MarkNotRequired() {
  if (armed_ || decision_ != ConsentDecision::kPending) {
    return false;
  }
  required_ = false;
  decision_ = ConsentDecision::kApproved;
  return true;
}

ConsentUpdate ConsentGate::Approve(const Clock::time_point now) {
  return Decide(ConsentDecision::kApproved, now);
}

ConsentUpdate ConsentGate::Deny(const Clock::time_point now) {
  return Decide(ConsentDecision::kDenied, now);
}

bool ConsentGate::IsExpired(const Clock::time_point now) {
  if (decision_ == ConsentDecision::kTimedOut) {
    return true;
  }
  if (decision_ != ConsentDecision::kPending || !armed_) {
    return false;
  }
  if (now >= deadline_) {
    decision_ = ConsentDecision::kTimedOut;
    return true;
  }
  return false;
}

ConsentUpdate ConsentGate::Decide(const ConsentDecision decision, const Clock::time_point now) {
  if (decision_ != ConsentDecision::kPending) {
    return ConsentUpdate::kAlreadyDecided;
  }
  // A response that lands after the deadline loses to the timeout even if
  // the timer input has not been processed yet.
  if (IsExpired(now)) {
    return ConsentUpdate::kExpired;
  }
  decision_ = decision;
  return ConsentUpdate::kApplied;
}

} // namespace bugreportd::consent
