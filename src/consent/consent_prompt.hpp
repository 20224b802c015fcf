#pragma once

#include "capture/capture_request.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>

namespace bugreportd::consent {

// Called with true for approve, false for deny. May be invoked from any
// thread, at most once per Request.
using ConsentResponder = std::function<void(bool approved)>;

// Consent UI collaborator. It presents a yes/no prompt to the requester; the
// session owns the timeout, so an implementation may simply never answer.
class IConsentPrompt {
public:
  virtual ~IConsentPrompt() = default;

  virtual bool Request(const capture::Principal& requester, ConsentResponder responder,
                       std::string& error) = 0;

  // Withdraws the outstanding prompt, if any. A responder invoked after this
  // is ignored by the session.
  virtual void Cancel() = 0;
};

enum class AutoConsentPolicy {
  kApprove,
  kDeny,
  // Never answer; the session times out.
  kNone,
};

const char* ToString(AutoConsentPolicy policy);
bool ParseAutoConsentPolicy(std::string_view text, AutoConsentPolicy& policy, std::string& error);

// Unattended prompt used by the CLI: answers with a fixed policy after a
// delay, on its own thread.
class AutoConsentPrompt final : public IConsentPrompt {
public:
  AutoConsentPrompt(AutoConsentPolicy policy, std::chrono::milliseconds delay)
      : policy_(policy), delay_(delay) {}
  ~AutoConsentPrompt() override;

  AutoConsentPrompt(const AutoConsentPrompt&) = delete;
  AutoConsentPrompt& operator=(const AutoConsentPrompt&) = delete;

  bool Request(const capture::Principal& requester, ConsentResponder responder,
               std::string& error) override;
  void Cancel() override;

  std::uint64_t request_count() const;

private:
  void JoinWorker();

  const AutoConsentPolicy policy_;
  const std::chrono::milliseconds delay_;

  mutable std::mutex mu_;
  std::condition_variable cv_;
  bool cancelled_ = false;
  std::uint64_t request_count_ = 0;
  std::thread worker_;
};

} // namespace bugreportd::consent
