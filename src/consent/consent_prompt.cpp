#include "consent/consent_prompt.hpp"

#include <utility>

namespace bugreportd::consent {

const char* ToString(const AutoConsentPolicy policy) {
  switch (policy) {
  case AutoConsentPolicy::kApprove:
    return "approve";
  case AutoConsentPolicy::kDeny:
    return "deny";
  case AutoConsentPolicy::kNone:
    return "none";
  }
  return "none";
}

bool ParseAutoConsentPolicy(std::string_view text, AutoConsentPolicy& policy, std::string& error) {
  if (text == "approve") {
    policy = AutoConsentPolicy::kApprove;
    return true;
  }
  if (text == "deny") {
    policy = AutoConsentPolicy::kDeny;
    return true;
  }
  if (text == "none") {
    policy = AutoConsentPolicy::kNone;
    return true;
  }
  error = "invalid consent policy '" + std::string(text) + "' (expected approve|deny|none)";
  return false;
}

AutoConsentPrompt::~AutoConsentPrompt() {
  Cancel();
  JoinWorker();
}

bool AutoConsentPrompt::Request(const capture::Principal& requester, ConsentResponder responder,
                                std::string& error) {
  if (!responder) {
    error = "consent prompt requires a responder";
    return false;
  }
  if (requester.package.empty()) {
    error = "consent prompt requires a requester package";
    return false;
  }

  // A previous prompt may still be winding down after Cancel.
  Cancel();
  JoinWorker();

  std::lock_guard<std::mutex> lock(mu_);
  cancelled_ = false;
  ++request_count_;
  if (policy_ == AutoConsentPolicy::kNone) {
    return true;
  }

  const bool approved = policy_ == AutoConsentPolicy::kApprove;
  worker_ = std::thread([this, approved, responder = std::move(responder)]() {
    {
      std::unique_lock<std::mutex> wait_lock(mu_);
      if (cv_.wait_for(wait_lock, delay_, [this]() { return cancelled_; })) {
        return;
      }
    }
    responder(approved);
  });
  return true;
}

void AutoConsentPrompt::Cancel() {
  std::lock_guard<std::mutex> lock(mu_);
  cancelled_ = true;
  cv_.notify_all();
}

std::uint64_t AutoConsentPrompt::request_count() const {
  std::lock_guard<std::mutex> lock(mu_);
  return request_count_;
}

void AutoConsentPrompt::JoinWorker() {
  std::thread worker;
  {
    std::lock_guard<std::mutex> lock(mu_);
    worker = std::move(worker_);
  }
  if (!worker.joinable()) {
    return;
  }
  if (worker.get_id() == std::this_thread::get_id()) {
    worker.detach();
    return;
  }
  worker.join();
}

} // namespace bugreportd::consent
