#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace bugreportd::capture {

// Writable byte destination. Implementations either accept all of `bytes`
// or return false with `error` populated.
class IByteSink {
public:
  virtual ~IByteSink() = default;

  virtual bool Write(std::string_view bytes, std::string& error) = 0;
};

// Sink over a caller-owned file descriptor, typically opened write-only in
// append mode. The descriptor is borrowed: this class never closes it.
class FdByteSink final : public IByteSink {
public:
  explicit FdByteSink(int fd) : fd_(fd) {}

  bool Write(std::string_view bytes, std::string& error) override;

  int fd() const {
    return fd_;
  }

  std::uint64_t bytes_written() const {
    return bytes_written_;
  }

private:
  int fd_ = -1;
  std::uint64_t bytes_written_ = 0;
};

} // namespace bugreportd::capture
