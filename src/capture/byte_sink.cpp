#include "capture/byte_sink.hpp"

#include <cerrno>
#include <cstring>

#include <unistd.h>

namespace bugreportd::capture {

bool FdByteSink::Write(std::string_view bytes, std::string& error) {
  if (fd_ < 0) {
    error = "sink file descriptor is invalid";
    return false;
  }

  const char* cursor = bytes.data();
  std::size_t remaining = bytes.size();
  while (remaining > 0U) {
    const ssize_t written = ::write(fd_, cursor, remaining);
    if (written < 0) {
      if (errno == EINTR) {
        continue;
      }
      error = "write to fd " + std::to_string(fd_) + " failed: " + std::strerror(errno);
      return false;
    }
    cursor += written;
    remaining -= static_cast<std::size_t>(written);
    bytes_written_ += static_cast<std::uint64_t>(written);
  }
  return true;
}

} // namespace bugreportd::capture
