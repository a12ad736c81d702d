#include "byte_source.hpp"
#include <cerrno>
#include <unistd.h>
#include "errors.hpp"

ReadStatus FdByteSource::read_byte(unsigned char& b) {
  for (;;) {
    ssize_t n = ::read(fd_, &b, 1);
    if (n == 1) return ReadStatus::Byte;
    if (n == 0) return ReadStatus::None;
    if (errno == EINTR) continue;
    last_error_ = errno_message("read");
    return ReadStatus::Error;
  }
}

ReadStatus ScriptedByteSource::read_byte(unsigned char& b) {
  if (pos_ >= bytes_.size()) return end_status_;
  b = static_cast<unsigned char>(bytes_[pos_++]);
  return ReadStatus::Byte;
}
