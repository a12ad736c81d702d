#pragma once
/*
 * IByteSource
 *
 * Purpose: one-byte-at-a-time input boundary for the editor loop.
 * Result: Byte (b filled), None (nothing read, try again), Error (stream failed;
 *         the loop treats it like end of session).
 */
#include <cstddef>
#include <string>
#include <utility>

enum class ReadStatus { Byte, None, Error };

class IByteSource {
public:
  virtual ~IByteSource() = default;
  virtual ReadStatus read_byte(unsigned char& b) = 0;
};

// blocking read(2) on a descriptor the caller owns
class FdByteSource : public IByteSource {
public:
  explicit FdByteSource(int fd) : fd_(fd) {}
  ReadStatus read_byte(unsigned char& b) override;
  // strerror text of the last Error, empty otherwise
  const std::string& last_error() const { return last_error_; }

private:
  int fd_;
  std::string last_error_;
};

// replays a fixed byte string, then reports end_status forever
class ScriptedByteSource : public IByteSource {
public:
  explicit ScriptedByteSource(std::string bytes, ReadStatus end_status = ReadStatus::Error)
    : bytes_(std::move(bytes)), end_status_(end_status) {}
  ReadStatus read_byte(unsigned char& b) override;
  size_t remaining() const { return bytes_.size() - pos_; }

private:
  std::string bytes_;
  size_t pos_ = 0;
  ReadStatus end_status_;
};
