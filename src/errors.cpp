#include "errors.hpp"
#include <cerrno>
#include <cstring>

std::string errno_message(const char* call) {
  return std::string(call) + ": " + std::strerror(errno);
}
