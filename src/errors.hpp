#pragma once
/*
 * Errors
 *
 * Purpose: fatal error kinds raised at the terminal boundary.
 * Note: buffer and decoder never throw; read failures are reported as ReadStatus.
 */
#include <stdexcept>
#include <string>

// tcgetattr/tcsetattr or terminfo lookup failed
class TerminalError : public std::runtime_error {
public:
  explicit TerminalError(const std::string& what) : std::runtime_error(what) {}
};

// write to the output device failed
class OutputWriteError : public std::runtime_error {
public:
  explicit OutputWriteError(const std::string& what) : std::runtime_error(what) {}
};

std::string errno_message(const char* call);
