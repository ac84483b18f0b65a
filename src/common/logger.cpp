#include "launchpad/common/logger.hpp"

#include <iostream>

namespace launchpad::common {

StderrLogger::StderrLogger(const bool verbose) : StderrLogger(std::cout, std::cerr, verbose) {}

StderrLogger::StderrLogger(std::ostream &out, std::ostream &err, const bool verbose)
    : out_(out), err_(err), verbose_(verbose) {}

void StderrLogger::trace(const std::string &message) {
  if (!verbose_) {
    return;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  err_ << "[trace] " << message << "\n";
}

void StderrLogger::status(const std::string &message) {
  std::lock_guard<std::mutex> lock(mutex_);
  out_ << message << "\n";
}

void StderrLogger::error(const std::string &message) {
  std::lock_guard<std::mutex> lock(mutex_);
  err_ << message << "\n";
}

void BufferLogger::trace(const std::string &message) {
  std::lock_guard<std::mutex> lock(mutex_);
  trace_.push_back(message);
}

void BufferLogger::status(const std::string &message) {
  std::lock_guard<std::mutex> lock(mutex_);
  status_.push_back(message);
}

void BufferLogger::error(const std::string &message) {
  std::lock_guard<std::mutex> lock(mutex_);
  error_.push_back(message);
}

std::vector<std::string> BufferLogger::trace_lines() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return trace_;
}

std::vector<std::string> BufferLogger::status_lines() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return status_;
}

std::vector<std::string> BufferLogger::error_lines() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return error_;
}

void BufferLogger::clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  trace_.clear();
  status_.clear();
  error_.clear();
}

} // namespace launchpad::common
