#pragma once

#include <mutex>
#include <ostream>
#include <string>
#include <vector>

namespace launchpad::common {

class Logger {
public:
  virtual ~Logger() = default;

  /// Diagnostic detail, only shown in verbose mode.
  virtual void trace(const std::string &message) = 0;
  virtual void status(const std::string &message) = 0;
  virtual void error(const std::string &message) = 0;
};

class StderrLogger final : public Logger {
public:
  explicit StderrLogger(bool verbose = false);
  StderrLogger(std::ostream &out, std::ostream &err, bool verbose);

  void trace(const std::string &message) override;
  void status(const std::string &message) override;
  void error(const std::string &message) override;

  void set_verbose(bool verbose) { verbose_ = verbose; }
  [[nodiscard]] bool verbose() const { return verbose_; }

private:
  std::ostream &out_;
  std::ostream &err_;
  bool verbose_ = false;
  std::mutex mutex_;
};

class BufferLogger final : public Logger {
public:
  void trace(const std::string &message) override;
  void status(const std::string &message) override;
  void error(const std::string &message) override;

  [[nodiscard]] std::vector<std::string> trace_lines() const;
  [[nodiscard]] std::vector<std::string> status_lines() const;
  [[nodiscard]] std::vector<std::string> error_lines() const;
  void clear();

private:
  mutable std::mutex mutex_;
  std::vector<std::string> trace_;
  std::vector<std::string> status_;
  std::vector<std::string> error_;
};

} // namespace launchpad::common
