#pragma once
#include <iosfwd>
#include <string_view>

namespace addonsync {

// Side channel for non-fatal diagnostics. Library code reports through this
// instead of writing to global streams.
class Reporter {
public:
  virtual ~Reporter() = default;

  virtual void warn(std::string_view message) = 0;
  virtual void info(std::string_view message) = 0;
};

// Writes "warning: <msg>" lines to `warn_os` and plain lines to `info_os`.
class StreamReporter final : public Reporter {
public:
  StreamReporter();
  StreamReporter(std::ostream &warn_os, std::ostream &info_os);

  void warn(std::string_view message) override;
  void info(std::string_view message) override;

private:
  std::ostream *warn_os_;
  std::ostream *info_os_;
};

class NullReporter final : public Reporter {
public:
  void warn(std::string_view /*message*/) override {}
  void info(std::string_view /*message*/) override {}
};

} // namespace addonsync
