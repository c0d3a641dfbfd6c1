#pragma once

#include <memory>
#include <sstream>
#include <string>

namespace mpchat::log {

// Levels in decreasing order of severity.  A message is delivered if its
// level is at or above the configured threshold.
enum struct Level
{
  fatal,
  error,
  warn,
  info,
  debug,
  crypto,
};

struct Sink
{
  virtual ~Sink() = default;
  virtual void fatal(const std::string& /*mod*/, const std::string& /*msg*/) {}
  virtual void error(const std::string& /*mod*/, const std::string& /*msg*/) {}
  virtual void warn(const std::string& /*mod*/, const std::string& /*msg*/) {}
  virtual void info(const std::string& /*mod*/, const std::string& /*msg*/) {}
  virtual void debug(const std::string& /*mod*/, const std::string& /*msg*/) {}
  virtual void crypto(const std::string& /*mod*/, const std::string& /*msg*/) {}
};

struct Log
{
private:
  static std::shared_ptr<Sink> sink;
  static Level threshold;

  static bool enabled(Level level)
  {
    return sink && static_cast<int>(level) <= static_cast<int>(threshold);
  }

  template<typename... Ts>
  static std::string print(const Ts&... vals)
  {
    auto ss = std::stringstream();
    (ss << ... << vals);
    return ss.str();
  }

public:
  static void set_sink(std::shared_ptr<Sink> sink_in);
  static void remove_sink();

  static void set_level(Level level);
  static Level level();

  template<typename... Ts>
  static void fatal(const std::string& mod, const Ts&... vals)
  {
    if (enabled(Level::fatal)) {
      sink->fatal(mod, print(vals...));
    }
  }

  template<typename... Ts>
  static void error(const std::string& mod, const Ts&... vals)
  {
    if (enabled(Level::error)) {
      sink->error(mod, print(vals...));
    }
  }

  template<typename... Ts>
  static void warn(const std::string& mod, const Ts&... vals)
  {
    if (enabled(Level::warn)) {
      sink->warn(mod, print(vals...));
    }
  }

  template<typename... Ts>
  static void info(const std::string& mod, const Ts&... vals)
  {
    if (enabled(Level::info)) {
      sink->info(mod, print(vals...));
    }
  }

  template<typename... Ts>
  static void debug(const std::string& mod, const Ts&... vals)
  {
    if (enabled(Level::debug)) {
      sink->debug(mod, print(vals...));
    }
  }

  // Key material is only logged in builds configured with
  // MPCHAT_LOG_KEY_MATERIAL
#ifdef MPCHAT_LOG_KEY_MATERIAL
  template<typename... Ts>
  static void crypto(const std::string& mod, const Ts&... vals)
  {
    if (enabled(Level::crypto)) {
      sink->crypto(mod, print(vals...));
    }
  }
#else
  template<typename... Ts>
  static void crypto(const std::string& /*mod*/, const Ts&... /*vals*/)
  {
  }
#endif
};

} // namespace mpchat::log
