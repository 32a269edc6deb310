#ifndef MYLOGGER_HPP
#define MYLOGGER_HPP

#include <string>

// Thin static facade over Boost.Log trivial logging.
class MyLogger
{
public:
  // level: "trace", "debug", "info", "warning", "error" or "fatal".
  // When log_file is non-empty, records are also written to that file.
  static void init(const std::string &level, const std::string &log_file = "");

  static void debug(const std::string &msg);
  static void info(const std::string &msg);
  static void warning(const std::string &msg);
  static void error(const std::string &msg);
};

#endif // MYLOGGER_HPP
