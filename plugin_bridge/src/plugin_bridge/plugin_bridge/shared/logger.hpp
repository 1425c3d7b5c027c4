#pragma once

#include <plugin_bridge/shared/utility.hpp>
#include <string>

#define PBRIDGE_WRITE_LOG(msg) ::plugin_bridge::write_log( \
  ::plugin_bridge::log_level::info, __FILE__, __LINE__, __func__, msg)
#define PBRIDGE_WRITE_LOG_AT(level, msg) ::plugin_bridge::write_log( \
  ::plugin_bridge::log_level::level, __FILE__, __LINE__, __func__, msg)
#define PBRIDGE_LOG_FUNC_ENTRY_EXIT() ::plugin_bridge::func_entry_exit_logger \
PBRIDGE_COMBINE(func_entry_exit_logger_, __LINE__)(__FILE__, __LINE__, __func__)

namespace plugin_bridge {

// misbehaving is a peer breaking the protocol, error is our own failure
enum class log_level { info, warning, error, misbehaving };
char const* log_level_name(log_level level);

void cleanup_logging();
void init_logging(std::string const& vendor, std::string const& full_name);

// no-op until init_logging
void write_log(
  log_level level, char const* file, int line,
  char const* func, std::string const& message);

class func_entry_exit_logger {
  char const* const _file;
  int const _line;
  char const* const _func;
public:
  ~func_entry_exit_logger() { write_log(log_level::info, _file, _line, _func, "Function exit."); }
  func_entry_exit_logger(char const* file, int line, char const* func) :
  _file(file), _line(line), _func(func) { write_log(log_level::info, _file, _line, _func, "Function enter."); }
};

}
