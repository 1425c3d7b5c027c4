#include <plugin_bridge/shared/logger.hpp>

#include <juce_core/juce_core.h>

#include <memory>

namespace plugin_bridge {

static int constexpr max_log_size = 1024 * 1024;

// host and plugin both log, from any thread
static juce::CriticalSection _log_lock;
static std::unique_ptr<juce::Uuid> _instance_id = {};
static std::unique_ptr<juce::FileLogger> _logger = {};

char const*
log_level_name(log_level level)
{
  switch (level)
  {
  case log_level::info: return "info";
  case log_level::warning: return "warning";
  case log_level::error: return "error";
  case log_level::misbehaving: return "misbehaving";
  default: return "unknown";
  }
}

void
cleanup_logging()
{
  juce::ScopedLock lock(_log_lock);
  _instance_id.reset();
  _logger.reset();
}

void
init_logging(std::string const& vendor, std::string const& full_name)
{
  juce::ScopedLock lock(_log_lock);
  auto file = juce::File::getSpecialLocation(juce::File::userApplicationDataDirectory)
    .getChildFile(juce::String(vendor))
    .getChildFile(juce::String(full_name))
    .getChildFile("plugin_bridge.log");
  _logger = std::make_unique<juce::FileLogger>(file, juce::String(full_name), max_log_size);
  _instance_id = std::make_unique<juce::Uuid>();
}

void
write_log(
  log_level level, char const* file, int line,
  char const* func, std::string const& message)
{
  juce::ScopedLock lock(_log_lock);
  if (!_instance_id) return;

  juce::String entry;
  entry << juce::Time::getCurrentTime().formatted("%d-%m-%Y %H:%M:%S")
    << ": instance " << _instance_id->toString()
    << ": [" << log_level_name(level) << "] "
    << juce::File::createFileWithoutCheckingPath(file).getFileName()
    << " line " << line << ", " << func << ": "
    << juce::String::fromUTF8(message.c_str(), static_cast<int>(message.size()));
  _logger->logMessage(entry);
}

}
