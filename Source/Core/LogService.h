/*
  ==============================================================================
    Source/Core/LogService.h
    Role: Unified logging for the bridge (console, optional date-stamped log
    file, UI callback).
  ==============================================================================
*/
#pragma once

#include <atomic>
#include <functional>
#include <iostream>
#include <juce_core/juce_core.h>
#include <memory>

class LogService {
public:
  enum class Level { Debug, Info, Warning, Error };

  static LogService &instance() {
    static LogService svc;
    return svc;
  }

  void log(const juce::String &msg, Level level = Level::Info) {
    if (static_cast<int>(level) < static_cast<int>(minimumLevel.load()))
      return;

    const juce::String line = levelPrefix(level) + msg;
    std::function<void(const juce::String &, bool)> callback;
    {
      const juce::ScopedLock sl(lock);
      juce::Logger::outputDebugString(line);
      if (consoleEnabled)
        std::cout << line << std::endl;
      if (fileLogger)
        fileLogger->logMessage(
            juce::Time::getCurrentTime().formatted("%Y-%m-%d %H:%M:%S ") +
            line);
      callback = onLogEntry;
    }

    // Callback for UI
    if (callback)
      callback(msg, level == Level::Error || level == Level::Warning);
  }

  void debug(const juce::String &msg) { log(msg, Level::Debug); }
  void info(const juce::String &msg) { log(msg, Level::Info); }
  void warning(const juce::String &msg) { log(msg, Level::Warning); }
  void error(const juce::String &msg) { log(msg, Level::Error); }

  void setMinimumLevel(Level level) { minimumLevel.store(level); }
  void setConsoleEnabled(bool enabled) {
    const juce::ScopedLock sl(lock);
    consoleEnabled = enabled;
  }

  /** Opens a date-stamped log file in the user's log folder. */
  void installFileLogger(const juce::String &subFolder,
                         const juce::String &fileRoot) {
    const juce::ScopedLock sl(lock);
    fileLogger.reset(juce::FileLogger::createDateStampedLogger(
        subFolder, fileRoot, ".log", fileRoot + " starting"));
  }

  juce::File getLogFile() const {
    const juce::ScopedLock sl(lock);
    return fileLogger ? fileLogger->getLogFile() : juce::File();
  }

  void setOnLogEntry(std::function<void(const juce::String &, bool)> fn) {
    const juce::ScopedLock sl(lock);
    onLogEntry = std::move(fn);
  }

private:
  LogService() = default;

  static juce::String levelPrefix(Level level) {
    switch (level) {
    case Level::Debug:
      return "[DEBUG] ";
    case Level::Info:
      return "[INFO] ";
    case Level::Warning:
      return "[WARN] ";
    case Level::Error:
      return "[ERROR] ";
    default:
      return "";
    }
  }

  mutable juce::CriticalSection lock;
  std::atomic<Level> minimumLevel{Level::Info};
  bool consoleEnabled = true;
  std::unique_ptr<juce::FileLogger> fileLogger;
  std::function<void(const juce::String &, bool isError)> onLogEntry;
};
