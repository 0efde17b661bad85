// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __RISKGOV_RISK_LOGGER_H
#define __RISKGOV_RISK_LOGGER_H 1

#include <array>
#include <fstream>
#include <memory>
#include <ostream>
#include <string>
#include <boost/thread/mutex.hpp>
#include "TeeStream.h"

namespace mkc_riskgov
{
  enum class LogLevel
  {
    Debug = 0,
    Info,
    Warning,
    Error
  };

  const char* toString(LogLevel level);

  // Accepts "debug", "info", "warning" and "error" in any case
  // @throws std::invalid_argument for an unknown name
  LogLevel logLevelFromString(const std::string& name);

  /**
   * @brief Line oriented logger shared by the risk governance components.
   *
   * Each line is written as
   *
   *   <UTC ISO timestamp> <LEVEL> [<component>] <message>
   *
   * under a mutex so lines from independent decision streams never
   * interleave. When a log file path is supplied output is mirrored to both
   * the console stream and the file through a TeeStream.
   *
   * Components hold a std::shared_ptr<RiskLogger>; a null pointer means the
   * component is silent (see logTo()).
   */
  class RiskLogger
  {
  public:
    explicit RiskLogger(std::ostream& out, LogLevel minimumLevel = LogLevel::Info);

    /**
     * @brief Mirror every line to out and to the file at logFilePath (appended).
     * @throws std::runtime_error if the log file cannot be opened.
     */
    RiskLogger(std::ostream& out, const std::string& logFilePath,
	       LogLevel minimumLevel = LogLevel::Info);

    RiskLogger(const RiskLogger&) = delete;
    RiskLogger& operator=(const RiskLogger&) = delete;

    void log(LogLevel level, const std::string& component, const std::string& message);

    void debug(const std::string& component, const std::string& message)
    {
      log(LogLevel::Debug, component, message);
    }

    void info(const std::string& component, const std::string& message)
    {
      log(LogLevel::Info, component, message);
    }

    void warning(const std::string& component, const std::string& message)
    {
      log(LogLevel::Warning, component, message);
    }

    void error(const std::string& component, const std::string& message)
    {
      log(LogLevel::Error, component, message);
    }

    void setMinimumLevel(LogLevel level);
    LogLevel getMinimumLevel() const;

    // Number of lines actually emitted at the given level
    unsigned long getLineCount(LogLevel level) const;

  private:
    std::ofstream mLogFile;
    std::unique_ptr<TeeStream> mTeeStream;
    std::ostream* mOut;
    LogLevel mMinimumLevel;
    std::array<unsigned long, 4> mLineCounts;
    mutable boost::mutex mMutex;
  };

  inline void logTo(const std::shared_ptr<RiskLogger>& logger,
		    LogLevel level,
		    const std::string& component,
		    const std::string& message)
  {
    if (logger)
      logger->log(level, component, message);
  }
}

#endif
