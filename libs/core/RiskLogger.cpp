// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#include "RiskLogger.h"
#include <stdexcept>
#include <boost/algorithm/string/case_conv.hpp>
#include <boost/date_time/posix_time/posix_time.hpp>

namespace mkc_riskgov
{
  const char* toString(LogLevel level)
  {
    switch (level)
      {
      case LogLevel::Debug:
	return "DEBUG";
      case LogLevel::Info:
	return "INFO";
      case LogLevel::Warning:
	return "WARNING";
      case LogLevel::Error:
	return "ERROR";
      }

    return "UNKNOWN";
  }

  LogLevel logLevelFromString(const std::string& name)
  {
    const std::string lower(boost::algorithm::to_lower_copy(name));

    if (lower == "debug")
      return LogLevel::Debug;

    if (lower == "info")
      return LogLevel::Info;

    if (lower == "warning" || lower == "warn")
      return LogLevel::Warning;

    if (lower == "error")
      return LogLevel::Error;

    throw std::invalid_argument("Unknown log level: " + name);
  }

  RiskLogger::RiskLogger(std::ostream& out, LogLevel minimumLevel)
    : mLogFile(),
      mTeeStream(),
      mOut(&out),
      mMinimumLevel(minimumLevel),
      mLineCounts{{0, 0, 0, 0}},
      mMutex()
  {}

  RiskLogger::RiskLogger(std::ostream& out, const std::string& logFilePath,
			 LogLevel minimumLevel)
    : mLogFile(logFilePath, std::ios::out | std::ios::app),
      mTeeStream(),
      mOut(&out),
      mMinimumLevel(minimumLevel),
      mLineCounts{{0, 0, 0, 0}},
      mMutex()
  {
    if (!mLogFile.is_open())
      throw std::runtime_error("RiskLogger: unable to open log file " + logFilePath);

    mTeeStream = std::make_unique<TeeStream>(out, mLogFile);
    mOut = mTeeStream.get();
  }

  void RiskLogger::log(LogLevel level, const std::string& component, const std::string& message)
  {
    boost::mutex::scoped_lock lock(mMutex);

    if (static_cast<int>(level) < static_cast<int>(mMinimumLevel))
      return;

    const boost::posix_time::ptime now(boost::posix_time::microsec_clock::universal_time());

    (*mOut) << boost::posix_time::to_iso_extended_string(now) << ' '
	    << toString(level) << " [" << component << "] "
	    << message << std::endl;

    ++mLineCounts[static_cast<std::size_t>(level)];
  }

  void RiskLogger::setMinimumLevel(LogLevel level)
  {
    boost::mutex::scoped_lock lock(mMutex);
    mMinimumLevel = level;
  }

  LogLevel RiskLogger::getMinimumLevel() const
  {
    boost::mutex::scoped_lock lock(mMutex);
    return mMinimumLevel;
  }

  unsigned long RiskLogger::getLineCount(LogLevel level) const
  {
    boost::mutex::scoped_lock lock(mMutex);
    return mLineCounts[static_cast<std::size_t>(level)];
  }
}
