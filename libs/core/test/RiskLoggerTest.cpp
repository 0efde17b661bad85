// RiskLoggerTest.cpp
//
// Unit tests for the shared line logger, its level filter, file mirroring
// through TeeStream, and the exception hierarchy used across the libraries.

#include <catch2/catch_test_macros.hpp>
#include <fstream>
#include <iterator>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>
#include <boost/filesystem.hpp>

#include "RiskGovernanceException.h"
#include "RiskLogger.h"
#include "TeeStream.h"

using namespace mkc_riskgov;

namespace
{
  std::vector<std::string> lines(const std::string& text)
  {
    std::vector<std::string> result;
    std::istringstream in(text);
    std::string line;

    while (std::getline(in, line))
      result.push_back(line);

    return result;
  }

  std::string readFile(const boost::filesystem::path& path)
  {
    std::ifstream in(path.string());
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
  }
}

TEST_CASE("RiskLogger: line format", "[Core][RiskLogger]")
{
  std::ostringstream out;
  RiskLogger logger(out);

  logger.info("Stream ES", "posture PASS -> DERISK");

  const auto written = lines(out.str());
  REQUIRE(written.size() == 1);

  // 2024-03-01T09:30:00.123456 INFO [Stream ES] posture PASS -> DERISK
  const std::string& line = written.front();
  REQUIRE(line.size() > 20);
  REQUIRE(line[4] == '-');
  REQUIRE(line[10] == 'T');
  REQUIRE(line.find(" INFO [Stream ES] posture PASS -> DERISK") != std::string::npos);
}

TEST_CASE("RiskLogger: minimum level filters lines", "[Core][RiskLogger]")
{
  std::ostringstream out;
  RiskLogger logger(out, LogLevel::Warning);

  logger.debug("c", "d");
  logger.info("c", "i");
  logger.warning("c", "w");
  logger.error("c", "e");

  REQUIRE(lines(out.str()).size() == 2);
  REQUIRE(logger.getLineCount(LogLevel::Debug) == 0);
  REQUIRE(logger.getLineCount(LogLevel::Info) == 0);
  REQUIRE(logger.getLineCount(LogLevel::Warning) == 1);
  REQUIRE(logger.getLineCount(LogLevel::Error) == 1);

  SECTION("Lowering the level lets debug lines through")
    {
      logger.setMinimumLevel(LogLevel::Debug);
      REQUIRE(logger.getMinimumLevel() == LogLevel::Debug);

      logger.debug("c", "now visible");
      REQUIRE(logger.getLineCount(LogLevel::Debug) == 1);
      REQUIRE(out.str().find("DEBUG [c] now visible") != std::string::npos);
    }
}

TEST_CASE("RiskLogger: level names", "[Core][RiskLogger]")
{
  REQUIRE(std::string(toString(LogLevel::Debug)) == "DEBUG");
  REQUIRE(std::string(toString(LogLevel::Info)) == "INFO");
  REQUIRE(std::string(toString(LogLevel::Warning)) == "WARNING");
  REQUIRE(std::string(toString(LogLevel::Error)) == "ERROR");

  REQUIRE(logLevelFromString("debug") == LogLevel::Debug);
  REQUIRE(logLevelFromString("INFO") == LogLevel::Info);
  REQUIRE(logLevelFromString("Warning") == LogLevel::Warning);
  REQUIRE(logLevelFromString("warn") == LogLevel::Warning);
  REQUIRE(logLevelFromString("error") == LogLevel::Error);
  REQUIRE_THROWS_AS(logLevelFromString("verbose"), std::invalid_argument);
}

TEST_CASE("RiskLogger: log file mirrors the console", "[Core][RiskLogger]")
{
  namespace fs = boost::filesystem;

  const fs::path dir = fs::temp_directory_path() / fs::unique_path("riskgov-logger-%%%%-%%%%");
  fs::create_directories(dir);
  const fs::path logFile = dir / "riskgovernor.log";

  {
    std::ostringstream out;
    RiskLogger logger(out, logFile.string());

    logger.warning("Scheduler", "write failed: disk full");
    logger.info("Engine", "checkpoint complete");

    REQUIRE(lines(out.str()).size() == 2);
  }

  const auto mirrored = lines(readFile(logFile));
  REQUIRE(mirrored.size() == 2);
  REQUIRE(mirrored[0].find("WARNING [Scheduler] write failed: disk full") != std::string::npos);
  REQUIRE(mirrored[1].find("INFO [Engine] checkpoint complete") != std::string::npos);

  SECTION("A second logger appends")
    {
      std::ostringstream out;
      RiskLogger logger(out, logFile.string());
      logger.error("Engine", "again");

      REQUIRE(lines(readFile(logFile)).size() == 3);
    }

  fs::remove_all(dir);
}

TEST_CASE("RiskLogger: unopenable log file throws", "[Core][RiskLogger]")
{
  namespace fs = boost::filesystem;

  const fs::path missingDir = fs::temp_directory_path() / fs::unique_path("riskgov-missing-%%%%-%%%%");
  std::ostringstream out;

  REQUIRE_THROWS_AS(RiskLogger(out, (missingDir / "x.log").string()), std::runtime_error);
}

TEST_CASE("RiskLogger: concurrent writers never interleave lines", "[Core][RiskLogger]")
{
  std::ostringstream out;
  auto logger = std::make_shared<RiskLogger>(out);

  const int threads = 4;
  const int perThread = 200;
  std::vector<std::thread> workers;

  for (int t = 0; t < threads; ++t)
    workers.emplace_back([logger, t]()
			 {
			   const std::string component = "Stream " + std::to_string(t);
			   for (int i = 0; i < 200; ++i)
			     logTo(logger, LogLevel::Info, component, "cycle " + std::to_string(i));
			 });

  for (auto& worker : workers)
    worker.join();

  const auto written = lines(out.str());
  REQUIRE(written.size() == static_cast<std::size_t>(threads * perThread));
  REQUIRE(logger->getLineCount(LogLevel::Info) == static_cast<unsigned long>(threads * perThread));

  for (const auto& line : written)
    {
      REQUIRE(line.find(" INFO [Stream ") != std::string::npos);
      REQUIRE(line.find("] cycle ") != std::string::npos);
    }
}

TEST_CASE("logTo: null logger is silent", "[Core][RiskLogger]")
{
  std::shared_ptr<RiskLogger> none;
  REQUIRE_NOTHROW(logTo(none, LogLevel::Error, "c", "nobody listens"));
}

TEST_CASE("TeeStream: writes reach both streams", "[Core][TeeStream]")
{
  std::ostringstream a;
  std::ostringstream b;
  TeeStream tee(a, b);

  tee << "kappa=" << 0.25 << '\n';
  tee.flush();

  REQUIRE(a.str() == "kappa=0.25\n");
  REQUIRE(b.str() == "kappa=0.25\n");
}

TEST_CASE("RiskGovernanceException: hierarchy", "[Core][RiskGovernanceException]")
{
  REQUIRE_THROWS_AS(throw InvalidInputException("bad"), RiskGovernanceException);
  REQUIRE_THROWS_AS(throw BudgetExceededException("spent"), RiskGovernanceException);
  REQUIRE_THROWS_AS(throw PersistenceException("io"), RiskGovernanceException);
  REQUIRE_THROWS_AS(throw ConfigurationException("cfg"), std::runtime_error);

  try
    {
      throw PersistenceException("snapshot unreadable");
    }
  catch (const RiskGovernanceException& e)
    {
      REQUIRE(std::string(e.what()).find("snapshot unreadable") != std::string::npos);
    }
}
