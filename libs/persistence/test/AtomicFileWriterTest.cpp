// AtomicFileWriterTest.cpp
//
// Unit tests for the temp-file-and-rename writer and the quarantine helper.

#include <catch2/catch_test_macros.hpp>
#include <string>
#include <boost/filesystem.hpp>

#include "AtomicFileWriter.h"
#include "RiskGovernanceException.h"
#include "TestUtils.h"

using namespace mkc_riskgov;
namespace fs = boost::filesystem;

namespace
{
  class ScratchDirectory
  {
  public:
    ScratchDirectory()
      : mPath(fs::temp_directory_path() / fs::unique_path("riskgov-writer-%%%%-%%%%"))
    {
      fs::create_directories(mPath);
    }

    ~ScratchDirectory()
    {
      boost::system::error_code ec;
      fs::remove_all(mPath, ec);
    }

    const fs::path& path() const
    {
      return mPath;
    }

  private:
    fs::path mPath;
  };
}

TEST_CASE("AtomicFileWriter: write and read back", "[AtomicFileWriter]")
{
  ScratchDirectory scratch;
  const fs::path target = scratch.path() / "ES.stream.json";

  SECTION("missing file reads as nothing")
    {
      REQUIRE_FALSE(AtomicFileWriter::read(target).has_value());
    }

  SECTION("content is replaced and no temporary file is left")
    {
      AtomicFileWriter::write(target, "{\"a\": 1}");
      AtomicFileWriter::write(target, "{\"a\": 2}");

      const auto content = AtomicFileWriter::read(target);
      REQUIRE(content.has_value());
      REQUIRE(*content == "{\"a\": 2}");
      REQUIRE_FALSE(fs::exists(AtomicFileWriter::temporaryPath(target)));
    }

  SECTION("parent directories are created")
    {
      const fs::path nested = scratch.path() / "streams" / "futures" / "NQ.stream.json";
      AtomicFileWriter::write(nested, "x");
      REQUIRE(*AtomicFileWriter::read(nested) == "x");
    }

  SECTION("empty content")
    {
      AtomicFileWriter::write(target, "");
      const auto content = AtomicFileWriter::read(target);
      REQUIRE(content.has_value());
      REQUIRE(content->empty());
    }
}

TEST_CASE("AtomicFileWriter: temporary path is a sibling", "[AtomicFileWriter]")
{
  const fs::path target("/var/lib/riskgov/ES.stream.json");
  REQUIRE(AtomicFileWriter::temporaryPath(target) == fs::path("/var/lib/riskgov/ES.stream.json.tmp"));
}

TEST_CASE("AtomicFileWriter: write into an unusable location fails", "[AtomicFileWriter]")
{
  ScratchDirectory scratch;
  const fs::path blocker = scratch.path() / "not-a-directory";
  AtomicFileWriter::write(blocker, "plain file");

  REQUIRE_THROWS_AS(AtomicFileWriter::write(blocker / "ES.stream.json", "{}"), PersistenceException);
}

TEST_CASE("AtomicFileWriter: quarantine", "[AtomicFileWriter]")
{
  ScratchDirectory scratch;
  const fs::path target = scratch.path() / "ES.stream.json";
  AtomicFileWriter::write(target, "{not json");

  const fs::path moved = AtomicFileWriter::quarantine(target, timestampAt(0));

  REQUIRE(moved.filename().string() == "ES.stream.json.corrupt-1709285400");
  REQUIRE_FALSE(fs::exists(target));
  REQUIRE(*AtomicFileWriter::read(moved) == "{not json");

  SECTION("a missing file cannot be quarantined")
    {
      REQUIRE_THROWS_AS(AtomicFileWriter::quarantine(target, timestampAt(1)), PersistenceException);
    }
}
