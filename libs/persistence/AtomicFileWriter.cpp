// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#include "AtomicFileWriter.h"
#include <fstream>
#include <iterator>
#include <sstream>
#include "RiskGovernanceException.h"

namespace mkc_riskgov
{
  namespace fs = boost::filesystem;

  void AtomicFileWriter::write(const fs::path& target, const std::string& content)
  {
    const fs::path temporary = temporaryPath(target);

    boost::system::error_code ec;
    if (target.has_parent_path())
      {
	fs::create_directories(target.parent_path(), ec);
	if (ec)
	  throw PersistenceException("AtomicFileWriter: cannot create directory " +
				     target.parent_path().string() + ": " + ec.message());
      }

    {
      std::ofstream out(temporary.string(), std::ios::out | std::ios::binary | std::ios::trunc);
      if (!out.is_open())
	throw PersistenceException("AtomicFileWriter: cannot open " + temporary.string());

      out.write(content.data(), static_cast<std::streamsize>(content.size()));
      out.flush();
      if (!out)
	{
	  out.close();
	  fs::remove(temporary, ec);
	  throw PersistenceException("AtomicFileWriter: write failed for " + temporary.string());
	}
    }

    fs::rename(temporary, target, ec);
    if (ec)
      {
	boost::system::error_code ignored;
	fs::remove(temporary, ignored);
	throw PersistenceException("AtomicFileWriter: cannot rename " + temporary.string() +
				   " to " + target.string() + ": " + ec.message());
      }
  }

  std::optional<std::string> AtomicFileWriter::read(const fs::path& source)
  {
    boost::system::error_code ec;
    if (!fs::exists(source, ec))
      return std::nullopt;

    std::ifstream in(source.string(), std::ios::in | std::ios::binary);
    if (!in.is_open())
      throw PersistenceException("AtomicFileWriter: cannot open " + source.string());

    std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad())
      throw PersistenceException("AtomicFileWriter: read failed for " + source.string());

    return content;
  }

  fs::path AtomicFileWriter::quarantine(const fs::path& source, const boost::posix_time::ptime& now)
  {
    static const boost::posix_time::ptime epoch(boost::gregorian::date(1970, 1, 1));

    std::ostringstream name;
    name << source.string() << ".corrupt-" << (now - epoch).total_seconds();
    const fs::path destination(name.str());

    boost::system::error_code ec;
    fs::rename(source, destination, ec);
    if (ec)
      throw PersistenceException("AtomicFileWriter: cannot quarantine " + source.string() + ": " +
				 ec.message());

    return destination;
  }

  fs::path AtomicFileWriter::temporaryPath(const fs::path& target)
  {
    return fs::path(target.string() + ".tmp");
  }
}
