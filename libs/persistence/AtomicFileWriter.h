// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __RISKGOV_ATOMIC_FILE_WRITER_H
#define __RISKGOV_ATOMIC_FILE_WRITER_H 1

#include <optional>
#include <string>
#include <boost/date_time/posix_time/posix_time.hpp>
#include <boost/filesystem.hpp>

namespace mkc_riskgov
{
  /**
   * @brief Whole-file writes that never leave a partially written target.
   *
   * The content goes to a sibling temporary file which is flushed and then
   * renamed over the target. A reader sees either the old or the new file.
   */
  class AtomicFileWriter
  {
  public:
    /**
     * @throws PersistenceException if the temporary file cannot be written or renamed
     */
    static void write(const boost::filesystem::path& target, const std::string& content);

    /**
     * @brief Whole file content, or nothing when the file does not exist.
     * @throws PersistenceException if the file exists but cannot be read
     */
    static std::optional<std::string> read(const boost::filesystem::path& source);

    /**
     * @brief Move an unreadable snapshot aside as <file>.corrupt-<epoch seconds>.
     * @return the new path
     * @throws PersistenceException if the rename fails
     */
    static boost::filesystem::path quarantine(const boost::filesystem::path& source,
					      const boost::posix_time::ptime& now =
						boost::posix_time::second_clock::universal_time());

    static boost::filesystem::path temporaryPath(const boost::filesystem::path& target);
  };
}

#endif
