// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __RISKGOV_TEE_STREAM_H
#define __RISKGOV_TEE_STREAM_H 1

#include <streambuf>
#include <ostream>

namespace mkc_riskgov
{
  /**
   * @brief Stream buffer that mirrors output to two underlying buffers
   *
   * Used by RiskLogger to write the same log line to the console and a
   * log file.
   */
  class TeeBuf : public std::streambuf
  {
  public:
    TeeBuf(std::streambuf* sb1, std::streambuf* sb2);

  protected:
    int overflow(int c) override;
    int sync() override;

  private:
    std::streambuf* mStreamBuf1;
    std::streambuf* mStreamBuf2;
  };

  /**
   * @brief Output stream that writes to two streams simultaneously
   */
  class TeeStream : public std::ostream
  {
  public:
    TeeStream(std::ostream& streamA, std::ostream& streamB);

  private:
    TeeBuf mTeeBuf;
  };
}

#endif
