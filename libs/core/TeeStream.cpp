// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#include "TeeStream.h"
#include <cstdio>

namespace mkc_riskgov
{
  TeeBuf::TeeBuf(std::streambuf* sb1, std::streambuf* sb2)
    : mStreamBuf1(sb1),
      mStreamBuf2(sb2)
  {
  }

  int TeeBuf::overflow(int c)
  {
    if (c == EOF)
      return !EOF;

    const int r1 = mStreamBuf1->sputc(static_cast<char>(c));
    const int r2 = mStreamBuf2->sputc(static_cast<char>(c));
    return (r1 == EOF || r2 == EOF) ? EOF : c;
  }

  int TeeBuf::sync()
  {
    const int r1 = mStreamBuf1->pubsync();
    const int r2 = mStreamBuf2->pubsync();
    return (r1 == 0 && r2 == 0) ? 0 : -1;
  }

  TeeStream::TeeStream(std::ostream& streamA, std::ostream& streamB)
    : std::ostream(nullptr),
      mTeeBuf(streamA.rdbuf(), streamB.rdbuf())
  {
    this->rdbuf(&mTeeBuf);
  }
}
