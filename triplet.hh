// Copyright (c) 2026 ZLSH contributors, see CONTRIBUTORS
// Part of ZLSH. Licensed under GNU GPLv2 or later + OpenSSL, see LICENSE

#ifndef TRIPLET_HH_INCLUDED__
#define TRIPLET_HH_INCLUDED__

#include "pearson_hash.hh"

/// Three bytes of the slide window combined with a salt. Different salts
/// applied to the same window position yield decorrelated bucket indices
class Triplet
{
  unsigned char c1, c2, c3;
  unsigned char salt;

public:
  Triplet( unsigned char c1, unsigned char c2, unsigned char c3,
           unsigned char salt ): c1( c1 ), c2( c2 ), c3( c3 ), salt( salt )
  {}

  /// Returns the bucket index of the triplet
  unsigned char getHash() const
  { return PearsonHash::hash( salt, c1, c2, c3 ); }
};

#endif
