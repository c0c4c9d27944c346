// Copyright (c) 2026 ZLSH contributors, see CONTRIBUTORS
// Part of ZLSH. Licensed under GNU GPLv2 or later + OpenSSL, see LICENSE

#include <algorithm>

#include "debug.hh"
#include "quartiles.hh"
#include "utils.hh"

Quartiles::Quartiles( uint64_t const * buckets, size_t size )
{
  if ( size < SampleSize )
    throw exNotEnoughSamples( Utils::numberToString( size ) );

  uint64_t sorted[ SampleSize ];
  std::copy( buckets, buckets + SampleSize, sorted );
  std::sort( sorted, sorted + SampleSize );

  first = sorted[ SampleSize / 4 - 1 ];
  second = sorted[ SampleSize / 2 - 1 ];
  third = sorted[ SampleSize - SampleSize / 4 - 1 ];

  if ( isDegenerate() )
    dPrintf( "Third quartile is zero, ratios fall back to zero\n" );
}

unsigned Quartiles::getRatio( uint64_t quartile ) const
{
  if ( isDegenerate() )
    return 0;

  return ( unsigned )( ( quartile * 100 / third ) % RatioModulo );
}

unsigned Quartiles::getQ1Ratio() const
{
  return getRatio( first );
}

unsigned Quartiles::getQ2Ratio() const
{
  return getRatio( second );
}
