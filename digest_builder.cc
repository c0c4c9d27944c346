// Copyright (c) 2026 ZLSH contributors, see CONTRIBUTORS
// Part of ZLSH. Licensed under GNU GPLv2 or later + OpenSSL, see LICENSE

#include <math.h>

#include "digest_builder.hh"
#include "static_assert.hh"

namespace DigestBuilder {

namespace {
uint64_t const LowRange = 656;
uint64_t const MidRange = 3199;

double const Log1_5 = 0.4054651;
double const Log1_3 = 0.26236426;
double const Log1_1 = 0.095310180;

long const LValueModulo = 256;

STATIC_ASSERT( int( Body::CodeCount ) == int( Quartiles::SampleSize ) );
}

LValue calculateLValue( uint64_t length )
{
  if ( !length )
    return LValue( 0 );

  double l = log( ( double ) length );
  long value;

  if ( length <= LowRange )
    value = ( long ) floor( l / Log1_5 );
  else
  if ( length <= MidRange )
    value = ( long ) floor( l / Log1_3 - 8.72777 );
  else
    value = ( long ) floor( l / Log1_1 - 62.5472 );

  return LValue( ( unsigned char )( value % LValueModulo ) );
}

Q calculateQ( Quartiles const & quartiles )
{
  return Q::fromRatios( quartiles.getQ1Ratio(), quartiles.getQ2Ratio() );
}

Body calculateBody( uint64_t const * buckets, Quartiles const & quartiles )
{
  unsigned char data[ Body::Size ];

  for ( unsigned i = 0; i < Body::Size; ++i )
  {
    unsigned char h = 0;

    for ( unsigned j = 0; j < 4; ++j )
    {
      uint64_t k = buckets[ i * 4 + j ];
      unsigned code;

      if ( k > quartiles.getThird() )
        code = 3;
      else
      if ( k > quartiles.getSecond() )
        code = 2;
      else
      if ( k > quartiles.getFirst() )
        code = 1;
      else
        code = 0;

      h |= code << ( j * 2 );
    }

    data[ i ] = h;
  }

  return Body( data );
}

Digest build( ProcessedBuckets const & processed, Quartiles const & quartiles )
{
  return Digest( Checksum( processed.checksum ),
                 calculateLValue( processed.length ),
                 calculateQ( quartiles ),
                 calculateBody( processed.buckets, quartiles ) );
}

}
