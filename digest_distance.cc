// Copyright (c) 2026 ZLSH contributors, see CONTRIBUTORS
// Part of ZLSH. Licensed under GNU GPLv2 or later + OpenSSL, see LICENSE

#include "digest_distance.hh"
#include "modular_difference.hh"

namespace DigestDistance {

namespace {
unsigned const LValueRing = 256;
unsigned const QRatioRing = 16;

uint64_t ratioDistance( unsigned a, unsigned b, uint64_t multiplier )
{
  unsigned d = modularDifference( a, b, QRatioRing );

  return d <= 1 ? d : ( d - 1 ) * multiplier;
}
}

uint64_t lengthDistance( LValue const & a, LValue const & b,
                         DistanceInfo const & info )
{
  uint64_t d = modularDifference( a.get(), b.get(), LValueRing );

  return d <= 1 ? d : d * info.length_multiplier();
}

uint64_t qDistance( Q const & a, Q const & b, DistanceInfo const & info )
{
  return ratioDistance( a.getQ1Ratio(), b.getQ1Ratio(),
                        info.q_ratio_multiplier() ) +
         ratioDistance( a.getQ2Ratio(), b.getQ2Ratio(),
                        info.q_ratio_multiplier() );
}

uint64_t bodyDistance( Body const & a, Body const & b,
                       DistanceInfo const & info )
{
  uint64_t result = 0;

  for ( unsigned x = 0; x < Body::CodeCount; ++x )
  {
    unsigned ca = a.getCode( x );
    unsigned cb = b.getCode( x );
    unsigned d = ca > cb ? ca - cb : cb - ca;

    result += d == 3 ? info.far_bit_pair_penalty() : d;
  }

  return result;
}

unsigned calculate( Digest const & a, Digest const & b,
                    DistanceInfo const & info )
{
  uint64_t result = 0;

  if ( info.include_length() )
    result += lengthDistance( a.getLValue(), b.getLValue(), info );

  result += qDistance( a.getQ(), b.getQ(), info );

  if ( !( a.getChecksum() == b.getChecksum() ) )
    result += info.checksum_penalty();

  result += bodyDistance( a.getBody(), b.getBody(), info );

  return result > MaxDistance ? MaxDistance : ( unsigned ) result;
}

}
