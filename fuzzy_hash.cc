// Copyright (c) 2026 ZLSH contributors, see CONTRIBUTORS
// Part of ZLSH. Licensed under GNU GPLv2 or later + OpenSSL, see LICENSE

#include <string.h>

#include "debug.hh"
#include "digest_builder.hh"
#include "digest_distance.hh"
#include "fuzzy_hash.hh"
#include "quartiles.hh"
#include "utils.hh"

namespace FuzzyHash {

Digest buildDigest( ProcessedBuckets const & processed, DigestInfo const & info )
{
  if ( processed.length < info.min_data_length() )
    throw exInsufficientData( Utils::numberToString( processed.length ) +
                              " bytes, at least " +
                              Utils::numberToString( info.min_data_length() ) +
                              " needed" );

  uint64_t samples = processed.getSampleCount();

  if ( samples < MinSampleCount )
    throw exInsufficientData( Utils::numberToString( samples ) +
                              " histogram samples, at least " +
                              Utils::numberToString( ( int ) MinSampleCount ) +
                              " needed" );

  if ( info.reject_low_complexity() )
  {
    unsigned nonEmpty = processed.getNonEmptySampledBuckets();

    if ( nonEmpty <= LowComplexityBuckets )
      throw exTooSimple( Utils::numberToString( nonEmpty ) +
                         " buckets used" );
  }

  Quartiles quartiles( processed.buckets, ProcessedBuckets::BucketCount );

  if ( quartiles.isDegenerate() && info.reject_degenerate_quartiles() )
    throw exDegenerateQuartiles();

  dPrintf( "Quartiles %llu %llu %llu\n",
           ( unsigned long long ) quartiles.getFirst(),
           ( unsigned long long ) quartiles.getSecond(),
           ( unsigned long long ) quartiles.getThird() );

  return DigestBuilder::build( processed, quartiles );
}

Digest computeDigest( void const * data, size_t size, DigestInfo const & info )
{
  BucketProcessor processor;
  processor.add( data, size );

  return buildDigest( processor.finish(), info );
}

Digest computeDigest( string const & data, DigestInfo const & info )
{
  return computeDigest( data.data(), data.size(), info );
}

unsigned compareDigests( Digest const & a, Digest const & b,
                         DistanceInfo const & info )
{
  return DigestDistance::calculate( a, b, info );
}

}
