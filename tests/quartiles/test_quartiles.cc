// Copyright (c) 2026 ZLSH contributors, see CONTRIBUTORS
// Part of ZLSH. Licensed under GNU GPLv2 or later + OpenSSL, see LICENSE

#include <stdlib.h>
#include <stdio.h>
#include <stdint.h>
#include "../../bucket_processor.hh"
#include "../../check.hh"
#include "../../quartiles.hh"

int main()
{
  uint64_t buckets[ 256 ];

  // Values 1..128 in the sampled part, junk in the rest which must be ignored
  for ( unsigned x = 0; x < 256; ++x )
    buckets[ x ] = x < 128 ? 128 - x : 1000000;

  {
    Quartiles q( buckets, 256 );

    CHECK( q.getFirst() == 32, "first quartile is %llu",
           ( unsigned long long ) q.getFirst() );
    CHECK( q.getSecond() == 64, "second quartile is %llu",
           ( unsigned long long ) q.getSecond() );
    CHECK( q.getThird() == 96, "third quartile is %llu",
           ( unsigned long long ) q.getThird() );
    CHECK( !q.isDegenerate(), "not degenerate" );

    // 32 * 100 / 96 = 33, 64 * 100 / 96 = 66
    CHECK( q.getQ1Ratio() == 33 % 16, "q1 ratio is %u", q.getQ1Ratio() );
    CHECK( q.getQ2Ratio() == 66 % 16, "q2 ratio is %u", q.getQ2Ratio() );
  }

  // Histogram of bytes(range(256)) * 4
  {
    unsigned char data[ 1024 ];

    for ( unsigned x = 0; x < sizeof( data ); ++x )
      data[ x ] = x;

    ProcessedBuckets p = BucketProcessor::process( data, sizeof( data ) );
    Quartiles q( p.buckets, ProcessedBuckets::BucketCount );

    CHECK( q.getFirst() == 16 && q.getSecond() == 24 && q.getThird() == 28,
           "quartiles are %llu %llu %llu",
           ( unsigned long long ) q.getFirst(),
           ( unsigned long long ) q.getSecond(),
           ( unsigned long long ) q.getThird() );
  }

  // Ordering holds for any histogram
  for ( unsigned iteration = 0; iteration < 10000; ++iteration )
  {
    for ( unsigned x = 0; x < 128; ++x )
      buckets[ x ] = rand() % ( 1 + iteration );

    Quartiles q( buckets, 128 );

    CHECK( q.getFirst() <= q.getSecond() && q.getSecond() <= q.getThird(),
           "Error in iteration %u: quartiles out of order", iteration );
    CHECK( q.getQ1Ratio() < 16 && q.getQ2Ratio() < 16,
           "Error in iteration %u: ratio out of range", iteration );
  }

  // Mostly empty histogram
  {
    for ( unsigned x = 0; x < 128; ++x )
      buckets[ x ] = x < 100 ? 0 : 500;

    Quartiles q( buckets, 128 );

    CHECK( q.isDegenerate(), "zero third quartile must be degenerate" );
    CHECK( q.getQ1Ratio() == 0 && q.getQ2Ratio() == 0,
           "degenerate ratios must be zero" );
  }

  CHECK_THROWS( Quartiles q( buckets, 127 ), Quartiles::exNotEnoughSamples );

  fprintf( stderr, "Quartiles test passed\n" );

  return EXIT_SUCCESS;
}
