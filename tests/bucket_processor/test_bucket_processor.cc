// Copyright (c) 2026 ZLSH contributors, see CONTRIBUTORS
// Part of ZLSH. Licensed under GNU GPLv2 or later + OpenSSL, see LICENSE

#include <stdlib.h>
#include <stdio.h>
#include <string.h>
#include <vector>
#include "../../bucket_processor.hh"
#include "../../check.hh"

using std::vector;

namespace {
bool sameResult( ProcessedBuckets const & a, ProcessedBuckets const & b )
{
  return a.length == b.length && a.checksum == b.checksum &&
         memcmp( a.buckets, b.buckets, sizeof( a.buckets ) ) == 0;
}

uint64_t totalHits( ProcessedBuckets const & p )
{
  uint64_t total = 0;

  for ( unsigned x = 0; x < ProcessedBuckets::BucketCount; ++x )
    total += p.buckets[ x ];

  return total;
}
}

int main()
{
  // Empty input
  {
    ProcessedBuckets empty = BucketProcessor::process( "", 0 );

    CHECK( empty.length == 0, "empty input has length" );
    CHECK( empty.checksum == 0, "empty input has a checksum" );
    CHECK( totalHits( empty ) == 0, "empty input hit buckets" );
    CHECK( empty.getNonEmptySampledBuckets() == 0, "empty input used buckets" );
  }

  // Short inputs: 5 bytes give 1 + 3 + 6 triplets
  {
    ProcessedBuckets p = BucketProcessor::process( "abcde", 5 );

    CHECK( p.length == 5, "wrong length" );
    CHECK( p.checksum == 197, "checksum of abcde is %u", p.checksum );
    CHECK( totalHits( p ) == 10, "abcde hit %llu buckets",
           ( unsigned long long ) totalHits( p ) );
  }

  // Every byte past the fourth adds all six triplets
  {
    vector< char > data( 1000, 'x' );
    ProcessedBuckets p = BucketProcessor::process( data.data(), data.size() );

    CHECK( totalHits( p ) == 4 + ( data.size() - 4 ) * 6, "wrong hit count" );
  }

  // Feeding data in arbitrary chunks must give the same result as feeding it
  // all at once
  vector< char > data( 65536 );
  for ( size_t x = 0; x < data.size(); ++x )
    data[ x ] = rand();

  ProcessedBuckets whole = BucketProcessor::process( data.data(), data.size() );

  CHECK( whole.length == data.size(), "wrong length" );
  CHECK( whole.getSampleCount() <= totalHits( whole ), "bad sample count" );

  for ( unsigned iteration = 0; iteration < 100; ++iteration )
  {
    BucketProcessor processor;

    for ( size_t offset = 0; offset < data.size(); )
    {
      size_t size = rand() % 100;

      if ( size > data.size() - offset )
        size = data.size() - offset;

      processor.add( data.data() + offset, size );
      offset += size;
    }

    CHECK( sameResult( processor.finish(), whole ),
           "Error in iteration %u: chunked result differs", iteration );

    printf( "Iteration %u: checksum %02x\n", iteration, whole.checksum );
  }

  // std::string input
  {
    BucketProcessor processor;
    processor.add( std::string( data.data(), data.size() ) );
    CHECK( sameResult( processor.finish(), whole ), "string input differs" );
  }

  // No data after finish
  {
    BucketProcessor processor;
    processor.add( "abc", 3 );
    processor.finish();

    CHECK_THROWS( processor.add( "d", 1 ), BucketProcessor::exAlreadyFinished );
  }

  fprintf( stderr, "Bucket processor test passed\n" );

  return EXIT_SUCCESS;
}
