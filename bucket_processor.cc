// Copyright (c) 2026 ZLSH contributors, see CONTRIBUTORS
// Part of ZLSH. Licensed under GNU GPLv2 or later + OpenSSL, see LICENSE

#include <string.h>

#include "bucket_processor.hh"
#include "debug.hh"

namespace {
unsigned char const ChecksumSeed = 0;
}

ProcessedBuckets::ProcessedBuckets(): length( 0 ), checksum( ChecksumSeed )
{
  memset( buckets, 0, sizeof( buckets ) );
}

uint64_t ProcessedBuckets::getSampleCount() const
{
  uint64_t total = 0;

  for ( unsigned x = 0; x < SampledBucketCount; ++x )
    total += buckets[ x ];

  return total;
}

unsigned ProcessedBuckets::getNonEmptySampledBuckets() const
{
  unsigned nonEmpty = 0;

  for ( unsigned x = 0; x < SampledBucketCount; ++x )
    if ( buckets[ x ] )
      ++nonEmpty;

  return nonEmpty;
}

BucketProcessor::BucketProcessor(): finished( false )
{
}

void BucketProcessor::add( void const * data, size_t size )
{
  if ( finished )
    throw exAlreadyFinished();

  SlideWindow::TripletHashes hashes;

  for ( unsigned char const * p = ( unsigned char const * ) data; size--; )
  {
    SlideWindow::Pivot startPivot = slideWindow.getPivot();
    slideWindow.put( *p++ );

    result.checksum = slideWindow.getChecksum( startPivot, result.checksum );

    slideWindow.getTripletHashes( startPivot, hashes );

    for ( unsigned x = 0; x < hashes.count; ++x )
      ++result.buckets[ hashes.values[ x ] ];
  }

  result.length = slideWindow.getPivot();
}

ProcessedBuckets const & BucketProcessor::finish()
{
  finished = true;

  dPrintf( "Processed %llu bytes, checksum %02x, %u sampled buckets hit\n",
           ( unsigned long long ) result.length, result.checksum,
           result.getNonEmptySampledBuckets() );

  return result;
}

ProcessedBuckets BucketProcessor::process( void const * data, size_t size )
{
  BucketProcessor processor;
  processor.add( data, size );

  return processor.finish();
}
