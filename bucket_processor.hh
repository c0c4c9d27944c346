// Copyright (c) 2026 ZLSH contributors, see CONTRIBUTORS
// Part of ZLSH. Licensed under GNU GPLv2 or later + OpenSSL, see LICENSE

#ifndef BUCKET_PROCESSOR_HH_INCLUDED__
#define BUCKET_PROCESSOR_HH_INCLUDED__

#include <stddef.h>
#include <stdint.h>
#include <exception>
#include <string>

#include "ex.hh"
#include "nocopy.hh"
#include "slide_window.hh"

/// The outcome of a complete pass over the input
struct ProcessedBuckets
{
  enum
  {
    BucketCount = 256,
    // Only this many leading buckets take part in quartiles and the body
    SampledBucketCount = 128
  };

  uint64_t length;
  uint64_t buckets[ BucketCount ];
  unsigned char checksum;

  ProcessedBuckets();

  /// Returns the total number of triplet hits in the sampled buckets
  uint64_t getSampleCount() const;

  /// Returns the number of sampled buckets which got at least one hit
  unsigned getNonEmptySampledBuckets() const;
};

/// Runs the single forward pass over the input, maintaining the bucket
/// histogram and the rolling checksum. The data can be fed in any number of
/// pieces. Create one per input
class BucketProcessor: NoCopy
{
  SlideWindow slideWindow;
  ProcessedBuckets result;
  bool finished;

public:
  DEF_EX( Ex, "Bucket processor exception", std::exception )
  DEF_EX( exAlreadyFinished, "Data added to a finished bucket processor", Ex )

  BucketProcessor();

  /// Processes more data
  void add( void const * data, size_t size );

  void add( std::string const & data )
  { add( data.data(), data.size() ); }

  /// Ends the pass and returns its result. No more data can be added
  /// afterwards
  ProcessedBuckets const & finish();

  /// Processes the whole given buffer at once
  static ProcessedBuckets process( void const * data, size_t size );
};

#endif
