// Copyright (c) 2026 ZLSH contributors, see CONTRIBUTORS
// Part of ZLSH. Licensed under GNU GPLv2 or later + OpenSSL, see LICENSE

#ifndef FUZZY_HASH_HH_INCLUDED__
#define FUZZY_HASH_HH_INCLUDED__

#include <stddef.h>
#include <exception>
#include <string>

#include "bucket_processor.hh"
#include "digest.hh"
#include "ex.hh"
#include "zlsh.pb.h"

using std::string;

/// Computing and comparing locality-sensitive digests. Similar inputs get
/// digests which are close to each other, unrelated inputs get distant ones.
/// All functions here are pure and can be called from any thread
namespace FuzzyHash {

DEF_EX( Ex, "Fuzzy hash exception", std::exception )
DEF_EX_STR( exInsufficientData, "Not enough data for a digest:", Ex )
DEF_EX_STR( exTooSimple, "Data is too simple for a digest:", exInsufficientData )
DEF_EX( exDegenerateQuartiles, "Third quartile of the bucket histogram is zero", Ex )

enum
{
  // Triplet hits the sampled buckets need to have
  MinSampleCount = 128,
  // With reject_low_complexity, inputs hitting this many sampled buckets or
  // fewer are rejected
  LowComplexityBuckets = 64
};

/// Builds the digest out of a finished pass. Throws exInsufficientData if
/// the pass doesn't carry enough information
Digest buildDigest( ProcessedBuckets const &,
                    DigestInfo const & = DigestInfo::default_instance() );

Digest computeDigest( void const * data, size_t size,
                      DigestInfo const & = DigestInfo::default_instance() );

Digest computeDigest( string const & data,
                      DigestInfo const & = DigestInfo::default_instance() );

/// Returns the distance between the two digests. 0 means the digests are
/// identical
unsigned compareDigests( Digest const &, Digest const &,
                         DistanceInfo const & = DistanceInfo::default_instance() );
}

#endif
