// Copyright (c) 2026 ZLSH contributors, see CONTRIBUTORS
// Part of ZLSH. Licensed under GNU GPLv2 or later + OpenSSL, see LICENSE

#ifndef DIGEST_BUILDER_HH_INCLUDED__
#define DIGEST_BUILDER_HH_INCLUDED__

#include <stdint.h>

#include "bucket_processor.hh"
#include "digest.hh"
#include "quartiles.hh"

/// Derives the parts of a digest from a finished pass
namespace DigestBuilder {

/// Encodes the input length on a log scale. Three length ranges
/// (up to 656, up to 3199 and above) use different scales, so that close
/// lengths usually get the same code
LValue calculateLValue( uint64_t length );

Q calculateQ( Quartiles const & );

/// Quantizes each of the sampled buckets against the quartiles: 0 up to Q1,
/// 1 up to Q2, 2 up to Q3 and 3 above it
Body calculateBody( uint64_t const * buckets, Quartiles const & );

Digest build( ProcessedBuckets const &, Quartiles const & );
}

#endif
