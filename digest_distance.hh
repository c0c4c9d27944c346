// Copyright (c) 2026 ZLSH contributors, see CONTRIBUTORS
// Part of ZLSH. Licensed under GNU GPLv2 or later + OpenSSL, see LICENSE

#ifndef DIGEST_DISTANCE_HH_INCLUDED__
#define DIGEST_DISTANCE_HH_INCLUDED__

#include <limits.h>
#include <stdint.h>

#include "digest.hh"
#include "zlsh.pb.h"

// The distance between two digests is the sum of:

// - the length code difference on a ring of 256, counted as is when it is
//   0 or 1 and multiplied by length_multiplier otherwise;
// - each quartile ratio difference on a ring of 16, counted as is when it
//   is 0 or 1 and as ( d - 1 ) * q_ratio_multiplier otherwise;
// - checksum_penalty if the checksums differ;
// - for every body bucket, the difference of the two codes, with 3 counted
//   as far_bit_pair_penalty.

// Identical digests are 0 apart and the distance is symmetric. The default
// weights are those of TLSH.

namespace DigestDistance {

unsigned const MaxDistance = UINT_MAX;

// The parts are 64-bit and don't wrap for any weights a DistanceInfo holds

uint64_t lengthDistance( LValue const &, LValue const &, DistanceInfo const & );

uint64_t qDistance( Q const &, Q const &, DistanceInfo const & );

uint64_t bodyDistance( Body const &, Body const &, DistanceInfo const & );

/// Returns the total distance, clamped to MaxDistance
unsigned calculate( Digest const &, Digest const &, DistanceInfo const & );
}

#endif
