// Copyright (c) 2026 ZLSH contributors, see CONTRIBUTORS
// Part of ZLSH. Licensed under GNU GPLv2 or later + OpenSSL, see LICENSE

#ifndef PEARSON_HASH_HH_INCLUDED__
#define PEARSON_HASH_HH_INCLUDED__

#include <stddef.h>

// Pearson hashing: an 8-bit accumulator is passed through a fixed
// permutation of 0..255 once per input byte:

// h = 0
// h = table[ h ^ b1 ]
// h = table[ h ^ b2 ]
// ...

// The table is the one used by TLSH. It is a compile-time constant, so
// digests are reproducible across runs and machines, and it can be read
// from any number of threads.

namespace PearsonHash {

/// Hashes 'size' bytes pointed to by 'in'
unsigned char hash( unsigned char const * in, size_t size );

/// Hashes the four given bytes, in that order. This is the form used for
/// triplets and for the checksum
unsigned char hash( unsigned char b1, unsigned char b2, unsigned char b3,
                    unsigned char b4 );
}

#endif
