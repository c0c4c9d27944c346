// Copyright (c) 2026 ZLSH contributors, see CONTRIBUTORS
// Part of ZLSH. Licensed under GNU GPLv2 or later + OpenSSL, see LICENSE

#include <stdlib.h>
#include <stdio.h>
#include <set>
#include "../../check.hh"
#include "../../pearson_hash.hh"

using std::set;

int main()
{
  // The substitution table must be a permutation. A single byte hashes to
  // its table entry
  set< unsigned > seen;

  for ( unsigned x = 0; x < 256; ++x )
  {
    unsigned char byte = x;
    seen.insert( PearsonHash::hash( &byte, 1 ) );
  }

  CHECK( seen.size() == 256, "substitution table is not a permutation: %zu",
         seen.size() );

  // Known values
  unsigned char zero = 0;
  CHECK( PearsonHash::hash( &zero, 0 ) == 0, "empty input must hash to zero" );
  CHECK( PearsonHash::hash( &zero, 1 ) == 1, "hash of a zero byte is wrong" );
  CHECK( PearsonHash::hash( 2, 'a', 'a', 'a' ) == 225,
         "hash of a salted triplet is wrong" );
  CHECK( PearsonHash::hash( 0, 1, 2, 3 ) == 163,
         "hash of four bytes is wrong" );

  // Each byte passes the previous value through the table again, and the
  // four-byte form hashes its arguments in order
  for ( unsigned iteration = 0; iteration < 100000; ++iteration )
  {
    unsigned char bytes[ 4 ];

    for ( unsigned x = 0; x < 4; ++x )
      bytes[ x ] = rand();

    unsigned char generic = PearsonHash::hash( bytes, sizeof( bytes ) );
    unsigned char fixed = PearsonHash::hash( bytes[ 0 ], bytes[ 1 ],
                                             bytes[ 2 ], bytes[ 3 ] );

    CHECK( generic == fixed, "Error in iteration %u: %02x vs %02x",
           iteration, generic, fixed );

    unsigned char chained = 0;
    for ( unsigned x = 0; x < 4; ++x )
    {
      unsigned char next = chained ^ bytes[ x ];
      chained = PearsonHash::hash( &next, 1 );
    }

    CHECK( chained == generic, "Chaining broke in iteration %u: %02x vs %02x",
           iteration, chained, generic );
  }

  fprintf( stderr, "Pearson hash test passed\n" );

  return EXIT_SUCCESS;
}
