// Copyright (c) 2026 ZLSH contributors, see CONTRIBUTORS
// Part of ZLSH. Licensed under GNU GPLv2 or later + OpenSSL, see LICENSE

#include <string.h>

#include "check.hh"
#include "pearson_hash.hh"
#include "slide_window.hh"
#include "static_assert.hh"
#include "triplet.hh"

namespace {
struct TripletDefinition
{
  unsigned char salt;
  // Offsets back from the newest byte. 'third' is always the largest one
  unsigned first, second, third;
};

TripletDefinition const triplets[] =
{
  {  2, 0, 1, 2 },
  {  3, 0, 1, 3 },
  {  5, 0, 2, 3 },
  {  7, 0, 2, 4 },
  { 11, 0, 1, 4 },
  { 13, 0, 3, 4 }
};

STATIC_ASSERT( sizeof( triplets ) / sizeof( *triplets ) ==
               SlideWindow::MaxTriplets );

unsigned char const ChecksumSalt = 0;
}

SlideWindow::SlideWindow()
{
  reset();
}

void SlideWindow::reset()
{
  memset( window, 0, sizeof( window ) );
  pivot = 0;
}

unsigned char SlideWindow::getChecksum( Pivot startPivot,
                                        unsigned char previous ) const
{
  DCHECK( startPivot < pivot, "checksum requested before the byte was put" );

  if ( startPivot < 1 )
    return previous;

  return PearsonHash::hash( ChecksumSalt, at( startPivot, 0 ),
                            at( startPivot, 1 ), previous );
}

void SlideWindow::getTripletHashes( Pivot startPivot,
                                    TripletHashes & result ) const
{
  DCHECK( startPivot < pivot, "triplets requested before the byte was put" );

  result.count = 0;

  for ( unsigned x = 0; x < MaxTriplets; ++x )
  {
    TripletDefinition const & def = triplets[ x ];

    if ( def.third > startPivot )
      continue;

    Triplet triplet( at( startPivot, def.first ), at( startPivot, def.second ),
                     at( startPivot, def.third ), def.salt );

    result.values[ result.count++ ] = triplet.getHash();
  }
}
