// Copyright (c) 2026 ZLSH contributors, see CONTRIBUTORS
// Part of ZLSH. Licensed under GNU GPLv2 or later + OpenSSL, see LICENSE

#ifndef SLIDE_WINDOW_HH_INCLUDED__
#define SLIDE_WINDOW_HH_INCLUDED__

#include <stdint.h>

// A window over the last five bytes of the stream. Every byte put into it
// produces up to six triplet hashes and a checksum update. With A being the
// newest byte and B, C, D, E the ones preceding it, the triplets are:

// salt  2: A B C
// salt  3: A B D
// salt  5: A C D
// salt  7: A C E
// salt 11: A B E
// salt 13: A D E

// A triplet is only evaluated once all of its bytes have been seen, so the
// first bytes of a stream produce fewer hashes (none for the first two).

// The window is meant to be used like this:

// SlideWindow::Pivot pivot = window.getPivot();
// window.put( c );
// checksum = window.getChecksum( pivot, checksum );
// window.getTripletHashes( pivot, hashes );

class SlideWindow
{
public:
  enum
  {
    Size = 5,
    MaxTriplets = 6
  };

  /// Number of bytes put into the window so far
  typedef uint64_t Pivot;

  struct TripletHashes
  {
    unsigned char values[ MaxTriplets ];
    unsigned count;
  };

  SlideWindow();

  void reset();

  void put( unsigned char c )
  {
    window[ pivot % Size ] = c;
    ++pivot;
  }

  Pivot getPivot() const
  { return pivot; }

  /// Returns the checksum updated with the byte put after 'startPivot'. The
  /// first byte of a stream has no predecessor and leaves the checksum as is
  unsigned char getChecksum( Pivot startPivot, unsigned char previous ) const;

  /// Fills 'result' with the hashes of the triplets which can be evaluated
  /// for the byte put after 'startPivot'
  void getTripletHashes( Pivot startPivot, TripletHashes & result ) const;

private:
  unsigned char window[ Size ];
  Pivot pivot;

  /// Returns the byte put 'back' positions before the one at 'startPivot'
  unsigned char at( Pivot startPivot, unsigned back ) const
  { return window[ ( startPivot - back ) % Size ]; }
};

#endif
