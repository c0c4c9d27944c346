// Copyright (c) 2026 ZLSH contributors, see CONTRIBUTORS
// Part of ZLSH. Licensed under GNU GPLv2 or later + OpenSSL, see LICENSE

#ifndef MODULAR_DIFFERENCE_HH_INCLUDED__
#define MODULAR_DIFFERENCE_HH_INCLUDED__

/// Distance between two positions on a ring of 'ringSize' positions, going
/// whichever way is shorter. 255 and 0 are 1 apart on a ring of 256. Both
/// positions must be less than 'ringSize'
inline unsigned modularDifference( unsigned a, unsigned b, unsigned ringSize )
{
  unsigned internal = a > b ? a - b : b - a;
  unsigned external = ringSize - internal;

  return internal < external ? internal : external;
}

#endif
