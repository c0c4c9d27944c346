// Copyright (c) 2026 ZLSH contributors, see CONTRIBUTORS
// Part of ZLSH. Licensed under GNU GPLv2 or later + OpenSSL, see LICENSE

#ifndef QUARTILES_HH_INCLUDED__
#define QUARTILES_HH_INCLUDED__

#include <stddef.h>
#include <stdint.h>
#include <exception>

#include "ex.hh"

/// Quartiles of the bucket histogram. Only the first SampleSize buckets are
/// looked at: they are sorted, and the values at the end of the first, second
/// and third quarter are taken
class Quartiles
{
  uint64_t first, second, third;

public:
  DEF_EX( Ex, "Quartiles exception", std::exception )
  DEF_EX_STR( exNotEnoughSamples, "Not enough buckets to compute quartiles:", Ex )

  enum
  {
    SampleSize = 128,
    RatioModulo = 16
  };

  /// 'size' must be at least SampleSize
  Quartiles( uint64_t const * buckets, size_t size );

  uint64_t getFirst() const
  { return first; }

  uint64_t getSecond() const
  { return second; }

  uint64_t getThird() const
  { return third; }

  /// True when the third quartile is zero. The ratios can't be computed then
  /// and are reported as zero
  bool isDegenerate() const
  { return third == 0; }

  /// floor( Q1 * 100 / Q3 ) mod 16
  unsigned getQ1Ratio() const;

  /// floor( Q2 * 100 / Q3 ) mod 16
  unsigned getQ2Ratio() const;

private:
  unsigned getRatio( uint64_t quartile ) const;
};

#endif
