// Copyright (c) 2026 ZLSH contributors, see CONTRIBUTORS
// Part of ZLSH. Licensed under GNU GPLv2 or later + OpenSSL, see LICENSE

#ifndef DIGEST_HH_INCLUDED__
#define DIGEST_HH_INCLUDED__

#include <exception>
#include <string>

#include "ex.hh"

using std::string;

/// One-byte checksum over the whole stream
class Checksum
{
  unsigned char value;

public:
  explicit Checksum( unsigned char value ): value( value ) {}

  unsigned char get() const
  { return value; }

  bool operator == ( Checksum const & other ) const
  { return value == other.value; }
};

/// Log-scale code of the input length
class LValue
{
  unsigned char value;

public:
  explicit LValue( unsigned char value ): value( value ) {}

  unsigned char get() const
  { return value; }

  bool operator == ( LValue const & other ) const
  { return value == other.value; }
};

/// The two quartile ratios packed into one byte, Q1 ratio in the low nibble
class Q
{
  unsigned char value;

public:
  explicit Q( unsigned char packed ): value( packed ) {}

  static Q fromRatios( unsigned q1Ratio, unsigned q2Ratio )
  { return Q( ( q1Ratio & 0x0F ) | ( ( q2Ratio & 0x0F ) << 4 ) ); }

  unsigned getQ1Ratio() const
  { return value & 0x0F; }

  unsigned getQ2Ratio() const
  { return value >> 4; }

  unsigned char get() const
  { return value; }

  bool operator == ( Q const & other ) const
  { return value == other.value; }
};

/// Two bits per sampled bucket, telling which quartile range its count
/// falls into. Bucket 4 * i + j is stored in byte i at bits 2 * j and
/// 2 * j + 1
class Body
{
public:
  enum
  {
    Size = 32,
    CodeCount = Size * 4
  };

  /// 'data' must point at Size bytes
  explicit Body( unsigned char const * data );

  /// Returns the 2-bit code of the given bucket
  unsigned getCode( unsigned bucket ) const
  { return ( data[ bucket / 4 ] >> ( ( bucket % 4 ) * 2 ) ) & 3; }

  unsigned char const * get() const
  { return data; }

  bool operator == ( Body const & other ) const;

private:
  unsigned char data[ Size ];
};

/// The fingerprint of a byte stream. Can only be created with all of its
/// parts present and is never modified afterwards
class Digest
{
  Checksum checksum;
  LValue lValue;
  Q q;
  Body body;

public:
  DEF_EX( Ex, "Digest exception", std::exception )
  DEF_EX_STR( exMalformed, "Malformed digest:", Ex )

  enum
  {
    // Checksum, LValue and Q, followed by the body
    Size = 3 + Body::Size,
    StringSize = Size * 2
  };

  Digest( Checksum const & checksum, LValue const & lValue, Q const & q,
          Body const & body ):
    checksum( checksum ), lValue( lValue ), q( q ), body( body )
  {}

  Checksum const & getChecksum() const
  { return checksum; }

  LValue const & getLValue() const
  { return lValue; }

  Q const & getQ() const
  { return q; }

  Body const & getBody() const
  { return body; }

  /// Returns the digest as StringSize uppercase hex characters. The layout
  /// is the one of TLSH hash strings: checksum, LValue and Q with their
  /// nibbles swapped, then the body bytes from the last one to the first, so
  /// buckets 124 to 127 come first
  string toString() const;

  /// Parses the result of toString(). Lowercase is accepted as well
  static Digest fromString( string const & );

  bool operator == ( Digest const & other ) const
  {
    return checksum == other.checksum && lValue == other.lValue &&
           q == other.q && body == other.body;
  }

  bool operator != ( Digest const & other ) const
  { return !( *this == other ); }
};

#endif
