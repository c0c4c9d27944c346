// Copyright (c) 2026 ZLSH contributors, see CONTRIBUTORS
// Part of ZLSH. Licensed under GNU GPLv2 or later + OpenSSL, see LICENSE

#include <string.h>

#include "digest.hh"
#include "utils.hh"

namespace {
unsigned char swapNibbles( unsigned char v )
{
  return ( unsigned char )( ( v << 4 ) | ( v >> 4 ) );
}
}

Body::Body( unsigned char const * in )
{
  memcpy( data, in, sizeof( data ) );
}

bool Body::operator == ( Body const & other ) const
{
  return memcmp( data, other.data, sizeof( data ) ) == 0;
}

string Digest::toString() const
{
  unsigned char raw[ Size ];

  raw[ 0 ] = swapNibbles( checksum.get() );
  raw[ 1 ] = swapNibbles( lValue.get() );
  raw[ 2 ] = swapNibbles( q.get() );

  for ( unsigned x = 0; x < Body::Size; ++x )
    raw[ 3 + x ] = body.get()[ Body::Size - 1 - x ];

  return Utils::toHex( raw, sizeof( raw ), true );
}

Digest Digest::fromString( string const & in )
{
  if ( in.size() != StringSize )
    throw exMalformed( "expected " + Utils::numberToString( ( int ) StringSize ) +
                       " hex characters, got " +
                       Utils::numberToString( in.size() ) );

  string raw = Utils::fromHex( in );

  if ( raw.size() != Size )
    throw exMalformed( in );

  unsigned char const * p = ( unsigned char const * ) raw.data();
  unsigned char body[ Body::Size ];

  for ( unsigned x = 0; x < Body::Size; ++x )
    body[ x ] = p[ Size - 1 - x ];

  return Digest( Checksum( swapNibbles( p[ 0 ] ) ),
                 LValue( swapNibbles( p[ 1 ] ) ),
                 Q( swapNibbles( p[ 2 ] ) ), Body( body ) );
}
