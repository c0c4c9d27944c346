// Copyright (c) 2026 ZLSH contributors, see CONTRIBUTORS
// Part of ZLSH. Licensed under GNU GPLv2 or later + OpenSSL, see LICENSE

#include <string.h>

#include "utils.hh"
#include "debug.hh"

bool verboseMode = true;

namespace Utils {

namespace {
/// Converts 'size' bytes pointed to by 'in' into a hex string pointed to by
/// 'out'. It should have at least size * 2 bytes. No trailing zero is added
void hexify( unsigned char const * in, unsigned size, char * out,
             bool upperCase )
{
  char const letterBase = upperCase ? 'A' : 'a';

  while( size-- )
  {
    unsigned char v = *in++;

    *out++ = ( v >> 4 < 10 ) ? '0' + ( v >> 4 ) : letterBase + ( v >> 4 ) - 10;
    *out++ = ( ( v & 0xF ) < 10 ) ? '0' + ( v & 0xF ) : letterBase + ( v & 0xF ) - 10;
  }
}

/// Returns the value of a hex digit, or -1 if it isn't one
int unhexify( char c )
{
  if ( c >= '0' && c <= '9' )
    return c - '0';
  else if ( c >= 'A' && c <= 'F' )
    return c - 'A' + 10;
  else if ( c >= 'a' && c <= 'f' )
    return c - 'a' + 10;

  return -1;
}
}

string toHex( unsigned char const * in, unsigned size, bool upperCase )
{
  string result( size * 2, 0 );

  if ( size )
    hexify( in, size, &result[ 0 ], upperCase );

  return result;
}

string fromHex( string const & in )
{
  string result;

  if ( in.length() % 2 != 0 )
  {
    return result;
  }

  result.reserve( in.length() / 2 );

  for ( string::const_iterator it = in.begin() ; it != in.end() ; it += 2 )
  {
    int high = unhexify( *it );
    int low = unhexify( *( it + 1 ) );

    if ( high < 0 || low < 0 )
    {
      // Invalid hex digit
      result.clear();
      return result;
    }

    result += ( char )( ( high << 4 ) | low );
  }

  return result;
}

}
