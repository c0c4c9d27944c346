// Copyright (c) 2026 ZLSH contributors, see CONTRIBUTORS
// Part of ZLSH. Licensed under GNU GPLv2 or later + OpenSSL, see LICENSE

#ifndef UTILS_HH_INCLUDED
#define UTILS_HH_INCLUDED

#include <sstream>
#include <string>

namespace Utils {
using std::string;

/// Converts 'size' bytes pointed to by 'in' into a hex string
std::string toHex( unsigned char const * in, unsigned size,
                   bool upperCase = false );

/// Converts hex input string to binary. Accepts upper or lower case.
/// For input with illegal or odd number of characters, returns empty string
string fromHex( string const & in );

template <typename T>
string numberToString( T pNumber )
{
  std::ostringstream oOStrStream;
  oOStrStream << pNumber;
  return oOStrStream.str();
}

}

#endif
