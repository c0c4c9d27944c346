// Copyright (c) 2026 ZLSH contributors, see CONTRIBUTORS
// Part of ZLSH. Licensed under GNU GPLv2 or later + OpenSSL, see LICENSE

#ifndef CHECK_HH_INCLUDED__
#define CHECK_HH_INCLUDED__

#include <inttypes.h>
#include <stdio.h>
#include <stdlib.h>

// Run-time assertion macro

// Usage: CHECK( value == 16, "Value is not 16: %d", value );
// This will abort() if the value is not 16 with the message stating so.

// Only for conditions which can't fail unless the code itself is wrong. Bad
// input is reported with exceptions instead.

#define CHECK( condition, message, ... ) ({if (!(condition)) \
{ \
  fprintf( stderr, "Check failed: " ); \
  fprintf( stderr, message, ##__VA_ARGS__ ); \
  fprintf( stderr, "\nAt %s:%d\n", __FILE__, __LINE__ ); \
  abort(); \
}})

/// Checks that the given code throws the given exception type. For tests
#define CHECK_THROWS( statement, exType ) ({ \
  bool thrown = false; \
  try { statement; } \
  catch( exType & ) { thrown = true; } \
  CHECK( thrown, "%s did not throw %s", #statement, #exType ); \
})


// Debug-only versions. Only instantiated in debug builds
#ifndef NDEBUG
#define DCHECK CHECK
#else
#define DCHECK( ... )
#endif

#endif
