// Copyright (c) 2026 ZLSH contributors, see CONTRIBUTORS
// Part of ZLSH. Licensed under GNU GPLv2 or later + OpenSSL, see LICENSE

#ifndef DEBUG_HH_INCLUDED
#define DEBUG_HH_INCLUDED

#include <stdio.h>
#include <string.h>
#include <typeinfo>

// Macros we use to output debugging information

#define __CLASS typeid( *this ).name()

#ifndef NDEBUG

#define __FILE_BASE (strrchr(__FILE__, '/') ? strrchr(__FILE__, '/') + 1 : __FILE__)

#define dPrintf( ... ) ({ fprintf( stderr, "[DEBUG] at %s( %s:%d ): ", __func__,\
      __FILE_BASE, __LINE__ );\
    fprintf( stderr, __VA_ARGS__ ); })

#else

#define dPrintf( ... )

#endif

/// Set by the tool, cleared with --silent. Progress messages go to stderr
/// only when it is set
extern bool verboseMode;

#define verbosePrintf( ... ) ({ if ( verboseMode ) \
                                  fprintf( stderr, __VA_ARGS__ ); })

#endif
