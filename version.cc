// Copyright (c) 2026 ZLSH contributors, see CONTRIBUTORS
// Part of ZLSH. Licensed under GNU GPLv2 or later + OpenSSL, see LICENSE

#include "version.hh"

#ifndef ZLSH_VERSION
std::string zlsh_version( "1.0" );
#else
std::string zlsh_version( ZLSH_VERSION );
#endif
