// Copyright (c) 2026 ZLSH contributors, see CONTRIBUTORS
// Part of ZLSH. Licensed under GNU GPLv2 or later + OpenSSL, see LICENSE

#ifndef VERSION_HH_INCLUDED__
#define VERSION_HH_INCLUDED__

#include <string>

extern std::string zlsh_version;

#endif
