// Copyright (c) 2026 ZLSH contributors, see CONTRIBUTORS
// Part of ZLSH. Licensed under GNU GPLv2 or later + OpenSSL, see LICENSE

#ifndef NOCOPY_HH_INCLUDED__
#define NOCOPY_HH_INCLUDED__

/// Disallows copying of the objects of a class. Inherit from it to use it.
/// Things like a bucket processor in the middle of a pass or a running
/// thread should never be duplicated
class NoCopy
{
public:
  NoCopy() {}

private:
  NoCopy( NoCopy const & );
  NoCopy & operator = ( NoCopy const & );
};

#endif // NOCOPY_HH
