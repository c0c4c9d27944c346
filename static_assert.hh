// Copyright (c) 2026 ZLSH contributors, see CONTRIBUTORS
// Part of ZLSH. Licensed under GNU GPLv2 or later + OpenSSL, see LICENSE

#ifndef STATIC_ASSERT_HH_INCLUDED__
#define STATIC_ASSERT_HH_INCLUDED__

// Based on the one from the Boost library. It wouldn't make sense to depend on
// boost just for that

namespace StaticAssert {

template < bool >
struct AssertionFailure;

template <>
struct AssertionFailure< true >
{};

template< int > struct Test
{};
}

#define STATIC_ASSERT_JOIN( a, b ) STATIC_ASSERT_JOIN_IMPL( a, b )
#define STATIC_ASSERT_JOIN_IMPL( a, b ) a ## b

#define STATIC_ASSERT( B ) \
  typedef ::StaticAssert::Test< \
    sizeof( ::StaticAssert::AssertionFailure< bool( B ) > ) >\
      STATIC_ASSERT_JOIN( static_assert_typedef_, __LINE__ ) \
      __attribute__(( unused ))

#endif
