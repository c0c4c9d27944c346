// Copyright (c) 2026 ZLSH contributors, see CONTRIBUTORS
// Part of ZLSH. Licensed under GNU GPLv2 or later + OpenSSL, see LICENSE

#include "mt.hh"

#include <string.h>
#include <unistd.h>
#include "check.hh"

Mutex::Mutex()
{
  pthread_mutex_init( &mutex, 0 );
}

void Mutex::lock()
{
  pthread_mutex_lock( &mutex );
}

void Mutex::unlock()
{
  pthread_mutex_unlock( &mutex );
}

Mutex::~Mutex()
{
  pthread_mutex_destroy( &mutex );
}

Thread::Thread(): started( false )
{
}

void * Thread::threadRoutine( void * param )
{
  static_cast< Thread * >( param )->threadFunction();
  return 0;
}

void Thread::start()
{
  CHECK( !started, "thread started twice" );

  // pthread_create() returns the error code instead of setting errno
  int result = pthread_create( &thread, 0, &threadRoutine, this );

  if ( result != 0 )
    throw exCantStart( strerror( result ) );

  started = true;
}

void Thread::join()
{
  if ( !started )
    return;

  CHECK( pthread_join( thread, 0 ) == 0, "pthread_join() failed" );
  started = false;
}

bool JobCounter::take( size_t & job )
{
  Lock lock( mutex );

  if ( next >= count )
    return false;

  job = next++;

  return true;
}

size_t getNumberOfCpus()
{
  long result = sysconf( _SC_NPROCESSORS_ONLN );

  // Handle -1 and also sanitize the 0 value which wouldn't make sense
  return result < 1 ? 1 : result;
}
