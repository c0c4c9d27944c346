// Copyright (c) 2026 ZLSH contributors, see CONTRIBUTORS
// Part of ZLSH. Licensed under GNU GPLv2 or later + OpenSSL, see LICENSE

#ifndef MT_HH_INCLUDED__
#define MT_HH_INCLUDED__

#include <pthread.h>
#include <stddef.h>
#include <exception>

#include "ex.hh"
#include "nocopy.hh"

/// Multithreading

class Mutex: NoCopy
{
  pthread_mutex_t mutex;

public:

  Mutex();

  /// Please consider using the Lock class instead
  void lock();

  void unlock();

  ~Mutex();
};

class Lock: NoCopy
{
  Mutex & m;

public:

  explicit Lock( Mutex & mutex ): m( mutex ) { m.lock(); }

  ~Lock()
  { m.unlock(); }
};

class Thread: NoCopy
{
public:
  DEF_EX( Ex, "Thread exception", std::exception )
  DEF_EX_STR( exCantStart, "Can't start a thread:", Ex )

  Thread();

  /// Runs threadFunction() in a new thread
  void start();

  /// Waits for threadFunction() to return. Does nothing if the thread was
  /// never started
  void join();

  virtual ~Thread() {}

protected:
  /// This is the function that is meant to work in a separate thread. It
  /// must not let exceptions out
  virtual void threadFunction() throw()=0;

private:
  pthread_t thread;
  bool started;
  static void * threadRoutine( void * );
};

/// Hands out the numbers 0 to count - 1, each one once, to any number of
/// threads
class JobCounter: NoCopy
{
  Mutex mutex;
  size_t next;
  size_t const count;

public:
  explicit JobCounter( size_t count ): next( 0 ), count( count ) {}

  /// Stores the next free number in 'job'. Returns false once they are all
  /// taken
  bool take( size_t & job );
};

/// Returns the number of CPUs this system has
size_t getNumberOfCpus();

#endif
