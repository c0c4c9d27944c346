// Copyright (c) 2026 ZLSH contributors, see CONTRIBUTORS
// Part of ZLSH. Licensed under GNU GPLv2 or later + OpenSSL, see LICENSE

#ifndef FILE_HH_INCLUDED__
#define FILE_HH_INCLUDED__

#include <stddef.h>
#include <cstdio>
#include <exception>
#include <string>

#include "ex.hh"
#include "nocopy.hh"

using std::string;

/// A simple read-only wrapper over FILE * operations
class File: NoCopy
{
  FILE * f;
  bool owned;

public:
  DEF_EX( Ex, "File exception", std::exception )
  DEF_EX_STR( exCantOpen, "Can't open", Ex )
  DEF_EX( exReadError, "Error reading from file", Ex )

  File( char const * filename ) throw( exCantOpen );

  File( std::string const & filename ) throw( exCantOpen );

  /// Reads from an already opened stream, e.g. stdin. The stream is not
  /// closed on destruction
  explicit File( FILE * ) throw();

  /// Reads at most 'size' bytes into the buffer. Returns the number of bytes
  /// read, which is only less than 'size' at the end of file
  size_t read( void * buf, size_t size ) throw( exReadError );

  /// Checks if the file exists or not
  static bool exists( char const * filename ) throw();

  static bool exists( std::string const & filename ) throw()
  { return exists( filename.c_str() ); }

  ~File() throw();

  /// Throwing this class instead of exReadError will make the description
  /// include the file name
  class exReadErrorDetailed: public exReadError
  {
    string description;

  public:
    exReadErrorDetailed( FILE * f );
    virtual const char * what() const throw();
    virtual ~exReadErrorDetailed() throw ();

  private:
    void buildDescription( int fd );
  };

private:

  void open( char const * filename ) throw( exCantOpen );
};

#endif
