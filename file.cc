// Copyright (c) 2026 ZLSH contributors, see CONTRIBUTORS
// Part of ZLSH. Licensed under GNU GPLv2 or later + OpenSSL, see LICENSE

#include <limits.h>
#include <sys/stat.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>

#include "file.hh"

bool File::exists( char const * filename ) throw()
{
  struct stat buf;

  // EOVERFLOW rationale: if the file is too large, it still does exist
  return stat( filename, &buf ) == 0 || errno == EOVERFLOW;
}

void File::open( char const * filename ) throw( exCantOpen )
{
  f = fopen( filename, "rb" );

  if ( !f )
    throw exCantOpen( std::string( filename ) + ": " + strerror( errno ) );
}

File::File( char const * filename ) throw( exCantOpen ): owned( true )
{
  open( filename );
}

File::File( std::string const & filename ) throw( exCantOpen ): owned( true )
{
  open( filename.c_str() );
}

File::File( FILE * stream ) throw(): f( stream ), owned( false )
{
}

size_t File::read( void * buf, size_t size ) throw( exReadError )
{
  if ( !size )
    return 0;

  size_t result = fread( buf, 1, size, f );

  if ( result != size && ferror( f ) )
    throw exReadErrorDetailed( f );

  return result;
}

File::~File() throw()
{
  if ( f && owned )
    fclose( f );
}

File::exReadErrorDetailed::exReadErrorDetailed( FILE * f )
{
  buildDescription( fileno( f ) );
}

void File::exReadErrorDetailed::buildDescription( int fd )
{
  description = "Error reading from file ";

  char path[ PATH_MAX ];
  char procFdLink[ 48 ];
  sprintf( procFdLink, "/proc/self/fd/%d", fd );

  int pathChars = readlink( procFdLink, path, sizeof( path ) );

  if ( pathChars < 0 )
    description += "(unknown)";
  else
    description.append( path, pathChars );
}

const char * File::exReadErrorDetailed::what() const throw()
{
  return description.c_str();
}

File::exReadErrorDetailed::~exReadErrorDetailed() throw ()
{
}
