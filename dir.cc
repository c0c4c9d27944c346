// Copyright (c) 2026 ZLSH contributors, see CONTRIBUTORS
// Part of ZLSH. Licensed under GNU GPLv2 or later + OpenSSL, see LICENSE

#include <errno.h>
#include <fcntl.h>
#include <string.h>
#include <sys/stat.h>
#include <unistd.h>
#include <algorithm>

#include "debug.hh"
#include "dir.hh"

namespace Dir {

namespace {
Entry::Type getType( mode_t mode )
{
  if ( S_ISREG( mode ) )
    return Entry::RegularFile;
  if ( S_ISDIR( mode ) )
    return Entry::Directory;
  if ( S_ISLNK( mode ) )
    return Entry::SymLink;

  return Entry::Other;
}

bool isDotOrDotDot( char const * name )
{
  return name[ 0 ] == '.' &&
         ( !name[ 1 ] || ( name[ 1 ] == '.' && !name[ 2 ] ) );
}
}

bool exists( string const & name )
{
  struct stat buf;

  return stat( name.c_str(), &buf ) == 0 && S_ISDIR( buf.st_mode );
}

string addPath( string const & first, string const & second )
{
  if ( first.empty() )
    return second;

  if ( second.empty() )
    return first;

  if ( first[ first.size() - 1 ] == separator() )
    return first + second;
  else
    return first + separator() + second;
}

Listing::Listing( string const & dirName ): dirName( dirName )
{
  dir = opendir( dirName.c_str() );

  if ( !dir )
    throw exCantList( dirName + ": " + strerror( errno ) );
}

Listing::~Listing()
{
  closedir( dir );
}

bool Listing::getNext( Entry & result )
{
  struct stat entryStats;

  for ( ; ; )
  {
    // A listing is only ever used by one thread, so plain readdir() is fine
    errno = 0;
    dirent * entry = readdir( dir );

    if ( !entry )
    {
      if ( errno )
        throw exCantList( dirName + ": " + strerror( errno ) );

      return false;
    }

    if ( isDotOrDotDot( entry->d_name ) )
      continue;

    if ( fstatat( dirfd( dir ), entry->d_name, &entryStats,
                  AT_SYMLINK_NOFOLLOW ) != 0 )
      throw exCantList( addPath( dirName, entry->d_name ) + ": " +
                        strerror( errno ) );

    result = Entry( entry->d_name, getType( entryStats.st_mode ) );
    return true;
  }
}

vector< string > findFiles( string const & root )
{
  vector< string > files;
  vector< string > pending( 1, root );

  while ( !pending.empty() )
  {
    string dirName = pending.back();
    pending.pop_back();

    Listing listing( dirName );
    Entry entry;

    while ( listing.getNext( entry ) )
    {
      string path = addPath( dirName, entry.getFileName() );

      switch ( entry.getType() )
      {
        case Entry::RegularFile:
          dPrintf( "Found file %s\n", path.c_str() );
          files.push_back( path );
        break;

        case Entry::Directory:
          pending.push_back( path );
        break;

        case Entry::SymLink:
          verbosePrintf( "Skipping symbolic link %s...\n", path.c_str() );
        break;

        case Entry::Other:
          verbosePrintf( "Skipping special file %s...\n", path.c_str() );
        break;
      }
    }
  }

  std::sort( files.begin(), files.end() );

  return files;
}

}
