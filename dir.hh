// Copyright (c) 2026 ZLSH contributors, see CONTRIBUTORS
// Part of ZLSH. Licensed under GNU GPLv2 or later + OpenSSL, see LICENSE

#ifndef DIR_HH_INCLUDED__
#define DIR_HH_INCLUDED__

#include <dirent.h>
#include <sys/types.h>
#include <exception>
#include <string>
#include <vector>

#include "ex.hh"
#include "nocopy.hh"

using std::string;
using std::vector;

/// Directory-related operations
namespace Dir {

DEF_EX( Ex, "Directory exception", std::exception )
DEF_EX_STR( exCantList, "Can't list directory", Ex )

/// Checks whether the given dir exists or not
bool exists( string const & );

/// Adds one path to another, e.g. for /hello/world and baz/bar, returns
/// /hello/world/baz/bar
string addPath( string const & first, string const & second );

inline char separator()
{ return '/'; }

class Entry
{
public:
  enum Type
  {
    RegularFile,
    Directory,
    SymLink,
    // Devices, sockets, fifos
    Other
  };

  Entry(): type( Other ) {}
  Entry( string const & fileName, Type type ):
    fileName( fileName ), type( type ) {}

  string const & getFileName() const
  { return fileName; }

  Type getType() const
  { return type; }

private:
  string fileName;
  Type type;
};

/// Lists one directory, skipping . and ..
class Listing: NoCopy
{
  string dirName;
  DIR * dir;
public:
  explicit Listing( string const & dirName );
  ~Listing();

  /// Return true if entry was filled, false if end of dir was encountered
  bool getNext( Entry & );
};

/// Returns the regular files under 'root' and all its subdirectories,
/// sorted, each prefixed with 'root'. Symbolic links aren't followed
vector< string > findFiles( string const & root );

}

#endif
