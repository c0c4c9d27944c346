// Copyright (c) 2026 ZLSH contributors, see CONTRIBUTORS
// Part of ZLSH. Licensed under GNU GPLv2 or later + OpenSSL, see LICENSE

#ifndef FILE_HASHER_HH_INCLUDED__
#define FILE_HASHER_HH_INCLUDED__

#include <stddef.h>
#include <string>
#include <vector>

#include "digest.hh"
#include "file.hh"
#include "mt.hh"
#include "nocopy.hh"
#include "zlsh.pb.h"

using std::string;
using std::vector;

/// Computes digests of many files using several threads. Each file is
/// processed by one thread from start to end; the threads only share the
/// queue of file names and the result lists
class FileHasher: NoCopy
{
public:
  struct Hashed
  {
    size_t index;
    string fileName;
    Digest digest;
    /// Hex SHA-256 of the contents, empty unless requested
    string sha256;

    Hashed( size_t index, string const & fileName, Digest const & digest,
            string const & sha256 ):
      index( index ), fileName( fileName ), digest( digest ), sha256( sha256 )
    {}
  };

  struct Failed
  {
    size_t index;
    string fileName;
    string error;

    Failed( size_t index, string const & fileName, string const & error ):
      index( index ), fileName( fileName ), error( error )
    {}
  };

  FileHasher( vector< string > const & fileNames, DigestInfo const &,
              size_t threads, bool withSha256 );

  /// Hashes all the files. Returns when all of them are done. Both result
  /// lists come out in the order of the file names given
  void run();

  vector< Hashed > const & getHashed() const
  { return hashed; }

  vector< Failed > const & getFailed() const
  { return failed; }

  /// Hashes one file, "-" being stdin. If 'sha256' is given, it receives the
  /// hex SHA-256 of the contents. Throws on read errors and on files which
  /// can't get a digest
  static Digest hashFile( string const & fileName, DigestInfo const &,
                          string * sha256 = 0 );

private:
  static Digest hashStream( File &, DigestInfo const &, string * sha256 );

  class Worker: public Thread
  {
    FileHasher & hasher;

  public:
    Worker( FileHasher & hasher ): hasher( hasher ) {}

  protected:
    virtual void threadFunction() throw();
  };

  void processFile( size_t index );

  static void joinAll( vector< Worker * > & );

  vector< string > const & fileNames;
  DigestInfo const & digestInfo;
  size_t threads;
  bool withSha256;

  JobCounter jobs;
  /// Guards the result lists
  Mutex mutex;
  vector< Hashed > hashed;
  vector< Failed > failed;
};

#endif
