// Copyright (c) 2026 ZLSH contributors, see CONTRIBUTORS
// Part of ZLSH. Licensed under GNU GPLv2 or later + OpenSSL, see LICENSE

#include <stdio.h>
#include <algorithm>
#include <exception>

#include "bucket_processor.hh"
#include "debug.hh"
#include "file.hh"
#include "file_hasher.hh"
#include "fuzzy_hash.hh"
#include "sha256.hh"

namespace {
enum
{
  ReadBufferSize = 65536
};

template< class T >
bool byIndex( T const & a, T const & b )
{
  return a.index < b.index;
}
}

FileHasher::FileHasher( vector< string > const & fileNames,
                        DigestInfo const & digestInfo, size_t threads,
                        bool withSha256 ):
  fileNames( fileNames ), digestInfo( digestInfo ),
  threads( threads ? threads : 1 ), withSha256( withSha256 ),
  jobs( fileNames.size() )
{
}

Digest FileHasher::hashFile( string const & fileName,
                             DigestInfo const & digestInfo, string * sha256 )
{
  if ( fileName == "-" )
  {
    File f( stdin );
    return hashStream( f, digestInfo, sha256 );
  }

  File f( fileName );
  return hashStream( f, digestInfo, sha256 );
}

Digest FileHasher::hashStream( File & f, DigestInfo const & digestInfo,
                               string * sha256 )
{
  BucketProcessor processor;
  Sha256 contentHash;
  vector< char > buffer( ReadBufferSize );

  while ( size_t got = f.read( buffer.data(), buffer.size() ) )
  {
    processor.add( buffer.data(), got );

    if ( sha256 )
      contentHash.add( buffer.data(), got );
  }

  if ( sha256 )
    *sha256 = contentHash.finishAsHex();

  return FuzzyHash::buildDigest( processor.finish(), digestInfo );
}

void FileHasher::processFile( size_t index )
{
  string const & fileName = fileNames[ index ];

  try
  {
    string sha256;
    Digest digest = hashFile( fileName, digestInfo,
                              withSha256 ? &sha256 : 0 );

    Lock lock( mutex );
    hashed.push_back( Hashed( index, fileName, digest, sha256 ) );
  }
  catch( std::exception & e )
  {
    dPrintf( "Can't hash %s: %s\n", fileName.c_str(), e.what() );

    Lock lock( mutex );
    failed.push_back( Failed( index, fileName, e.what() ) );
  }
}

void FileHasher::Worker::threadFunction() throw()
{
  size_t index;

  while ( hasher.jobs.take( index ) )
    hasher.processFile( index );
}

void FileHasher::joinAll( vector< Worker * > & workers )
{
  for ( size_t x = 0; x < workers.size(); ++x )
  {
    workers[ x ]->join();
    delete workers[ x ];
  }

  workers.clear();
}

void FileHasher::run()
{
  size_t workerCount = std::min( threads, fileNames.size() );

  verbosePrintf( "Hashing %zu files using %zu threads...\n", fileNames.size(),
                 workerCount );

  vector< Worker * > workers;

  try
  {
    for ( size_t x = 0; x < workerCount; ++x )
    {
      workers.push_back( new Worker( *this ) );
      workers.back()->start();
    }
  }
  catch( Thread::exCantStart & )
  {
    // Let the ones already running finish before giving up
    joinAll( workers );
    throw;
  }

  joinAll( workers );

  std::sort( hashed.begin(), hashed.end(), byIndex< Hashed > );
  std::sort( failed.begin(), failed.end(), byIndex< Failed > );
}
