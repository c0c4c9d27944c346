// Copyright (c) 2026 ZLSH contributors, see CONTRIBUTORS
// Part of ZLSH. Licensed under GNU GPLv2 or later + OpenSSL, see LICENSE

#include <stdlib.h>
#include <stdio.h>
#include <stdint.h>
#include <sys/stat.h>
#include <unistd.h>
#include <set>
#include <string>
#include <vector>
#include "../../check.hh"
#include "../../dir.hh"
#include "../../file.hh"
#include "../../file_hasher.hh"
#include "../../fuzzy_hash.hh"
#include "../../mt.hh"
#include "../../sha256.hh"

using std::set;
using std::string;
using std::vector;

namespace {
string lcgBytes( size_t size, uint32_t seed )
{
  string result( size, 0 );

  for ( size_t x = 0; x < size; ++x )
  {
    seed = seed * 1103515245u + 12345u;
    result[ x ] = ( char )( ( seed >> 16 ) & 0xFF );
  }

  return result;
}

void writeFile( string const & name, string const & data )
{
  FILE * f = fopen( name.c_str(), "wb" );
  CHECK( f, "can't create %s", name.c_str() );
  CHECK( fwrite( data.data(), 1, data.size(), f ) == data.size(),
         "can't write %s", name.c_str() );
  fclose( f );
}

class Taker: public Thread
{
  JobCounter & counter;

public:
  vector< size_t > taken;

  explicit Taker( JobCounter & counter ): counter( counter ) {}

protected:
  virtual void threadFunction() throw()
  {
    size_t job;

    while ( counter.take( job ) )
      taken.push_back( job );
  }
};
}

int main()
{
  // Known SHA-256 values
  {
    Sha256 empty;
    CHECK( empty.finishAsHex() ==
           "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855",
           "wrong hash of nothing" );

    Sha256 abc;
    abc.add( "a", 1 );
    abc.add( "bc", 2 );
    CHECK( abc.finishAsHex() ==
           "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad",
           "wrong hash of abc" );
  }

  // Every job is handed out exactly once
  {
    JobCounter counter( 10000 );
    Taker first( counter ), second( counter ), third( counter );

    first.start();
    second.start();
    third.start();
    first.join();
    second.join();
    third.join();

    set< size_t > all;
    all.insert( first.taken.begin(), first.taken.end() );
    all.insert( second.taken.begin(), second.taken.end() );
    all.insert( third.taken.begin(), third.taken.end() );

    CHECK( first.taken.size() + second.taken.size() + third.taken.size() ==
           10000, "jobs taken more than once" );
    CHECK( all.size() == 10000 && *all.rbegin() == 9999, "jobs lost" );

    size_t job;
    CHECK( !counter.take( job ), "counter not exhausted" );
  }

  char dirTemplate[] = "/tmp/zlsh_test_XXXXXX";
  CHECK( mkdtemp( dirTemplate ), "can't create a temporary directory" );
  string root( dirTemplate );
  string sub = Dir::addPath( root, "sub" );

  CHECK( mkdir( sub.c_str(), 0700 ) == 0, "can't create %s", sub.c_str() );

  string original = lcgBytes( 5000, 1 );
  string edited( original );
  edited[ 2500 ] ^= 0xFF;

  writeFile( Dir::addPath( root, "a.bin" ), original );
  writeFile( Dir::addPath( root, "d.bin" ), lcgBytes( 5000, 2 ) );
  writeFile( Dir::addPath( root, "small.txt" ), "hello" );
  writeFile( Dir::addPath( sub, "b.bin" ), original );
  writeFile( Dir::addPath( sub, "c.bin" ), edited );
  CHECK( symlink( "a.bin", Dir::addPath( root, "link" ).c_str() ) == 0,
         "can't create a symlink" );

  // Walking
  vector< string > files = Dir::findFiles( root );

  CHECK( files.size() == 5, "found %zu files", files.size() );
  CHECK( files[ 0 ] == Dir::addPath( root, "a.bin" ) &&
         files[ 1 ] == Dir::addPath( root, "d.bin" ) &&
         files[ 2 ] == Dir::addPath( root, "small.txt" ) &&
         files[ 3 ] == Dir::addPath( sub, "b.bin" ) &&
         files[ 4 ] == Dir::addPath( sub, "c.bin" ), "wrong file list" );

  CHECK( Dir::exists( root ) && !Dir::exists( files[ 0 ] ),
         "directory check broken" );
  CHECK_THROWS( Dir::findFiles( Dir::addPath( root, "missing" ) ),
                Dir::exCantList );

  // Single files
  {
    string sha256;
    Digest digest = FileHasher::hashFile( files[ 0 ], DigestInfo(), &sha256 );

    CHECK( digest == FuzzyHash::computeDigest( original ),
           "file digest differs from the in-memory one" );
    CHECK( sha256.size() == 64, "no content hash" );

    CHECK_THROWS( FileHasher::hashFile( files[ 2 ], DigestInfo() ),
                  FuzzyHash::exInsufficientData );
    CHECK_THROWS( FileHasher::hashFile( Dir::addPath( root, "missing" ),
                                        DigestInfo() ),
                  File::exCantOpen );
  }

  // All of them in parallel
  for ( size_t threads = 1; threads <= 8; threads *= 2 )
  {
    DigestInfo info;
    FileHasher hasher( files, info, threads, true );
    hasher.run();

    vector< FileHasher::Hashed > const & hashed = hasher.getHashed();
    vector< FileHasher::Failed > const & failed = hasher.getFailed();

    CHECK( hashed.size() == 4 && failed.size() == 1,
           "%zu threads: %zu hashed, %zu failed", threads, hashed.size(),
           failed.size() );

    CHECK( failed[ 0 ].index == 2 && failed[ 0 ].fileName == files[ 2 ],
           "wrong file failed" );
    CHECK( !failed[ 0 ].error.empty(), "failure has no message" );

    for ( size_t x = 0; x < hashed.size(); ++x )
      CHECK( hashed[ x ].fileName == files[ hashed[ x ].index ],
             "result out of place" );

    // a.bin, d.bin, sub/b.bin, sub/c.bin
    CHECK( hashed[ 0 ].sha256 == hashed[ 2 ].sha256, "copies hash apart" );
    CHECK( hashed[ 0 ].sha256 != hashed[ 3 ].sha256, "edit not seen" );
    CHECK( hashed[ 0 ].digest == hashed[ 2 ].digest, "copies differ" );

    CHECK( FuzzyHash::compareDigests( hashed[ 0 ].digest,
                                      hashed[ 3 ].digest ) == 5,
           "edited copy distance" );
    CHECK( FuzzyHash::compareDigests( hashed[ 0 ].digest,
                                      hashed[ 1 ].digest ) == 233,
           "unrelated file distance" );

    printf( "%zu threads: ok\n", threads );
  }

  for ( size_t x = 0; x < files.size(); ++x )
    unlink( files[ x ].c_str() );

  unlink( Dir::addPath( root, "link" ).c_str() );
  rmdir( sub.c_str() );
  rmdir( root.c_str() );

  fprintf( stderr, "File hasher test passed\n" );

  return EXIT_SUCCESS;
}
