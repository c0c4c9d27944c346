// Copyright (c) 2026 ZLSH contributors, see CONTRIBUTORS
// Part of ZLSH. Licensed under GNU GPLv2 or later + OpenSSL, see LICENSE

#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <map>
#include <string>
#include <vector>

#include "config.hh"
#include "debug.hh"
#include "digest.hh"
#include "dir.hh"
#include "ex.hh"
#include "file.hh"
#include "file_hasher.hh"
#include "fuzzy_hash.hh"
#include "version.hh"

using std::map;
using std::string;
using std::vector;

DEF_EX( exNothingToScan, "No files found to scan", std::exception )

namespace {
/// An argument naming an existing file gets hashed, anything else must be
/// a digest string
Digest digestFromArgument( string const & arg, DigestInfo const & info )
{
  if ( arg == "-" || File::exists( arg ) )
    return FileHasher::hashFile( arg, info );

  return Digest::fromString( arg );
}

int hashFiles( vector< string > const & fileNames, Config const & config )
{
  FileHasher hasher( fileNames, config.engine.digest(),
                     config.runtime.threads, false );
  hasher.run();

  vector< FileHasher::Hashed > const & hashed = hasher.getHashed();
  for ( size_t x = 0; x < hashed.size(); ++x )
    printf( "%s  %s\n", hashed[ x ].digest.toString().c_str(),
            hashed[ x ].fileName.c_str() );

  vector< FileHasher::Failed > const & failed = hasher.getFailed();
  for ( size_t x = 0; x < failed.size(); ++x )
    fprintf( stderr, "%s: %s\n", failed[ x ].fileName.c_str(),
             failed[ x ].error.c_str() );

  return failed.empty() ? EXIT_SUCCESS : EXIT_FAILURE;
}

/// Reports files with identical contents, then pairs of different files
/// whose digests are within the threshold
int scan( vector< string > const & paths, Config const & config )
{
  vector< string > fileNames;

  for ( size_t x = 0; x < paths.size(); ++x )
  {
    if ( Dir::exists( paths[ x ] ) )
    {
      vector< string > found( Dir::findFiles( paths[ x ] ) );
      fileNames.insert( fileNames.end(), found.begin(), found.end() );
    }
    else
      fileNames.push_back( paths[ x ] );
  }

  if ( fileNames.empty() )
    throw exNothingToScan();

  FileHasher hasher( fileNames, config.engine.digest(),
                     config.runtime.threads, true );
  hasher.run();

  vector< FileHasher::Failed > const & failed = hasher.getFailed();
  for ( size_t x = 0; x < failed.size(); ++x )
    verbosePrintf( "Skipped %s: %s\n", failed[ x ].fileName.c_str(),
                   failed[ x ].error.c_str() );

  vector< FileHasher::Hashed > const & hashed = hasher.getHashed();

  map< string, vector< size_t > > identical;
  for ( size_t x = 0; x < hashed.size(); ++x )
    identical[ hashed[ x ].sha256 ].push_back( x );

  for ( map< string, vector< size_t > >::const_iterator i = identical.begin();
        i != identical.end(); ++i )
  {
    if ( i->second.size() < 2 )
      continue;

    printf( "identical:" );
    for ( size_t x = 0; x < i->second.size(); ++x )
      printf( " %s", hashed[ i->second[ x ] ].fileName.c_str() );
    printf( "\n" );
  }

  size_t nearCount = 0;

  for ( size_t x = 0; x < hashed.size(); ++x )
    for ( size_t y = x + 1; y < hashed.size(); ++y )
    {
      if ( hashed[ x ].sha256 == hashed[ y ].sha256 )
        continue;

      unsigned distance = FuzzyHash::compareDigests( hashed[ x ].digest,
          hashed[ y ].digest, config.engine.distance() );

      if ( distance <= config.runtime.threshold )
      {
        printf( "near %u: %s %s\n", distance, hashed[ x ].fileName.c_str(),
                hashed[ y ].fileName.c_str() );
        ++nearCount;
      }
    }

  verbosePrintf( "Scanned %zu files, %zu skipped, %zu near duplicate pairs\n",
                 fileNames.size(), failed.size(), nearCount );

  return EXIT_SUCCESS;
}
}

int main( int argc, char *argv[] )
{
  try
  {
    dPrintf( "ZLSH version %s\n", zlsh_version.c_str() );

    bool printHelp = false;
    vector< char const * > args;
    Config config;

    for( int x = 1; x < argc; ++x )
    {
      if ( strcmp( argv[ x ], "--config" ) == 0 && x + 1 < argc )
      {
        config.loadFile( argv[ x + 1 ] );
        ++x;
      }
      else
      if ( strcmp( argv[ x ], "--silent" ) == 0 )
        verboseMode = false;
      else
      if ( strcmp( argv[ x ], "--help" ) == 0 || strcmp( argv[ x ], "-h" ) == 0 )
      {
        printHelp = true;
      }
      else
      if ( ( strcmp( argv[ x ], "-o" ) == 0 || strcmp( argv[ x ], "-O" ) == 0 )
          && x + 1 < argc )
      {
        string option = argv[ x + 1 ];
        Config::OptionType optionType =
          strcmp( argv[ x ], "-O" ) == 0 ? Config::Runtime : Config::Engine;

        if ( option == "help" )
        {
          config.showHelp( optionType );
          return EXIT_SUCCESS;
        }

        if ( option.empty() || !config.parseOption( option, optionType ) )
        {
          fprintf( stderr, "Invalid option specified: %s\n",
                   option.c_str() );
          return EXIT_FAILURE;
        }
        ++x;
      }
      else
        args.push_back( argv[ x ] );
    }

    if ( args.size() < 1 || printHelp )
    {
      fprintf( stderr,
"ZLSH, a locality-sensitive hashing tool, version %s\n"
"Comes with no warranty. Licensed under GNU GPLv2 or later + OpenSSL.\n\n"

"Usage: %s [flags] <command> [command args]\n"
"\n"
"  Flags: --config <file> (loads engine options from a text-format\n"
"          configuration file, see 'config show' for the format)\n"
"         --silent (default is verbose)\n"
"         --help|-h show this message\n"
"         -O <option[=value]> (overrides runtime configuration,\n"
"          can be specified multiple times,\n"
"          for detailed runtime options overview run with -O help)\n"
"         -o <option[=value]> (overrides engine configuration,\n"
"          can be specified multiple times,\n"
"          for detailed engine options overview run with -o help)\n"
"\n"
"  Commands:\n"
"    hash [file...] - prints the digest of each file, or of stdin\n"
"    compare <file|digest> <file|digest> - prints the distance\n"
"            between two digests\n"
"    scan <path...> - finds identical and similar files, walking\n"
"            directories\n"
"    config [show] - prints the effective configuration\n"
"", zlsh_version.c_str(), *argv );
      return EXIT_FAILURE;
    }

    if ( strcmp( args[ 0 ], "hash" ) == 0 )
    {
      vector< string > fileNames( args.begin() + 1, args.end() );

      if ( fileNames.empty() )
        fileNames.push_back( "-" );

      return hashFiles( fileNames, config );
    }
    else
    if ( strcmp( args[ 0 ], "compare" ) == 0 )
    {
      if ( args.size() != 3 )
      {
        fprintf( stderr, "Usage: %s %s <file|digest> <file|digest>\n",
                 *argv, args[ 0 ] );
        return EXIT_FAILURE;
      }

      Digest first = digestFromArgument( args[ 1 ], config.engine.digest() );
      Digest second = digestFromArgument( args[ 2 ], config.engine.digest() );

      printf( "%u\n", FuzzyHash::compareDigests( first, second,
                                                 config.engine.distance() ) );
    }
    else
    if ( strcmp( args[ 0 ], "scan" ) == 0 )
    {
      if ( args.size() < 2 )
      {
        fprintf( stderr, "Usage: %s %s <path...>\n", *argv, args[ 0 ] );
        return EXIT_FAILURE;
      }

      return scan( vector< string >( args.begin() + 1, args.end() ), config );
    }
    else
    if ( strcmp( args[ 0 ], "config" ) == 0 )
    {
      if ( args.size() > 2 ||
           ( args.size() == 2 && strcmp( args[ 1 ], "show" ) != 0 ) )
      {
        fprintf( stderr, "Usage: %s %s [show]\n", *argv, args[ 0 ] );
        return EXIT_FAILURE;
      }

      config.show();
    }
    else
    {
      fprintf( stderr, "Error: unknown command line option: %s\n", args[ 0 ] );
      return EXIT_FAILURE;
    }
  }
  catch( std::exception & e )
  {
    fprintf( stderr, "%s\n", e.what() );
    return EXIT_FAILURE;
  }
  return EXIT_SUCCESS;
}
