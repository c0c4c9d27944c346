// Copyright (c) 2026 ZLSH contributors, see CONTRIBUTORS
// Part of ZLSH. Licensed under GNU GPLv2 or later + OpenSSL, see LICENSE

#include <stdlib.h>
#include <stdio.h>
#include <unistd.h>
#include <string>
#include "../../check.hh"
#include "../../config.hh"
#include "../../file.hh"

using std::string;

int main()
{
  // Defaults
  {
    Config config;

    CHECK( config.engine.digest().min_data_length() == 256,
           "default minimum length is %u",
           config.engine.digest().min_data_length() );
    CHECK( !config.engine.digest().reject_low_complexity(),
           "low complexity is accepted by default" );
    CHECK( config.engine.distance().length_multiplier() == 12,
           "default length multiplier" );
    CHECK( config.runtime.threads >= 1, "at least one thread" );
    CHECK( config.runtime.threshold == 40, "default threshold is %u",
           config.runtime.threshold );
  }

  // Engine options
  {
    Config config;

    CHECK( config.parseOption( "digest.min_data_length=50", Config::Engine ),
           "valid length rejected" );
    CHECK( config.engine.digest().min_data_length() == 50, "length not set" );

    CHECK( config.parseOption( "digest.reject_low_complexity", Config::Engine ),
           "bare switch rejected" );
    CHECK( config.engine.digest().reject_low_complexity(), "switch not set" );

    CHECK( config.parseOption( "digest.reject_low_complexity=no",
                               Config::Engine ), "explicit false rejected" );
    CHECK( !config.engine.digest().reject_low_complexity(),
           "switch not cleared" );

    CHECK( config.parseOption( "DISTANCE.include_length=false", Config::Engine ),
           "names are case insensitive" );
    CHECK( !config.engine.distance().include_length(), "switch not cleared" );

    CHECK( config.parseOption( "distance.far_bit_pair_penalty=4",
                               Config::Engine ), "penalty rejected" );
    CHECK( config.engine.distance().far_bit_pair_penalty() == 4,
           "penalty not set" );

    // Invalid ones leave the config alone
    CHECK( !config.parseOption( "digest.min_data_length", Config::Engine ),
           "missing value accepted" );
    CHECK( !config.parseOption( "digest.min_data_length=-1", Config::Engine ),
           "negative value accepted" );
    CHECK( !config.parseOption( "digest.min_data_length=12abc", Config::Engine ),
           "trailing junk accepted" );
    CHECK( !config.parseOption( "digest.reject_low_complexity=maybe",
                                Config::Engine ), "bad switch accepted" );
    CHECK( !config.parseOption( "no.such_option=1", Config::Engine ),
           "unknown option accepted" );
    CHECK( !config.parseOption( "threads=2", Config::Engine ),
           "runtime option accepted as engine one" );
    CHECK( config.engine.digest().min_data_length() == 50,
           "invalid options changed the config" );
  }

  // Runtime options
  {
    Config config;

    CHECK( config.parseOption( "threads=3", Config::Runtime ),
           "threads rejected" );
    CHECK( config.runtime.threads == 3, "threads not set" );
    CHECK( config.parseOption( "threshold=100", Config::Runtime ),
           "threshold rejected" );
    CHECK( config.runtime.threshold == 100, "threshold not set" );

    CHECK_THROWS( config.parseOption( "threads=0", Config::Runtime ),
                  Config::exInvalidThreadsValue );
    CHECK_THROWS( config.parseOption( "threads=lots", Config::Runtime ),
                  Config::exInvalidThreadsValue );
    CHECK( config.runtime.threads == 3, "bad thread count applied" );
  }

  // Distance weights are bounded
  {
    Config config;

    CHECK( config.parseOption( "distance.length_multiplier=1000",
                               Config::Engine ),
           "largest weight rejected" );
    CHECK( config.engine.distance().length_multiplier() == Config::MaxWeight,
           "largest weight not set" );

    CHECK( !config.parseOption( "distance.length_multiplier=1001",
                                Config::Engine ),
           "weight over the limit accepted" );
    CHECK( !config.parseOption( "distance.length_multiplier=2147483648",
                                Config::Engine ),
           "huge weight accepted" );
    CHECK( !config.parseOption( "distance.far_bit_pair_penalty=4294967295",
                                Config::Engine ),
           "huge penalty accepted" );
    CHECK( config.engine.distance().length_multiplier() == Config::MaxWeight,
           "rejected weight applied" );
    CHECK( config.engine.distance().far_bit_pair_penalty() == 6,
           "rejected penalty applied" );
  }

  // Text format
  {
    ConfigInfo info;

    CHECK( Config::parseProto( "digest { min_data_length: 512 }\n"
                               "distance { checksum_penalty: 0 }\n", &info ),
           "valid text rejected" );
    CHECK( info.digest().min_data_length() == 512, "length not parsed" );
    CHECK( info.distance().checksum_penalty() == 0, "penalty not parsed" );
    CHECK( info.distance().length_multiplier() == 12,
           "unmentioned fields keep their defaults" );

    ConfigInfo again;
    CHECK( Config::parseProto( Config::toString( info ), &again ),
           "printed config does not parse" );
    CHECK( again.digest().min_data_length() == 512, "length lost" );

    CHECK( !Config::parseProto( "digest { no_such_field: 1 }", &again ),
           "unknown field accepted" );
  }

  // Configuration file
  {
    char const * fileName = "test_config.conf";

    FILE * f = fopen( fileName, "w" );
    CHECK( f, "can't create %s", fileName );
    fprintf( f, "distance { length_multiplier: 7 }\n" );
    fclose( f );

    Config config;
    CHECK( config.parseOption( "digest.min_data_length=64", Config::Engine ),
           "valid length rejected" );
    config.loadFile( fileName );

    CHECK( config.engine.distance().length_multiplier() == 7,
           "file value not applied" );
    CHECK( config.engine.digest().min_data_length() == 64,
           "options the file doesn't mention were lost" );

    f = fopen( fileName, "w" );
    CHECK( f, "can't create %s", fileName );
    fprintf( f, "this is not a config\n" );
    fclose( f );

    CHECK_THROWS( config.loadFile( fileName ), Config::exCantParseFile );

    f = fopen( fileName, "w" );
    CHECK( f, "can't create %s", fileName );
    fprintf( f, "digest { min_data_length: 128 }\n"
                "distance { checksum_penalty: 5000 }\n" );
    fclose( f );

    CHECK_THROWS( config.loadFile( fileName ), Config::exInvalidWeight );
    CHECK( config.engine.distance().checksum_penalty() == 1,
           "out of range penalty applied" );
    CHECK( config.engine.digest().min_data_length() == 64,
           "file with a bad weight partly applied" );

    unlink( fileName );

    CHECK_THROWS( config.loadFile( fileName ), File::exCantOpen );
  }

  fprintf( stderr, "Config test passed\n" );

  return EXIT_SUCCESS;
}
