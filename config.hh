// Copyright (c) 2026 ZLSH contributors, see CONTRIBUTORS
// Part of ZLSH. Licensed under GNU GPLv2 or later + OpenSSL, see LICENSE

#ifndef CONFIG_HH_INCLUDED
#define CONFIG_HH_INCLUDED

#include <stddef.h>
#include <exception>
#include <string>
#include <vector>
#include <google/protobuf/text_format.h>

#include "ex.hh"
#include "mt.hh"
#include "zlsh.pb.h"

#define SET_ENGINE( section, property, value ) \
  engine.mutable_##section()->set_##property( value )

#define GET_ENGINE( section, property ) \
  engine.section().property()

using std::string;

class Config
{
public:
  DEF_EX( Ex, "Config exception", std::exception )
  DEF_EX_STR( exCantParseFile, "Can't parse configuration file", Ex )
  DEF_EX_STR( exInvalidThreadsValue, "Invalid threads value specified:", Ex )
  DEF_EX_STR( exInvalidWeight, "Distance weight out of range:", Ex )

  enum
  {
    // Largest value any distance multiplier or penalty may have
    MaxWeight = 1000
  };

  struct RuntimeConfig
  {
    size_t threads;
    /// Files whose digests are this close or closer are reported as near
    /// duplicates
    unsigned threshold;

    // Default runtime config
    RuntimeConfig():
      threads( getNumberOfCpus() ),
      threshold( 40 )
    {
    }
  };

  enum OptionType
  {
    Runtime,
    Engine,
    None
  };

  /* Keyword tokens. */
  typedef enum
  {
    oBadOption,

    oDigest_min_data_length,
    oDigest_reject_low_complexity,
    oDigest_reject_degenerate_quartiles,

    oDistance_include_length,
    oDistance_length_multiplier,
    oDistance_q_ratio_multiplier,
    oDistance_checksum_penalty,
    oDistance_far_bit_pair_penalty,

    oRuntime_threads,
    oRuntime_threshold
  } OpCodes;

  static bool parseProto( const string &, google::protobuf::Message * );

  static string toString( google::protobuf::Message const & );

  /// Merges the engine options from the given text-format file into the
  /// current ones. Throws exInvalidWeight if the file sets a distance weight
  /// over MaxWeight, leaving the current options as they were
  void loadFile( const string & );

  /// Throws exInvalidWeight naming the first distance weight over MaxWeight
  static void validateWeights( DistanceInfo const & );

  // Print configuration to screen
  void show();

  void showHelp( const OptionType );

  OpCodes parseToken( const char *, const OptionType );

  /// Parses "name=value" or a bare "name" for switches. Returns false if
  /// the option is unknown or its value is invalid
  bool parseOption( const string &, const OptionType );

  Config();

  RuntimeConfig runtime;
  ConfigInfo engine;

private:
  struct Keyword
  {
    string name;
    Config::OpCodes opcode;
    Config::OptionType type;
    string description;
    string defaultValue;
  };

  std::vector< Keyword > keywords;

  void prefillKeywords();
};

#endif
