// Copyright (c) 2026 ZLSH contributors, see CONTRIBUTORS
// Part of ZLSH. Licensed under GNU GPLv2 or later + OpenSSL, see LICENSE

#include <stdint.h>
#include <stdio.h>
#include <string.h>
#include <strings.h>
#include <vector>

#include "config.hh"
#include "debug.hh"
#include "file.hh"
#include "utils.hh"

// Some configurables could be just a switch
// So we introducing a macros that would indicate
// that this configurable is not a switch
#define REQUIRE_VALUE \
{ \
  if ( !hasValue ) \
    return false; \
}

namespace {
/// Parses "true", "false", "yes", "no", "1" and "0". A switch given without
/// a value means true
bool parseBool( bool hasValue, char const * value, bool & result )
{
  if ( !hasValue || strcasecmp( value, "true" ) == 0 ||
       strcasecmp( value, "yes" ) == 0 || strcmp( value, "1" ) == 0 )
    result = true;
  else
  if ( strcasecmp( value, "false" ) == 0 || strcasecmp( value, "no" ) == 0 ||
       strcmp( value, "0" ) == 0 )
    result = false;
  else
    return false;

  return true;
}

bool parseUnsigned( char const * value, uint32_t & result )
{
  int n;

  return value[ 0 ] != '-' &&
         sscanf( value, "%u %n", &result, &n ) == 1 && !value[ n ];
}

bool parseWeight( char const * value, uint32_t & result )
{
  return parseUnsigned( value, result ) && result <= Config::MaxWeight;
}

char const * boolToString( bool value )
{
  return value ? "true" : "false";
}
}

void Config::prefillKeywords()
{
  /* Textual representations of the tokens. */

  Keyword defaultKeywords[] = {
    // Engine options
    {
      "digest.min_data_length",
      Config::oDigest_min_data_length,
      Config::Engine,
      "Inputs shorter than this many bytes get no digest\n"
      "Default is %s",
      Utils::numberToString( GET_ENGINE( digest, min_data_length ) )
    },
    {
      "digest.reject_low_complexity",
      Config::oDigest_reject_low_complexity,
      Config::Engine,
      "Refuse digests for inputs which hit half or fewer of the\n"
      "sampled buckets, e.g. long runs of the same byte\n"
      "Default is %s",
      boolToString( GET_ENGINE( digest, reject_low_complexity ) )
    },
    {
      "digest.reject_degenerate_quartiles",
      Config::oDigest_reject_degenerate_quartiles,
      Config::Engine,
      "Refuse digests for inputs whose third quartile is zero\n"
      "instead of storing zero quartile ratios\n"
      "Default is %s",
      boolToString( GET_ENGINE( digest, reject_degenerate_quartiles ) )
    },
    {
      "distance.include_length",
      Config::oDistance_include_length,
      Config::Engine,
      "Count the difference of input lengths in the distance\n"
      "Default is %s",
      boolToString( GET_ENGINE( distance, include_length ) )
    },
    {
      "distance.length_multiplier",
      Config::oDistance_length_multiplier,
      Config::Engine,
      "Weight of length code differences over 1\n"
      "At most 1000\n"
      "Default is %s",
      Utils::numberToString( GET_ENGINE( distance, length_multiplier ) )
    },
    {
      "distance.q_ratio_multiplier",
      Config::oDistance_q_ratio_multiplier,
      Config::Engine,
      "Weight of quartile ratio differences over 1\n"
      "At most 1000\n"
      "Default is %s",
      Utils::numberToString( GET_ENGINE( distance, q_ratio_multiplier ) )
    },
    {
      "distance.checksum_penalty",
      Config::oDistance_checksum_penalty,
      Config::Engine,
      "Added to the distance when checksums differ\n"
      "At most 1000\n"
      "Default is %s",
      Utils::numberToString( GET_ENGINE( distance, checksum_penalty ) )
    },
    {
      "distance.far_bit_pair_penalty",
      Config::oDistance_far_bit_pair_penalty,
      Config::Engine,
      "Counted for a bucket in the lowest quartile in one digest\n"
      "and above the third quartile in the other\n"
      "At most 1000\n"
      "Default is %s",
      Utils::numberToString( GET_ENGINE( distance, far_bit_pair_penalty ) )
    },

    // Runtime options
    {
      "threads",
      Config::oRuntime_threads,
      Config::Runtime,
      "Maximum number of threads hashing files in parallel\n"
      "Default is %s on your system",
      Utils::numberToString( runtime.threads )
    },
    {
      "threshold",
      Config::oRuntime_threshold,
      Config::Runtime,
      "Maximum distance at which scan reports files as near duplicates\n"
      "Default is %s",
      Utils::numberToString( runtime.threshold )
    }
  };

  keywords.assign( defaultKeywords, defaultKeywords +
      sizeof( defaultKeywords ) / sizeof( Keyword ) );
}

Config::Config()
{
  // Have all the defaults present, so show() prints them
  engine.mutable_digest()->CopyFrom( DigestInfo::default_instance() );
  engine.mutable_distance()->CopyFrom( DistanceInfo::default_instance() );
  prefillKeywords();
  dPrintf( "%s is instantiated and initialized with default values\n",
      __CLASS );
}

Config::OpCodes Config::parseToken( const char * option, const OptionType type )
{
  for ( size_t i = 0; i < keywords.size(); i++ )
  {
    if ( strcasecmp( option, keywords[ i ].name.c_str() ) == 0 )
    {
      if ( keywords[ i ].type != type )
      {
        fprintf( stderr, "Invalid option type specified for %s\n", option );
        break;
      }

      return keywords[ i ].opcode;
    }
  }

  return Config::oBadOption;
}

bool Config::parseOption( const string & option, const OptionType type )
{
  dPrintf( "Parsing %s option \"%s\"...\n",
      type == Runtime ? "runtime" : "engine", option.c_str() );

  bool hasValue = false;
  string optionName( option ), optionValue;

  size_t separator = option.find( '=' );
  if ( separator != string::npos )
  {
    optionName.assign( option, 0, separator );
    optionValue.assign( option, separator + 1, string::npos );
    hasValue = true;
    dPrintf( "option %s: %s\n", optionName.c_str(), optionValue.c_str() );
  }

  char const * value = optionValue.c_str();
  uint32_t uint32Value;
  bool boolValue;
  size_t sizeValue;
  int n;

  switch ( parseToken( optionName.c_str(), type ) )
  {
    case oDigest_min_data_length:
      REQUIRE_VALUE;

      if ( !parseUnsigned( value, uint32Value ) )
        return false;

      SET_ENGINE( digest, min_data_length, uint32Value );
      dPrintf( "engine[digest][min_data_length] = %u\n",
          GET_ENGINE( digest, min_data_length ) );

      return true;

    case oDigest_reject_low_complexity:
      if ( !parseBool( hasValue, value, boolValue ) )
        return false;

      SET_ENGINE( digest, reject_low_complexity, boolValue );

      return true;

    case oDigest_reject_degenerate_quartiles:
      if ( !parseBool( hasValue, value, boolValue ) )
        return false;

      SET_ENGINE( digest, reject_degenerate_quartiles, boolValue );

      return true;

    case oDistance_include_length:
      if ( !parseBool( hasValue, value, boolValue ) )
        return false;

      SET_ENGINE( distance, include_length, boolValue );

      return true;

    case oDistance_length_multiplier:
      REQUIRE_VALUE;

      if ( !parseWeight( value, uint32Value ) )
        return false;

      SET_ENGINE( distance, length_multiplier, uint32Value );

      return true;

    case oDistance_q_ratio_multiplier:
      REQUIRE_VALUE;

      if ( !parseWeight( value, uint32Value ) )
        return false;

      SET_ENGINE( distance, q_ratio_multiplier, uint32Value );

      return true;

    case oDistance_checksum_penalty:
      REQUIRE_VALUE;

      if ( !parseWeight( value, uint32Value ) )
        return false;

      SET_ENGINE( distance, checksum_penalty, uint32Value );

      return true;

    case oDistance_far_bit_pair_penalty:
      REQUIRE_VALUE;

      if ( !parseWeight( value, uint32Value ) )
        return false;

      SET_ENGINE( distance, far_bit_pair_penalty, uint32Value );

      return true;

    case oRuntime_threads:
      REQUIRE_VALUE;

      sizeValue = runtime.threads;
      if ( value[ 0 ] == '-' || sscanf( value, "%zu %n", &sizeValue, &n ) != 1 ||
           value[ n ] || sizeValue < 1 )
        throw exInvalidThreadsValue( optionValue );
      runtime.threads = sizeValue;

      dPrintf( "runtime[threads] = %zu\n", runtime.threads );

      return true;

    case oRuntime_threshold:
      REQUIRE_VALUE;

      if ( !parseUnsigned( value, uint32Value ) )
        return false;

      runtime.threshold = uint32Value;
      dPrintf( "runtime[threshold] = %u\n", runtime.threshold );

      return true;

    case oBadOption:
    default:
      return false;
  }
}

void Config::showHelp( const OptionType type )
{
  string typeName;
  switch ( type )
  {
    case Runtime:
      typeName = "runtime";
      break;
    case Engine:
      typeName = "engine";
      break;
    default:
      typeName = "(unknown)";
  }

  fprintf( stderr,
"Available %s options overview:\n\n"
"== 'help' ==\n"
"show this message\n"
"", typeName.c_str() );

  for ( size_t i = 0; i < keywords.size(); i++ )
  {
    if ( keywords[ i ].type != type )
      continue;

    fprintf( stderr, "\n== '%s' ==\n", keywords[ i ].name.c_str() );
    fprintf( stderr, keywords[ i ].description.c_str(),
             keywords[ i ].defaultValue.c_str() );
    fprintf( stderr, "\n" );
  }
}

bool Config::parseProto( const string & str, google::protobuf::Message * mutable_message )
{
  return google::protobuf::TextFormat::ParseFromString( str, mutable_message );
}

string Config::toString( google::protobuf::Message const & message )
{
  string str;
  google::protobuf::TextFormat::PrintToString( message, &str );

  return str;
}

void Config::loadFile( const string & fileName )
{
  File f( fileName );
  string contents;
  std::vector< char > buffer( 4096 );

  while ( size_t got = f.read( buffer.data(), buffer.size() ) )
    contents.append( buffer.data(), got );

  ConfigInfo loaded;
  if ( !parseProto( contents, &loaded ) )
    throw exCantParseFile( fileName );

  validateWeights( loaded.distance() );

  // Fields the file doesn't mention keep their current values
  engine.MergeFrom( loaded );
  dPrintf( "Loaded configuration from %s\n", fileName.c_str() );
}

void Config::validateWeights( DistanceInfo const & info )
{
  if ( info.length_multiplier() > MaxWeight )
    throw exInvalidWeight( "length_multiplier " +
                           Utils::numberToString( info.length_multiplier() ) );

  if ( info.q_ratio_multiplier() > MaxWeight )
    throw exInvalidWeight( "q_ratio_multiplier " +
                           Utils::numberToString( info.q_ratio_multiplier() ) );

  if ( info.checksum_penalty() > MaxWeight )
    throw exInvalidWeight( "checksum_penalty " +
                           Utils::numberToString( info.checksum_penalty() ) );

  if ( info.far_bit_pair_penalty() > MaxWeight )
    throw exInvalidWeight( "far_bit_pair_penalty " +
                           Utils::numberToString( info.far_bit_pair_penalty() ) );
}

void Config::show()
{
  printf( "%s", toString( engine ).c_str() );
  printf( "# runtime\n# threads: %zu\n# threshold: %u\n", runtime.threads,
          runtime.threshold );
}
