// Copyright (c) 2026 ZLSH contributors, see CONTRIBUTORS
// Part of ZLSH. Licensed under GNU GPLv2 or later + OpenSSL, see LICENSE

#ifndef SHA256_HH_INCLUDED__
#define SHA256_HH_INCLUDED__

#include <stddef.h>
#include <exception>
#include <string>
#include <openssl/evp.h>
#include <openssl/sha.h>

#include "ex.hh"
#include "nocopy.hh"

using std::string;

/// SHA-256 of a file's contents. Two files with equal hashes are exact
/// duplicates, which scan reports apart from the near ones
class Sha256: NoCopy
{
  EVP_MD_CTX * ctx;

public:
  DEF_EX( Ex, "SHA-256 exception", std::exception )
  DEF_EX( exCantHash, "OpenSSL failed to compute SHA-256", Ex )

  enum
  {
    // Number of bytes a digest has
    Size = SHA256_DIGEST_LENGTH
  };

  Sha256();

  /// Adds more data
  void add( void const * data, size_t size );

  /// Ends hashing and returns the result as a lowercase hex string
  string finishAsHex();

  ~Sha256();
};

#endif
