// Copyright (c) 2026 ZLSH contributors, see CONTRIBUTORS
// Part of ZLSH. Licensed under GNU GPLv2 or later + OpenSSL, see LICENSE

#include "sha256.hh"
#include "utils.hh"

Sha256::Sha256(): ctx( EVP_MD_CTX_new() )
{
  if ( !ctx )
    throw exCantHash();

  if ( EVP_DigestInit_ex( ctx, EVP_sha256(), 0 ) != 1 )
  {
    EVP_MD_CTX_free( ctx );
    throw exCantHash();
  }
}

void Sha256::add( void const * data, size_t size )
{
  if ( EVP_DigestUpdate( ctx, data, size ) != 1 )
    throw exCantHash();
}

string Sha256::finishAsHex()
{
  unsigned char result[ EVP_MAX_MD_SIZE ];
  unsigned size = 0;

  if ( EVP_DigestFinal_ex( ctx, result, &size ) != 1 || size != Size )
    throw exCantHash();

  return Utils::toHex( result, size );
}

Sha256::~Sha256()
{
  EVP_MD_CTX_free( ctx );
}
