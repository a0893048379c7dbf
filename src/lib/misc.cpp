/*
 * Copyright (c) 2017-2020, [Ribose Inc](https://www.ribose.com).
 * All rights reserved.
 *
 * Redistribution and use in source and binary forms, with or without modification,
 * are permitted provided that the following conditions are met:
 *
 * 1.  Redistributions of source code must retain the above copyright notice,
 *     this list of conditions and the following disclaimer.
 *
 * 2.  Redistributions in binary form must reproduce the above copyright notice,
 *     this list of conditions and the following disclaimer in the documentation
 *     and/or other materials provided with the distribution.
 *
 * THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS "AS IS" AND
 * ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE IMPLIED
 * WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE ARE
 * DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT OWNER OR CONTRIBUTORS BE LIABLE
 * FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR CONSEQUENTIAL
 * DAMAGES (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR
 * SERVICES; LOSS OF USE, DATA, OR PROFITS; OR BUSINESS INTERRUPTION) HOWEVER
 * CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY,
 * OR TORT (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE OF
 * THIS SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.
 */

#include <algorithm>
#include <iterator>
#include "types.h"
#include "pgp-def.hpp"

const char *
id_str_pair::lookup(const id_str_pair pair[], int id, const char *notfound)
{
    for (; pair && pair->str; pair++) {
        if (pair->id == id) {
            return pair->str;
        }
    }
    return notfound;
}

namespace pgp {

const id_str_pair sig_subpkt_type_map[] = {
  {2, "signature creation time"},
  {3, "signature expiration time"},
  {4, "exportable certification"},
  {5, "trust signature"},
  {6, "regular expression"},
  {7, "revocable"},
  {9, "key expiration time"},
  {11, "preferred symmetric algorithms"},
  {12, "revocation key"},
  {16, "issuer key ID"},
  {20, "notation data"},
  {21, "preferred hash algorithms"},
  {22, "preferred compression algorithms"},
  {23, "key server preferences"},
  {24, "preferred key server"},
  {25, "primary user ID"},
  {26, "policy URI"},
  {27, "key flags"},
  {28, "signer's user ID"},
  {29, "reason for revocation"},
  {30, "features"},
  {31, "signature target"},
  {32, "embedded signature"},
  {33, "issuer fingerprint"},
  {34, "preferred AEAD algorithms"},
  {0x00, NULL},
};

template <size_t N>
static bool
listed(const uint8_t (&codes)[N], uint8_t code) noexcept
{
    return std::find(std::begin(codes), std::end(codes), code) != std::end(codes);
}

static const uint8_t sig_types[] = {PGP_SIG_BINARY,
                                    PGP_SIG_TEXT,
                                    PGP_SIG_STANDALONE,
                                    PGP_CERT_GENERIC,
                                    PGP_CERT_PERSONA,
                                    PGP_CERT_CASUAL,
                                    PGP_CERT_POSITIVE,
                                    PGP_SIG_SUBKEY,
                                    PGP_SIG_PRIMARY,
                                    PGP_SIG_DIRECT,
                                    PGP_SIG_REV_KEY,
                                    PGP_SIG_REV_SUBKEY,
                                    PGP_SIG_REV_CERT,
                                    PGP_SIG_TIMESTAMP,
                                    PGP_SIG_3RD_PARTY};

static const uint8_t pubkey_algs[] = {PGP_PKA_RSA,
                                      PGP_PKA_RSA_ENCRYPT_ONLY,
                                      PGP_PKA_RSA_SIGN_ONLY,
                                      PGP_PKA_ELGAMAL,
                                      PGP_PKA_DSA,
                                      PGP_PKA_ECDH,
                                      PGP_PKA_ECDSA,
                                      PGP_PKA_ELGAMAL_ENCRYPT_OR_SIGN,
                                      PGP_PKA_RESERVED_DH,
                                      PGP_PKA_EDDSA};

static const uint8_t hash_algs[] = {PGP_HASH_MD5,
                                    PGP_HASH_SHA1,
                                    PGP_HASH_RIPEMD,
                                    PGP_HASH_SHA256,
                                    PGP_HASH_SHA384,
                                    PGP_HASH_SHA512,
                                    PGP_HASH_SHA224,
                                    PGP_HASH_SHA3_256,
                                    PGP_HASH_SHA3_512};

bool
is_private_code(uint8_t code) noexcept
{
    return (code >= 100) && (code <= 110);
}

bool
sig_type_known(uint8_t code) noexcept
{
    return listed(sig_types, code);
}

bool
pubkey_alg_known(uint8_t code) noexcept
{
    return listed(pubkey_algs, code) || is_private_code(code);
}

bool
hash_alg_known(uint8_t code) noexcept
{
    return listed(hash_algs, code) || is_private_code(code);
}

bool
symm_alg_known(uint8_t code) noexcept
{
    /* 5 and 6 are not assigned */
    return (code <= PGP_SA_BLOWFISH) ||
           ((code >= PGP_SA_AES_128) && (code <= PGP_SA_CAMELLIA_256)) ||
           is_private_code(code);
}

bool
z_alg_known(uint8_t code) noexcept
{
    return (code <= PGP_C_BZIP2) || is_private_code(code);
}

bool
aead_alg_known(uint8_t code) noexcept
{
    return ((code >= PGP_AEAD_EAX) && (code <= PGP_AEAD_GCM)) || is_private_code(code);
}

bool
revocation_code_known(uint8_t code) noexcept
{
    return (code <= PGP_REVOCATION_RETIRED) || (code == PGP_REVOCATION_NO_LONGER_VALID) ||
           is_private_code(code);
}

bool
revoker_class_known(uint8_t code) noexcept
{
    return (code == PGP_REVOKER_CLASS_DEFAULT) || (code == PGP_REVOKER_CLASS_SENSITIVE);
}

bool
key_version_known(uint8_t code) noexcept
{
    return (code >= PGP_V2) && (code <= PGP_V5);
}

} // namespace pgp
