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

#ifndef PGPSIG_PGP_DEF_H_
#define PGPSIG_PGP_DEF_H_

/**
 * OpenPGP identifiers consumed by the signature parser.
 *
 * \see RFC4880 9.1-9.4, RFC4880bis 9.6
 */

/** Outer packet format of the Signature packet.
 *
 * \see RFC4880 4.2
 */
typedef enum {
    PGP_PKT_FORMAT_OLD = 0, /* Old (legacy) packet format */
    PGP_PKT_FORMAT_NEW = 1  /* New packet format */
} pgp_pkt_format_t;

/** Signature and key versions.
 *
 * \see RFC4880 5.2, 5.5.2
 */
typedef enum {
    PGP_VUNKNOWN = 0,
    PGP_V2 = 2, /* Version 2 (essentially the same as v3) */
    PGP_V3 = 3, /* Version 3 */
    PGP_V4 = 4, /* Version 4 */
    PGP_V5 = 5  /* Version 5 */
} pgp_version_t;

/** Public Key Algorithm Numbers.
 *
 * \see RFC4880 9.1
 */
typedef enum {
    PGP_PKA_NOTHING = 0,          /* No PKA */
    PGP_PKA_RSA = 1,              /* RSA (Encrypt or Sign) */
    PGP_PKA_RSA_ENCRYPT_ONLY = 2, /* RSA Encrypt-Only (deprecated -
                                   * \see RFC4880 13.5) */
    PGP_PKA_RSA_SIGN_ONLY = 3,    /* RSA Sign-Only (deprecated -
                                   * \see RFC4880 13.5) */
    PGP_PKA_ELGAMAL = 16,         /* Elgamal (Encrypt-Only) */
    PGP_PKA_DSA = 17,             /* DSA (Digital Signature Algorithm) */
    PGP_PKA_ECDH = 18,            /* ECDH public key algorithm */
    PGP_PKA_ECDSA = 19,           /* ECDSA public key algorithm [FIPS186-3] */
    PGP_PKA_ELGAMAL_ENCRYPT_OR_SIGN =
      20,                     /* Deprecated. Reserved (formerly Elgamal Encrypt or Sign) */
    PGP_PKA_RESERVED_DH = 21, /* Reserved for Diffie-Hellman
                               * (X9.42, as defined for
                               * IETF-S/MIME) */
    PGP_PKA_EDDSA = 22,       /* EdDSA from draft-ietf-openpgp-rfc4880bis */

    PGP_PKA_PRIVATE00 = 100, /* Private/Experimental Algorithm */
    PGP_PKA_PRIVATE10 = 110  /* Private/Experimental Algorithm */
} pgp_pubkey_alg_t;

/** Symmetric Key Algorithm Numbers.
 *
 * \see RFC4880 9.2
 */
typedef enum {
    PGP_SA_PLAINTEXT = 0,     /* Plaintext or unencrypted data */
    PGP_SA_IDEA = 1,          /* IDEA */
    PGP_SA_TRIPLEDES = 2,     /* TripleDES */
    PGP_SA_CAST5 = 3,         /* CAST5 */
    PGP_SA_BLOWFISH = 4,      /* Blowfish */
    PGP_SA_AES_128 = 7,       /* AES with 128-bit key (AES) */
    PGP_SA_AES_192 = 8,       /* AES with 192-bit key */
    PGP_SA_AES_256 = 9,       /* AES with 256-bit key */
    PGP_SA_TWOFISH = 10,      /* Twofish with 256-bit key (TWOFISH) */
    PGP_SA_CAMELLIA_128 = 11, /* Camellia with 128-bit key (CAMELLIA) */
    PGP_SA_CAMELLIA_192 = 12, /* Camellia with 192-bit key */
    PGP_SA_CAMELLIA_256 = 13, /* Camellia with 256-bit key */

    PGP_SA_PRIVATE00 = 100,
    PGP_SA_PRIVATE10 = 110
} pgp_symm_alg_t;

typedef enum {
    PGP_AEAD_NONE = 0,
    PGP_AEAD_EAX = 1,
    PGP_AEAD_OCB = 2,
    PGP_AEAD_GCM = 3,
    PGP_AEAD_PRIVATE00 = 100,
    PGP_AEAD_PRIVATE10 = 110
} pgp_aead_alg_t;

/** Types of Compression */
typedef enum {
    PGP_C_NONE = 0,
    PGP_C_ZIP = 1,
    PGP_C_ZLIB = 2,
    PGP_C_BZIP2 = 3,
    PGP_C_PRIVATE00 = 100,
    PGP_C_PRIVATE10 = 110
} pgp_compression_type_t;

/** Hashing Algorithm Numbers.
 *
 * \see RFC4880 9.4
 */
typedef enum {
    PGP_HASH_UNKNOWN = 0, /* used to indicate errors */
    PGP_HASH_MD5 = 1,     /* MD5 */
    PGP_HASH_SHA1 = 2,    /* SHA-1 */
    PGP_HASH_RIPEMD = 3,  /* RIPEMD160 */

    PGP_HASH_SHA256 = 8,    /* SHA256 */
    PGP_HASH_SHA384 = 9,    /* SHA384 */
    PGP_HASH_SHA512 = 10,   /* SHA512 */
    PGP_HASH_SHA224 = 11,   /* SHA224 */
    PGP_HASH_SHA3_256 = 12, /* SHA3-256 */
    PGP_HASH_SHA3_512 = 14, /* SHA3-512 */

    /* Private range */
    PGP_HASH_PRIVATE00 = 100,
    PGP_HASH_PRIVATE10 = 110
} pgp_hash_alg_t;

/** Signature Type.
 *
 * \see RFC4880 5.2.1
 */
typedef enum {
    PGP_SIG_BINARY = 0x00,     /* Signature of a binary document */
    PGP_SIG_TEXT = 0x01,       /* Signature of a canonical text document */
    PGP_SIG_STANDALONE = 0x02, /* Standalone signature */

    PGP_CERT_GENERIC = 0x10,  /* Generic certification of a User ID and
                               * Public Key packet */
    PGP_CERT_PERSONA = 0x11,  /* Persona certification of a User ID and
                               * Public Key packet */
    PGP_CERT_CASUAL = 0x12,   /* Casual certification of a User ID and
                               * Public Key packet */
    PGP_CERT_POSITIVE = 0x13, /* Positive certification of a
                               * User ID and Public Key packet */

    PGP_SIG_SUBKEY = 0x18,  /* Subkey Binding Signature */
    PGP_SIG_PRIMARY = 0x19, /* Primary Key Binding Signature */
    PGP_SIG_DIRECT = 0x1f,  /* Signature directly on a key */

    PGP_SIG_REV_KEY = 0x20,    /* Key revocation signature */
    PGP_SIG_REV_SUBKEY = 0x28, /* Subkey revocation signature */
    PGP_SIG_REV_CERT = 0x30,   /* Certification revocation signature */

    PGP_SIG_TIMESTAMP = 0x40, /* Timestamp signature */

    PGP_SIG_3RD_PARTY = 0x50 /* Third-Party Confirmation signature */
} pgp_sig_type_t;

/** Reason for revocation codes.
 *
 * \see RFC4880 5.2.3.23
 */
typedef enum {
    PGP_REVOCATION_NO_REASON = 0,
    PGP_REVOCATION_SUPERSEDED = 1,
    PGP_REVOCATION_COMPROMISED = 2,
    PGP_REVOCATION_RETIRED = 3,
    PGP_REVOCATION_NO_LONGER_VALID = 0x20,
    PGP_REVOCATION_PRIVATE00 = 100,
    PGP_REVOCATION_PRIVATE10 = 110
} pgp_revocation_type_t;

/** Revocation key class.
 *
 * \see RFC4880 5.2.3.15
 */
typedef enum {
    PGP_REVOKER_CLASS_DEFAULT = 0x80,
    PGP_REVOKER_CLASS_SENSITIVE = 0xC0
} pgp_revoker_class_t;

/** Key Flags
 *
 * \see RFC4880 5.2.3.21
 */
typedef enum {
    PGP_KF_CERTIFY = 0x01,         /* This key may be used to certify other keys. */
    PGP_KF_SIGN = 0x02,            /* This key may be used to sign data. */
    PGP_KF_ENCRYPT_COMMS = 0x04,   /* This key may be used to encrypt communications. */
    PGP_KF_ENCRYPT_STORAGE = 0x08, /* This key may be used to encrypt storage. */
    PGP_KF_SPLIT = 0x10,           /* The private component of this key may have been split
                                            by a secret-sharing mechanism. */
    PGP_KF_AUTH = 0x20,            /* This key may be used for authentication. */
    PGP_KF_SHARED = 0x80,          /* The private component of this key may be in the
                                            possession of more than one person. */
    /* pseudo flags */
    PGP_KF_NONE = 0x00,
    PGP_KF_ENCRYPT = PGP_KF_ENCRYPT_COMMS | PGP_KF_ENCRYPT_STORAGE,
} pgp_key_flags_t;

/* Key server preferences, first octet */
#define PGP_KEY_SERVER_NO_MODIFY 0x80

/* Features, first octet */
#define PGP_KEY_FEATURE_MDC 0x01
#define PGP_KEY_FEATURE_AEAD 0x02
#define PGP_KEY_FEATURE_V5 0x04

/* Notation data flags, first octet */
#define PGP_NOTATION_HUMAN_READABLE 0x80

#endif
