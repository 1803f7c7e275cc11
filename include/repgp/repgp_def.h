/*
 * Copyright (c) 2017-2025 [Ribose Inc](https://www.ribose.com).
 * All rights reserved.
 *
 * Redistribution and use in source and binary forms, with or without
 * modification, are permitted provided that the following conditions
 * are met:
 * 1. Redistributions of source code must retain the above copyright
 *    notice, this list of conditions and the following disclaimer.
 * 2. Redistributions in binary form must reproduce the above copyright
 *    notice, this list of conditions and the following disclaimer in the
 *    documentation and/or other materials provided with the distribution.
 *
 * THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS
 * ``AS IS'' AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED
 * TO, THE IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR
 * PURPOSE ARE DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT HOLDERS OR CONTRIBUTORS
 * BE LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR
 * CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF
 * SUBSTITUTE GOODS OR SERVICES; LOSS OF USE, DATA, OR PROFITS; OR BUSINESS
 * INTERRUPTION) HOWEVER CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN
 * CONTRACT, STRICT LIABILITY, OR TORT (INCLUDING NEGLIGENCE OR OTHERWISE)
 * ARISING IN ANY WAY OUT OF THE USE OF THIS SOFTWARE, EVEN IF ADVISED OF THE
 * POSSIBILITY OF SUCH DAMAGE.
 */

#ifndef REPGP_DEF_H_
#define REPGP_DEF_H_

#include <cstdint>

/* Packet tag octet, RFC 4880 section 4.2 */
#define PGP_PTAG_ALWAYS_SET 0x80
#define PGP_PTAG_NEW_FORMAT 0x40
/* old format: content tag in bits 5..2, length type in bits 1..0 */
#define PGP_PTAG_OF_CONTENT_TAG_MASK 0x3c
#define PGP_PTAG_OF_CONTENT_TAG_SHIFT 2
#define PGP_PTAG_OF_LENGTH_TYPE_MASK 0x03
/* new format: content tag in bits 5..0 */
#define PGP_PTAG_NF_CONTENT_TAG_MASK 0x3f

/* The longest OID is the one of legacy Curve25519 */
#define MAX_CURVE_OID_HEX_LEN 10U

#define PGP_FINGERPRINT_V4_SIZE 20
#define PGP_FINGERPRINT_V5_SIZE 32
#define PGP_KEY_ID_SIZE 8

/* Tag octet and up to 5 octets of length */
#define PGP_MAX_HEADER_SIZE 6

/* Key, userid and signature packets larger than this are refused */
#define PGP_MAX_PKT_SIZE 0x100000

/* Per hashed or unhashed signature area */
#define PGP_MAX_SUBPACKETS 64

/* Old format length types */
typedef enum {
    PGP_PTAG_OLD_LEN_1 = 0x00,
    PGP_PTAG_OLD_LEN_2 = 0x01,
    PGP_PTAG_OLD_LEN_4 = 0x02,
    PGP_PTAG_OLD_LEN_INDETERMINATE = 0x03
} pgp_ptag_of_lt_t;

/* Packet types, RFC 4880 section 4.3 and RFC 9580 section 5 */
typedef enum : uint8_t {
    PGP_PKT_RESERVED = 0,
    PGP_PKT_PK_SESSION_KEY = 1,
    PGP_PKT_SIGNATURE = 2,
    PGP_PKT_SK_SESSION_KEY = 3,
    PGP_PKT_ONE_PASS_SIG = 4,
    PGP_PKT_SECRET_KEY = 5,
    PGP_PKT_PUBLIC_KEY = 6,
    PGP_PKT_SECRET_SUBKEY = 7,
    PGP_PKT_COMPRESSED = 8,
    PGP_PKT_SE_DATA = 9,
    PGP_PKT_MARKER = 10,
    PGP_PKT_LITDATA = 11,
    PGP_PKT_TRUST = 12,
    PGP_PKT_USER_ID = 13,
    PGP_PKT_PUBLIC_SUBKEY = 14,
    PGP_PKT_USER_ATTR = 17,
    PGP_PKT_SE_IP_DATA = 18,
    PGP_PKT_PADDING = 21
} pgp_pkt_type_t;

/* Public key algorithms, RFC 9580 section 9.1 */
typedef enum : uint8_t {
    PGP_PKA_NOTHING = 0,
    PGP_PKA_RSA = 1,
    PGP_PKA_RSA_ENCRYPT_ONLY = 2, /* deprecated */
    PGP_PKA_RSA_SIGN_ONLY = 3,    /* deprecated */
    PGP_PKA_ELGAMAL = 16,
    PGP_PKA_DSA = 17,
    PGP_PKA_ECDH = 18,
    PGP_PKA_ECDSA = 19,
    PGP_PKA_ELGAMAL_ENCRYPT_OR_SIGN = 20, /* deprecated */
    PGP_PKA_EDDSA = 22,                   /* legacy EdDSA with curve OID */
    PGP_PKA_X25519 = 25,
    PGP_PKA_ED25519 = 27,
    PGP_PKA_SM2 = 99
} pgp_pubkey_alg_t;

/* Curves known by OID */
typedef enum {
    PGP_CURVE_UNKNOWN = 0,
    PGP_CURVE_NIST_P_256,
    PGP_CURVE_NIST_P_384,
    PGP_CURVE_NIST_P_521,
    PGP_CURVE_ED25519,
    PGP_CURVE_25519,
    PGP_CURVE_BP256,
    PGP_CURVE_BP384,
    PGP_CURVE_BP512,
    PGP_CURVE_P256K1,
    PGP_CURVE_SM2_P_256,

    PGP_CURVE_MAX
} pgp_curve_t;

/* Signature types which matter for the key structure, RFC 4880 section 5.2.1 */
typedef enum : uint8_t {
    PGP_SIG_BINARY = 0x00,

    PGP_CERT_GENERIC = 0x10,
    PGP_CERT_PERSONA = 0x11,
    PGP_CERT_CASUAL = 0x12,
    PGP_CERT_POSITIVE = 0x13,

    PGP_SIG_SUBKEY = 0x18,
    PGP_SIG_DIRECT = 0x1f
} pgp_sig_type_t;

/* Key flags subpacket bits, RFC 4880 section 5.2.3.21 */
typedef enum : uint8_t {
    PGP_KF_NONE = 0x00,
    PGP_KF_CERTIFY = 0x01,
    PGP_KF_SIGN = 0x02,
    PGP_KF_ENCRYPT_COMMS = 0x04,
    PGP_KF_ENCRYPT_STORAGE = 0x08,
    PGP_KF_AUTH = 0x20,

    PGP_KF_ENCRYPT = PGP_KF_ENCRYPT_COMMS | PGP_KF_ENCRYPT_STORAGE,
} pgp_key_flags_t;

/* Key and signature packet versions. v5 is the LibrePGP one. */
typedef enum : uint8_t {
    PGP_VUNKNOWN = 0,
    PGP_V2 = 2,
    PGP_V3 = 3,
    PGP_V4 = 4,
    PGP_V5 = 5,
} pgp_version_t;

/* Only the fingerprint algorithms are named, others pass through as numbers */
typedef enum : uint8_t {
    PGP_HASH_UNKNOWN = 0,
    PGP_HASH_MD5 = 1,
    PGP_HASH_SHA1 = 2,
    PGP_HASH_SHA256 = 8,
} pgp_hash_alg_t;

/* Armor header line kinds */
typedef enum {
    PGP_ARMORED_UNKNOWN,
    PGP_ARMORED_PUBLIC_KEY,
    PGP_ARMORED_SECRET_KEY,
    PGP_ARMORED_MESSAGE,
    PGP_ARMORED_SIGNATURE,
    PGP_ARMORED_CLEARTEXT
} pgp_armored_msg_t;

#endif
