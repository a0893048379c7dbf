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

#ifndef PGPSIG_PGP_DEF_HPP_
#define PGPSIG_PGP_DEF_HPP_

#include <cstdint>
#include "types.h"

namespace pgp {

/* Subpacket type names, used to report the failed subpacket */
extern const id_str_pair sig_subpkt_type_map[];

/* 100..110, shared by algorithms, revocation codes and subpacket types */
bool is_private_code(uint8_t code) noexcept;

/* Identifiers accepted by the parser. Algorithms and revocation codes may be private. */
bool sig_type_known(uint8_t code) noexcept;
bool pubkey_alg_known(uint8_t code) noexcept;
bool hash_alg_known(uint8_t code) noexcept;
bool symm_alg_known(uint8_t code) noexcept;
bool z_alg_known(uint8_t code) noexcept;
bool aead_alg_known(uint8_t code) noexcept;
bool revocation_code_known(uint8_t code) noexcept;
bool revoker_class_known(uint8_t code) noexcept;
bool key_version_known(uint8_t code) noexcept;

} // namespace pgp

#endif
