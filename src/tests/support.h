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

#ifndef SUPPORT_H_
#define SUPPORT_H_

#include <string>
#include <vector>
#include <initializer_list>
#include <stddef.h>
#include <stdint.h>
#include <string.h>

#include "crypto/mem.h"

/* data equals to the hex string */
bool bin_eq_hex(const uint8_t *data, size_t len, const char *val);

std::vector<uint8_t> concat(std::initializer_list<std::vector<uint8_t>> chunks);

/* length, type octet and body */
std::vector<uint8_t> subpkt_bytes(uint8_t tag, const std::vector<uint8_t> &body);

/* bit count and the big-endian value */
std::vector<uint8_t> mpi_bytes(const std::vector<uint8_t> &value);

/* v4 or v5 signature body, left hash bits are AA BB */
std::vector<uint8_t> sig_v4_bytes(uint8_t                     type,
                                  uint8_t                     palg,
                                  uint8_t                     halg,
                                  const std::vector<uint8_t> &hashed,
                                  const std::vector<uint8_t> &unhashed,
                                  const std::vector<uint8_t> &material,
                                  uint8_t                     version = 4);

std::vector<uint8_t> sig_v3_bytes(uint8_t                     type,
                                  uint32_t                    ctime,
                                  const std::vector<uint8_t> &keyid,
                                  uint8_t                     palg,
                                  uint8_t                     halg,
                                  const std::vector<uint8_t> &material);

#endif /* SUPPORT_H_ */
