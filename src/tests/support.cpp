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
#include "support.h"
#include "utils.h"
#include "librepgp/stream-packet.h"

bool
bin_eq_hex(const uint8_t *data, size_t len, const char *val)
{
    auto bin = pgpsig::hex_to_bin(val);
    return (bin.size() == len) && std::equal(bin.begin(), bin.end(), data);
}

static void
add_area(std::vector<uint8_t> &res, const std::vector<uint8_t> &area)
{
    uint8_t len[2];
    write_uint16(len, (uint16_t) area.size());
    res.insert(res.end(), len, len + 2);
    res.insert(res.end(), area.begin(), area.end());
}

std::vector<uint8_t>
concat(std::initializer_list<std::vector<uint8_t>> chunks)
{
    std::vector<uint8_t> res;
    for (auto &chunk : chunks) {
        res.insert(res.end(), chunk.begin(), chunk.end());
    }
    return res;
}

std::vector<uint8_t>
subpkt_bytes(uint8_t tag, const std::vector<uint8_t> &body)
{
    uint8_t              len[5];
    size_t               lenlen = write_packet_len(len, body.size() + 1);
    std::vector<uint8_t> res(len, len + lenlen);
    res.push_back(tag);
    res.insert(res.end(), body.begin(), body.end());
    return res;
}

std::vector<uint8_t>
mpi_bytes(const std::vector<uint8_t> &value)
{
    size_t bits = 0;
    if (!value.empty()) {
        bits = (value.size() - 1) * 8;
        for (uint8_t bt = value[0]; bt; bt >>= 1) {
            bits++;
        }
    }
    std::vector<uint8_t> res = {(uint8_t)(bits >> 8), (uint8_t)(bits & 0xff)};
    res.insert(res.end(), value.begin(), value.end());
    return res;
}

std::vector<uint8_t>
sig_v4_bytes(uint8_t                     type,
             uint8_t                     palg,
             uint8_t                     halg,
             const std::vector<uint8_t> &hashed,
             const std::vector<uint8_t> &unhashed,
             const std::vector<uint8_t> &material,
             uint8_t                     version)
{
    std::vector<uint8_t> res = {version, type, palg, halg};
    add_area(res, hashed);
    add_area(res, unhashed);
    /* left 16 bits of the hash */
    res.push_back(0xAA);
    res.push_back(0xBB);
    res.insert(res.end(), material.begin(), material.end());
    return res;
}

std::vector<uint8_t>
sig_v3_bytes(uint8_t                     type,
             uint32_t                    ctime,
             const std::vector<uint8_t> &keyid,
             uint8_t                     palg,
             uint8_t                     halg,
             const std::vector<uint8_t> &material)
{
    std::vector<uint8_t> res = {3, 5, type, 0, 0, 0, 0};
    write_uint32(&res[3], ctime);
    res.insert(res.end(), keyid.begin(), keyid.end());
    res.push_back(palg);
    res.push_back(halg);
    res.push_back(0xAA);
    res.push_back(0xBB);
    res.insert(res.end(), material.begin(), material.end());
    return res;
}
