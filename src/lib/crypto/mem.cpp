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

#include "mem.h"
#include "logging.h"
#include <botan/ffi.h>

namespace pgpsig {

std::string
bin_to_hex(const uint8_t *data, size_t len, HexFormat format)
{
    if (!len) {
        return std::string();
    }
    uint32_t    flags = format == HexFormat::Lowercase ? BOTAN_FFI_HEX_LOWER_CASE : 0;
    std::string res(len * 2 + 1, '\0');
    if (botan_hex_encode(data, len, &res[0], flags)) {
        PGPSIG_LOG("hex encoding failed");
        return std::string();
    }
    res.resize(len * 2);
    return res;
}

std::string
bin_to_hex(const std::vector<uint8_t> &vec, HexFormat format)
{
    return bin_to_hex(vec.data(), vec.size(), format);
}

std::vector<uint8_t>
hex_to_bin(const std::string &str)
{
    size_t skip = 0;
    if ((str.size() >= 2) && (str[0] == '0') && ((str[1] == 'x') || (str[1] == 'X'))) {
        skip = 2;
    }
    std::vector<uint8_t> res(str.size() / 2 + 1);
    size_t               len = res.size();
    if (botan_hex_decode(str.c_str() + skip, str.size() - skip, res.data(), &len)) {
        PGPSIG_LOG("invalid hex string: %s", str.c_str());
        return std::vector<uint8_t>();
    }
    res.resize(len);
    return res;
}

} // namespace pgpsig
