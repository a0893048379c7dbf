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

#include "str-utils.h"

namespace pgpsig {

static const char UTF8_REPLACEMENT[] = "\xEF\xBF\xBD";

/* Return length of the well-formed sequence at data, or 0 if it is ill-formed. In the last
 * case bad is set to the number of bytes which should be replaced. */
static size_t
utf8_seq_len(const uint8_t *data, size_t len, size_t &bad)
{
    uint8_t b0 = data[0];
    bad = 1;
    if (b0 < 0x80) {
        return 1;
    }
    size_t  need = 0;
    uint8_t lo = 0x80;
    uint8_t hi = 0xBF;
    if ((b0 >= 0xC2) && (b0 <= 0xDF)) {
        need = 1;
    } else if ((b0 >= 0xE0) && (b0 <= 0xEF)) {
        need = 2;
        /* no overlongs and no surrogates */
        lo = b0 == 0xE0 ? 0xA0 : 0x80;
        hi = b0 == 0xED ? 0x9F : 0xBF;
    } else if ((b0 >= 0xF0) && (b0 <= 0xF4)) {
        need = 3;
        /* no overlongs and nothing above U+10FFFF */
        lo = b0 == 0xF0 ? 0x90 : 0x80;
        hi = b0 == 0xF4 ? 0x8F : 0xBF;
    } else {
        return 0;
    }

    for (size_t idx = 1; idx <= need; idx++) {
        if (idx >= len) {
            return 0;
        }
        uint8_t bt = data[idx];
        if ((idx == 1) && ((bt < lo) || (bt > hi))) {
            return 0;
        }
        if ((idx > 1) && ((bt < 0x80) || (bt > 0xBF))) {
            return 0;
        }
        bad = idx + 1;
    }
    return need + 1;
}

bool
is_utf8(const uint8_t *data, size_t len)
{
    size_t pos = 0;
    while (pos < len) {
        size_t bad = 0;
        size_t seq = utf8_seq_len(data + pos, len - pos, bad);
        if (!seq) {
            return false;
        }
        pos += seq;
    }
    return true;
}

std::string
utf8_lossy(const uint8_t *data, size_t len)
{
    std::string res;
    res.reserve(len);
    size_t pos = 0;
    while (pos < len) {
        size_t bad = 0;
        size_t seq = utf8_seq_len(data + pos, len - pos, bad);
        if (seq) {
            res.append((const char *) data + pos, seq);
            pos += seq;
            continue;
        }
        res.append(UTF8_REPLACEMENT);
        pos += bad;
    }
    return res;
}

} // namespace pgpsig
