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
#include "crypto/mem.h"
#include "fingerprint.hpp"

namespace pgp {

bool
Fingerprint::size_valid(size_t size) noexcept
{
    return size_for_version(PGP_V4) == size || size_for_version(PGP_V5) == size;
}

size_t
Fingerprint::size_for_version(uint8_t version) noexcept
{
    if (version == PGP_V4) {
        return PGP_FINGERPRINT_V4_SIZE;
    }
    return version == PGP_V5 ? PGP_FINGERPRINT_V5_SIZE : 0;
}

KeyID
Fingerprint::keyid() const noexcept
{
    KeyID res{};
    /* v4 key id is the tail of the fingerprint, v5 one is the head */
    if (fp_.size() == PGP_FINGERPRINT_V4_SIZE) {
        std::copy(fp_.end() - res.size(), fp_.end(), res.begin());
    } else if (fp_.size() == PGP_FINGERPRINT_V5_SIZE) {
        std::copy(fp_.begin(), fp_.begin() + res.size(), res.begin());
    }
    return res;
}

std::string
Fingerprint::str() const
{
    return pgpsig::bin_to_hex(fp_);
}

} // namespace pgp
