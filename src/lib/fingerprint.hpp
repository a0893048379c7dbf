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

#ifndef PGPSIG_FINGERPRINT_HPP_
#define PGPSIG_FINGERPRINT_HPP_

#include <array>
#include <vector>
#include <string>
#include <cstdint>
#include <pgpsig/pgp_def.h>

#define PGP_KEY_ID_SIZE 8
#define PGP_FINGERPRINT_V4_SIZE 20
#define PGP_FINGERPRINT_V5_SIZE 32

namespace pgp {

using KeyID = std::array<uint8_t, PGP_KEY_ID_SIZE>;

/* Fingerprint as it is referenced from the subpackets, any length is kept */
class Fingerprint {
    std::vector<uint8_t> fp_;

  public:
    Fingerprint()
    {
    }
    Fingerprint(const uint8_t *data, size_t size) : fp_(data, data + size)
    {
    }

    bool
    operator==(const Fingerprint &src) const
    {
        return fp_ == src.fp_;
    }
    bool
    operator!=(const Fingerprint &src) const
    {
        return fp_ != src.fp_;
    }

    /* v4 or v5 fingerprint size */
    static bool size_valid(size_t size) noexcept;
    /* 0 for versions without fingerprints */
    static size_t size_for_version(uint8_t version) noexcept;

    bool
    has_keyid() const noexcept
    {
        return size_valid(fp_.size());
    }
    /* zeroes if there is no key id */
    KeyID keyid() const noexcept;

    const std::vector<uint8_t> &
    vec() const noexcept
    {
        return fp_;
    }
    size_t
    size() const noexcept
    {
        return fp_.size();
    }
    std::string str() const;
};

} // namespace pgp

#endif
