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

#ifndef PGPSIG_MPI_HPP_
#define PGPSIG_MPI_HPP_

#include <cstdint>
#include <cstddef>
#include <vector>

namespace pgp {

/* Big-endian unsigned integer of the signature value. Bytes are kept as they were given. */
class mpi {
    std::vector<uint8_t> data_;

    /* number of leading zero bytes */
    size_t zeroes() const noexcept;

  public:
    /* significant bits, 0 for the zero value */
    size_t bits() const noexcept;

    size_t
    size() const noexcept
    {
        return data_.size();
    }
    const uint8_t *
    data() const noexcept
    {
        return data_.data();
    }
    uint8_t
    operator[](size_t idx) const
    {
        return data_.at(idx);
    }

    /* values are compared, leading zeroes do not matter */
    bool operator==(const mpi &src) const;
    bool
    operator!=(const mpi &src) const
    {
        return !(*this == src);
    }

    void assign(const uint8_t *val, size_t size);
    void resize(size_t size, uint8_t fill = 0);
};

} // namespace pgp

#endif
