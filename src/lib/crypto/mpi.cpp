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
#include "mpi.hpp"

namespace pgp {

size_t
mpi::zeroes() const noexcept
{
    auto first = std::find_if(data_.begin(), data_.end(), [](uint8_t bt) { return bt; });
    return first - data_.begin();
}

size_t
mpi::bits() const noexcept
{
    size_t lead = zeroes();
    if (lead == data_.size()) {
        return 0;
    }
    size_t  res = (data_.size() - lead - 1) * 8;
    uint8_t top = data_[lead];
    while (top) {
        res++;
        top >>= 1;
    }
    return res;
}

bool
mpi::operator==(const mpi &src) const
{
    size_t lead = zeroes();
    size_t srclead = src.zeroes();
    if (size() - lead != src.size() - srclead) {
        return false;
    }
    return std::equal(data_.begin() + lead, data_.end(), src.data_.begin() + srclead);
}

void
mpi::assign(const uint8_t *val, size_t size)
{
    data_.assign(val, val + size);
}

void
mpi::resize(size_t size, uint8_t fill)
{
    data_.resize(size, fill);
}

} // namespace pgp
