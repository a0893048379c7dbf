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

#ifndef PGPSIG_TYPES_H_
#define PGPSIG_TYPES_H_

#include <cstdint>
#include <string>
#include <vector>
#include <array>
#include <stdexcept>

#include <pgpsig/pgpsig_def.h>
#include <pgpsig/pgp_def.h>

/* Identifier and its name. Tables of them end with {0, NULL}. */
struct id_str_pair {
    int         id;
    const char *str;

    static const char *lookup(const id_str_pair pair[],
                              int               id,
                              const char *      notfound = "unknown");
};

namespace pgpsig {
/* Thrown by the writers and setters on the inconsistent input */
class pgpsig_exception : public std::runtime_error {
    pgpsig_result_t code_;

  public:
    explicit pgpsig_exception(pgpsig_result_t code = PGPSIG_ERROR_GENERIC)
        : std::runtime_error("pgpsig error"), code_(code)
    {
    }

    pgpsig_result_t
    code() const noexcept
    {
        return code_;
    }
};
} // namespace pgpsig

#endif
