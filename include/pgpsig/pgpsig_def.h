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

#ifndef PGPSIG_DEF_H_
#define PGPSIG_DEF_H_

#include <stdint.h>

/** Function return type. PGPSIG_SUCCESS (0) means success. */
typedef uint32_t pgpsig_result_t;

/* Error codes definitions */
enum {
    PGPSIG_SUCCESS = 0x00000000,

    /* Common error codes */
    PGPSIG_ERROR_GENERIC = 0x10000000,
    PGPSIG_ERROR_BAD_FORMAT,
    PGPSIG_ERROR_BAD_PARAMETERS,
    PGPSIG_ERROR_NOT_IMPLEMENTED,
    PGPSIG_ERROR_NOT_SUPPORTED,
    PGPSIG_ERROR_OUT_OF_MEMORY,
    PGPSIG_ERROR_SHORT_BUFFER,
    PGPSIG_ERROR_NULL_POINTER,

    /* Parsing */
    PGPSIG_ERROR_NOT_ENOUGH_DATA = 0x14000000,
    PGPSIG_ERROR_UNKNOWN_TAG,
    PGPSIG_ERROR_RECURSION_LIMIT,
};

#endif
