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

#ifndef PGPSIG_SIG_MATERIAL_HPP_
#define PGPSIG_SIG_MATERIAL_HPP_

#include <vector>
#include "types.h"
#include "defaults.h"
#include "crypto/mpi.hpp"

typedef struct pgp_packet_body_t pgp_packet_body_t;

namespace pgp {

/**
 * @brief Signature value: sequence of MPIs, number of which depends on the public key
 *        algorithm. No cryptographic meaning is attached to the values.
 */
class SigMaterial {
  public:
    pgp_pubkey_alg_t alg;
    std::vector<mpi> mpis;

    SigMaterial(pgp_pubkey_alg_t aalg = PGP_PKA_NOTHING) : alg(aalg){};

    bool operator==(const SigMaterial &src) const;
    bool operator!=(const SigMaterial &src) const;

    /** @brief number of MPIs in signature made with the specified algorithm */
    static size_t mpi_count(pgp_pubkey_alg_t alg) noexcept;
    /** @brief name of the MPI at the specified position, used for the diagnostics */
    static const char *mpi_name(pgp_pubkey_alg_t alg, size_t idx) noexcept;

    /**
     * @brief Read MPIs from the packet body. Body must not have trailing data after them.
     * @return PGPSIG_SUCCESS or error code. Running out of data in incomplete body gives
     *         PGPSIG_ERROR_NOT_ENOUGH_DATA.
     */
    pgpsig_result_t parse(pgp_packet_body_t &pkt);
    void            write(pgp_packet_body_t &pkt) const;
};

} // namespace pgp

#endif // PGPSIG_SIG_MATERIAL_HPP_
