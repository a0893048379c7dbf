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

#include "sig_material.hpp"
#include "librepgp/stream-packet.h"
#include "logging.h"

namespace pgp {

bool
SigMaterial::operator==(const SigMaterial &src) const
{
    return (alg == src.alg) && (mpis == src.mpis);
}

bool
SigMaterial::operator!=(const SigMaterial &src) const
{
    return !(*this == src);
}

size_t
SigMaterial::mpi_count(pgp_pubkey_alg_t alg) noexcept
{
    switch (alg) {
    case PGP_PKA_DSA:
    case PGP_PKA_ECDSA:
    case PGP_PKA_EDDSA:
        return 2;
    default:
        /* RSA and everything we do not know is a single mpi */
        return 1;
    }
}

const char *
SigMaterial::mpi_name(pgp_pubkey_alg_t alg, size_t idx) noexcept
{
    switch (alg) {
    case PGP_PKA_DSA:
    case PGP_PKA_ECDSA:
    case PGP_PKA_EDDSA:
        return idx ? "s" : "r";
    case PGP_PKA_RSA:
    case PGP_PKA_RSA_ENCRYPT_ONLY:
    case PGP_PKA_RSA_SIGN_ONLY:
        return "s";
    default:
        return "value";
    }
}

pgpsig_result_t
SigMaterial::parse(pgp_packet_body_t &pkt)
{
    mpis.clear();
    size_t count = mpi_count(alg);
    for (size_t idx = 0; idx < count; idx++) {
        mpi val;
        if (!pkt.get(val)) {
            PGPSIG_LOG("failed to read signature mpi %s", mpi_name(alg, idx));
            return pkt.read_error();
        }
        mpis.push_back(std::move(val));
    }
    if (pkt.left()) {
        PGPSIG_LOG("extra %zu bytes in signature packet", pkt.left());
        return PGPSIG_ERROR_BAD_FORMAT;
    }
    return PGPSIG_SUCCESS;
}

void
SigMaterial::write(pgp_packet_body_t &pkt) const
{
    if (mpis.size() != mpi_count(alg)) {
        PGPSIG_LOG("wrong number of signature mpis: %zu", mpis.size());
        throw pgpsig::pgpsig_exception(PGPSIG_ERROR_BAD_PARAMETERS);
    }
    for (auto &val : mpis) {
        pkt.add(val);
    }
}

} // namespace pgp
