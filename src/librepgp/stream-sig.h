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

#ifndef STREAM_SIG_H_
#define STREAM_SIG_H_

#include <stdint.h>
#include <stdbool.h>
#include <array>
#include <vector>
#include "types.h"
#include "stream-packet.h"
#include "sig_subpacket.hpp"
#include "sig_material.hpp"

namespace pgp {
namespace pkt {

/* Signature packet body of version 2 to 5 */
class Signature {
  private:
    pgp_sig_type_t       type_;
    pgpsig_result_t      parse_body(pgp_packet_body_t &pkt, ParseContext &ctx);
    pgpsig_result_t      parse_v2v3(pgp_packet_body_t &pkt, ParseContext &ctx);
    pgpsig_result_t      parse_v4up(pgp_packet_body_t &pkt, ParseContext &ctx);
    pgpsig_result_t      parse_type(pgp_packet_body_t &pkt, ParseContext &ctx);
    pgpsig_result_t      parse_algs(pgp_packet_body_t &pkt, ParseContext &ctx);
    pgpsig_result_t      parse_area(pgp_packet_body_t &pkt, bool hashed, ParseContext &ctx);
    pgpsig_result_t      parse_subpackets(const uint8_t *buf,
                                          size_t         len,
                                          bool           hashed,
                                          ParseContext & ctx);
    const sigsub::Raw *  subpkt(size_t idx) const noexcept;
    std::vector<uint8_t> build_hashed_data() const;

  public:
    pgp_pkt_format_t       format; /* outer packet format, not used by the parser */
    pgp_version_t          version;
    pgp_pubkey_alg_t       palg;
    pgp_hash_alg_t         halg;
    std::array<uint8_t, 2> lbits{};
    std::vector<uint8_t>   hashed_data;
    SigMaterial            material;

    /* v2 and v3 */
    uint32_t creation_time;
    KeyID    signer{};

    /* v4 and v5 */
    sigsub::List hashed_subpkts;
    sigsub::List unhashed_subpkts;

    Signature()
        : type_(PGP_SIG_BINARY), format(PGP_PKT_FORMAT_NEW), version(PGP_VUNKNOWN),
          palg(PGP_PKA_NOTHING), halg(PGP_HASH_UNKNOWN), creation_time(0){};
    bool operator==(const Signature &src) const;
    bool operator!=(const Signature &src) const;

    pgp_sig_type_t
    type() const
    {
        return type_;
    };
    void
    set_type(pgp_sig_type_t atype)
    {
        type_ = atype;
    };

    /**
     * @brief Locate subpacket by its type code.
     * @param hashed true to look in the hashed area only, false for both areas.
     * @param skip number of matches to pass over.
     * @return index counting the hashed area first, SIZE_MAX if there is no match. v2 and v3
     *         signatures never match.
     */
    size_t find_subpkt(uint8_t type, bool hashed = true, size_t skip = 0) const;
    size_t find_subpkt(sigsub::Type type, bool hashed = true, size_t skip = 0) const;
    const sigsub::Raw *get_subpkt(uint8_t stype, bool hashed = true) const;
    const sigsub::Raw *get_subpkt(sigsub::Type type, bool hashed = true) const;
    bool               has_subpkt(uint8_t stype, bool hashed = true) const;
    bool               has_subpkt(sigsub::Type type, bool hashed = true) const;

    template <typename T>
    const T *
    find(bool hashed = true) const
    {
        return dynamic_cast<const T *>(get_subpkt(T::kind, hashed));
    }

    /**
     * @brief Append subpacket to the area, chosen by sub->hashed(). Throws for v2 and v3.
     * @param replace overwrite the first subpacket with the same code instead.
     */
    void add_subpkt(sigsub::RawPtr &&sub, bool replace = false);

    /* issuer is known from the v3 field, issuer key id or issuer fingerprint */
    bool  has_keyid() const;
    KeyID keyid() const noexcept;
    /* issuer fingerprint of the size, expected for the signature version */
    bool        has_keyfp() const;
    Fingerprint keyfp() const noexcept;

    /* values of the hashed subpackets, or defaults when they are missing */
    uint32_t creation() const;
    uint32_t expiration() const;
    uint32_t key_expiration() const;
    uint8_t  key_flags() const;
    bool     revocable() const;
    bool     primary_uid() const;
    /* embedded signature from any area */
    const Signature *embedded_sig() const noexcept;

    /**
     * @brief Parse signature body, starting from the version octet. No data is allowed
     *        after the signature value.
     * @param ctx limits. On failure ctx.failed() names the field which failed.
     * @return PGPSIG_SUCCESS, or PGPSIG_ERROR_NOT_ENOUGH_DATA when incomplete pkt ended
     *         before a valid signature, PGPSIG_ERROR_BAD_FORMAT, PGPSIG_ERROR_UNKNOWN_TAG,
     *         PGPSIG_ERROR_RECURSION_LIMIT.
     */
    pgpsig_result_t parse(pgp_packet_body_t &pkt, pgp_pkt_format_t format, ParseContext &ctx);
    pgpsig_result_t parse(const uint8_t *  data,
                          size_t           len,
                          pgp_pkt_format_t format,
                          bool             complete = true);

    /* recalculate hashed_data from the fields */
    void fill_hashed_data();
    /* body without the packet header, throws on inconsistent fields */
    std::vector<uint8_t> write() const;
};

} // namespace pkt
} // namespace pgp

#endif
