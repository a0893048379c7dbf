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

#include <string.h>
#include <cinttypes>
#include <new>
#include "stream-sig.h"
#include "pgp-def.hpp"
#include "utils.h"
#include "logging.h"

namespace pgp {
namespace pkt {

bool
Signature::operator==(const Signature &src) const
{
    return (version == src.version) && (type_ == src.type_) && (palg == src.palg) &&
           (halg == src.halg) && (lbits == src.lbits) &&
           (creation_time == src.creation_time) && (signer == src.signer) &&
           (hashed_subpkts == src.hashed_subpkts) &&
           (unhashed_subpkts == src.unhashed_subpkts) && (material == src.material);
}

bool
Signature::operator!=(const Signature &src) const
{
    return !(*this == src);
}

const sigsub::Raw *
Signature::subpkt(size_t idx) const noexcept
{
    if (idx < hashed_subpkts.size()) {
        return hashed_subpkts[idx].get();
    }
    idx -= hashed_subpkts.size();
    return idx < unhashed_subpkts.size() ? unhashed_subpkts[idx].get() : nullptr;
}

size_t
Signature::find_subpkt(uint8_t stype, bool hashed, size_t skip) const
{
    if (version < PGP_V4) {
        return SIZE_MAX;
    }
    size_t count = hashed_subpkts.size();
    if (!hashed) {
        count += unhashed_subpkts.size();
    }
    for (size_t idx = 0; idx < count; idx++) {
        if (subpkt(idx)->code() != stype) {
            continue;
        }
        if (!skip) {
            return idx;
        }
        skip--;
    }
    return SIZE_MAX;
}

size_t
Signature::find_subpkt(sigsub::Type type, bool hashed, size_t skip) const
{
    return find_subpkt(static_cast<uint8_t>(type), hashed, skip);
}

const sigsub::Raw *
Signature::get_subpkt(uint8_t stype, bool hashed) const
{
    size_t idx = find_subpkt(stype, hashed);
    return idx == SIZE_MAX ? nullptr : subpkt(idx);
}

const sigsub::Raw *
Signature::get_subpkt(sigsub::Type type, bool hashed) const
{
    return get_subpkt(static_cast<uint8_t>(type), hashed);
}

bool
Signature::has_subpkt(uint8_t stype, bool hashed) const
{
    return find_subpkt(stype, hashed) != SIZE_MAX;
}

bool
Signature::has_subpkt(sigsub::Type type, bool hashed) const
{
    return has_subpkt(static_cast<uint8_t>(type), hashed);
}

void
Signature::add_subpkt(sigsub::RawPtr &&sub, bool replace)
{
    if (version < PGP_V4) {
        PGPSIG_LOG("wrong signature version");
        throw pgpsig::pgpsig_exception(PGPSIG_ERROR_BAD_PARAMETERS);
    }

    auto &list = sub->hashed() ? hashed_subpkts.items : unhashed_subpkts.items;
    if (replace) {
        for (auto &item : list) {
            if (item->code() == sub->code()) {
                item = std::move(sub);
                return;
            }
        }
    }
    list.push_back(std::move(sub));
}

bool
Signature::has_keyid() const
{
    return (version < PGP_V4) || has_subpkt(sigsub::Type::IssuerKeyID, false) ||
           has_keyfp();
}

KeyID
Signature::keyid() const noexcept
{
    if (version < PGP_V4) {
        return signer;
    }
    auto sub = find<sigsub::IssuerKeyID>(false);
    /* fallback to the keyid, derived from the issuer fingerprint */
    return sub ? sub->value() : keyfp().keyid();
}

bool
Signature::has_keyfp() const
{
    auto   sub = find<sigsub::IssuerFingerprint>(false);
    size_t size = Fingerprint::size_for_version(version);
    return sub && size && (sub->value().fp.size() == size);
}

Fingerprint
Signature::keyfp() const noexcept
{
    auto sub = find<sigsub::IssuerFingerprint>(false);
    return sub ? sub->value().fp : Fingerprint();
}

uint32_t
Signature::creation() const
{
    if (version < PGP_V4) {
        return creation_time;
    }
    auto sub = find<sigsub::CreationTime>();
    return sub ? sub->value() : 0;
}

uint32_t
Signature::expiration() const
{
    auto sub = find<sigsub::ExpirationTime>();
    return sub ? sub->value() : 0;
}

uint32_t
Signature::key_expiration() const
{
    auto sub = find<sigsub::KeyExpirationTime>();
    return sub ? sub->value() : 0;
}

uint8_t
Signature::key_flags() const
{
    auto sub = find<sigsub::KeyFlags>();
    return sub && !sub->value().empty() ? sub->value()[0] : 0;
}

bool
Signature::revocable() const
{
    auto sub = find<sigsub::Revocable>();
    return sub ? sub->value() : true;
}

bool
Signature::primary_uid() const
{
    auto sub = find<sigsub::PrimaryUserID>();
    return sub && sub->value();
}

const Signature *
Signature::embedded_sig() const noexcept
{
    auto sub = find<sigsub::EmbeddedSignature>(false);
    return sub ? sub->signature() : nullptr;
}

/* code is checked right after reading, before any following field */
static pgpsig_result_t
get_code(pgp_packet_body_t &pkt,
         bool (*known)(uint8_t),
         const char *  name,
         ParseContext &ctx,
         uint8_t &     val)
{
    if (!pkt.get(val)) {
        PGPSIG_LOG("cannot get %s", name);
        ctx.fail(name);
        return pkt.read_error();
    }
    if (!known(val)) {
        PGPSIG_LOG("unknown %s: %" PRIu8, name, val);
        ctx.fail(name);
        return PGPSIG_ERROR_UNKNOWN_TAG;
    }
    return PGPSIG_SUCCESS;
}

pgpsig_result_t
Signature::parse_type(pgp_packet_body_t &pkt, ParseContext &ctx)
{
    uint8_t         code = 0;
    pgpsig_result_t ret = get_code(pkt, sig_type_known, "signature type", ctx, code);
    if (!ret) {
        type_ = (pgp_sig_type_t) code;
    }
    return ret;
}

pgpsig_result_t
Signature::parse_algs(pgp_packet_body_t &pkt, ParseContext &ctx)
{
    uint8_t         code = 0;
    pgpsig_result_t ret = get_code(pkt, pubkey_alg_known, "public key algorithm", ctx, code);
    if (ret) {
        return ret;
    }
    palg = (pgp_pubkey_alg_t) code;
    ret = get_code(pkt, hash_alg_known, "hash algorithm", ctx, code);
    if (ret) {
        return ret;
    }
    halg = (pgp_hash_alg_t) code;
    return PGPSIG_SUCCESS;
}

pgpsig_result_t
Signature::parse_v2v3(pgp_packet_body_t &pkt, ParseContext &ctx)
{
    /* length of hashed data, always 5 */
    uint8_t hlen = 0;
    if (!pkt.get(hlen)) {
        ctx.fail("hashed data length");
        return pkt.read_error();
    }
    if (hlen != PGP_V3_HASHED_LEN) {
        PGPSIG_LOG("wrong length of hashed data: %" PRIu8, hlen);
        ctx.fail("hashed data length");
        return PGPSIG_ERROR_BAD_FORMAT;
    }
    pgpsig_result_t ret = parse_type(pkt, ctx);
    if (ret) {
        return ret;
    }
    if (!pkt.get(creation_time)) {
        PGPSIG_LOG("cannot get creation time");
        ctx.fail("creation time");
        return pkt.read_error();
    }
    if (!pkt.get(signer)) {
        PGPSIG_LOG("cannot get signer's key id");
        ctx.fail("signer");
        return pkt.read_error();
    }
    ret = parse_algs(pkt, ctx);
    if (ret) {
        return ret;
    }
    /* hashed data is the type and creation time */
    hashed_data = build_hashed_data();
    return PGPSIG_SUCCESS;
}

pgpsig_result_t
Signature::parse_subpackets(const uint8_t *buf, size_t len, bool hashed, ParseContext &ctx)
{
    /* area is a complete slice, so running out of data is always malformed */
    pgp_packet_body_t spkt(buf, len);
    auto &            list = hashed ? hashed_subpkts : unhashed_subpkts;

    while (spkt.left()) {
        if (hashed_subpkts.size() + unhashed_subpkts.size() >= ctx.max_subpackets) {
            PGPSIG_LOG("too many signature subpackets");
            ctx.fail("subpackets number");
            return PGPSIG_ERROR_BAD_FORMAT;
        }

        /* subpacket length */
        size_t splen = 0;
        if (!spkt.get_subpkt_len(splen)) {
            PGPSIG_LOG("wrong subpacket length encoding");
            ctx.fail("subpacket length");
            return PGPSIG_ERROR_BAD_FORMAT;
        }
        /* subpacket data */
        size_t         avail = spkt.left();
        const uint8_t *spdata = spkt.view(splen);
        if (!spdata) {
            PGPSIG_LOG("got subpacket len %zu, while only %zu bytes left", splen, avail);
            ctx.fail("subpacket length");
            return PGPSIG_ERROR_BAD_FORMAT;
        }

        sigsub::RawPtr  subpkt;
        pgpsig_result_t ret = sigsub::Raw::parse(spdata, splen, hashed, ctx, subpkt);
        if (ret) {
            return ret;
        }
        list.items.push_back(std::move(subpkt));
    }
    return PGPSIG_SUCCESS;
}

pgpsig_result_t
Signature::parse_area(pgp_packet_body_t &pkt, bool hashed, ParseContext &ctx)
{
    const char *name = hashed ? "hashed subpackets" : "unhashed subpackets";
    uint16_t    splen = 0;
    if (!pkt.get(splen)) {
        PGPSIG_LOG("cannot get %s len", name);
        ctx.fail(name);
        return pkt.read_error();
    }
    std::vector<uint8_t> area;
    if (!pkt.get(area, splen)) {
        PGPSIG_LOG("not enough data for %s: %" PRIu16 " bytes", name, splen);
        ctx.fail(name);
        return pkt.read_error();
    }
    if (hashed) {
        hashed_data.push_back(splen >> 8);
        hashed_data.push_back(splen & 0xff);
        hashed_data.insert(hashed_data.end(), area.begin(), area.end());
    }
    pgpsig_result_t ret = parse_subpackets(area.data(), area.size(), hashed, ctx);
    if (ret) {
        PGPSIG_LOG("failed to parse %s", name);
        ctx.fail(name);
    }
    return ret;
}

pgpsig_result_t
Signature::parse_v4up(pgp_packet_body_t &pkt, ParseContext &ctx)
{
    pgpsig_result_t ret = parse_type(pkt, ctx);
    if (ret) {
        return ret;
    }
    ret = parse_algs(pkt, ctx);
    if (ret) {
        return ret;
    }
    /* hashed data starts from the version */
    hashed_data = {(uint8_t) version, (uint8_t) type_, (uint8_t) palg, (uint8_t) halg};

    ret = parse_area(pkt, true, ctx);
    if (ret) {
        return ret;
    }
    return parse_area(pkt, false, ctx);
}

pgpsig_result_t
Signature::parse_body(pgp_packet_body_t &pkt, ParseContext &ctx)
{
    uint8_t ver = 0;
    if (!pkt.get(ver)) {
        ctx.fail("version");
        return pkt.read_error();
    }
    version = (pgp_version_t) ver;

    /* v2/v3 or v4/v5 signature body */
    pgpsig_result_t res;
    switch (ver) {
    case PGP_V2:
        FALLTHROUGH_STATEMENT;
    case PGP_V3:
        res = parse_v2v3(pkt, ctx);
        break;
    case PGP_V4:
        FALLTHROUGH_STATEMENT;
    case PGP_V5:
        res = parse_v4up(pkt, ctx);
        break;
    default:
        PGPSIG_LOG("unknown signature version: %d", (int) ver);
        ctx.fail("version");
        res = PGPSIG_ERROR_BAD_FORMAT;
    }

    if (res) {
        return res;
    }

    /* left 16 bits of the hash */
    if (!pkt.get(lbits.data(), 2)) {
        PGPSIG_LOG("not enough data for hash left bits");
        ctx.fail("hash left bits");
        return pkt.read_error();
    }

    /* signature material, nothing is allowed after it */
    material.alg = palg;
    res = material.parse(pkt);
    if (res) {
        ctx.fail("signature value");
    }
    return res;
}

pgpsig_result_t
Signature::parse(pgp_packet_body_t &pkt, pgp_pkt_format_t fmt, ParseContext &ctx)
{
    *this = Signature();
    format = fmt;
    try {
        return parse_body(pkt, ctx);
    } catch (const std::bad_alloc &e) {
        PGPSIG_LOG("%s", e.what());
        ctx.fail("memory");
        return PGPSIG_ERROR_OUT_OF_MEMORY;
    } catch (const std::exception &e) {
        PGPSIG_LOG("%s", e.what());
        ctx.fail("exception");
        return PGPSIG_ERROR_GENERIC;
    }
}

pgpsig_result_t
Signature::parse(const uint8_t *data, size_t len, pgp_pkt_format_t fmt, bool complete)
{
    if (!data && len) {
        return PGPSIG_ERROR_NULL_POINTER;
    }
    try {
        pgp_packet_body_t pkt(data, len, complete);
        ParseContext      ctx;
        return parse(pkt, fmt, ctx);
    } catch (const std::bad_alloc &e) {
        PGPSIG_LOG("%s", e.what());
        return PGPSIG_ERROR_OUT_OF_MEMORY;
    }
}

std::vector<uint8_t>
Signature::build_hashed_data() const
{
    pgp_packet_body_t out;
    if (version >= PGP_V4) {
        const uint8_t head[4] = {
          (uint8_t) version, (uint8_t) type_, (uint8_t) palg, (uint8_t) halg};
        out.add(head, sizeof(head));
        out.add_subpackets(*this, true);
    } else {
        out.add_byte(type_);
        out.add_uint32(creation_time);
    }
    return std::vector<uint8_t>(out.data(), out.data() + out.size());
}

static void
check_version(pgp_version_t version)
{
    if ((version >= PGP_V2) && (version <= PGP_V5)) {
        return;
    }
    PGPSIG_LOG("cannot write signature of version %d", (int) version);
    throw pgpsig::pgpsig_exception(PGPSIG_ERROR_BAD_PARAMETERS);
}

void
Signature::fill_hashed_data()
{
    check_version(version);
    hashed_data = build_hashed_data();
}

std::vector<uint8_t>
Signature::write() const
{
    check_version(version);
    auto hashed = hashed_data.empty() ? build_hashed_data() : hashed_data;

    pgp_packet_body_t out;
    if (version >= PGP_V4) {
        /* hashed data starts from the version and ends with the hashed area */
        out.add(hashed);
        out.add_subpackets(*this, false);
    } else {
        const uint8_t head[2] = {(uint8_t) version, (uint8_t) hashed.size()};
        out.add(head, sizeof(head));
        out.add(hashed);
        out.add(signer);
        out.add_byte(palg);
        out.add_byte(halg);
    }
    out.add(lbits.data(), lbits.size());
    material.write(out);
    return std::vector<uint8_t>(out.data(), out.data() + out.size());
}

} // namespace pkt
} // namespace pgp
