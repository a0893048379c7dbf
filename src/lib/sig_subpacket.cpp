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
#include <iterator>
#include <cinttypes>
#include <cstring>
#include "sig_subpacket.hpp"
#include "utils.h"
#include "logging.h"
#include "str-utils.h"
#include "crypto/mem.h"
#include "librepgp/stream-sig.h"

namespace pgp {
namespace pkt {
namespace sigsub {

static pgpsig_result_t
check_size(const char *name, size_t size, size_t expected)
{
    if (size != expected) {
        PGPSIG_LOG("wrong %s len %zu, expected %zu", name, size, expected);
        return PGPSIG_ERROR_BAD_FORMAT;
    }
    return PGPSIG_SUCCESS;
}

static pgpsig_result_t
check_min_size(const char *name, size_t size, size_t min)
{
    if (size < min) {
        PGPSIG_LOG("too short %s: %zu bytes", name, size);
        return PGPSIG_ERROR_BAD_FORMAT;
    }
    return PGPSIG_SUCCESS;
}

static pgpsig_result_t
check_code(const char *name, uint8_t code, bool (*known)(uint8_t))
{
    if (!known(code)) {
        PGPSIG_LOG("unknown %s %" PRIu8, name, code);
        return PGPSIG_ERROR_UNKNOWN_TAG;
    }
    return PGPSIG_SUCCESS;
}

pgpsig_result_t
TimeCodec::decode(const uint8_t *data, size_t size, uint32_t &val)
{
    pgpsig_result_t ret = check_size("time", size, 4);
    if (!ret) {
        val = read_uint32(data);
    }
    return ret;
}

void
TimeCodec::encode(uint32_t val, std::vector<uint8_t> &body)
{
    body.resize(4);
    write_uint32(body.data(), val);
}

pgpsig_result_t
decode_flag(const uint8_t *data, size_t size, bool &val)
{
    pgpsig_result_t ret = check_size("flag", size, 1);
    if (!ret) {
        val = data[0] == 1;
    }
    return ret;
}

pgpsig_result_t
decode_text(const uint8_t *data, size_t size, bool strict, std::string &val)
{
    if (!strict) {
        val = pgpsig::utf8_lossy(data, size);
        return PGPSIG_SUCCESS;
    }
    if (!pgpsig::is_utf8(data, size)) {
        PGPSIG_LOG("invalid UTF-8 string");
        return PGPSIG_ERROR_BAD_FORMAT;
    }
    val.assign(data, data + size);
    return PGPSIG_SUCCESS;
}

pgpsig_result_t
decode_algs(const uint8_t *       data,
            size_t                size,
            bool (*known)(uint8_t),
            std::vector<uint8_t> &val)
{
    for (size_t idx = 0; idx < size; idx++) {
        pgpsig_result_t ret = check_code("preferred algorithm", data[idx], known);
        if (ret) {
            return ret;
        }
    }
    val.assign(data, data + size);
    return PGPSIG_SUCCESS;
}

pgpsig_result_t
KeyIDCodec::decode(const uint8_t *data, size_t size, KeyID &val)
{
    pgpsig_result_t ret = check_size("issuer key id", size, val.size());
    if (!ret) {
        memcpy(val.data(), data, val.size());
    }
    return ret;
}

void
KeyIDCodec::encode(const KeyID &val, std::vector<uint8_t> &body)
{
    body.assign(val.begin(), val.end());
}

pgpsig_result_t
TrustCodec::decode(const uint8_t *data, size_t size, TrustLevel &val)
{
    pgpsig_result_t ret = check_size("trust", size, 2);
    if (!ret) {
        val.level = data[0];
        val.amount = data[1];
    }
    return ret;
}

void
TrustCodec::encode(const TrustLevel &val, std::vector<uint8_t> &body)
{
    body = {val.level, val.amount};
}

pgp_version_t
Revoker::key_version() const noexcept
{
    if (fp.size() == PGP_FINGERPRINT_V4_SIZE) {
        return PGP_V4;
    }
    return fp.size() == PGP_FINGERPRINT_V5_SIZE ? PGP_V5 : PGP_VUNKNOWN;
}

pgpsig_result_t
RevokerCodec::decode(const uint8_t *data, size_t size, Revoker &val)
{
    pgpsig_result_t ret = check_min_size("revocation key", size, 2);
    if (!ret) {
        ret = check_code("revocation key class", data[0], revoker_class_known);
    }
    if (!ret) {
        ret = check_code("revocation key algorithm", data[1], pubkey_alg_known);
    }
    if (ret) {
        return ret;
    }
    /* fingerprint length is defined by the key version */
    if (!Fingerprint::size_valid(size - 2)) {
        PGPSIG_LOG("wrong revocation key fingerprint len %zu", size - 2);
        return PGPSIG_ERROR_BAD_FORMAT;
    }
    val.rev_class = data[0];
    val.alg = static_cast<pgp_pubkey_alg_t>(data[1]);
    val.fp = Fingerprint(data + 2, size - 2);
    return PGPSIG_SUCCESS;
}

void
RevokerCodec::encode(const Revoker &val, std::vector<uint8_t> &body)
{
    body = {val.rev_class, static_cast<uint8_t>(val.alg)};
    body.insert(body.end(), val.fp.vec().begin(), val.fp.vec().end());
}

std::string
Notation::text() const
{
    return pgpsig::utf8_lossy(value.data(), value.size());
}

pgpsig_result_t
NotationCodec::decode(const uint8_t *data, size_t size, Notation &val)
{
    pgpsig_result_t ret = check_min_size("notation", size, 8);
    if (ret) {
        return ret;
    }
    /* only the first flags octet has the defined bits */
    if (data[1] || data[2] || data[3]) {
        PGPSIG_LOG("non-zero reserved notation flags");
        return PGPSIG_ERROR_BAD_FORMAT;
    }
    size_t nlen = read_uint16(data + 4);
    size_t vlen = read_uint16(data + 6);
    if (size != nlen + vlen + 8) {
        PGPSIG_LOG("wrong notation len %zu, name %zu, value %zu", size, nlen, vlen);
        return PGPSIG_ERROR_BAD_FORMAT;
    }
    std::copy(data, data + 4, val.flags.begin());
    val.name = pgpsig::utf8_lossy(data + 8, nlen);
    val.value.assign(data + 8 + nlen, data + size);
    return PGPSIG_SUCCESS;
}

void
NotationCodec::encode(const Notation &val, std::vector<uint8_t> &body)
{
    if ((val.name.size() > 0xffff) || (val.value.size() > 0xffff)) {
        PGPSIG_LOG("too large notation");
        throw pgpsig::pgpsig_exception(PGPSIG_ERROR_BAD_PARAMETERS);
    }
    std::vector<uint8_t> res(8);
    std::copy(val.flags.begin(), val.flags.end(), res.begin());
    write_uint16(res.data() + 4, val.name.size());
    write_uint16(res.data() + 6, val.value.size());
    res.insert(res.end(), val.name.begin(), val.name.end());
    res.insert(res.end(), val.value.begin(), val.value.end());
    body.swap(res);
}

pgpsig_result_t
ReasonCodec::decode(const uint8_t *data, size_t size, Reason &val)
{
    pgpsig_result_t ret = check_min_size("revocation reason", size, 1);
    if (!ret) {
        ret = check_code("revocation code", data[0], revocation_code_known);
    }
    if (!ret) {
        val.code = static_cast<pgp_revocation_type_t>(data[0]);
        val.text = pgpsig::utf8_lossy(data + 1, size - 1);
    }
    return ret;
}

void
ReasonCodec::encode(const Reason &val, std::vector<uint8_t> &body)
{
    body.assign(1, static_cast<uint8_t>(val.code));
    body.insert(body.end(), val.text.begin(), val.text.end());
}

pgpsig_result_t
TargetCodec::decode(const uint8_t *data, size_t size, Target &val)
{
    pgpsig_result_t ret = check_min_size("signature target", size, 2);
    if (!ret) {
        ret = check_code("signature target algorithm", data[0], pubkey_alg_known);
    }
    if (!ret) {
        ret = check_code("signature target hash algorithm", data[1], hash_alg_known);
    }
    if (!ret) {
        val.alg = static_cast<pgp_pubkey_alg_t>(data[0]);
        val.halg = static_cast<pgp_hash_alg_t>(data[1]);
        val.hash.assign(data + 2, data + size);
    }
    return ret;
}

void
TargetCodec::encode(const Target &val, std::vector<uint8_t> &body)
{
    body = {static_cast<uint8_t>(val.alg), static_cast<uint8_t>(val.halg)};
    body.insert(body.end(), val.hash.begin(), val.hash.end());
}

pgpsig_result_t
IssuerCodec::decode(const uint8_t *data, size_t size, Issuer &val)
{
    pgpsig_result_t ret = check_min_size("issuer fingerprint", size, 1);
    if (!ret) {
        ret = check_code("issuer fingerprint key version", data[0], key_version_known);
    }
    if (!ret) {
        val.version = data[0];
        val.fp = Fingerprint(data + 1, size - 1);
    }
    return ret;
}

void
IssuerCodec::encode(const Issuer &val, std::vector<uint8_t> &body)
{
    body.assign(1, val.version);
    body.insert(body.end(), val.fp.vec().begin(), val.fp.vec().end());
}

constexpr Type EmbeddedSignature::kind;

EmbeddedSignature::EmbeddedSignature(bool hashed, bool critical)
    : Raw(kind, critical ? (uint8_t) kind | 0x80 : (uint8_t) kind, hashed)
{
}

EmbeddedSignature::EmbeddedSignature(const EmbeddedSignature &src) : Raw(src)
{
    if (src.sig_) {
        sig_.reset(new Signature(*src.sig_));
    }
}

EmbeddedSignature::~EmbeddedSignature()
{
}

pgpsig_result_t
EmbeddedSignature::decode(ParseContext &ctx)
{
    if (ctx.depth >= ctx.max_depth) {
        PGPSIG_LOG("too deep embedded signature nesting: %zu", ctx.depth + 1);
        return PGPSIG_ERROR_RECURSION_LIMIT;
    }
    /* nested signature is always a complete slice of new format */
    pgp_packet_body_t          pkt(body_.data(), body_.size());
    ParseContext               nctx = ctx.nested();
    std::unique_ptr<Signature> sig(new Signature());
    pgpsig_result_t            ret = sig->parse(pkt, PGP_PKT_FORMAT_NEW, nctx);
    if (ret) {
        ctx.fail(nctx.failed());
        return ret;
    }
    sig_ = std::move(sig);
    return PGPSIG_SUCCESS;
}

void
EmbeddedSignature::set_signature(const Signature &sig)
{
    std::unique_ptr<Signature> copy(new Signature(sig));
    body_ = copy->write();
    sig_ = std::move(copy);
}

RawPtr
EmbeddedSignature::clone() const
{
    return RawPtr(new EmbeddedSignature(*this));
}

/* Build the empty subpacket object for the type octet */
static RawPtr
make_subpkt(uint8_t tag, bool hashed)
{
    bool    crit = tag & 0x80;
    uint8_t code = tag & 0x7f;
    switch (code) {
    case (uint8_t) Type::CreationTime:
        return RawPtr(new CreationTime(hashed, crit));
    case (uint8_t) Type::ExpirationTime:
        return RawPtr(new ExpirationTime(hashed, crit));
    case (uint8_t) Type::ExportableCert:
        return RawPtr(new ExportableCert(hashed, crit));
    case (uint8_t) Type::Trust:
        return RawPtr(new Trust(hashed, crit));
    case (uint8_t) Type::RegExp:
        return RawPtr(new RegExp(hashed, crit));
    case (uint8_t) Type::Revocable:
        return RawPtr(new Revocable(hashed, crit));
    case (uint8_t) Type::KeyExpirationTime:
        return RawPtr(new KeyExpirationTime(hashed, crit));
    case (uint8_t) Type::PreferredSymmetric:
        return RawPtr(new PreferredSymmetric(hashed, crit));
    case (uint8_t) Type::RevocationKey:
        return RawPtr(new RevocationKey(hashed, crit));
    case (uint8_t) Type::IssuerKeyID:
        return RawPtr(new IssuerKeyID(hashed, crit));
    case (uint8_t) Type::NotationData:
        return RawPtr(new NotationData(hashed, crit));
    case (uint8_t) Type::PreferredHash:
        return RawPtr(new PreferredHash(hashed, crit));
    case (uint8_t) Type::PreferredCompress:
        return RawPtr(new PreferredCompress(hashed, crit));
    case (uint8_t) Type::KeyserverPrefs:
        return RawPtr(new KeyserverPrefs(hashed, crit));
    case (uint8_t) Type::PreferredKeyserver:
        return RawPtr(new PreferredKeyserver(hashed, crit));
    case (uint8_t) Type::PrimaryUserID:
        return RawPtr(new PrimaryUserID(hashed, crit));
    case (uint8_t) Type::PolicyURI:
        return RawPtr(new PolicyURI(hashed, crit));
    case (uint8_t) Type::KeyFlags:
        return RawPtr(new KeyFlags(hashed, crit));
    case (uint8_t) Type::SignersUserID:
        return RawPtr(new SignersUserID(hashed, crit));
    case (uint8_t) Type::RevocationReason:
        return RawPtr(new RevocationReason(hashed, crit));
    case (uint8_t) Type::Features:
        return RawPtr(new Features(hashed, crit));
    case (uint8_t) Type::SignatureTarget:
        return RawPtr(new SignatureTarget(hashed, crit));
    case (uint8_t) Type::EmbeddedSignature:
        return RawPtr(new EmbeddedSignature(hashed, crit));
    case (uint8_t) Type::IssuerFingerprint:
        return RawPtr(new IssuerFingerprint(hashed, crit));
    case (uint8_t) Type::PreferredAEAD:
        return RawPtr(new PreferredAEAD(hashed, crit));
    default:
        break;
    }
    if (is_private_code(code)) {
        return RawPtr(new Experimental(code, hashed, crit));
    }
    return nullptr;
}

/* reserved and placeholder codes are silently kept as unknown */
static bool
is_reserved(uint8_t code)
{
    static const uint8_t reserved[] = {1, 8, 10, 13, 14, 15, 17, 18, 19};
    return std::find(std::begin(reserved), std::end(reserved), code) != std::end(reserved);
}

pgpsig_result_t
Raw::parse(const uint8_t *data, size_t size, bool hashed, ParseContext &ctx, RawPtr &res)
{
    if (!size) {
        PGPSIG_LOG("got subpacket with 0 length");
        ctx.fail("subpacket length");
        return PGPSIG_ERROR_BAD_FORMAT;
    }
    uint8_t tag = data[0];
    RawPtr  sub = make_subpkt(tag, hashed);
    if (!sub) {
        if (!is_reserved(tag & 0x7f)) {
            PGPSIG_LOG("%sunknown subpacket %" PRIu8, tag & 0x80 ? "critical " : "", tag);
        }
        /* unknown subpacket keeps the whole type octet */
        sub.reset(new Raw(Type::Unknown, tag, hashed));
    } else if (sub->critical() && (sub->kind_ >= Type::Private_100)) {
        PGPSIG_LOG("critical private subpacket %" PRIu8, sub->code());
    }
    /* body is kept verbatim, the value is decoded from it */
    sub->body_.assign(data + 1, data + size);
    pgpsig_result_t ret = sub->decode(ctx);
    if (ret) {
        const char *name = id_str_pair::lookup(sig_subpkt_type_map, tag & 0x7f);
        PGPSIG_LOG_HEX("failed to parse subpacket %s", data, size);
        PGPSIG_LOG("subpacket type: %s", name);
        ctx.fail(name);
        return ret;
    }
    res = std::move(sub);
    return PGPSIG_SUCCESS;
}

RawPtr
Raw::create(uint8_t code, bool hashed, bool critical)
{
    uint8_t tag = critical ? code | 0x80 : code;
    RawPtr  sub = make_subpkt(tag, hashed);
    return sub ? std::move(sub) : RawPtr(new Raw(Type::Unknown, tag, hashed));
}

RawPtr
Raw::create(Type type, bool hashed, bool critical)
{
    return create(static_cast<uint8_t>(type), hashed, critical);
}

List::List(const List &src)
{
    *this = src;
}

List &
List::operator=(const List &src)
{
    if (&src == this) {
        return *this;
    }
    std::vector<RawPtr> copy;
    copy.reserve(src.items.size());
    for (auto &item : src.items) {
        copy.push_back(item->clone());
    }
    items.swap(copy);
    return *this;
}

bool
List::operator==(const List &src) const
{
    if (items.size() != src.items.size()) {
        return false;
    }
    return std::equal(
      items.begin(), items.end(), src.items.begin(), [](const RawPtr &a, const RawPtr &b) {
          return (a->tag() == b->tag()) && (a->data() == b->data());
      });
}

} // namespace sigsub
} // namespace pkt
} // namespace pgp
