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
#include "stream-packet.h"
#include "stream-sig.h"
#include "utils.h"
#include "logging.h"

/* 192..8383 are encoded in two octets, with the 192 offset */
#define PGP_SUBPKT_LEN_2OCT_MIN 192
#define PGP_SUBPKT_LEN_2OCT_MAX 8383

size_t
write_packet_len(uint8_t *buf, size_t len)
{
    if (len < PGP_SUBPKT_LEN_2OCT_MIN) {
        buf[0] = (uint8_t) len;
        return 1;
    }
    if (len <= PGP_SUBPKT_LEN_2OCT_MAX) {
        size_t off = len - PGP_SUBPKT_LEN_2OCT_MIN;
        buf[0] = (uint8_t)((off >> 8) + PGP_SUBPKT_LEN_2OCT_MIN);
        buf[1] = (uint8_t) off;
        return 2;
    }
    buf[0] = 0xff;
    write_uint32(buf + 1, (uint32_t) len);
    return 5;
}

bool
read_packet_len(const uint8_t *buf, size_t buflen, size_t &len, size_t &lenlen)
{
    size_t need = 1;
    if (buflen && (buf[0] >= PGP_SUBPKT_LEN_2OCT_MIN)) {
        need = buf[0] == 0xff ? 5 : 2;
    }
    if (buflen < need) {
        return false;
    }
    switch (need) {
    case 1:
        len = buf[0];
        break;
    case 2:
        len = ((size_t)(buf[0] - PGP_SUBPKT_LEN_2OCT_MIN) << 8) + buf[1] +
              PGP_SUBPKT_LEN_2OCT_MIN;
        break;
    default:
        len = read_uint32(buf + 1);
    }
    lenlen = need;
    return true;
}

namespace pgp {
namespace pkt {

ParseContext
ParseContext::nested() const
{
    ParseContext res;
    res.max_depth = max_depth;
    res.max_subpackets = max_subpackets;
    res.depth = depth + 1;
    return res;
}

void
ParseContext::fail(const std::string &what)
{
    if (failed_.empty()) {
        failed_ = what;
    }
}

} // namespace pkt
} // namespace pgp

pgp_packet_body_t::pgp_packet_body_t() : complete_(true)
{
}

pgp_packet_body_t::pgp_packet_body_t(const uint8_t *data, size_t len, bool complete)
    : data_(data, data + len), complete_(complete)
{
}

pgp_packet_body_t::pgp_packet_body_t(const std::vector<uint8_t> &data, bool complete)
    : data_(data), complete_(complete)
{
}

pgpsig_result_t
pgp_packet_body_t::read_error() const noexcept
{
    return short_ && !complete_ ? PGPSIG_ERROR_NOT_ENOUGH_DATA : PGPSIG_ERROR_BAD_FORMAT;
}

const uint8_t *
pgp_packet_body_t::view(size_t len) noexcept
{
    if (len > left()) {
        short_ = true;
        return nullptr;
    }
    const uint8_t *res = data_.data() + pos_;
    pos_ += len;
    return res;
}

bool
pgp_packet_body_t::get(uint8_t &val) noexcept
{
    const uint8_t *src = view(1);
    if (src) {
        val = *src;
    }
    return src;
}

bool
pgp_packet_body_t::get(uint16_t &val) noexcept
{
    const uint8_t *src = view(2);
    if (src) {
        val = read_uint16(src);
    }
    return src;
}

bool
pgp_packet_body_t::get(uint32_t &val) noexcept
{
    const uint8_t *src = view(4);
    if (src) {
        val = read_uint32(src);
    }
    return src;
}

bool
pgp_packet_body_t::get(uint8_t *val, size_t len) noexcept
{
    const uint8_t *src = view(len);
    if (src && len) {
        memcpy(val, src, len);
    }
    return src;
}

bool
pgp_packet_body_t::get(std::vector<uint8_t> &val, size_t len)
{
    const uint8_t *src = view(len);
    if (src) {
        val.assign(src, src + len);
    }
    return src;
}

bool
pgp_packet_body_t::get(pgp::KeyID &val) noexcept
{
    return get(val.data(), val.size());
}

bool
pgp_packet_body_t::get(pgp::mpi &val) noexcept
{
    uint16_t bits = 0;
    if (!get(bits)) {
        return false;
    }
    size_t len = BITS_TO_BYTES(bits);
    if (!len || (len > PGP_MPINT_SIZE)) {
        PGPSIG_LOG("wrong mpi bit count: %" PRIu16, bits);
        return false;
    }
    const uint8_t *src = view(len);
    if (!src) {
        PGPSIG_LOG("not enough data for %zu bytes mpi", len);
        return false;
    }
    try {
        val.assign(src, len);
    } catch (const std::exception &e) {
        PGPSIG_LOG("%s", e.what());
        return false;
    }
    /* mismatch is tolerated, real value is used */
    if (val.bits() != bits) {
        PGPSIG_LOG("Warning! mpi has %zu bits instead of %" PRIu16, val.bits(), bits);
    }
    return true;
}

bool
pgp_packet_body_t::get_subpkt_len(size_t &val) noexcept
{
    size_t lenlen = 0;
    if (!read_packet_len(data_.data() + pos_, left(), val, lenlen)) {
        short_ = true;
        return false;
    }
    pos_ += lenlen;
    return true;
}

void
pgp_packet_body_t::add(const void *data, size_t len)
{
    auto bytes = static_cast<const uint8_t *>(data);
    data_.insert(data_.end(), bytes, bytes + len);
}

void
pgp_packet_body_t::add(const std::vector<uint8_t> &data)
{
    data_.insert(data_.end(), data.begin(), data.end());
}

void
pgp_packet_body_t::add_byte(uint8_t bt)
{
    data_.push_back(bt);
}

void
pgp_packet_body_t::add_uint16(uint16_t val)
{
    data_.push_back(val >> 8);
    data_.push_back(val & 0xff);
}

void
pgp_packet_body_t::add_uint32(uint32_t val)
{
    add_uint16(val >> 16);
    add_uint16(val & 0xffff);
}

void
pgp_packet_body_t::add(const pgp::KeyID &val)
{
    data_.insert(data_.end(), val.begin(), val.end());
}

void
pgp_packet_body_t::add(const pgp::mpi &val)
{
    size_t bits = val.bits();
    /* zero value would not be read back */
    if (!bits || (bits > PGP_MPINT_BITS)) {
        PGPSIG_LOG("cannot write mpi of %zu bits", bits);
        throw pgpsig::pgpsig_exception(PGPSIG_ERROR_BAD_PARAMETERS);
    }
    size_t len = BITS_TO_BYTES(bits);
    add_uint16(bits);
    add(val.data() + val.size() - len, len);
}

void
pgp_packet_body_t::add_subpkt_len(size_t len)
{
    uint8_t buf[5];
    add(buf, write_packet_len(buf, len));
}

void
pgp_packet_body_t::add_subpackets(const pgp::pkt::Signature &sig, bool hashed)
{
    pgp_packet_body_t area;
    for (auto &sub : (hashed ? sig.hashed_subpkts : sig.unhashed_subpkts).items) {
        area.add_subpkt_len(sub->data().size() + 1);
        area.add_byte(sub->tag());
        area.add(sub->data());
    }
    if (area.size() > PGP_MAX_SUBPACKETS_AREA) {
        PGPSIG_LOG("subpackets area is too large: %zu", area.size());
        throw pgpsig::pgpsig_exception(PGPSIG_ERROR_BAD_PARAMETERS);
    }
    add_uint16(area.size());
    add(area.data_);
}
