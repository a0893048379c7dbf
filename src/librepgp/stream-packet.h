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

#ifndef STREAM_PACKET_H_
#define STREAM_PACKET_H_

#include <stdint.h>
#include <string>
#include <vector>
#include "types.h"
#include "defaults.h"
#include "fingerprint.hpp"
#include "crypto/mpi.hpp"

namespace pgp {
namespace pkt {
class Signature;

/**
 * @brief Limits and state of a single parse call. Each embedded signature gets its own
 *        copy, one level deeper.
 */
class ParseContext {
    std::string failed_;

  public:
    size_t max_depth;      /* maximum nesting of embedded signatures */
    size_t max_subpackets; /* maximum number of subpackets per signature */
    size_t depth;          /* 0 for the top-level signature */

    ParseContext()
        : max_depth(DEFAULT_MAX_EMBEDDED_DEPTH), max_subpackets(DEFAULT_MAX_SUBPACKETS),
          depth(0){};

    ParseContext nested() const;

    /* record the failed field or subpacket name, the first one wins */
    void fail(const std::string &what);

    const std::string &
    failed() const noexcept
    {
        return failed_;
    }
};

} // namespace pkt
} // namespace pgp

/**
 * @brief Signature body bytes with a read cursor. Reads are bounds-checked; running out of
 *        data in the incomplete body means that caller should supply more input.
 */
typedef struct pgp_packet_body_t {
  private:
    std::vector<uint8_t> data_;
    size_t               pos_{};
    bool                 complete_;
    bool                 short_{};

  public:
    /* empty body for writing */
    pgp_packet_body_t();
    /**
     * @param complete false if data may be only a prefix of the signature body.
     */
    pgp_packet_body_t(const uint8_t *data, size_t len, bool complete = true);
    pgp_packet_body_t(const std::vector<uint8_t> &data, bool complete = true);

    pgp_packet_body_t(const pgp_packet_body_t &src) = delete;
    pgp_packet_body_t &operator=(const pgp_packet_body_t &) = delete;

    const uint8_t *
    data() const noexcept
    {
        return data_.data();
    }
    size_t
    size() const noexcept
    {
        return data_.size();
    }
    size_t
    left() const noexcept
    {
        return data_.size() - pos_;
    }

    /**
     * @brief Error for the failed read: PGPSIG_ERROR_NOT_ENOUGH_DATA when the end of the
     *        incomplete body was hit, PGPSIG_ERROR_BAD_FORMAT for everything else.
     */
    pgpsig_result_t read_error() const noexcept;

    /* next len bytes, consumed. nullptr if there are less bytes left. */
    const uint8_t *view(size_t len) noexcept;

    /* big-endian reads, false if data is not available */
    bool get(uint8_t &val) noexcept;
    bool get(uint16_t &val) noexcept;
    bool get(uint32_t &val) noexcept;
    bool get(uint8_t *val, size_t len) noexcept;
    bool get(std::vector<uint8_t> &val, size_t len);
    bool get(pgp::KeyID &val) noexcept;
    /* also false for the empty or too large mpi, which is not a short read */
    bool get(pgp::mpi &val) noexcept;
    /* subpacket length in 1, 2 or 5 octets */
    bool get_subpkt_len(size_t &val) noexcept;

    void add(const void *data, size_t len);
    void add(const std::vector<uint8_t> &data);
    void add_byte(uint8_t bt);
    void add_uint16(uint16_t val);
    void add_uint32(uint32_t val);
    void add(const pgp::KeyID &val);
    /* bit count and the value without leading zeroes, throws on empty or too large one */
    void add(const pgp::mpi &val);
    void add_subpkt_len(size_t len);
    /* subpackets area of the signature, with the two-octet length */
    void add_subpackets(const pgp::pkt::Signature &sig, bool hashed);
} pgp_packet_body_t;

/**
 * @brief Encode subpacket length in the shortest form.
 * @param buf output buffer, must have room for 5 bytes.
 * @return number of bytes written.
 */
size_t write_packet_len(uint8_t *buf, size_t len);

/**
 * @brief Decode subpacket length.
 * @param lenlen number of length octets on success.
 * @return false if buf is too short for the length encoding.
 */
bool read_packet_len(const uint8_t *buf, size_t buflen, size_t &len, size_t &lenlen);

#endif
