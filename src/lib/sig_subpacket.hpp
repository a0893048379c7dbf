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

#ifndef PGPSIG_SIG_SUBPACKET_HPP_
#define PGPSIG_SIG_SUBPACKET_HPP_

#include <cstdint>
#include <vector>
#include <string>
#include <memory>
#include <array>
#include "fingerprint.hpp"
#include "types.h"
#include "pgp-def.hpp"

namespace pgp {
namespace pkt {

class Signature;
class ParseContext;

namespace sigsub {

/* Subpacket type codes, without the critical bit */
enum class Type : uint8_t {
    Unknown = 0,
    CreationTime = 2,
    ExpirationTime = 3,
    ExportableCert = 4,
    Trust = 5,
    RegExp = 6,
    Revocable = 7,
    KeyExpirationTime = 9,
    Placeholder = 10,
    PreferredSymmetric = 11,
    RevocationKey = 12,
    IssuerKeyID = 16,
    NotationData = 20,
    PreferredHash = 21,
    PreferredCompress = 22,
    KeyserverPrefs = 23,
    PreferredKeyserver = 24,
    PrimaryUserID = 25,
    PolicyURI = 26,
    KeyFlags = 27,
    SignersUserID = 28,
    RevocationReason = 29,
    Features = 30,
    SignatureTarget = 31,
    EmbeddedSignature = 32,
    IssuerFingerprint = 33,
    PreferredAEAD = 34,
    Private_100 = 100,
    Private_110 = 110
};

class Raw;
using RawPtr = std::unique_ptr<Raw>;

/**
 * @brief Single signature subpacket. Body is always kept in the wire form: verbatim for the
 *        parsed subpackets, re-encoded on each change for the built ones. Subpackets of the
 *        unknown types are represented by the Raw itself.
 */
class Raw {
  protected:
    Type                 kind_;
    uint8_t              tag_;
    bool                 hashed_;
    std::vector<uint8_t> body_;

    Raw(Type kind, uint8_t tag, bool hashed) : kind_(kind), tag_(tag), hashed_(hashed)
    {
    }

    /* fill the typed value from body_ */
    virtual pgpsig_result_t
    decode(ParseContext &)
    {
        return PGPSIG_SUCCESS;
    }

  public:
    virtual ~Raw()
    {
    }

    Type
    type() const noexcept
    {
        return kind_;
    }

    /* type code. Unknown subpackets keep the whole octet, including the critical bit. */
    uint8_t
    code() const noexcept
    {
        return kind_ == Type::Unknown ? tag_ : tag_ & 0x7f;
    }

    /* type octet as it goes to the wire */
    uint8_t
    tag() const noexcept
    {
        return tag_;
    }

    bool
    critical() const noexcept
    {
        return tag_ & 0x80;
    }

    bool
    hashed() const noexcept
    {
        return hashed_;
    }

    const std::vector<uint8_t> &
    data() const noexcept
    {
        return body_;
    }

    virtual RawPtr
    clone() const
    {
        return RawPtr(new Raw(*this));
    }

    /**
     * @brief Parse subpacket, starting from the type octet.
     * @param data subpacket contents, without the length.
     * @param size number of bytes in data, must be non-zero.
     * @param hashed area of the subpacket.
     * @param ctx parse context, failed field name is recorded there.
     * @param res parsed subpacket.
     */
    static pgpsig_result_t parse(
      const uint8_t *data, size_t size, bool hashed, ParseContext &ctx, RawPtr &res);

    static RawPtr create(Type type, bool hashed = true, bool critical = false);
    static RawPtr create(uint8_t code, bool hashed = true, bool critical = false);
};

/* Typed subpacket, value is converted to and from the body by the Codec */
template <Type K, typename Codec> class Field : public Raw {
  public:
    typedef typename Codec::value_type value_type;

  private:
    value_type value_;

  protected:
    pgpsig_result_t
    decode(ParseContext &) override
    {
        return Codec::decode(body_.data(), body_.size(), value_);
    }

  public:
    static constexpr Type kind = K;

    explicit Field(bool hashed = true, bool critical = false)
        : Raw(K, static_cast<uint8_t>(K) | (critical ? 0x80 : 0), hashed),
          value_(Codec::initial())
    {
        Codec::encode(value_, body_);
    }

    const value_type &
    value() const noexcept
    {
        return value_;
    }

    void
    set_value(const value_type &val)
    {
        Codec::encode(val, body_);
        value_ = val;
    }

    RawPtr
    clone() const override
    {
        return RawPtr(new Field(*this));
    }
};

template <Type K, typename Codec> constexpr Type Field<K, Codec>::kind;

/* Four-octet time: seconds since epoch or since the creation */
struct TimeCodec {
    typedef uint32_t value_type;
    static uint32_t
    initial()
    {
        return 0;
    }
    static pgpsig_result_t decode(const uint8_t *data, size_t size, uint32_t &val);
    static void            encode(uint32_t val, std::vector<uint8_t> &body);
};

pgpsig_result_t decode_flag(const uint8_t *data, size_t size, bool &val);

/* Single octet flag, only 1 means true */
template <bool Default> struct FlagCodec {
    typedef bool value_type;
    static bool
    initial()
    {
        return Default;
    }
    static pgpsig_result_t
    decode(const uint8_t *data, size_t size, bool &val)
    {
        return decode_flag(data, size, val);
    }
    static void
    encode(bool val, std::vector<uint8_t> &body)
    {
        body.assign(1, val ? 1 : 0);
    }
};

pgpsig_result_t decode_text(const uint8_t *data, size_t size, bool strict, std::string &val);

/* Strict text must be valid UTF-8, other one is decoded with replacement characters */
template <bool Strict> struct TextCodec {
    typedef std::string value_type;
    static std::string
    initial()
    {
        return std::string();
    }
    static pgpsig_result_t
    decode(const uint8_t *data, size_t size, std::string &val)
    {
        return decode_text(data, size, Strict, val);
    }
    static void
    encode(const std::string &val, std::vector<uint8_t> &body)
    {
        body.assign(val.begin(), val.end());
    }
};

/* Bit flags of any length */
struct OctetsCodec {
    typedef std::vector<uint8_t> value_type;
    static value_type
    initial()
    {
        return value_type();
    }
    static pgpsig_result_t
    decode(const uint8_t *data, size_t size, value_type &val)
    {
        val.assign(data, data + size);
        return PGPSIG_SUCCESS;
    }
    static void
    encode(const value_type &val, std::vector<uint8_t> &body)
    {
        body = val;
    }
};

pgpsig_result_t decode_algs(const uint8_t *       data,
                            size_t                size,
                            bool (*known)(uint8_t),
                            std::vector<uint8_t> &val);

/* Ordered list of algorithm codes, each must be known to the Known check */
template <bool (*Known)(uint8_t)> struct AlgsCodec : OctetsCodec {
    static pgpsig_result_t
    decode(const uint8_t *data, size_t size, value_type &val)
    {
        return decode_algs(data, size, Known, val);
    }
};

struct KeyIDCodec {
    typedef KeyID value_type;
    static KeyID
    initial()
    {
        return KeyID{};
    }
    static pgpsig_result_t decode(const uint8_t *data, size_t size, KeyID &val);
    static void            encode(const KeyID &val, std::vector<uint8_t> &body);
};

struct TrustLevel {
    uint8_t level;
    uint8_t amount;
};

struct TrustCodec {
    typedef TrustLevel value_type;
    static TrustLevel
    initial()
    {
        return TrustLevel{0, 0};
    }
    static pgpsig_result_t decode(const uint8_t *data, size_t size, TrustLevel &val);
    static void            encode(const TrustLevel &val, std::vector<uint8_t> &body);
};

struct Revoker {
    uint8_t          rev_class;
    pgp_pubkey_alg_t alg;
    Fingerprint      fp;

    /* key version, derived from the fingerprint size */
    pgp_version_t key_version() const noexcept;
};

struct RevokerCodec {
    typedef Revoker value_type;
    static Revoker
    initial()
    {
        return Revoker{PGP_REVOKER_CLASS_DEFAULT, PGP_PKA_NOTHING, Fingerprint()};
    }
    static pgpsig_result_t decode(const uint8_t *data, size_t size, Revoker &val);
    static void            encode(const Revoker &val, std::vector<uint8_t> &body);
};

struct Notation {
    std::array<uint8_t, 4> flags;
    std::string            name;
    std::vector<uint8_t>   value;

    bool
    human_readable() const noexcept
    {
        return flags[0] & PGP_NOTATION_HUMAN_READABLE;
    }
    /* value as text, invalid UTF-8 is replaced */
    std::string text() const;
};

struct NotationCodec {
    typedef Notation value_type;
    static Notation
    initial()
    {
        return Notation{{{0, 0, 0, 0}}, std::string(), std::vector<uint8_t>()};
    }
    static pgpsig_result_t decode(const uint8_t *data, size_t size, Notation &val);
    /* throws on name or value longer than 0xffff */
    static void encode(const Notation &val, std::vector<uint8_t> &body);
};

struct Reason {
    pgp_revocation_type_t code;
    std::string           text;
};

struct ReasonCodec {
    typedef Reason value_type;
    static Reason
    initial()
    {
        return Reason{PGP_REVOCATION_NO_REASON, std::string()};
    }
    static pgpsig_result_t decode(const uint8_t *data, size_t size, Reason &val);
    static void            encode(const Reason &val, std::vector<uint8_t> &body);
};

struct Target {
    pgp_pubkey_alg_t     alg;
    pgp_hash_alg_t       halg;
    std::vector<uint8_t> hash;
};

struct TargetCodec {
    typedef Target value_type;
    static Target
    initial()
    {
        return Target{PGP_PKA_NOTHING, PGP_HASH_UNKNOWN, std::vector<uint8_t>()};
    }
    static pgpsig_result_t decode(const uint8_t *data, size_t size, Target &val);
    static void            encode(const Target &val, std::vector<uint8_t> &body);
};

struct Issuer {
    uint8_t     version;
    Fingerprint fp;
};

struct IssuerCodec {
    typedef Issuer value_type;
    static Issuer
    initial()
    {
        return Issuer{PGP_V4, Fingerprint()};
    }
    static pgpsig_result_t decode(const uint8_t *data, size_t size, Issuer &val);
    static void            encode(const Issuer &val, std::vector<uint8_t> &body);
};

using CreationTime = Field<Type::CreationTime, TimeCodec>;
using ExpirationTime = Field<Type::ExpirationTime, TimeCodec>;
using KeyExpirationTime = Field<Type::KeyExpirationTime, TimeCodec>;
using ExportableCert = Field<Type::ExportableCert, FlagCodec<true>>;
using Revocable = Field<Type::Revocable, FlagCodec<true>>;
using PrimaryUserID = Field<Type::PrimaryUserID, FlagCodec<false>>;
using Trust = Field<Type::Trust, TrustCodec>;
using RegExp = Field<Type::RegExp, TextCodec<false>>;
using PolicyURI = Field<Type::PolicyURI, TextCodec<false>>;
using PreferredKeyserver = Field<Type::PreferredKeyserver, TextCodec<true>>;
using SignersUserID = Field<Type::SignersUserID, TextCodec<true>>;
using PreferredSymmetric = Field<Type::PreferredSymmetric, AlgsCodec<symm_alg_known>>;
using PreferredHash = Field<Type::PreferredHash, AlgsCodec<hash_alg_known>>;
using PreferredCompress = Field<Type::PreferredCompress, AlgsCodec<z_alg_known>>;
using PreferredAEAD = Field<Type::PreferredAEAD, AlgsCodec<aead_alg_known>>;
using KeyserverPrefs = Field<Type::KeyserverPrefs, OctetsCodec>;
using KeyFlags = Field<Type::KeyFlags, OctetsCodec>;
using Features = Field<Type::Features, OctetsCodec>;
using IssuerKeyID = Field<Type::IssuerKeyID, KeyIDCodec>;
using RevocationKey = Field<Type::RevocationKey, RevokerCodec>;
using NotationData = Field<Type::NotationData, NotationCodec>;
using RevocationReason = Field<Type::RevocationReason, ReasonCodec>;
using SignatureTarget = Field<Type::SignatureTarget, TargetCodec>;
using IssuerFingerprint = Field<Type::IssuerFingerprint, IssuerCodec>;

/* Signature inside of the subpacket, parsed with one more nesting level */
class EmbeddedSignature : public Raw {
    std::unique_ptr<Signature> sig_;

  protected:
    pgpsig_result_t decode(ParseContext &ctx) override;

  public:
    static constexpr Type kind = Type::EmbeddedSignature;

    explicit EmbeddedSignature(bool hashed = true, bool critical = false);
    EmbeddedSignature(const EmbeddedSignature &src);
    ~EmbeddedSignature();

    const Signature *
    signature() const noexcept
    {
        return sig_.get();
    }
    /* body is the serialized signature */
    void   set_signature(const Signature &sig);
    RawPtr clone() const override;
};

/* Subpacket of the private range 100..110, body is opaque */
class Experimental : public Raw {
  public:
    Experimental(uint8_t code, bool hashed = true, bool critical = false)
        : Raw(static_cast<Type>(code), critical ? code | 0x80 : code, hashed)
    {
    }

    void
    set_data(const std::vector<uint8_t> &data)
    {
        body_ = data;
    }

    RawPtr
    clone() const override
    {
        return RawPtr(new Experimental(*this));
    }
};

/* Subpackets of a single area, in the wire order */
class List {
  public:
    std::vector<RawPtr> items;

    List()
    {
    }
    List(const List &src);
    List(List &&src) = default;
    List &operator=(const List &src);
    List &operator=(List &&src) = default;

    /* same type octets and bodies in the same order */
    bool operator==(const List &src) const;
    bool
    operator!=(const List &src) const
    {
        return !(*this == src);
    }

    size_t
    size() const noexcept
    {
        return items.size();
    }
    bool
    empty() const noexcept
    {
        return items.empty();
    }
    const RawPtr &
    operator[](size_t idx) const
    {
        return items[idx];
    }
};

} // namespace sigsub
} // namespace pkt
} // namespace pgp

#endif
