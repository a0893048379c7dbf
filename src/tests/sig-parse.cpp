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

#include "pgpsig_tests.h"
#include "support.h"
#include "librepgp/stream-sig.h"

using namespace pgp::pkt;
using namespace pgp::pkt::sigsub;

static const std::vector<uint8_t> ISSUER_KEYID = {
  0xF8, 0xC0, 0x8F, 0x8C, 0x1F, 0x1E, 0x2D, 0x3C};

static pgpsig_result_t
parse_sig(const std::vector<uint8_t> &data, Signature &sig, std::string &failed)
{
    pgp_packet_body_t pkt(data);
    ParseContext      ctx;
    pgpsig_result_t   ret = sig.parse(pkt, PGP_PKT_FORMAT_NEW, ctx);
    failed = ctx.failed();
    return ret;
}

TEST_F(pgpsig_tests, test_sig_parse_v4_creation_time)
{
    const std::vector<uint8_t> data = {4,    0x00, 0x02, 0x08, 0x00, 0x06, 0x05,
                                       0x02, 0x3B, 0x12, 0xAB, 0xCD, 0x00, 0x00,
                                       0xAA, 0xBB, 0x00, 0x08, 0xC5};
    Signature sig;
    assert_pgpsig_success(sig.parse(data.data(), data.size(), PGP_PKT_FORMAT_NEW));
    assert_int_equal(sig.version, PGP_V4);
    assert_int_equal(sig.type(), PGP_SIG_BINARY);
    assert_int_equal(sig.palg, PGP_PKA_RSA_ENCRYPT_ONLY);
    assert_int_equal(sig.halg, PGP_HASH_SHA256);
    assert_int_equal(sig.hashed_subpkts.size(), 1);
    assert_true(sig.hashed_subpkts[0]->type() == Type::CreationTime);
    assert_true(sig.unhashed_subpkts.empty());
    assert_int_equal(sig.creation(), 0x3B12ABCD);
    assert_int_equal(sig.lbits[0], 0xAA);
    assert_int_equal(sig.lbits[1], 0xBB);
    assert_int_equal(sig.material.mpis.size(), 1);
    assert_int_equal(sig.material.mpis[0].bits(), 8);
    assert_int_equal(sig.material.mpis[0][0], 0xC5);
    /* hashed data is the header and the hashed area */
    assert_true(sig.hashed_data == std::vector<uint8_t>(data.begin(), data.begin() + 12));
    /* serialization gives the same bytes */
    assert_true(sig.write() == data);
}

TEST_F(pgpsig_tests, test_sig_parse_v3)
{
    auto data = sig_v3_bytes(0x13, 0x5F000000, ISSUER_KEYID, 1, 2, mpi_bytes({0x01, 0x02}));
    Signature sig;
    assert_pgpsig_success(sig.parse(data.data(), data.size(), PGP_PKT_FORMAT_OLD));
    assert_int_equal(sig.version, PGP_V3);
    assert_int_equal(sig.format, PGP_PKT_FORMAT_OLD);
    assert_int_equal(sig.type(), PGP_CERT_POSITIVE);
    assert_int_equal(sig.creation(), 0x5F000000);
    assert_int_equal(sig.creation_time, 0x5F000000);
    assert_true(sig.has_keyid());
    auto keyid = sig.keyid();
    assert_true(bin_eq_hex(keyid.data(), keyid.size(), "F8C08F8C1F1E2D3C"));
    assert_int_equal(sig.palg, PGP_PKA_RSA);
    assert_int_equal(sig.halg, PGP_HASH_SHA1);
    assert_true(sig.hashed_data == std::vector<uint8_t>({0x13, 0x5F, 0x00, 0x00, 0x00}));
    assert_int_equal(sig.material.mpis.size(), 1);
    assert_int_equal(sig.material.mpis[0].bits(), 9);
    /* subpackets are not available for v3 */
    assert_false(sig.has_subpkt(Type::CreationTime, false));
    assert_throw(sig.add_subpkt(Raw::create(Type::CreationTime)));
    assert_true(sig.write() == data);

    /* v2 is parsed the same way */
    data[0] = 2;
    assert_pgpsig_success(sig.parse(data.data(), data.size(), PGP_PKT_FORMAT_OLD));
    assert_int_equal(sig.version, PGP_V2);
    assert_true(sig.write() == data);

    /* wrong hashed length */
    data[1] = 4;
    std::string failed;
    assert_int_equal(parse_sig(data, sig, failed), PGPSIG_ERROR_BAD_FORMAT);
    assert_true(failed == "hashed data length");
}

TEST_F(pgpsig_tests, test_sig_parse_versions)
{
    auto data = sig_v4_bytes(0x00, 1, 8, {}, {}, mpi_bytes({0x7F}));
    /* empty hashed area is fine */
    Signature sig;
    assert_pgpsig_success(sig.parse(data.data(), data.size(), PGP_PKT_FORMAT_NEW));
    assert_true(sig.hashed_subpkts.empty());
    assert_int_equal(sig.creation(), 0);
    assert_int_equal(sig.material.mpis[0].bits(), 7);

    /* v5 uses the same layout */
    data[0] = 5;
    assert_pgpsig_success(sig.parse(data.data(), data.size(), PGP_PKT_FORMAT_NEW));
    assert_int_equal(sig.version, PGP_V5);

    std::string failed;
    for (uint8_t ver : {0, 1, 6, 0xFF}) {
        data[0] = ver;
        assert_int_equal(parse_sig(data, sig, failed), PGPSIG_ERROR_BAD_FORMAT);
        assert_true(failed == "version");
    }
}

TEST_F(pgpsig_tests, test_sig_parse_unknown_codes)
{
    Signature   sig;
    std::string failed;
    /* hash algorithm 253 */
    auto data = sig_v4_bytes(0x00, 1, 253, {}, {}, mpi_bytes({0x01}));
    assert_int_equal(parse_sig(data, sig, failed), PGPSIG_ERROR_UNKNOWN_TAG);
    assert_true(failed == "hash algorithm");
    /* public key algorithm */
    data = sig_v4_bytes(0x00, 0xFE, 8, {}, {}, mpi_bytes({0x01}));
    assert_int_equal(parse_sig(data, sig, failed), PGPSIG_ERROR_UNKNOWN_TAG);
    assert_true(failed == "public key algorithm");
    /* signature type */
    data = sig_v4_bytes(0x05, 1, 8, {}, {}, mpi_bytes({0x01}));
    assert_int_equal(parse_sig(data, sig, failed), PGPSIG_ERROR_UNKNOWN_TAG);
    assert_true(failed == "signature type");
    /* v3 hash algorithm */
    data = sig_v3_bytes(0x00, 0, ISSUER_KEYID, 1, 253, mpi_bytes({0x01}));
    assert_int_equal(parse_sig(data, sig, failed), PGPSIG_ERROR_UNKNOWN_TAG);
    assert_true(failed == "hash algorithm");
    /* bad subpacket in the unhashed area fails the whole signature */
    data = sig_v4_bytes(0x00, 1, 8, {}, subpkt_bytes(0x0B, {0xFE}), mpi_bytes({0x01}));
    assert_int_equal(parse_sig(data, sig, failed), PGPSIG_ERROR_UNKNOWN_TAG);
    assert_true(failed == "preferred symmetric algorithms");
    /* private algorithms are accepted */
    data = sig_v4_bytes(0x00, 100, 110, {}, {}, mpi_bytes({0x01}));
    assert_pgpsig_success(parse_sig(data, sig, failed));
    assert_true(failed.empty());
    assert_int_equal(sig.material.mpis.size(), 1);
}

TEST_F(pgpsig_tests, test_sig_parse_material)
{
    Signature   sig;
    std::string failed;
    auto        two = concat({mpi_bytes({0x01, 0x02}), mpi_bytes({0x03})});
    for (uint8_t alg : {PGP_PKA_DSA, PGP_PKA_ECDSA, PGP_PKA_EDDSA}) {
        auto data = sig_v4_bytes(0x00, alg, 8, {}, {}, two);
        assert_pgpsig_success(parse_sig(data, sig, failed));
        assert_int_equal(sig.material.mpis.size(), 2);
        assert_int_equal(sig.material.mpis[1].bits(), 2);
        /* single mpi is not enough */
        data = sig_v4_bytes(0x00, alg, 8, {}, {}, mpi_bytes({0x01}));
        assert_int_equal(parse_sig(data, sig, failed), PGPSIG_ERROR_BAD_FORMAT);
        assert_true(failed == "signature value");
    }
    /* single-mpi algorithms reject the extra data */
    for (uint8_t alg : {PGP_PKA_RSA, PGP_PKA_RSA_SIGN_ONLY, PGP_PKA_ELGAMAL, PGP_PKA_ECDH}) {
        auto data = sig_v4_bytes(0x00, alg, 8, {}, {}, mpi_bytes({0x01}));
        assert_pgpsig_success(parse_sig(data, sig, failed));
        data = sig_v4_bytes(0x00, alg, 8, {}, {}, two);
        assert_int_equal(parse_sig(data, sig, failed), PGPSIG_ERROR_BAD_FORMAT);
        assert_true(failed == "signature value");
    }
    /* trailing byte */
    auto data = sig_v4_bytes(0x00, 1, 8, {}, {}, concat({mpi_bytes({0x01}), {0x00}}));
    assert_int_equal(parse_sig(data, sig, failed), PGPSIG_ERROR_BAD_FORMAT);
    /* zero-length mpi */
    data = sig_v4_bytes(0x00, 1, 8, {}, {}, {0x00, 0x00});
    assert_int_equal(parse_sig(data, sig, failed), PGPSIG_ERROR_BAD_FORMAT);
    /* too large mpi */
    data = sig_v4_bytes(0x00, 1, 8, {}, {}, {0xFF, 0xFF, 0x01});
    assert_int_equal(parse_sig(data, sig, failed), PGPSIG_ERROR_BAD_FORMAT);
    /* wrong bit count is tolerated */
    data = sig_v4_bytes(0x00, 1, 8, {}, {}, {0x00, 0x10, 0x00, 0x01});
    assert_pgpsig_success(parse_sig(data, sig, failed));
    assert_int_equal(sig.material.mpis[0].bits(), 1);
}

TEST_F(pgpsig_tests, test_sig_parse_incomplete)
{
    auto hashed = concat({subpkt_bytes(0x02, {0x3B, 0x12, 0xAB, 0xCD}),
                          subpkt_bytes(0x1B, {0x03}),
                          subpkt_bytes(0x10, ISSUER_KEYID)});
    auto unhashed = subpkt_bytes(0x1A, {'u', 'r', 'i'});
    auto data = sig_v4_bytes(
      0x18, PGP_PKA_DSA, 8, hashed, unhashed, concat({mpi_bytes({0x01}), mpi_bytes({0x02})}));

    Signature sig;
    assert_pgpsig_success(sig.parse(data.data(), data.size(), PGP_PKT_FORMAT_NEW, false));
    /* any prefix needs more data in stream mode, and is malformed otherwise */
    for (size_t len = 0; len < data.size(); len++) {
        assert_int_equal(sig.parse(data.data(), len, PGP_PKT_FORMAT_NEW, false),
                         PGPSIG_ERROR_NOT_ENOUGH_DATA);
        assert_int_equal(sig.parse(data.data(), len, PGP_PKT_FORMAT_NEW, true),
                         PGPSIG_ERROR_BAD_FORMAT);
    }

    /* short header with already invalid field never needs more data */
    struct {
        std::vector<uint8_t> data;
        pgpsig_result_t      ret;
        const char *         failed;
    } bad_heads[] = {
      {{3, 4}, PGPSIG_ERROR_BAD_FORMAT, "hashed data length"},
      {{3, 5, 0xFF}, PGPSIG_ERROR_UNKNOWN_TAG, "signature type"},
      {{2, 5, 0x00, 0x3B, 0x12, 0xAB, 0xCD, 1, 2, 3, 4, 5, 6, 7, 8, 0xFF},
       PGPSIG_ERROR_UNKNOWN_TAG,
       "public key algorithm"},
      {{3, 5, 0x00, 0x3B, 0x12, 0xAB, 0xCD, 1, 2, 3, 4, 5, 6, 7, 8, 0x01, 0xFD},
       PGPSIG_ERROR_UNKNOWN_TAG,
       "hash algorithm"},
      {{4, 0xFF}, PGPSIG_ERROR_UNKNOWN_TAG, "signature type"},
      {{4, 0x00, 0xFF}, PGPSIG_ERROR_UNKNOWN_TAG, "public key algorithm"},
      {{5, 0x00, 0x01, 0xFD}, PGPSIG_ERROR_UNKNOWN_TAG, "hash algorithm"},
    };
    for (auto &head : bad_heads) {
        ParseContext      ctx;
        pgp_packet_body_t pkt(head.data, false);
        assert_int_equal(sig.parse(pkt, PGP_PKT_FORMAT_NEW, ctx), head.ret);
        assert_true(ctx.failed() == head.failed);
    }
    /* valid but short header still waits for data */
    std::vector<uint8_t> head = {3, 5, 0x00, 0x3B};
    assert_int_equal(sig.parse(head.data(), head.size(), PGP_PKT_FORMAT_NEW, false),
                     PGPSIG_ERROR_NOT_ENOUGH_DATA);
    head = {4, 0x00, 0x01};
    assert_int_equal(sig.parse(head.data(), head.size(), PGP_PKT_FORMAT_NEW, false),
                     PGPSIG_ERROR_NOT_ENOUGH_DATA);

    /* subpacket which overruns its area is malformed even in stream mode */
    auto bad = sig_v4_bytes(0x00, 1, 8, {0x05, 0x02, 0x00, 0x00}, {}, mpi_bytes({0x01}));
    assert_int_equal(sig.parse(bad.data(), bad.size(), PGP_PKT_FORMAT_NEW, false),
                     PGPSIG_ERROR_BAD_FORMAT);
    /* as well as truncated subpacket length */
    bad = sig_v4_bytes(0x00, 1, 8, {0xC3}, {}, mpi_bytes({0x01}));
    assert_int_equal(sig.parse(bad.data(), bad.size(), PGP_PKT_FORMAT_NEW, false),
                     PGPSIG_ERROR_BAD_FORMAT);
    /* zero-length subpacket */
    bad = sig_v4_bytes(0x00, 1, 8, {0x00}, {}, mpi_bytes({0x01}));
    assert_int_equal(sig.parse(bad.data(), bad.size(), PGP_PKT_FORMAT_NEW, false),
                     PGPSIG_ERROR_BAD_FORMAT);

    assert_int_equal(sig.parse(NULL, 10, PGP_PKT_FORMAT_NEW), PGPSIG_ERROR_NULL_POINTER);
}

TEST_F(pgpsig_tests, test_sig_parse_subpacket_lengths)
{
    /* two-octet length */
    std::vector<uint8_t> value(300, 'v');
    std::vector<uint8_t> notation = {0x80, 0x00, 0x00, 0x00, 0x00, 0x01, 0x01, 0x2C, 'n'};
    notation.insert(notation.end(), value.begin(), value.end());
    auto sub = subpkt_bytes(0x14, notation);
    assert_true(sub[0] >= 192);
    assert_true(sub[0] < 255);
    /* five-octet length */
    std::vector<uint8_t> ctime = {0xFF, 0x00, 0x00, 0x00, 0x05, 0x02, 0x01, 0x02, 0x03, 0x04};

    auto data = sig_v4_bytes(0x00, 1, 8, concat({sub, ctime}), {}, mpi_bytes({0x01}));
    Signature   sig;
    std::string failed;
    assert_pgpsig_success(parse_sig(data, sig, failed));
    assert_int_equal(sig.hashed_subpkts.size(), 2);
    auto nd = dynamic_cast<const NotationData *>(sig.get_subpkt(Type::NotationData));
    assert_non_null(nd);
    assert_int_equal(nd->value().value.size(), 300);
    assert_true(nd->value().name == "n");
    assert_int_equal(sig.creation(), 0x01020304);
    /* parsed hashed data is written as is */
    assert_true(sig.write() == data);
    /* rebuilt one uses the shortest length encoding */
    sig.fill_hashed_data();
    auto written = sig.write();
    assert_int_equal(written.size(), data.size() - 4);
    assert_pgpsig_success(parse_sig(written, sig, failed));
    assert_int_equal(sig.creation(), 0x01020304);
}

TEST_F(pgpsig_tests, test_sig_parse_subpackets_limit)
{
    std::vector<uint8_t> hashed;
    for (int i = 0; i < DEFAULT_MAX_SUBPACKETS; i++) {
        hashed = concat({hashed, subpkt_bytes(0x1B, {0x01})});
    }
    auto data = sig_v4_bytes(0x00, 1, 8, hashed, {}, mpi_bytes({0x01}));

    Signature   sig;
    std::string failed;
    assert_pgpsig_success(parse_sig(data, sig, failed));
    assert_int_equal(sig.hashed_subpkts.size(), DEFAULT_MAX_SUBPACKETS);

    /* one more in the unhashed area */
    data = sig_v4_bytes(0x00, 1, 8, hashed, subpkt_bytes(0x1B, {0x01}), mpi_bytes({0x01}));
    assert_int_equal(parse_sig(data, sig, failed), PGPSIG_ERROR_BAD_FORMAT);
    assert_true(failed == "subpackets number");

    /* custom limit */
    pgp_packet_body_t pkt(sig_v4_bytes(0x00, 1, 8, hashed, {}, mpi_bytes({0x01})));
    ParseContext      ctx;
    ctx.max_subpackets = 2;
    assert_int_equal(sig.parse(pkt, PGP_PKT_FORMAT_NEW, ctx), PGPSIG_ERROR_BAD_FORMAT);
}

TEST_F(pgpsig_tests, test_sig_accessors)
{
    auto fp20 = pgpsig::hex_to_bin("7D0BC10E933404C9A0E4D7E2F8C08F8C1F1E2D3C");
    auto hashed = concat({subpkt_bytes(0x02, {0x00, 0x00, 0x10, 0x00}),
                          subpkt_bytes(0x03, {0x00, 0x00, 0x00, 0x64}),
                          subpkt_bytes(0x09, {0x00, 0x01, 0x00, 0x00}),
                          subpkt_bytes(0x1B, {0x0C}),
                          subpkt_bytes(0x19, {0x01}),
                          subpkt_bytes(0x07, {0x00}),
                          subpkt_bytes(0x21, concat({{0x04}, fp20}))});
    auto unhashed = concat({subpkt_bytes(0x1A, {'a'}), subpkt_bytes(0x1A, {'b'})});
    auto data = sig_v4_bytes(0x13, 1, 8, hashed, unhashed, mpi_bytes({0x01}));

    Signature   sig;
    std::string failed;
    assert_pgpsig_success(parse_sig(data, sig, failed));
    assert_int_equal(sig.creation(), 0x1000);
    assert_int_equal(sig.expiration(), 100);
    assert_int_equal(sig.key_expiration(), 0x10000);
    assert_int_equal(sig.key_flags(), PGP_KF_ENCRYPT);
    assert_true(sig.primary_uid());
    assert_false(sig.revocable());
    assert_null(sig.embedded_sig());

    /* key id is taken from the issuer fingerprint */
    assert_false(sig.has_subpkt(Type::IssuerKeyID, false));
    assert_true(sig.has_keyfp());
    assert_true(sig.keyfp().vec() == fp20);
    assert_true(sig.has_keyid());
    auto keyid = sig.keyid();
    assert_true(bin_eq_hex(keyid.data(), keyid.size(), "F8C08F8C1F1E2D3C"));

    /* hashed-only lookup and skip */
    assert_false(sig.has_subpkt(Type::PolicyURI));
    assert_true(sig.has_subpkt(Type::PolicyURI, false));
    size_t first = sig.find_subpkt(Type::PolicyURI, false);
    size_t second = sig.find_subpkt(Type::PolicyURI, false, 1);
    assert_int_equal(first, 7);
    assert_int_equal(second, 8);
    assert_int_equal(sig.find_subpkt(Type::PolicyURI, false, 2), SIZE_MAX);
    auto uri = dynamic_cast<const PolicyURI *>(sig.get_subpkt(Type::PolicyURI, false));
    assert_non_null(uri);
    assert_true(uri->value() == "a");

    /* v5 signature needs 32-byte fingerprint */
    data[0] = 5;
    assert_pgpsig_success(parse_sig(data, sig, failed));
    assert_false(sig.has_keyfp());
}

TEST_F(pgpsig_tests, test_sig_build_write)
{
    Signature sig;
    sig.version = PGP_V4;
    sig.set_type(PGP_SIG_SUBKEY);
    sig.palg = PGP_PKA_EDDSA;
    sig.halg = PGP_HASH_SHA512;

    std::unique_ptr<CreationTime> ctime(new CreationTime());
    ctime->set_value(1600000000);
    sig.add_subpkt(std::move(ctime));
    std::unique_ptr<KeyFlags> flags(new KeyFlags());
    flags->set_value({PGP_KF_SIGN});
    sig.add_subpkt(std::move(flags));
    std::unique_ptr<IssuerKeyID> issuer(new IssuerKeyID(false));
    pgp::KeyID                   keyid{};
    memcpy(keyid.data(), ISSUER_KEYID.data(), keyid.size());
    issuer->set_value(keyid);
    sig.add_subpkt(std::move(issuer));
    /* replace the existing one */
    std::unique_ptr<KeyFlags> flags2(new KeyFlags());
    flags2->set_value({PGP_KF_CERTIFY});
    sig.add_subpkt(std::move(flags2), true);
    assert_int_equal(sig.hashed_subpkts.size(), 2);
    assert_int_equal(sig.unhashed_subpkts.size(), 1);

    sig.lbits = {0x12, 0x34};
    sig.material.alg = sig.palg;
    /* wrong number of mpis */
    assert_throw(sig.write());
    pgp::mpi r, s;
    r.assign(ISSUER_KEYID.data(), 8);
    s.assign(ISSUER_KEYID.data(), 4);
    sig.material.mpis = {r, s};

    sig.fill_hashed_data();
    auto data = sig.write();

    Signature   parsed;
    std::string failed;
    assert_pgpsig_success(parse_sig(data, parsed, failed));
    assert_true(parsed == sig);
    assert_int_equal(parsed.creation(), 1600000000);
    assert_int_equal(parsed.key_flags(), PGP_KF_CERTIFY);
    assert_true(bin_eq_hex(parsed.keyid().data(), parsed.keyid().size(), "F8C08F8C1F1E2D3C"));
    assert_true(parsed.hashed_data == sig.hashed_data);

    /* copies are deep and equal */
    Signature copy(parsed);
    assert_true(copy == parsed);
    copy.material.mpis.pop_back();
    assert_true(copy != parsed);

    Signature empty;
    assert_throw(empty.write());
}
