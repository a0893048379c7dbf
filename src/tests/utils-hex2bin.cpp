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
#include "fingerprint.hpp"
#include "str-utils.h"
#include "crypto/mem.h"

TEST_F(pgpsig_tests, test_utils_hex2bin)
{
    const std::vector<uint8_t> feed = {0xfe, 0xed, 0xbe, 0xef};
    // with 0x prefix
    assert_true(pgpsig::hex_to_bin("0xfeedbeef") == feed);
    // without 0x prefix, capital
    assert_true(pgpsig::hex_to_bin("FEEDBEEF") == feed);
    // keyid with spaces
    auto keyid = pgpsig::hex_to_bin("4be1 47bb 22df 1e60");
    assert_int_equal(keyid.size(), PGP_KEY_ID_SIZE);
    assert_true(bin_eq_hex(keyid.data(), keyid.size(), "4BE147BB22DF1E60"));
    // wrong hex chars
    assert_true(pgpsig::hex_to_bin("0xYY").empty());
    assert_true(pgpsig::hex_to_bin("zz").empty());
    assert_true(pgpsig::hex_to_bin("").empty());

    // encoding
    uint8_t buf[2] = {0xAB, 0xCD};
    assert_true(pgpsig::bin_to_hex(buf, 2) == "ABCD");
    assert_true(pgpsig::bin_to_hex(buf, 2, pgpsig::HexFormat::Lowercase) == "abcd");
    assert_true(pgpsig::bin_to_hex(buf, 0).empty());
    assert_true(pgpsig::bin_to_hex(feed) == "FEEDBEEF");
}

TEST_F(pgpsig_tests, test_utils_utf8)
{
    const uint8_t ascii[] = "user@example.com";
    assert_true(pgpsig::is_utf8(ascii, sizeof(ascii) - 1));
    /* two and three-byte sequences */
    const uint8_t multi[] = {0x41, 0xC3, 0xA9, 0xE2, 0x82, 0xAC};
    assert_true(pgpsig::is_utf8(multi, sizeof(multi)));
    /* truncated sequence */
    const uint8_t trunc[] = {0x41, 0xE2, 0x82};
    assert_false(pgpsig::is_utf8(trunc, sizeof(trunc)));
    /* lone continuation byte */
    const uint8_t cont[] = {0x80, 0x41};
    assert_false(pgpsig::is_utf8(cont, sizeof(cont)));
    /* overlong encoding of '/' */
    const uint8_t overlong[] = {0xC0, 0xAF};
    assert_false(pgpsig::is_utf8(overlong, sizeof(overlong)));
    assert_true(pgpsig::is_utf8(NULL, 0));

    /* lossy decoding keeps valid text as is */
    assert_true(pgpsig::utf8_lossy(multi, sizeof(multi)) == "A\xC3\xA9\xE2\x82\xAC");
    /* and replaces the invalid bytes */
    const uint8_t bad[] = {0x41, 0xFF, 0x42};
    assert_true(pgpsig::utf8_lossy(bad, sizeof(bad)) == "A\xEF\xBF\xBD"
                                                        "B");
}

TEST_F(pgpsig_tests, test_fingerprint_keyid)
{
    auto v4 = pgpsig::hex_to_bin("7D0BC10E933404C9A0E4D7E2F8C08F8C1F1E2D3C");
    pgp::Fingerprint fp4(v4.data(), v4.size());
    assert_true(fp4.has_keyid());
    assert_true(bin_eq_hex(fp4.keyid().data(), fp4.keyid().size(), "F8C08F8C1F1E2D3C"));
    assert_true(fp4.str() == "7D0BC10E933404C9A0E4D7E2F8C08F8C1F1E2D3C");

    auto v5 = pgpsig::hex_to_bin(
      "19347BC9872464025F99DF3EC2E0000ED9884892E1F7B3EA4C94009159569B54");
    pgp::Fingerprint fp5(v5.data(), v5.size());
    assert_true(fp5.has_keyid());
    assert_true(bin_eq_hex(fp5.keyid().data(), fp5.keyid().size(), "19347BC987246402"));

    pgp::Fingerprint odd(v4.data(), 10);
    assert_false(odd.has_keyid());
    assert_int_equal(pgp::Fingerprint::size_for_version(PGP_V4), PGP_FINGERPRINT_V4_SIZE);
    assert_int_equal(pgp::Fingerprint::size_for_version(PGP_V5), PGP_FINGERPRINT_V5_SIZE);
    assert_int_equal(pgp::Fingerprint::size_for_version(PGP_V3), 0);
    assert_true(fp4 != fp5);
}
