#include <gtest/gtest.h>

#include "mintgate/auth/recover.hpp"
#include "mintgate/core/errors.hpp"
#include "mintgate/core/hex.hpp"
#include "mintgate/core/types.hpp"
#include "mintgate/crypto/secp256k1.hpp"

namespace {
mintgate::core::Hash256 word(const char* hex) {
    mintgate::core::Hash256 h{};
    EXPECT_TRUE(mintgate::core::is_ok(mintgate::core::parse_hash256(hex, &h))) << hex;
    return h;
}

mintgate::auth::Signature mail_signature() {
    mintgate::auth::Signature sig{};
    sig.v = 28;
    sig.r = word("4355c47d63924e8a72e509b65029052eb6c299d53a04e167c5775fd466751c9d");
    sig.s = word("07299936d304c153f6443dfa05f40ff007d72911b6f72307f996231605b91562");
    return sig;
}

mintgate::core::Hash256 mail_digest() {
    return word("be609aee343fb3c4b28e1df9e632fca64fcfaede20f02e86244efddf30957bd2");
}

// n - s over big-endian bytes.
mintgate::core::Hash256 negate_scalar(const mintgate::core::Hash256& s) {
    const mintgate::core::Hash256 n = word("fffffffffffffffffffffffffffffffebaaedce6af48a03bbfd25e8cd0364141");
    mintgate::core::Hash256 out{};
    int borrow = 0;
    for (size_t i = 32; i-- > 0;) {
        int d = static_cast<int>(n.b[i]) - static_cast<int>(s.b[i]) - borrow;
        borrow = d < 0 ? 1 : 0;
        out.b[i] = static_cast<mintgate::core::u8>(d + (borrow ? 256 : 0));
    }
    return out;
}

void expect_invalid_signature(const mintgate::core::Status& s, mintgate::core::u32 aux) {
    EXPECT_EQ(s.domain, mintgate::core::StatusDomain::Auth);
    EXPECT_EQ(s.code, mintgate::core::StatusCode::InvalidSignature);
    EXPECT_EQ(s.aux, aux);
}
} // namespace

TEST(RecoverSigner, RecoversKnownSigner) {
    mintgate::core::Address signer{};
    const mintgate::core::Status s = mintgate::auth::recover_signer(mail_digest(), mail_signature(), &signer);
    ASSERT_EQ(s.code, mintgate::core::StatusCode::Ok);

    mintgate::core::Address expected{};
    ASSERT_TRUE(mintgate::core::is_ok(
        mintgate::core::parse_address("0xcd2a3d9f938e13cd947ec05abc7fe734df8dd826", &expected)));
    EXPECT_EQ(signer, expected);
}

TEST(RecoverSigner, RejectsRecoveryIdOutsideRange) {
    const mintgate::core::u8 bad_v[] = {0, 1, 26, 29, 35, 255};
    for (mintgate::core::u8 v : bad_v) {
        mintgate::auth::Signature sig = mail_signature();
        sig.v = v;
        mintgate::core::Address signer{};
        expect_invalid_signature(mintgate::auth::recover_signer(mail_digest(), sig, &signer), 1);
    }
}

TEST(RecoverSigner, RejectsHighS) {
    mintgate::auth::Signature sig = mail_signature();
    // The malleable twin: (r, n - s) with the other parity.
    sig.s = negate_scalar(sig.s);
    sig.v = 27;
    ASSERT_FALSE(mintgate::crypto::scalar_is_low_s(sig.s));

    mintgate::core::Address signer{};
    expect_invalid_signature(mintgate::auth::recover_signer(mail_digest(), sig, &signer), 2);
}

TEST(RecoverSigner, RejectsZeroR) {
    mintgate::auth::Signature sig = mail_signature();
    sig.r = mintgate::core::Hash256{};
    mintgate::core::Address signer{};
    expect_invalid_signature(mintgate::auth::recover_signer(mail_digest(), sig, &signer), 3);
}

TEST(RecoverSigner, RejectsRThatIsNotOnTheCurve) {
    // x = 5: 5^3 + 7 = 132 is not a quadratic residue mod p.
    mintgate::auth::Signature sig = mail_signature();
    sig.r = mintgate::core::Hash256{};
    sig.r.b[31] = 5;
    mintgate::core::Address signer{};
    expect_invalid_signature(mintgate::auth::recover_signer(mail_digest(), sig, &signer), 3);
}

TEST(RecoverSigner, DifferentDigestYieldsDifferentSigner) {
    mintgate::core::Hash256 other = mail_digest();
    other.b[0] ^= 0x01;
    mintgate::core::Address a{};
    mintgate::core::Address b{};
    ASSERT_EQ(mintgate::auth::recover_signer(mail_digest(), mail_signature(), &a).code, mintgate::core::StatusCode::Ok);
    const mintgate::core::Status s = mintgate::auth::recover_signer(other, mail_signature(), &b);
    if (mintgate::core::is_ok(s)) {
        EXPECT_NE(a, b);
    }
}

TEST(RecoverSigner, NullOutput) {
    const mintgate::core::Status s = mintgate::auth::recover_signer(mail_digest(), mail_signature(), nullptr);
    EXPECT_EQ(s.domain, mintgate::core::StatusDomain::Auth);
    EXPECT_EQ(s.code, mintgate::core::StatusCode::Invalid);
}
