#include "mintgate/crypto/secp256k1.hpp"

#include <cstddef>
#include <cstring>
#include <memory>

#include <openssl/bn.h>
#include <openssl/core_names.h>
#include <openssl/ec.h>
#include <openssl/evp.h>
#include <openssl/obj_mac.h>
#include <openssl/param_build.h>
#include <openssl/params.h>

#include "mintgate/crypto/keccak.hpp"

namespace mintgate::crypto {
    namespace {
        using mintgate::core::Address;
        using mintgate::core::Hash256;
        using mintgate::core::Status;
        using mintgate::core::StatusCode;
        using mintgate::core::StatusDomain;

        // SEQUENCE { INTEGER r, INTEGER s } for 256-bit scalars.
        constexpr size_t kMaxDerSignature = 72;

        using PkeyPtr = std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)>;
        using PkeyCtxPtr = std::unique_ptr<EVP_PKEY_CTX, decltype(&EVP_PKEY_CTX_free)>;
        using ParamBldPtr = std::unique_ptr<OSSL_PARAM_BLD, decltype(&OSSL_PARAM_BLD_free)>;
        using ParamPtr = std::unique_ptr<OSSL_PARAM, decltype(&OSSL_PARAM_free)>;
        using EcdsaSigPtr = std::unique_ptr<ECDSA_SIG, decltype(&ECDSA_SIG_free)>;

        [[nodiscard]] Status crypto_status(StatusCode code) noexcept {
            return mintgate::core::make_status(StatusDomain::Crypto, code);
        }

        // Created once; EC_GROUP is read-only after construction.
        [[nodiscard]] const EC_GROUP* secp256k1_group() noexcept {
            static const EC_GROUP* group = EC_GROUP_new_by_curve_name(NID_secp256k1);
            return group;
        }

        struct BnFrame {
            BN_CTX* ctx{nullptr};

            BnFrame() noexcept : ctx(BN_CTX_new()) {
                if (ctx != nullptr) {
                    BN_CTX_start(ctx);
                }
            }
            ~BnFrame() noexcept {
                if (ctx != nullptr) {
                    BN_CTX_end(ctx);
                    BN_CTX_free(ctx);
                }
            }
            BnFrame(const BnFrame&) = delete;
            BnFrame& operator=(const BnFrame&) = delete;
        };

        struct Point {
            EC_POINT* p{nullptr};

            explicit Point(const EC_GROUP* group) noexcept : p(EC_POINT_new(group)) {}
            ~Point() noexcept {
                if (p != nullptr) {
                    EC_POINT_free(p);
                }
            }
            Point(const Point&) = delete;
            Point& operator=(const Point&) = delete;
        };

        [[nodiscard]] Status address_from_point(const EC_GROUP* group,
            const EC_POINT* q,
            BN_CTX* ctx,
            Address* out) noexcept {
            u8 buf[65];
            const size_t n = EC_POINT_point2oct(group, q, POINT_CONVERSION_UNCOMPRESSED, buf, sizeof(buf), ctx);
            if (n != sizeof(buf) || buf[0] != 0x04) {
                return crypto_status(StatusCode::Crypto);
            }

            Hash256 h{};
            const Status s = keccak256({buf + 1, 64}, &h);
            if (!mintgate::core::is_ok(s)) {
                return s;
            }
            std::memcpy(out->b.data(), h.b.data() + 12, out->b.size());
            return mintgate::core::ok_status();
        }

        [[nodiscard]] bool load_private_key(const PrivateKey& key, const BIGNUM* order, BIGNUM* d) noexcept {
            if (BN_bin2bn(key.b.data(), static_cast<int>(key.b.size()), d) == nullptr) {
                return false;
            }
            return !BN_is_zero(d) && BN_cmp(d, order) < 0;
        }

        [[nodiscard]] Status make_signing_key(const BIGNUM* d, const u8 (&pub)[65], PkeyPtr* out) noexcept {
            ParamBldPtr bld(OSSL_PARAM_BLD_new(), &OSSL_PARAM_BLD_free);
            if (!bld ||
                OSSL_PARAM_BLD_push_utf8_string(bld.get(), OSSL_PKEY_PARAM_GROUP_NAME, "secp256k1", 0) != 1 ||
                OSSL_PARAM_BLD_push_BN(bld.get(), OSSL_PKEY_PARAM_PRIV_KEY, d) != 1 ||
                OSSL_PARAM_BLD_push_octet_string(bld.get(), OSSL_PKEY_PARAM_PUB_KEY, pub, sizeof(pub)) != 1) {
                return crypto_status(StatusCode::Unavailable);
            }
            ParamPtr params(OSSL_PARAM_BLD_to_param(bld.get()), &OSSL_PARAM_free);
            PkeyCtxPtr kctx(EVP_PKEY_CTX_new_from_name(nullptr, "EC", nullptr), &EVP_PKEY_CTX_free);
            if (!params || !kctx || EVP_PKEY_fromdata_init(kctx.get()) != 1) {
                return crypto_status(StatusCode::Unavailable);
            }
            EVP_PKEY* raw = nullptr;
            if (EVP_PKEY_fromdata(kctx.get(), &raw, EVP_PKEY_KEYPAIR, params.get()) != 1) {
                return crypto_status(StatusCode::Crypto);
            }
            out->reset(raw);
            return mintgate::core::ok_status();
        }
    } // namespace

    Status ecdsa_recover_address(const Hash256& digest,
        u8 recid,
        const Hash256& r,
        const Hash256& s,
        Address* out) noexcept {
        if (out == nullptr || recid > 1) {
            return crypto_status(StatusCode::Invalid);
        }

        const EC_GROUP* group = secp256k1_group();
        if (group == nullptr) {
            return crypto_status(StatusCode::Unavailable);
        }
        BnFrame frame;
        if (frame.ctx == nullptr) {
            return crypto_status(StatusCode::Unavailable);
        }
        BN_CTX* ctx = frame.ctx;

        BIGNUM* rb = BN_CTX_get(ctx);
        BIGNUM* sb = BN_CTX_get(ctx);
        BIGNUM* e = BN_CTX_get(ctx);
        BIGNUM* rinv = BN_CTX_get(ctx);
        BIGNUM* u1 = BN_CTX_get(ctx);
        BIGNUM* u2 = BN_CTX_get(ctx);
        if (u2 == nullptr) {
            return crypto_status(StatusCode::Unavailable);
        }

        const BIGNUM* order = EC_GROUP_get0_order(group);
        if (BN_bin2bn(r.b.data(), 32, rb) == nullptr ||
            BN_bin2bn(s.b.data(), 32, sb) == nullptr ||
            BN_bin2bn(digest.b.data(), 32, e) == nullptr) {
            return crypto_status(StatusCode::Unavailable);
        }
        if (BN_is_zero(rb) || BN_is_zero(sb) || BN_cmp(rb, order) >= 0 || BN_cmp(sb, order) >= 0) {
            return crypto_status(StatusCode::Crypto);
        }

        Point big_r(group);
        Point q(group);
        if (big_r.p == nullptr || q.p == nullptr) {
            return crypto_status(StatusCode::Unavailable);
        }
        if (EC_POINT_set_compressed_coordinates(group, big_r.p, rb, static_cast<int>(recid), ctx) != 1) {
            return crypto_status(StatusCode::Crypto);
        }

        // Q = r^-1 * (s*R - e*G) = (-e * r^-1)*G + (s * r^-1)*R
        int ok = 1;
        ok &= BN_nnmod(e, e, order, ctx);
        ok &= (BN_mod_inverse(rinv, rb, order, ctx) != nullptr) ? 1 : 0;
        ok &= BN_mod_mul(u1, e, rinv, order, ctx);
        if (ok && !BN_is_zero(u1)) {
            ok &= BN_sub(u1, order, u1);
        }
        ok &= BN_mod_mul(u2, sb, rinv, order, ctx);
        ok &= EC_POINT_mul(group, q.p, u1, big_r.p, u2, ctx);
        if (!ok) {
            return crypto_status(StatusCode::Crypto);
        }
        if (EC_POINT_is_at_infinity(group, q.p) == 1) {
            return crypto_status(StatusCode::Crypto);
        }

        return address_from_point(group, q.p, ctx, out);
    }

    Status derive_address(const PrivateKey& key, Address* out) noexcept {
        if (out == nullptr) {
            return crypto_status(StatusCode::Invalid);
        }

        const EC_GROUP* group = secp256k1_group();
        if (group == nullptr) {
            return crypto_status(StatusCode::Unavailable);
        }
        BnFrame frame;
        if (frame.ctx == nullptr) {
            return crypto_status(StatusCode::Unavailable);
        }
        BIGNUM* d = BN_CTX_get(frame.ctx);
        if (d == nullptr) {
            return crypto_status(StatusCode::Unavailable);
        }
        if (!load_private_key(key, EC_GROUP_get0_order(group), d)) {
            return crypto_status(StatusCode::Invalid);
        }

        Point q(group);
        if (q.p == nullptr) {
            return crypto_status(StatusCode::Unavailable);
        }
        if (EC_POINT_mul(group, q.p, d, nullptr, nullptr, frame.ctx) != 1) {
            return crypto_status(StatusCode::Crypto);
        }
        return address_from_point(group, q.p, frame.ctx, out);
    }

    Status ecdsa_sign_recoverable(const PrivateKey& key, const Hash256& digest, Signature* out) noexcept {
        if (out == nullptr) {
            return crypto_status(StatusCode::Invalid);
        }

        const EC_GROUP* group = secp256k1_group();
        if (group == nullptr) {
            return crypto_status(StatusCode::Unavailable);
        }
        BnFrame frame;
        if (frame.ctx == nullptr) {
            return crypto_status(StatusCode::Unavailable);
        }
        BN_CTX* ctx = frame.ctx;

        BIGNUM* d = BN_CTX_get(ctx);
        BIGNUM* sb = BN_CTX_get(ctx);
        BIGNUM* half = BN_CTX_get(ctx);
        if (half == nullptr) {
            return crypto_status(StatusCode::Unavailable);
        }
        const BIGNUM* order = EC_GROUP_get0_order(group);
        if (!load_private_key(key, order, d)) {
            return crypto_status(StatusCode::Invalid);
        }
        BN_set_flags(d, BN_FLG_CONSTTIME);
        if (BN_rshift1(half, order) != 1) {
            return crypto_status(StatusCode::Unavailable);
        }

        Point q(group);
        if (q.p == nullptr) {
            return crypto_status(StatusCode::Unavailable);
        }
        u8 pub[65];
        if (EC_POINT_mul(group, q.p, d, nullptr, nullptr, ctx) != 1 ||
            EC_POINT_point2oct(group, q.p, POINT_CONVERSION_UNCOMPRESSED, pub, sizeof(pub), ctx) != sizeof(pub)) {
            return crypto_status(StatusCode::Crypto);
        }
        Address signer{};
        Status st = address_from_point(group, q.p, ctx, &signer);
        if (!mintgate::core::is_ok(st)) {
            return st;
        }

        PkeyPtr pkey(nullptr, &EVP_PKEY_free);
        st = make_signing_key(d, pub, &pkey);
        if (!mintgate::core::is_ok(st)) {
            return st;
        }

        PkeyCtxPtr sctx(EVP_PKEY_CTX_new_from_pkey(nullptr, pkey.get(), nullptr), &EVP_PKEY_CTX_free);
        if (!sctx || EVP_PKEY_sign_init(sctx.get()) != 1) {
            return crypto_status(StatusCode::Unavailable);
        }
        // RFC 6979 nonce with HMAC-SHA256; the input is the 32-byte digest as is.
        unsigned int nonce_type = 1;
        char md_name[] = "SHA256";
        const OSSL_PARAM params[] = {
            OSSL_PARAM_construct_utf8_string(OSSL_SIGNATURE_PARAM_DIGEST, md_name, 0),
            OSSL_PARAM_construct_uint(OSSL_SIGNATURE_PARAM_NONCE_TYPE, &nonce_type),
            OSSL_PARAM_construct_end(),
        };
        if (EVP_PKEY_CTX_set_params(sctx.get(), params) != 1) {
            return crypto_status(StatusCode::Unavailable);
        }

        u8 der[kMaxDerSignature];
        size_t der_len = sizeof(der);
        if (EVP_PKEY_sign(sctx.get(), der, &der_len, digest.b.data(), digest.b.size()) != 1) {
            return crypto_status(StatusCode::Crypto);
        }
        const unsigned char* cursor = der;
        EcdsaSigPtr parsed(d2i_ECDSA_SIG(nullptr, &cursor, static_cast<long>(der_len)), &ECDSA_SIG_free);
        if (!parsed) {
            return crypto_status(StatusCode::Crypto);
        }
        const BIGNUM* rb = nullptr;
        const BIGNUM* raw_s = nullptr;
        ECDSA_SIG_get0(parsed.get(), &rb, &raw_s);
        if (rb == nullptr || raw_s == nullptr || BN_copy(sb, raw_s) == nullptr) {
            return crypto_status(StatusCode::Crypto);
        }
        if (BN_cmp(sb, half) > 0 && BN_sub(sb, order, sb) != 1) {
            return crypto_status(StatusCode::Crypto);
        }

        Signature sig{};
        if (BN_bn2binpad(rb, sig.r.b.data(), 32) != 32 || BN_bn2binpad(sb, sig.s.b.data(), 32) != 32) {
            return crypto_status(StatusCode::Crypto);
        }

        // The parity of R is not reported; pick the recid that recovers the signer.
        // An R with x >= n would need recid 2 or 3, which v cannot express.
        for (u8 recid = 0; recid < 2; ++recid) {
            Address recovered{};
            if (mintgate::core::is_ok(ecdsa_recover_address(digest, recid, sig.r, sig.s, &recovered)) &&
                recovered == signer) {
                sig.v = static_cast<u8>(27 + recid);
                *out = sig;
                return mintgate::core::ok_status();
            }
        }
        return crypto_status(StatusCode::Crypto);
    }
} // namespace mintgate::crypto
