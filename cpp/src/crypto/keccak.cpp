#include "mintgate/crypto/keccak.hpp"

#include <memory>

#include <openssl/evp.h>

namespace mintgate::crypto {
    namespace {
        using mintgate::core::BufferView;
        using mintgate::core::Hash256;
        using mintgate::core::Status;
        using mintgate::core::StatusCode;
        using mintgate::core::StatusDomain;

        using MdCtxPtr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

        // Fetched once; an EVP_MD is immutable and shared across threads.
        [[nodiscard]] const EVP_MD* keccak256_md() noexcept {
            static EVP_MD* md = EVP_MD_fetch(nullptr, "KECCAK-256", nullptr);
            return md;
        }

        [[nodiscard]] bool view_is_valid(const BufferView& v) noexcept {
            return v.data != nullptr || v.len == 0;
        }
    } // namespace

    Status keccak256_parts(const BufferView* parts, u32 count, Hash256* out) noexcept {
        if (out == nullptr || (count > 0 && parts == nullptr)) {
            return mintgate::core::make_status(StatusDomain::Crypto, StatusCode::Invalid);
        }
        for (u32 i = 0; i < count; ++i) {
            if (!view_is_valid(parts[i])) {
                return mintgate::core::make_status(StatusDomain::Crypto, StatusCode::Invalid, i);
            }
        }

        const EVP_MD* md = keccak256_md();
        if (md == nullptr) {
            return mintgate::core::make_status(StatusDomain::Crypto, StatusCode::Unavailable);
        }

        MdCtxPtr ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
        if (!ctx || EVP_DigestInit_ex2(ctx.get(), md, nullptr) != 1) {
            return mintgate::core::make_status(StatusDomain::Crypto, StatusCode::Crypto);
        }
        for (u32 i = 0; i < count; ++i) {
            if (parts[i].len == 0) {
                continue;
            }
            if (EVP_DigestUpdate(ctx.get(), parts[i].data, parts[i].len) != 1) {
                return mintgate::core::make_status(StatusDomain::Crypto, StatusCode::Crypto);
            }
        }

        unsigned int len = 0;
        if (EVP_DigestFinal_ex(ctx.get(), out->b.data(), &len) != 1 || len != out->b.size()) {
            return mintgate::core::make_status(StatusDomain::Crypto, StatusCode::Crypto);
        }
        return mintgate::core::ok_status();
    }

    Status keccak256(BufferView data, Hash256* out) noexcept {
        return keccak256_parts(&data, 1, out);
    }
} // namespace mintgate::crypto
