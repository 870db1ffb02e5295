#include <algorithm>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "mintgate/core/errors.hpp"
#include "mintgate/core/hex.hpp"
#include "mintgate/core/types.hpp"
#include "mintgate/crypto/keccak.hpp"

namespace {
mintgate::core::Hash256 word(const char* hex) {
    mintgate::core::Hash256 h{};
    EXPECT_TRUE(mintgate::core::is_ok(mintgate::core::parse_hash256(hex, &h))) << hex;
    return h;
}

mintgate::core::Hash256 keccak_str(const std::string& s) {
    mintgate::core::Hash256 out{};
    const mintgate::core::BufferView v{reinterpret_cast<const mintgate::core::u8*>(s.data()),
                                       static_cast<mintgate::core::u32>(s.size())};
    EXPECT_EQ(mintgate::crypto::keccak256(v, &out).code, mintgate::core::StatusCode::Ok);
    return out;
}
} // namespace

TEST(Keccak256, EmptyInput) {
    mintgate::core::Hash256 out{};
    const mintgate::core::Status s = mintgate::crypto::keccak256(mintgate::core::BufferView{}, &out);
    ASSERT_EQ(s.code, mintgate::core::StatusCode::Ok);
    EXPECT_EQ(out, word("c5d2460186f7233c927e7db2dcc703c0e500b653ca82273b7bfad8045d85a470"));
}

TEST(Keccak256, Abc) {
    EXPECT_EQ(keccak_str("abc"), word("4e03657aea45a94fc7d47ba826c8d667c0d1e6e33a64a036ec44f58fa12d6c45"));
}

TEST(Keccak256, MultiBlockInput) {
    // 200 bytes spans the 136-byte rate.
    EXPECT_EQ(keccak_str(std::string(200, 'a')),
              word("96ea54061def936c4be90b518992fdc6f12f535068a256229aca54267b4d084d"));
}

TEST(Keccak256, PartsMatchOneShot) {
    const std::string msg(200, 'a');
    const mintgate::core::Hash256 expected = keccak_str(msg);
    const auto* bytes = reinterpret_cast<const mintgate::core::u8*>(msg.data());

    const size_t chunk_sizes[] = {1, 7, 135, 136, 137};
    for (size_t chunk : chunk_sizes) {
        std::vector<mintgate::core::BufferView> parts;
        for (size_t off = 0; off < msg.size(); off += chunk) {
            const size_t n = std::min(chunk, msg.size() - off);
            parts.push_back({bytes + off, static_cast<mintgate::core::u32>(n)});
        }
        mintgate::core::Hash256 out{};
        ASSERT_EQ(mintgate::crypto::keccak256_parts(parts.data(), static_cast<mintgate::core::u32>(parts.size()),
                      &out).code,
                  mintgate::core::StatusCode::Ok);
        EXPECT_EQ(out, expected) << "chunk=" << chunk;
    }
}

TEST(Keccak256, EmptyPartsAreSkipped) {
    const std::string msg = "abc";
    const mintgate::core::BufferView parts[3] = {
        {nullptr, 0},
        {reinterpret_cast<const mintgate::core::u8*>(msg.data()), 3},
        {nullptr, 0},
    };
    mintgate::core::Hash256 out{};
    ASSERT_EQ(mintgate::crypto::keccak256_parts(parts, 3, &out).code, mintgate::core::StatusCode::Ok);
    EXPECT_EQ(out, keccak_str(msg));

    ASSERT_EQ(mintgate::crypto::keccak256_parts(nullptr, 0, &out).code, mintgate::core::StatusCode::Ok);
    EXPECT_EQ(out, word("c5d2460186f7233c927e7db2dcc703c0e500b653ca82273b7bfad8045d85a470"));
}

TEST(Keccak256, RateSizedInputNeedsExtraPaddingBlock) {
    const std::string a(mintgate::crypto::kKeccak256Rate, 'x');
    const std::string b(mintgate::crypto::kKeccak256Rate - 1, 'x');
    EXPECT_NE(keccak_str(a), keccak_str(b));
}

TEST(Keccak256, KnownTypeStrings) {
    EXPECT_EQ(keccak_str("EIP712Domain(string name,uint256 chainId,address verifyingContract)"),
              word("8cad95687ba82c2ce50e74f7b754645e5117c3a5bec8151c0726d5857980a866"));
    EXPECT_EQ(keccak_str("cow"), word("c85ef7d79691fe79573b1a7064c19c1a9819ebdbd1faaab1a8ec92344438aaf4"));
}

TEST(Keccak256, RejectsNullArguments) {
    mintgate::core::Hash256 out{};
    const mintgate::core::Status s1 = mintgate::crypto::keccak256(mintgate::core::BufferView{nullptr, 4}, &out);
    EXPECT_EQ(s1.domain, mintgate::core::StatusDomain::Crypto);
    EXPECT_EQ(s1.code, mintgate::core::StatusCode::Invalid);

    const mintgate::core::u8 byte = 0;
    const mintgate::core::Status s2 = mintgate::crypto::keccak256(mintgate::core::BufferView{&byte, 1}, nullptr);
    EXPECT_EQ(s2.code, mintgate::core::StatusCode::Invalid);

    const mintgate::core::BufferView parts[2] = {{&byte, 1}, {nullptr, 2}};
    const mintgate::core::Status s3 = mintgate::crypto::keccak256_parts(parts, 2, &out);
    EXPECT_EQ(s3.code, mintgate::core::StatusCode::Invalid);
    EXPECT_EQ(s3.aux, 1u);
    EXPECT_EQ(mintgate::crypto::keccak256_parts(nullptr, 1, &out).code, mintgate::core::StatusCode::Invalid);
}
