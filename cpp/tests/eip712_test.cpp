#include <gtest/gtest.h>

#include "mintgate/core/errors.hpp"
#include "mintgate/core/hex.hpp"
#include "mintgate/core/types.hpp"
#include "mintgate/eip712/digest.hpp"

namespace {
mintgate::core::Hash256 word(const char* hex) {
    mintgate::core::Hash256 h{};
    EXPECT_TRUE(mintgate::core::is_ok(mintgate::core::parse_hash256(hex, &h))) << hex;
    return h;
}

mintgate::core::Address address(const char* hex) {
    mintgate::core::Address a{};
    EXPECT_TRUE(mintgate::core::is_ok(mintgate::core::parse_address(hex, &a))) << hex;
    return a;
}

mintgate::core::Address filled(mintgate::core::u8 v) {
    mintgate::core::Address a{};
    a.b.fill(v);
    return a;
}

mintgate::eip712::Domain gateway_domain(mintgate::core::u64 chain_id) {
    mintgate::eip712::Domain d{};
    d.name = "MintGateway";
    d.chain_id = chain_id;
    d.verifying_contract = address("0x000000000000000000000000000000000000c0de");
    return d;
}

mintgate::eip712::MintAuthorization sample_authorization() {
    mintgate::eip712::MintAuthorization m{};
    m.target = filled(0x11);
    m.recipient = filled(0x22);
    m.token_id = mintgate::core::u256_from_u64(42);
    m.valid_after = mintgate::core::u256_from_u64(1000);
    m.valid_before = mintgate::core::u256_from_u64(2000);
    m.nonce.b.fill(0xab);
    return m;
}

mintgate::eip712::Word string_word(const char* s) {
    mintgate::eip712::Word w{};
    EXPECT_EQ(mintgate::eip712::encode_string(s, &w).code, mintgate::core::StatusCode::Ok);
    return w;
}

mintgate::core::Hash256 typehash_of(const char* type) {
    return string_word(type);
}
} // namespace

TEST(Eip712Typehash, MatchesCanonicalTypeStrings) {
    mintgate::core::Hash256 h{};
    ASSERT_EQ(mintgate::eip712::domain_typehash(&h).code, mintgate::core::StatusCode::Ok);
    EXPECT_EQ(h, word("8cad95687ba82c2ce50e74f7b754645e5117c3a5bec8151c0726d5857980a866"));
    ASSERT_EQ(mintgate::eip712::mint_authorization_typehash(&h).code, mintgate::core::StatusCode::Ok);
    EXPECT_EQ(h, word("26a89ba47728a53f3e3ef4fe082cb9b2421884dde3749db7927736f4041125a5"));
    ASSERT_EQ(mintgate::eip712::cancel_authorization_typehash(&h).code, mintgate::core::StatusCode::Ok);
    EXPECT_EQ(h, word("158b0a9edf7a828aad02f63cd515c68ef2f50ba807396f6d12842833a1597429"));

    EXPECT_EQ(mintgate::eip712::domain_typehash(nullptr).code, mintgate::core::StatusCode::Invalid);
}

TEST(Eip712Encode, StaticTypesArePaddedTo32Bytes) {
    const mintgate::eip712::Word a = mintgate::eip712::encode_address(filled(0xff));
    for (size_t i = 0; i < 12; ++i) {
        EXPECT_EQ(a.b[i], 0) << i;
    }
    for (size_t i = 12; i < 32; ++i) {
        EXPECT_EQ(a.b[i], 0xff) << i;
    }

    const mintgate::eip712::Word u = mintgate::eip712::encode_u64(0x0102);
    EXPECT_EQ(u.b[30], 0x01);
    EXPECT_EQ(u.b[31], 0x02);
    EXPECT_EQ(u.b[0], 0x00);

    EXPECT_EQ(mintgate::eip712::encode_u256(mintgate::core::u256_from_u64(0x0102)), u);
}

// Reference vector from the EIP-712 "Ether Mail" example.
TEST(Eip712Digest, EtherMailExample) {
    const mintgate::core::Hash256 domain_type =
        typehash_of("EIP712Domain(string name,string version,uint256 chainId,address verifyingContract)");
    const mintgate::eip712::Word domain_fields[4] = {
        string_word("Ether Mail"),
        string_word("1"),
        mintgate::eip712::encode_u64(1),
        mintgate::eip712::encode_address(address("0xCcCCccccCCCCcCCCCCCcCcCccCcCCCcCcccccccC")),
    };
    mintgate::core::Hash256 separator{};
    ASSERT_EQ(mintgate::eip712::hash_struct(domain_type, domain_fields, 4, &separator).code,
              mintgate::core::StatusCode::Ok);
    EXPECT_EQ(separator, word("f2cee375fa42b42143804025fc449deafd50cc031ca257e0b194a650a912090f"));

    const mintgate::core::Hash256 person_type = typehash_of("Person(string name,address wallet)");
    const mintgate::core::Hash256 mail_type =
        typehash_of("Mail(Person from,Person to,string contents)Person(string name,address wallet)");
    EXPECT_EQ(mail_type, word("a0cedeb2dc280ba39b857546d74f5549c3a1d7bdc2dd96bf881f76108e23dac2"));

    const mintgate::eip712::Word cow[2] = {
        string_word("Cow"),
        mintgate::eip712::encode_address(address("0xCD2a3d9F938E13CD947Ec05AbC7FE734Df8DD826")),
    };
    const mintgate::eip712::Word bob[2] = {
        string_word("Bob"),
        mintgate::eip712::encode_address(address("0xbBbBBBBbbBBBbbbBbbBbbbbBBbBbbbbBbBbbBBbB")),
    };
    mintgate::eip712::Word mail[3]{};
    ASSERT_EQ(mintgate::eip712::hash_struct(person_type, cow, 2, &mail[0]).code, mintgate::core::StatusCode::Ok);
    ASSERT_EQ(mintgate::eip712::hash_struct(person_type, bob, 2, &mail[1]).code, mintgate::core::StatusCode::Ok);
    mail[2] = string_word("Hello, Bob!");

    mintgate::core::Hash256 mail_hash{};
    ASSERT_EQ(mintgate::eip712::hash_struct(mail_type, mail, 3, &mail_hash).code, mintgate::core::StatusCode::Ok);
    EXPECT_EQ(mail_hash, word("c52c0ee5d84264471806290a3f2c4cecfc5490626bf912d01f240d7a274b371e"));

    mintgate::core::Hash256 digest{};
    ASSERT_EQ(mintgate::eip712::typed_data_digest(separator, mail_hash, &digest).code, mintgate::core::StatusCode::Ok);
    EXPECT_EQ(digest, word("be609aee343fb3c4b28e1df9e632fca64fcfaede20f02e86244efddf30957bd2"));
}

TEST(Eip712Digest, GatewayDomainSeparator) {
    mintgate::core::Hash256 separator{};
    ASSERT_EQ(mintgate::eip712::domain_separator(gateway_domain(1), &separator).code, mintgate::core::StatusCode::Ok);
    EXPECT_EQ(separator, word("2b5e56af715b2a316bc26b3e2ea2387bddf4d79ba569757fb701d96cbc4092a3"));

    ASSERT_EQ(mintgate::eip712::domain_separator(gateway_domain(5), &separator).code, mintgate::core::StatusCode::Ok);
    EXPECT_EQ(separator, word("7f83055c52e4b41de8a1204f6db54b0521436fd9fdee65c2dd318b4fdfb2eef9"));
}

TEST(Eip712Digest, MintAuthorizationVector) {
    mintgate::core::Hash256 struct_hash{};
    ASSERT_EQ(mintgate::eip712::hash_mint_authorization(sample_authorization(), &struct_hash).code,
              mintgate::core::StatusCode::Ok);
    EXPECT_EQ(struct_hash, word("48b13ce8b7f0918c0be999cbc12e03fae93d54e7598c6cca0173903c836e43bd"));

    mintgate::core::Hash256 digest{};
    ASSERT_EQ(mintgate::eip712::mint_authorization_digest(gateway_domain(1), sample_authorization(), &digest).code,
              mintgate::core::StatusCode::Ok);
    EXPECT_EQ(digest, word("e5fa812f298552cccf5636dd3ea9494f45d8ab98fb3cc97fa943b3ac19fd1a35"));
}

TEST(Eip712Digest, CancelAuthorizationVector) {
    mintgate::eip712::CancelAuthorization c{};
    c.authorizer = address("0x7E5F4552091A69125d5DfCb7b8C2659029395Bdf");
    c.nonce.b.fill(0xab);

    mintgate::core::Hash256 digest{};
    ASSERT_EQ(mintgate::eip712::cancel_authorization_digest(gateway_domain(1), c, &digest).code,
              mintgate::core::StatusCode::Ok);
    EXPECT_EQ(digest, word("c1f3b597270f7c77d2f0bd1819f91244cfd37be9f917f8e627eb60adb87b6382"));
}

TEST(Eip712Digest, IsDeterministic) {
    mintgate::core::Hash256 a{};
    mintgate::core::Hash256 b{};
    ASSERT_EQ(mintgate::eip712::mint_authorization_digest(gateway_domain(1), sample_authorization(), &a).code,
              mintgate::core::StatusCode::Ok);
    ASSERT_EQ(mintgate::eip712::mint_authorization_digest(gateway_domain(1), sample_authorization(), &b).code,
              mintgate::core::StatusCode::Ok);
    EXPECT_EQ(a, b);
}

TEST(Eip712Digest, EveryFieldChangesTheDigest) {
    mintgate::core::Hash256 base{};
    ASSERT_EQ(mintgate::eip712::mint_authorization_digest(gateway_domain(1), sample_authorization(), &base).code,
              mintgate::core::StatusCode::Ok);

    auto digest_of = [](const mintgate::eip712::Domain& d, const mintgate::eip712::MintAuthorization& m) {
        mintgate::core::Hash256 h{};
        EXPECT_EQ(mintgate::eip712::mint_authorization_digest(d, m, &h).code, mintgate::core::StatusCode::Ok);
        return h;
    };

    mintgate::eip712::MintAuthorization m = sample_authorization();
    m.target = filled(0x12);
    EXPECT_NE(digest_of(gateway_domain(1), m), base);

    m = sample_authorization();
    m.recipient = filled(0x23);
    EXPECT_NE(digest_of(gateway_domain(1), m), base);

    m = sample_authorization();
    m.token_id = mintgate::core::u256_from_u64(43);
    EXPECT_NE(digest_of(gateway_domain(1), m), base);

    m = sample_authorization();
    m.valid_after = mintgate::core::u256_from_u64(1001);
    EXPECT_NE(digest_of(gateway_domain(1), m), base);

    m = sample_authorization();
    m.valid_before = mintgate::core::u256_from_u64(2001);
    EXPECT_NE(digest_of(gateway_domain(1), m), base);

    m = sample_authorization();
    m.nonce.b[0] = 0x00;
    EXPECT_NE(digest_of(gateway_domain(1), m), base);

    EXPECT_NE(digest_of(gateway_domain(2), sample_authorization()), base);

    mintgate::eip712::Domain other = gateway_domain(1);
    other.verifying_contract = filled(0x33);
    EXPECT_NE(digest_of(other, sample_authorization()), base);

    other = gateway_domain(1);
    other.name = "OtherGateway";
    EXPECT_NE(digest_of(other, sample_authorization()), base);
}

TEST(Eip712Digest, WindowBoundsUseAllThirtyTwoBytes) {
    auto digest_of = [](const mintgate::eip712::MintAuthorization& m) {
        mintgate::core::Hash256 h{};
        EXPECT_EQ(mintgate::eip712::mint_authorization_digest(gateway_domain(1), m, &h).code,
                  mintgate::core::StatusCode::Ok);
        return h;
    };

    // Same low 64 bits, different high word.
    mintgate::eip712::MintAuthorization a = sample_authorization();
    mintgate::eip712::MintAuthorization b = sample_authorization();
    b.valid_before.b[0] = 0x01;
    EXPECT_NE(digest_of(a), digest_of(b));

    b = sample_authorization();
    b.valid_after.b[8] = 0x80;
    EXPECT_NE(digest_of(a), digest_of(b));

    mintgate::core::Hash256 struct_hash{};
    a.valid_before.b.fill(0xff);
    ASSERT_EQ(mintgate::eip712::hash_mint_authorization(a, &struct_hash).code, mintgate::core::StatusCode::Ok);
}

TEST(Eip712Digest, HashStructRejectsTooManyFields) {
    const mintgate::eip712::Word fields[mintgate::eip712::kMaxStructFields + 1]{};
    mintgate::core::Hash256 out{};
    const mintgate::core::Status s = mintgate::eip712::hash_struct(
        mintgate::core::Hash256{}, fields, mintgate::eip712::kMaxStructFields + 1, &out);
    EXPECT_EQ(s.domain, mintgate::core::StatusDomain::Digest);
    EXPECT_EQ(s.code, mintgate::core::StatusCode::Invalid);
}

TEST(Eip712Digest, MintAndCancelDigestsAreDistinct) {
    const mintgate::eip712::MintAuthorization m = sample_authorization();
    mintgate::eip712::CancelAuthorization c{};
    c.authorizer = m.target;
    c.nonce = m.nonce;

    mintgate::core::Hash256 mint_digest{};
    mintgate::core::Hash256 cancel_digest{};
    ASSERT_EQ(mintgate::eip712::mint_authorization_digest(gateway_domain(1), m, &mint_digest).code,
              mintgate::core::StatusCode::Ok);
    ASSERT_EQ(mintgate::eip712::cancel_authorization_digest(gateway_domain(1), c, &cancel_digest).code,
              mintgate::core::StatusCode::Ok);
    EXPECT_NE(mint_digest, cancel_digest);
}

TEST(Eip712Digest, RejectsMissingDomainName) {
    mintgate::eip712::Domain d = gateway_domain(1);
    d.name = nullptr;
    mintgate::core::Hash256 out{};
    const mintgate::core::Status s = mintgate::eip712::domain_separator(d, &out);
    EXPECT_EQ(s.domain, mintgate::core::StatusDomain::Digest);
    EXPECT_EQ(s.code, mintgate::core::StatusCode::Invalid);

    EXPECT_EQ(mintgate::eip712::mint_authorization_digest(d, sample_authorization(), &out).code,
              mintgate::core::StatusCode::Invalid);
}
