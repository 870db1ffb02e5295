#include <gtest/gtest.h>
#include "mintgate/core/errors.hpp"
#include "mintgate/core/events.hpp"
#include "mintgate/core/types.hpp"
#include "mintgate/crypto/secp256k1.hpp"
#include <cstddef>

using namespace mintgate::core;

TEST(TypesLayout, WordsAreTightlyPacked) {
    EXPECT_EQ(sizeof(Address), 20);
    EXPECT_EQ(sizeof(Hash256), 32);
    EXPECT_EQ(sizeof(U256), 32);
    EXPECT_EQ(alignof(Address), 1);
    EXPECT_EQ(alignof(Hash256), 1);
}

TEST(TypesLayout, StatusFitsInRegister) {
    EXPECT_EQ(sizeof(Status), 8);
    EXPECT_EQ(offsetof(Status, code), 0);
    EXPECT_EQ(offsetof(Status, domain), 2);
    EXPECT_EQ(offsetof(Status, aux), 4);
}

TEST(TypesLayout, ExecContext) {
    EXPECT_EQ(sizeof(ExecContext), 40);
    EXPECT_EQ(offsetof(ExecContext, sender), 0);
    EXPECT_EQ(offsetof(ExecContext, now), 24);
    EXPECT_EQ(offsetof(ExecContext, chain_id), 32);
}

TEST(TypesLayout, EventRecord) {
    EXPECT_TRUE(std::is_trivially_copyable_v<Event>);
    EXPECT_TRUE(std::is_standard_layout_v<Event>);
    EXPECT_EQ(sizeof(Event), 168);
    EXPECT_EQ(alignof(Event), 8);

    // Addresses and words are byte arrays and pack behind the kind tag.
    EXPECT_EQ(offsetof(Event, actor), 1);
    EXPECT_EQ(offsetof(Event, token_id), 81);
    EXPECT_EQ(offsetof(Event, old_value), 152);
}

TEST(TypesLayout, SignatureIsSixtyFiveBytes) {
    EXPECT_EQ(sizeof(mintgate::crypto::Signature), 65);
    EXPECT_EQ(offsetof(mintgate::crypto::Signature, v), 0);
    EXPECT_EQ(offsetof(mintgate::crypto::Signature, r), 1);
    EXPECT_EQ(offsetof(mintgate::crypto::Signature, s), 33);
}
