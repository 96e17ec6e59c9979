// MATEICO - SHA256 Tests
// Copyright (c) 2024 MATEICO Developers
// MIT License

#include <gtest/gtest.h>
#include "mateico/crypto/sha256.h"
#include "mateico/core/types.h"

#include <array>
#include <string>
#include <vector>

using namespace mateico;

namespace {

std::string HashString(const std::string& input) {
    return SHA256Hash(reinterpret_cast<const Byte*>(input.data()), input.size()).ToHex();
}

} // anonymous namespace

// ============================================================================
// Known Vectors (FIPS 180-2)
// ============================================================================

TEST(SHA256Test, OutputSizeIs32Bytes) {
    EXPECT_EQ(SHA256::OUTPUT_SIZE, 32u);
}

TEST(SHA256Test, EmptyString) {
    EXPECT_EQ(HashString(""),
              "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST(SHA256Test, Abc) {
    EXPECT_EQ(HashString("abc"),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(SHA256Test, TwoBlockMessage) {
    EXPECT_EQ(HashString("abcdbcdecdefdefgefghfghighijhijkijkljklmklmnlmnomnopnopq"),
              "248d6a61d20638b8e5c026930c3e6039a33ce45964ff2167f6ecedd419db06c1");
}

TEST(SHA256Test, MillionA) {
    std::string input(1000000, 'a');
    EXPECT_EQ(HashString(input),
              "cdc76e5c9914fb9281a1c7e284d73e67f1809a48a497200e046d39ccc7112cd0");
}

// ============================================================================
// Incremental Interface
// ============================================================================

TEST(SHA256Test, IncrementalMatchesOneShot) {
    const std::string input = "The quick brown fox jumps over the lazy dog";
    const Byte* data = reinterpret_cast<const Byte*>(input.data());

    SHA256 hasher;
    hasher.Write(data, 10).Write(data + 10, 0).Write(data + 10, input.size() - 10);
    Hash256 result;
    hasher.Finalize(result.data());

    EXPECT_EQ(result, SHA256Hash(data, input.size()));
    EXPECT_EQ(result.ToHex(),
              "d7a8fbb307d7809469ca9abcb0082e4f8d5651e46d3cdb762d02d0bf37c9e592");
}

TEST(SHA256Test, ResetStartsOver) {
    SHA256 hasher;
    hasher.Write(reinterpret_cast<const Byte*>("garbage"), 7);
    hasher.Reset();
    hasher.Write(reinterpret_cast<const Byte*>("abc"), 3);

    std::array<Byte, SHA256::OUTPUT_SIZE> out;
    hasher.Finalize(out.data());
    EXPECT_EQ(BytesToHex(out.data(), out.size()), HashString("abc"));
}

TEST(SHA256Test, VectorOverload) {
    std::vector<Byte> data = {'a', 'b', 'c'};
    EXPECT_EQ(SHA256Hash(data).ToHex(), HashString("abc"));
}

// ============================================================================
// Label Addresses
// ============================================================================

TEST(AddressFromLabelTest, TruncatedDigest) {
    Address a = AddressFromLabel("abc");
    EXPECT_EQ(a.ToHex(), HashString("abc").substr(0, 40));
}

TEST(AddressFromLabelTest, StableAndDistinct) {
    EXPECT_EQ(AddressFromLabel("mateico:staking"), AddressFromLabel("mateico:staking"));
    EXPECT_NE(AddressFromLabel("mateico:staking"), AddressFromLabel("mateico:vesting"));
    EXPECT_FALSE(AddressFromLabel("").IsNull());
}
