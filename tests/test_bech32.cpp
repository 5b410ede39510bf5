#include <gtest/gtest.h>
#include "bech32.hpp"
#include "hex_utils.hpp"
#include "network.hpp"
#include "segwit.hpp"

namespace bitcli {
namespace {

TEST(Bech32Test, DecodesMainnetP2wpkh) {
    auto decoded = Bech32::decode_segwit("bc1qw508d6qejxtdg4y5r3zarvary0c5xw7kv8f3t4");
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded->hrp, "bc");
    EXPECT_EQ(decoded->witness_version, 0);
    EXPECT_EQ(HexUtils::encode(decoded->program), "751e76e8199196d454941c45d1b3a323f1433bd6");
}

TEST(Bech32Test, AcceptsUppercase) {
    auto decoded = Bech32::decode_segwit("BC1QW508D6QEJXTDG4Y5R3ZARVARY0C5XW7KV8F3T4");
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded->hrp, "bc");
    EXPECT_EQ(HexUtils::encode(decoded->program), "751e76e8199196d454941c45d1b3a323f1433bd6");
}

TEST(Bech32Test, DecodesTestnetP2wsh) {
    auto decoded = Bech32::decode_segwit("tb1qrp33g0q5c5txsp9arysrx4k6zdkfs4nce4xj0gdcccefvpysxf3q0sl5k7");
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded->hrp, "tb");
    EXPECT_EQ(decoded->witness_version, 0);
    EXPECT_EQ(HexUtils::encode(decoded->program),
              "1863143c14c5166804bd19203356da136c985678cd4d27a1b8c6329604903262");
}

TEST(Bech32Test, DecodesTaprootWithBech32m) {
    auto decoded = Bech32::decode_segwit("bc1p0xlxvlhemja6c4dqv22uapctqupfhlxm9h8z3k2e72q4k9hcz7vqzk5jj0");
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded->witness_version, 1);
    EXPECT_EQ(HexUtils::encode(decoded->program),
              "79be667ef9dcbbac55a06295ce870b07029bfcdb2dce28d959f2815b16f81798");

    auto script = Segwit::get_witness_script_pubkey(decoded->witness_version, decoded->program);
    EXPECT_EQ(HexUtils::encode(script),
              "512079be667ef9dcbbac55a06295ce870b07029bfcdb2dce28d959f2815b16f81798");
}

TEST(Bech32Test, EncodesKnownAddress) {
    auto program = HexUtils::decode("751e76e8199196d454941c45d1b3a323f1433bd6");
    EXPECT_EQ(Bech32::encode_segwit("bc", 0, program), "bc1qw508d6qejxtdg4y5r3zarvary0c5xw7kv8f3t4");

    auto taproot = HexUtils::decode("79be667ef9dcbbac55a06295ce870b07029bfcdb2dce28d959f2815b16f81798");
    EXPECT_EQ(Bech32::encode_segwit("bc", 1, taproot),
              "bc1p0xlxvlhemja6c4dqv22uapctqupfhlxm9h8z3k2e72q4k9hcz7vqzk5jj0");
}

TEST(Bech32Test, RejectsBadChecksum) {
    EXPECT_FALSE(Bech32::decode_segwit("bc1qw508d6qejxtdg4y5r3zarvary0c5xw7kv8f3t5").has_value());
}

TEST(Bech32Test, RejectsMixedCase) {
    EXPECT_FALSE(Bech32::decode_segwit(
        "tb1qrp33g0q5c5txsp9arysrx4k6zdkfs4nce4xj0gdcccefvpysxf3q0sL5k7").has_value());
}

TEST(Bech32Test, RejectsLegacyAndGarbage) {
    EXPECT_FALSE(Bech32::decode_segwit("1BvBMSEYstWetqTFn5Au4m4GFg7xJaNVN2").has_value());
    EXPECT_FALSE(Bech32::decode_segwit("").has_value());
    EXPECT_FALSE(Bech32::decode_segwit("bc1").has_value());
}

TEST(Bech32Test, EncodeRejectsBadProgram) {
    std::vector<uint8_t> too_short(1, 0x00);
    EXPECT_THROW(Bech32::encode_segwit("bc", 0, too_short), std::invalid_argument);

    std::vector<uint8_t> program(20, 0x00);
    EXPECT_THROW(Bech32::encode_segwit("bc", 17, program), std::invalid_argument);
}

TEST(Bech32Test, HrpPerNetwork) {
    EXPECT_EQ(bech32_hrp(Network::Main), "bc");
    EXPECT_EQ(bech32_hrp(Network::Test), "tb");
    EXPECT_EQ(bech32_hrp(Network::Signet), "tb");
    EXPECT_EQ(bech32_hrp(Network::Regtest), "bcrt");
}

} // namespace
} // namespace bitcli
