#include <gtest/gtest.h>
#include "bip32_util.hpp"
#include "bech32.hpp"
#include "consts.hpp"
#include "error.hpp"
#include "hex_utils.hpp"
#include "key_material.hpp"
#include "mnemonic.hpp"
#include "test_helpers.hpp"

namespace bitcli {
namespace {

class KeyMaterialTest : public ::testing::Test {
protected:
    // BIP39 / BIP84 test mnemonic
    const std::string mnemonic_ =
        "abandon abandon abandon abandon abandon abandon "
        "abandon abandon abandon abandon abandon about";
};

TEST_F(KeyMaterialTest, SeedMatchesBip39Vector) {
    auto seed = Mnemonic::to_seed(mnemonic_);
    EXPECT_EQ(HexUtils::encode(seed),
              "5eb00bbddcf069084889a8ab9155568165f5c453ccb85e70811aaed6f6da5fc1"
              "9a5ac40b389cd370d086206dec8aa6c43daea6690f20ad3d8d48b2d2ce9e38e4");
}

TEST_F(KeyMaterialTest, FirstReceiveAddressMatchesBip84) {
    auto key = KeyMaterial::from_mnemonic(mnemonic_, Network::Main);

    EXPECT_EQ(HexUtils::encode(key.public_key()),
              "0330d54fd0dd420a6e5f8d3624f5f3482cae350f79d5f0753bf5beef9c2d91af3c");
    EXPECT_EQ(key.address(), "bc1qcr8te4kr609gcawutmrza0j4xv80jy8z306fyu");
    EXPECT_EQ(key.network(), Network::Main);
}

TEST_F(KeyMaterialTest, SameKeyOnEveryNetwork) {
    auto main = KeyMaterial::from_mnemonic(mnemonic_, Network::Main);
    auto testnet = KeyMaterial::from_mnemonic(mnemonic_, Network::Test);

    EXPECT_EQ(main.public_key(), testnet.public_key());
    EXPECT_EQ(main.script_pubkey(), testnet.script_pubkey());
    EXPECT_EQ(testnet.address().rfind("tb1q", 0), 0u);

    auto decoded = Bech32::decode_segwit(testnet.address());
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded->hrp, "tb");
}

TEST_F(KeyMaterialTest, ScriptPubkeyIsP2wpkh) {
    auto key = KeyMaterial::from_mnemonic(mnemonic_, Network::Main);
    const auto& script = key.script_pubkey();

    ASSERT_EQ(script.size(), 22u);
    EXPECT_EQ(script[0], OP_0);
    EXPECT_EQ(script[1], 0x14);
    EXPECT_EQ(HexUtils::encode(std::span<const uint8_t>(script).subspan(2)),
              "c0cebcd6c3d3ca8c75dc5ec62ebe55330ef910e2");
}

TEST_F(KeyMaterialTest, NormalizesWhitespaceAndCase) {
    auto messy = "  ABANDON abandon\tabandon abandon abandon abandon\n"
                 "abandon abandon abandon abandon abandon About ";
    EXPECT_EQ(Mnemonic::normalize(messy), mnemonic_);

    auto a = KeyMaterial::from_mnemonic(messy, Network::Main);
    EXPECT_EQ(a.address(), "bc1qcr8te4kr609gcawutmrza0j4xv80jy8z306fyu");
}

TEST_F(KeyMaterialTest, RejectsBadWordCount) {
    EXPECT_EQ(test::error_kind([] { Mnemonic::normalize("abandon abandon abandon"); }),
              "KeyDerivationError");
    EXPECT_EQ(test::error_kind([] { Mnemonic::normalize(""); }), "KeyDerivationError");
    EXPECT_EQ(test::error_kind([this] { Mnemonic::normalize(mnemonic_ + " abandon"); }),
              "KeyDerivationError");
}

TEST_F(KeyMaterialTest, RejectsNonAlphabeticWords) {
    EXPECT_EQ(test::error_kind([] {
        Mnemonic::normalize("abandon abandon abandon abandon abandon abandon "
                            "abandon abandon abandon abandon abandon ab0ut");
    }), "KeyDerivationError");
}

TEST_F(KeyMaterialTest, PassphraseChangesSeed) {
    EXPECT_NE(Mnemonic::to_seed(mnemonic_), Mnemonic::to_seed(mnemonic_, "TREZOR"));
}

TEST(KeyMaterialKeyTest, RejectsZeroKey) {
    std::array<uint8_t, 32> zero{};
    EXPECT_EQ(test::error_kind([&] { KeyMaterial key(zero, Network::Test); }), "KeyDerivationError");
}

TEST(KeyMaterialKeyTest, RejectsKeyAboveCurveOrder) {
    std::array<uint8_t, 32> too_big;
    too_big.fill(0xff);
    EXPECT_EQ(test::error_kind([&] { KeyMaterial key(too_big, Network::Test); }), "KeyDerivationError");
}

TEST(KeyMaterialKeyTest, RejectsShortKey) {
    std::vector<uint8_t> short_key(31, 0x11);
    EXPECT_EQ(test::error_kind([&] { KeyMaterial key(short_key, Network::Test); }), "KeyDerivationError");
}

TEST(KeyMaterialKeyTest, DerivesPublicKeyFromRawKey) {
    auto private_key = HexUtils::decode("619c335025c7f4012e556c2a58b2506e30b8511b53ade95ea316fd8c3286feb9");
    KeyMaterial key(private_key, Network::Main);

    EXPECT_EQ(HexUtils::encode(key.public_key()),
              "025476c2e83188368da1ff3e292e7acafcdb3566bb0ad253f62fc70f07aeee6357");
    EXPECT_EQ(HexUtils::encode(key.script_pubkey()), "00141d0f172a0ecb48aee1be1f2687d2963ae33f71a1");
    EXPECT_EQ(std::vector<uint8_t>(key.private_key().begin(), key.private_key().end()), private_key);
}

TEST(Bip32Test, RejectsMalformedPath) {
    std::array<uint8_t, 64> seed{};
    seed.fill(0x42);
    auto master = Bip32Util::master_from_seed(seed);

    EXPECT_EQ(test::error_kind([&] { Bip32Util::get_child_key_at_path(master, "m/84'//0"); }),
              "KeyDerivationError");
    EXPECT_EQ(test::error_kind([&] { Bip32Util::get_child_key_at_path(master, "m/abc"); }),
              "KeyDerivationError");
}

TEST(Bip32Test, PathDepth) {
    std::array<uint8_t, 64> seed{};
    seed.fill(0x42);
    auto master = Bip32Util::master_from_seed(seed);
    auto child = Bip32Util::get_child_key_at_path(master, Mnemonic::DERIVATION_PATH);

    EXPECT_EQ(child.depth, 5);
    EXPECT_EQ(child.child_number, 0u);
    EXPECT_TRUE(Bip32Util::is_valid_private_key(child.key));
}

} // namespace
} // namespace bitcli
