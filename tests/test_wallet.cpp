#include <gtest/gtest.h>
#include <iterator>
#include <memory>
#include <sstream>
#include "bech32.hpp"
#include "error.hpp"
#include "hex_utils.hpp"
#include "mnemonic.hpp"
#include "wallet.hpp"
#include "test_helpers.hpp"

namespace bitcli {
namespace {

const std::string kMnemonic =
    "abandon abandon abandon abandon abandon abandon "
    "abandon abandon abandon abandon abandon about";

class WalletTest : public ::testing::Test {
protected:
    void SetUp() override {
        options_.api_url = test::API_URL;
        wallet_ = std::make_unique<Wallet>(KeyMaterial(test::test_private_key(), Network::Test), http_, options_);

        std::vector<uint8_t> program(20, 0x22);
        recipient_ = Bech32::encode_segwit("tb", 0, program);

        http_.on_get(url("/api/v1/fees/recommended"), 200, test::fee_json(10, 5, 1));
    }

    std::string url(const std::string& path) const { return std::string(test::API_URL) + path; }

    std::string utxo_url() const { return url("/api/address/" + wallet_->address() + "/utxo"); }

    Transaction posted_tx(size_t index = 0) const {
        std::vector<const test::FakeHttpClient::Request*> posts;
        for (const auto& request : http_.requests) {
            if (request.method == "POST") {
                posts.push_back(&request);
            }
        }
        return TxCodec::deserialize(HexUtils::decode(posts.at(index)->body));
    }

    test::FakeHttpClient http_;
    Wallet::Options options_;
    std::unique_ptr<Wallet> wallet_;
    std::string recipient_;
};

TEST_F(WalletTest, AddressBelongsToNetwork) {
    EXPECT_EQ(wallet_->network(), Network::Test);
    EXPECT_EQ(wallet_->address().rfind("tb1q", 0), 0u);
}

TEST_F(WalletTest, Balance) {
    http_.on_get(url("/api/address/" + wallet_->address()), 200,
                 R"({"chain_stats":{"funded_txo_sum":250000,"spent_txo_sum":50000}})");
    EXPECT_EQ(wallet_->balance(), 200000u);
}

TEST_F(WalletTest, SendBroadcastsSignedPayment) {
    http_.on_get(utxo_url(), 200, "[" + test::utxo_json(test::repeated_txid("aa"), 0, 100000) + "]");
    http_.on_post(url("/api/tx"), 200, "accepted-txid");

    EXPECT_EQ(wallet_->send(recipient_, 50000), "accepted-txid");

    EXPECT_EQ(http_.count("POST", url("/api/tx")), 1u);
    auto tx = posted_tx();
    ASSERT_EQ(tx.inputs.size(), 1u);
    ASSERT_EQ(tx.inputs[0].witness.size(), 2u);
    EXPECT_EQ(tx.inputs[0].witness[1], wallet_->key().public_key());
    ASSERT_EQ(tx.outputs.size(), 2u);
    EXPECT_EQ(tx.outputs[0].value, 50000u);
    EXPECT_EQ(tx.outputs[1].value, 47740u);
    EXPECT_EQ(tx.outputs[1].script_pubkey, wallet_->key().script_pubkey());
}

TEST_F(WalletTest, ExplicitFeeTier) {
    http_.on_get(utxo_url(), 200, "[" + test::utxo_json(test::repeated_txid("aa"), 0, 100000) + "]");
    http_.on_post(url("/api/tx"), 200, "ok");

    wallet_->send(recipient_, 50000, FeeTier::Low);
    EXPECT_EQ(posted_tx().outputs[1].value, 50000u - 226);
}

TEST_F(WalletTest, DefaultTierComesFromOptions) {
    options_.fee_tier = FeeTier::Medium;
    Wallet wallet(KeyMaterial(test::test_private_key(), Network::Test), http_, options_);
    http_.on_get(url("/api/address/" + wallet.address() + "/utxo"), 200,
                 "[" + test::utxo_json(test::repeated_txid("aa"), 0, 100000) + "]");
    http_.on_post(url("/api/tx"), 200, "ok");

    wallet.send(recipient_, 50000);
    EXPECT_EQ(posted_tx().outputs[1].value, 50000u - 1130);
}

TEST_F(WalletTest, RejectedBroadcastReleasesUtxos) {
    http_.on_get(utxo_url(), 200, "[" + test::utxo_json(test::repeated_txid("aa"), 0, 100000) + "]");
    http_.on_post(url("/api/tx"), 400, "min relay fee not met");

    try {
        wallet_->send(recipient_, 50000);
        FAIL() << "send should have thrown";
    } catch (const WalletError& e) {
        EXPECT_EQ(e.type(), WalletError::ErrorType::BroadcastError);
        EXPECT_EQ(std::string(e.what()), "min relay fee not met");
    }
    EXPECT_EQ(http_.count("POST", url("/api/tx")), 1u);
    EXPECT_EQ(wallet_->reservations().size(), 0u);

    // A retry starts over with the same UTXO
    http_.on_post(url("/api/tx"), 200, "accepted-txid");
    EXPECT_EQ(wallet_->send(recipient_, 50000), "accepted-txid");
    EXPECT_EQ(posted_tx(1).inputs.size(), 1u);
}

TEST_F(WalletTest, SpentUtxosStayReserved) {
    const auto first_utxo = test::utxo_json(test::repeated_txid("aa"), 0, 100000);
    const auto second_utxo = test::utxo_json(test::repeated_txid("bb"), 1, 80000);
    http_.on_get(utxo_url(), 200, "[" + first_utxo + "]");
    http_.on_post(url("/api/tx"), 200, "first");
    wallet_->send(recipient_, 50000);
    EXPECT_EQ(wallet_->reservations().size(), 1u);

    // The explorer has not seen the first spend yet and still lists its input
    http_.on_get(utxo_url(), 200, "[" + first_utxo + "," + second_utxo + "]");
    http_.on_post(url("/api/tx"), 200, "second");
    EXPECT_EQ(wallet_->send(recipient_, 20000), "second");

    auto tx = posted_tx(1);
    ASSERT_EQ(tx.inputs.size(), 1u);
    EXPECT_EQ(tx.inputs[0].prevout.txid, TxCodec::parse_txid(test::repeated_txid("bb")));
    EXPECT_EQ(tx.inputs[0].prevout.index, 1u);
    EXPECT_EQ(wallet_->reservations().size(), 2u);
}

TEST_F(WalletTest, ConfirmedSpendDropsReservation) {
    const auto first_utxo = test::utxo_json(test::repeated_txid("aa"), 0, 100000);
    const auto change_utxo = test::utxo_json(test::repeated_txid("cc"), 1, 47740);
    http_.on_get(utxo_url(), 200, "[" + first_utxo + "]");
    http_.on_post(url("/api/tx"), 200, "first");
    wallet_->send(recipient_, 50000);
    ASSERT_EQ(wallet_->reservations().size(), 1u);

    // The explorer now lists only the change of the first spend
    http_.on_get(utxo_url(), 200, "[" + change_utxo + "]");
    http_.on_post(url("/api/tx"), 500, "min relay fee not met");
    EXPECT_EQ(test::error_kind([&] { wallet_->send(recipient_, 20000); }), "BroadcastError");
    EXPECT_EQ(wallet_->reservations().size(), 0u);
}

TEST_F(WalletTest, InsufficientFundsNeverBroadcasts) {
    http_.on_get(utxo_url(), 200, "[" + test::utxo_json(test::repeated_txid("aa"), 0, 1000) + "]");

    EXPECT_EQ(test::error_kind([&] { wallet_->send(recipient_, 50000); }), "InsufficientFunds");
    EXPECT_EQ(http_.count("POST", url("/api/tx")), 0u);
    EXPECT_EQ(wallet_->reservations().size(), 0u);
}

TEST_F(WalletTest, InvalidRecipientNeverBroadcasts) {
    http_.on_get(utxo_url(), 200, "[" + test::utxo_json(test::repeated_txid("aa"), 0, 100000) + "]");

    auto send_to_mainnet = [&] { wallet_->send("bc1qw508d6qejxtdg4y5r3zarvary0c5xw7kv8f3t4", 50000); };
    EXPECT_EQ(test::error_kind(send_to_mainnet), "InvalidAddress");
    EXPECT_NE(test::error_message(send_to_mainnet).find("not valid for network"), std::string::npos);
    EXPECT_EQ(http_.count("POST", url("/api/tx")), 0u);
    EXPECT_EQ(wallet_->reservations().size(), 0u);
}

TEST_F(WalletTest, UtxoFetchFailureStopsSend) {
    http_.on_get(utxo_url(), 502, "Bad Gateway");

    EXPECT_EQ(test::error_kind([&] { wallet_->send(recipient_, 50000); }), "NetworkError");
    EXPECT_EQ(http_.count("GET", url("/api/v1/fees/recommended")), 0u);
}

TEST_F(WalletTest, LogsEachStage) {
    std::ostringstream log;
    options_.log = &log;
    Wallet wallet(KeyMaterial(test::test_private_key(), Network::Test), http_, options_);
    http_.on_get(url("/api/address/" + wallet.address() + "/utxo"), 200,
                 "[" + test::utxo_json(test::repeated_txid("aa"), 0, 100000) + "]");
    http_.on_post(url("/api/tx"), 200, "logged-txid");

    wallet.send(recipient_, 50000);

    const auto text = log.str();
    EXPECT_NE(text.find("[send] fetched 1 UTXOs"), std::string::npos);
    EXPECT_NE(text.find("change 47740 sats (high fee tier)"), std::string::npos);
    EXPECT_NE(text.find("[send] broadcast accepted logged-txid"), std::string::npos);
}

TEST(WalletMnemonicTest, ImportStoresNormalizedPhrase) {
    test::FakeHttpClient http;
    test::InMemoryMnemonicStore store;

    auto wallet = Wallet::from_mnemonic("  Abandon abandon abandon abandon abandon abandon\n"
                                        "abandon abandon abandon abandon abandon ABOUT",
                                        Network::Main, store, http, Wallet::Options{});

    EXPECT_EQ(store.load(), kMnemonic);
    EXPECT_EQ(wallet.address(), "bc1qcr8te4kr609gcawutmrza0j4xv80jy8z306fyu");
    EXPECT_TRUE(http.requests.empty());
}

TEST(WalletMnemonicTest, BadPhraseIsNotStored) {
    test::FakeHttpClient http;
    test::InMemoryMnemonicStore store;

    EXPECT_EQ(test::error_kind([&] {
        Wallet::from_mnemonic("abandon about", Network::Test, store, http, Wallet::Options{});
    }), "KeyDerivationError");
    EXPECT_EQ(store.load(), "");
}

TEST(WalletMnemonicTest, CreateStoresPhraseThatImportsToSameAddress) {
    test::FakeHttpClient http;
    test::InMemoryMnemonicStore store;

    auto created = Wallet::create(Network::Test, store, http, Wallet::Options{});
    const auto phrase = store.load();

    std::istringstream words(phrase);
    EXPECT_EQ(std::distance(std::istream_iterator<std::string>(words), std::istream_iterator<std::string>()), 12);
    EXPECT_EQ(Mnemonic::normalize(phrase), phrase);

    test::InMemoryMnemonicStore other_store;
    auto imported = Wallet::from_mnemonic(phrase, Network::Test, other_store, http, Wallet::Options{});
    EXPECT_EQ(imported.address(), created.address());
    EXPECT_EQ(other_store.load(), phrase);
    EXPECT_TRUE(http.requests.empty());
}

TEST(WalletMnemonicTest, CreateGivesFreshPhrases) {
    test::FakeHttpClient http;
    test::InMemoryMnemonicStore first;
    test::InMemoryMnemonicStore second;

    auto a = Wallet::create(Network::Test, first, http, Wallet::Options{});
    auto b = Wallet::create(Network::Test, second, http, Wallet::Options{});
    EXPECT_NE(first.load(), second.load());
    EXPECT_NE(a.address(), b.address());
}

TEST(WalletMnemonicTest, SignetNeedsExplicitExplorer) {
    test::FakeHttpClient http;
    Wallet wallet(KeyMaterial::from_mnemonic(kMnemonic, Network::Signet), http);

    EXPECT_EQ(wallet.address().rfind("tb1q", 0), 0u);
    EXPECT_EQ(test::error_kind([&] { wallet.balance(); }), "UnsupportedNetwork");
    EXPECT_TRUE(http.requests.empty());
}

} // namespace
} // namespace bitcli
