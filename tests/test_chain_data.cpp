#include <gtest/gtest.h>
#include "chain_data.hpp"
#include "error.hpp"
#include "test_helpers.hpp"

namespace bitcli {
namespace {

const std::string kAddress = "tb1qexampleaddress";

class ChainDataTest : public ::testing::Test {
protected:
    std::string url(const std::string& path) const { return std::string(test::API_URL) + path; }

    test::FakeHttpClient http_;
    ChainDataFetcher fetcher_{http_, Network::Test, std::string(test::API_URL)};
};

TEST_F(ChainDataTest, BalanceIsFundedMinusSpent) {
    http_.on_get(url("/api/address/" + kAddress), 200,
                 R"({"address":"tb1qexampleaddress",
                     "chain_stats":{"funded_txo_count":3,"funded_txo_sum":150000,
                                    "spent_txo_count":1,"spent_txo_sum":40000,"tx_count":4},
                     "mempool_stats":{"funded_txo_sum":7000,"spent_txo_sum":0}})");

    EXPECT_EQ(fetcher_.fetch_balance(kAddress), 110000u);
}

TEST_F(ChainDataTest, BalanceRejectsSpentAboveFunded) {
    http_.on_get(url("/api/address/" + kAddress), 200,
                 R"({"chain_stats":{"funded_txo_sum":100,"spent_txo_sum":200}})");

    EXPECT_EQ(test::error_kind([&] { fetcher_.fetch_balance(kAddress); }), "DecodeError");
}

TEST_F(ChainDataTest, BalanceRejectsMissingStats) {
    http_.on_get(url("/api/address/" + kAddress), 200, R"({"address":"tb1q"})");

    EXPECT_EQ(test::error_kind([&] { fetcher_.fetch_balance(kAddress); }), "DecodeError");
}

TEST_F(ChainDataTest, ParsesConfirmedAndUnconfirmedUtxos) {
    http_.on_get(url("/api/address/" + kAddress + "/utxo"), 200,
                 "[" + test::utxo_json(test::repeated_txid("aa"), 1, 100000) + ","
                 R"({"txid":")" + test::repeated_txid("bb") +
                 R"(","vout":0,"status":{"confirmed":false},"value":2500}])");

    auto utxos = fetcher_.fetch_utxos(kAddress);
    ASSERT_EQ(utxos.size(), 2u);

    EXPECT_EQ(utxos[0].txid, test::repeated_txid("aa"));
    EXPECT_EQ(utxos[0].vout, 1u);
    EXPECT_EQ(utxos[0].value, 100000u);
    EXPECT_TRUE(utxos[0].confirmed);
    EXPECT_EQ(utxos[0].block_height, 100u);
    EXPECT_EQ(utxos[0].block_time, 1700000000u);
    EXPECT_TRUE(utxos[0].block_hash.has_value());

    EXPECT_FALSE(utxos[1].confirmed);
    EXPECT_EQ(utxos[1].value, 2500u);
    EXPECT_FALSE(utxos[1].block_height.has_value());
    EXPECT_FALSE(utxos[1].block_hash.has_value());
    EXPECT_EQ(utxos[1].outpoint_key(), test::repeated_txid("bb") + ":0");
}

TEST_F(ChainDataTest, EmptyUtxoList) {
    http_.on_get(url("/api/address/" + kAddress + "/utxo"), 200, "[]");
    EXPECT_TRUE(fetcher_.fetch_utxos(kAddress).empty());
}

TEST_F(ChainDataTest, UtxoResponseMustBeArray) {
    http_.on_get(url("/api/address/" + kAddress + "/utxo"), 200, R"({"txid":"aa"})");
    EXPECT_EQ(test::error_kind([&] { fetcher_.fetch_utxos(kAddress); }), "DecodeError");
}

TEST_F(ChainDataTest, UtxoMissingFieldIsDecodeError) {
    http_.on_get(url("/api/address/" + kAddress + "/utxo"), 200,
                 R"([{"txid":"aa","status":{"confirmed":true},"value":1}])");
    EXPECT_EQ(test::error_kind([&] { fetcher_.fetch_utxos(kAddress); }), "DecodeError");
}

TEST_F(ChainDataTest, NegativeUtxoValueIsDecodeError) {
    http_.on_get(url("/api/address/" + kAddress + "/utxo"), 200,
                 R"([{"txid":")" + test::repeated_txid("aa") +
                 R"(","vout":0,"status":{"confirmed":true},"value":-1}])");
    EXPECT_EQ(test::error_kind([&] { fetcher_.fetch_utxos(kAddress); }), "DecodeError");
}

TEST_F(ChainDataTest, UtxoVoutOutOfRangeIsDecodeError) {
    http_.on_get(url("/api/address/" + kAddress + "/utxo"), 200,
                 R"([{"txid":")" + test::repeated_txid("aa") +
                 R"(","vout":4294967296,"status":{"confirmed":true},"value":1000}])");
    EXPECT_EQ(test::error_kind([&] { fetcher_.fetch_utxos(kAddress); }), "DecodeError");
}

TEST_F(ChainDataTest, FractionalBlockHeightIsDecodeError) {
    http_.on_get(url("/api/address/" + kAddress + "/utxo"), 200,
                 R"([{"txid":")" + test::repeated_txid("aa") +
                 R"(","vout":0,"status":{"confirmed":true,"block_height":10.5},"value":1000}])");
    EXPECT_EQ(test::error_kind([&] { fetcher_.fetch_utxos(kAddress); }), "DecodeError");
}

TEST_F(ChainDataTest, NegativeBalanceSumIsDecodeError) {
    http_.on_get(url("/api/address/" + kAddress), 200,
                 R"({"chain_stats":{"funded_txo_sum":-5,"spent_txo_sum":0}})");
    EXPECT_EQ(test::error_kind([&] { fetcher_.fetch_balance(kAddress); }), "DecodeError");
}

TEST_F(ChainDataTest, BooleanFeeRateIsDecodeError) {
    http_.on_get(url("/api/v1/fees/recommended"), 200,
                 R"({"fastestFee":true,"halfHourFee":10,"hourFee":8,"economyFee":4,"minimumFee":2})");
    EXPECT_EQ(test::error_kind([&] { fetcher_.fetch_fee_rates(); }), "DecodeError");
}

TEST_F(ChainDataTest, FractionalFeeRateIsDecodeError) {
    http_.on_get(url("/api/v1/fees/recommended"), 200,
                 R"({"fastestFee":12,"halfHourFee":10,"hourFee":8,"economyFee":4,"minimumFee":1.9})");
    EXPECT_EQ(test::error_kind([&] { fetcher_.fetch_fee_rates(); }), "DecodeError");
}

TEST_F(ChainDataTest, FeeRateAboveUint32IsDecodeError) {
    http_.on_get(url("/api/v1/fees/recommended"), 200,
                 R"({"fastestFee":4294967296,"halfHourFee":10,"hourFee":8,"economyFee":4,"minimumFee":2})");
    EXPECT_EQ(test::error_kind([&] { fetcher_.fetch_fee_rates(); }), "DecodeError");
}

TEST_F(ChainDataTest, MapsFeeTiers) {
    http_.on_get(url("/api/v1/fees/recommended"), 200, test::fee_json(12, 10, 2));

    auto rates = fetcher_.fetch_fee_rates();
    EXPECT_EQ(rates.high, 12u);
    EXPECT_EQ(rates.medium, 10u);
    EXPECT_EQ(rates.low, 2u);
}

TEST_F(ChainDataTest, FeeResponseNeedsEveryField) {
    http_.on_get(url("/api/v1/fees/recommended"), 200,
                 R"({"fastestFee":12,"halfHourFee":10,"minimumFee":2})");
    EXPECT_EQ(test::error_kind([&] { fetcher_.fetch_fee_rates(); }), "DecodeError");
}

TEST_F(ChainDataTest, NonJsonBodyIsDecodeError) {
    http_.on_get(url("/api/v1/fees/recommended"), 200, "<html>rate limited</html>");
    EXPECT_EQ(test::error_kind([&] { fetcher_.fetch_fee_rates(); }), "DecodeError");
}

TEST_F(ChainDataTest, HttpErrorIsNetworkError) {
    http_.on_get(url("/api/address/" + kAddress), 503, "Service Unavailable");
    EXPECT_EQ(test::error_kind([&] { fetcher_.fetch_balance(kAddress); }), "NetworkError");
}

TEST_F(ChainDataTest, TransportFailureIsNetworkError) {
    http_.fail_transport(url("/api/address/" + kAddress + "/utxo"));
    EXPECT_EQ(test::error_kind([&] { fetcher_.fetch_utxos(kAddress); }), "NetworkError");
}

TEST(ChainDataUrlTest, SignetWithoutOverrideIsUnsupported) {
    test::FakeHttpClient http;
    ChainDataFetcher fetcher(http, Network::Signet);

    EXPECT_EQ(test::error_kind([&] { fetcher.fetch_fee_rates(); }), "UnsupportedNetwork");
    EXPECT_EQ(test::error_kind([&] { fetcher.fetch_balance(kAddress); }), "UnsupportedNetwork");
    EXPECT_TRUE(http.requests.empty());
}

TEST(ChainDataUrlTest, UsesNetworkDefaultUrl) {
    test::FakeHttpClient http;
    http.on_get("https://mempool.space/testnet4/api/v1/fees/recommended", 200, test::fee_json(3));
    ChainDataFetcher fetcher(http, Network::Test);

    EXPECT_EQ(fetcher.fetch_fee_rates().high, 3u);
    ASSERT_EQ(http.requests.size(), 1u);
    EXPECT_EQ(http.requests[0].method, "GET");
}

TEST(ChainDataUrlTest, OverrideDropsTrailingSlash) {
    test::FakeHttpClient http;
    http.on_get("http://localhost:3002/api/v1/fees/recommended", 200, test::fee_json(7));
    ChainDataFetcher fetcher(http, Network::Regtest, std::string("http://localhost:3002/"));

    EXPECT_EQ(fetcher.fetch_fee_rates().high, 7u);
}

TEST(NetworkTest, Names) {
    EXPECT_EQ(network_name(Network::Main), "bitcoin");
    EXPECT_EQ(network_name(Network::Test), "testnet");
    EXPECT_EQ(parse_network("mainnet"), Network::Main);
    EXPECT_EQ(parse_network("testnet"), Network::Test);
    EXPECT_EQ(parse_network("signet"), Network::Signet);
    EXPECT_EQ(parse_network("regtest"), Network::Regtest);
    EXPECT_FALSE(parse_network("litecoin").has_value());
    EXPECT_EQ(default_api_url(Network::Main), "https://mempool.space");
    EXPECT_FALSE(default_api_url(Network::Signet).has_value());
}

} // namespace
} // namespace bitcli
