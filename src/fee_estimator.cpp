#include "fee_estimator.hpp"
#include <algorithm>
#include <cctype>

namespace bitcli {

namespace {

constexpr uint64_t TX_OVERHEAD_SIZE = 10;
constexpr uint64_t INPUT_SIZE = 148;
constexpr uint64_t OUTPUT_SIZE = 34;

} // namespace

std::string fee_tier_name(FeeTier tier) {
    switch (tier) {
        case FeeTier::Low: return "low";
        case FeeTier::Medium: return "medium";
        case FeeTier::High: return "high";
    }
    return "high";
}

std::optional<FeeTier> parse_fee_tier(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "low") return FeeTier::Low;
    if (lower == "medium") return FeeTier::Medium;
    if (lower == "high") return FeeTier::High;
    return std::nullopt;
}

uint32_t FeeRates::rate(FeeTier tier) const {
    switch (tier) {
        case FeeTier::Low: return low;
        case FeeTier::Medium: return medium;
        case FeeTier::High: return high;
    }
    return high;
}

// The per-input figure is the size of a legacy P2PKH input. A P2WPKH input
// weighs far less once witness data is discounted, so the estimate always
// overpays.
uint64_t FeeEstimator::estimate_size(uint64_t input_count, uint64_t output_count) {
    return TX_OVERHEAD_SIZE + INPUT_SIZE * input_count + OUTPUT_SIZE * output_count;
}

uint64_t FeeEstimator::estimate_fee(uint32_t rate, uint64_t size) {
    return static_cast<uint64_t>(rate) * size;
}

} // namespace bitcli
