#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace bitcli {

enum class FeeTier {
    Low,
    Medium,
    High
};

std::string fee_tier_name(FeeTier tier);
std::optional<FeeTier> parse_fee_tier(const std::string& name);

// Fee rates in satoshis per byte
struct FeeRates {
    uint32_t low = 0;    // minimumFee
    uint32_t medium = 0; // halfHourFee
    uint32_t high = 0;   // fastestFee

    uint32_t rate(FeeTier tier) const;
};

class FeeEstimator {
public:
    // Legacy (non-witness-discounted) size estimate:
    // 10 + 148 per input + 34 per output
    static uint64_t estimate_size(uint64_t input_count, uint64_t output_count);

    // rate * size, truncating integer arithmetic
    static uint64_t estimate_fee(uint32_t rate, uint64_t size);

private:
    FeeEstimator() = delete;
};

} // namespace bitcli
