#pragma once

#include "common/types.h"

namespace tally {
namespace svm {

using namespace tally::common;

/**
 * Rent-exempt minimum balance calculation
 *
 * An account must hold enough lamports to cover its storage for
 * exemption_threshold years, counting a fixed per-account metadata
 * overhead on top of its data length.
 */
class RentCalculator {
public:
    static constexpr Lamports DEFAULT_LAMPORTS_PER_BYTE_YEAR = 3480;
    static constexpr double DEFAULT_EXEMPTION_THRESHOLD = 2.0;
    static constexpr size_t ACCOUNT_STORAGE_OVERHEAD = 128;

    struct RentConfig {
        Lamports lamports_per_byte_year = DEFAULT_LAMPORTS_PER_BYTE_YEAR;
        double exemption_threshold = DEFAULT_EXEMPTION_THRESHOLD;

        RentConfig() = default;
        RentConfig(Lamports per_byte, double threshold)
            : lamports_per_byte_year(per_byte), exemption_threshold(threshold) {}
    };

    explicit RentCalculator(const RentConfig& config);
    RentCalculator();
    ~RentCalculator() = default;

    /// Build from the runtime configuration
    static RentCalculator from_config(const RuntimeConfig& config);

    /**
     * Minimum balance for an account with @p data_size bytes of data
     */
    Lamports minimum_balance(size_t data_size) const;

    /**
     * Check if an account with this balance and size is rent exempt
     */
    bool is_rent_exempt(Lamports balance, size_t data_size) const;

    const RentConfig& get_config() const { return config_; }

private:
    RentConfig config_;
};

} // namespace svm
} // namespace tally
