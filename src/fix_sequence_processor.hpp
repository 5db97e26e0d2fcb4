#pragma once

#include <cstddef>
#include <optional>
#include <vector>

#include "fix_record.hpp"
#include "speed_config.hpp"
#include "speed_estimator.hpp"

namespace orbit {
    struct FixSequenceReport {
        SpeedEstimate estimate;
        std::vector<SpeedSample> samples;
        std::size_t missing_fixes = 0;
        std::size_t invalid_fixes = 0;     // coordinate out of range, skipped like a missing fix
        std::size_t rejected_pairs = 0;     // non-positive interval
        std::size_t stationary_pairs = 0;   // zero distance, only counted when skipping is on
    };

    /// Pairs each valid fix with the last valid fix before it. Missing fixes are skipped
    /// without breaking the chain; fixes are taken in the given order and never re-sorted.
    class FixSequenceProcessor {
    public:
        explicit FixSequenceProcessor(const SpeedConfig &config);

        [[nodiscard]] SpeedEstimate process(const std::vector<std::optional<PositionFix> > &fixes) const;

        [[nodiscard]] FixSequenceReport processDetailed(
            const std::vector<std::optional<PositionFix> > &fixes) const;

    private:
        enum class PairingState {
            NoneSeen,
            HavePrevious
        };

        SpeedEstimator estimator_;
        bool skip_stationary_pairs_;
    };
} // namespace orbit
