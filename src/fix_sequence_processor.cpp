#include "fix_sequence_processor.hpp"

#include <iostream>

#include "geodesic.hpp"

namespace orbit {
    FixSequenceProcessor::FixSequenceProcessor(const SpeedConfig &config)
        : estimator_(config), skip_stationary_pairs_(config.skip_stationary_pairs) {
    }

    SpeedEstimate FixSequenceProcessor::process(const std::vector<std::optional<PositionFix> > &fixes) const {
        return processDetailed(fixes).estimate;
    }

    FixSequenceReport FixSequenceProcessor::processDetailed(
        const std::vector<std::optional<PositionFix> > &fixes) const {
        FixSequenceReport report;
        PairingState state = PairingState::NoneSeen;
        PositionFix previous;
        size_t previous_index = 0;

        for (size_t i = 0; i < fixes.size(); ++i) {
            if (!fixes[i]) {
                ++report.missing_fixes;
                continue;
            }
            const PositionFix &current = *fixes[i];
            if (!isValidCoordinate(current.latitude, current.longitude)) {
                ++report.invalid_fixes;
                std::cout << "[Speed] fix " << i << " skipped: invalid coordinate lat="
                        << current.latitude << ", lon=" << current.longitude << std::endl;
                continue;
            }

            if (state == PairingState::HavePrevious) {
                try {
                    SpeedSample sample = estimator_.sampleSpeed({previous, current});
                    sample.earlier_index = previous_index;
                    sample.later_index = i;
                    if (skip_stationary_pairs_ && sample.distance_km == 0.0) {
                        ++report.stationary_pairs;
                        std::cout << "[Speed] pair " << previous_index << "->" << i
                                << " skipped: zero distance" << std::endl;
                    } else {
                        report.samples.push_back(sample);
                    }
                } catch (const DegenerateInterval &e) {
                    ++report.rejected_pairs;
                    std::cout << "[Speed] pair " << previous_index << "->" << i
                            << " skipped: " << e.what() << std::endl;
                }
            }

            previous = current;
            previous_index = i;
            state = PairingState::HavePrevious;
        }

        report.estimate = estimator_.aggregate(report.samples);
        std::cout << "[Speed] done: fixes=" << fixes.size()
                << ", missing=" << report.missing_fixes
                << ", invalid=" << report.invalid_fixes
                << ", samples=" << report.samples.size()
                << ", rejected=" << report.rejected_pairs
                << ", stationary=" << report.stationary_pairs << std::endl;
        return report;
    }
} // namespace orbit
