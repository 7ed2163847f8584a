/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef DECISION_ADVISOR_HPP
#define DECISION_ADVISOR_HPP

#include <cstddef>
#include <optional>
#include <string>

namespace Amortize {

struct AdvisorQuery {
    std::string functionId;
    size_t totalItems{0};     // 0 when not known before sampling
    size_t physicalCores{1};
};

struct AdvisorHint {
    size_t workerCount{1};
    size_t batchSize{1};
    double confidence{0.0};   // 0..1
};

/**
 * @brief External source of (workers, batch) suggestions
 *
 * A hint below the planner's confidence threshold is ignored and planning
 * proceeds from measurements.
 */
class DecisionAdvisor {
public:
    virtual ~DecisionAdvisor() = default;

    virtual std::optional<AdvisorHint> advise(const AdvisorQuery& query) = 0;
};

} // namespace Amortize

#endif // DECISION_ADVISOR_HPP
