/**
 * @file StrategyChain.hpp
 * @brief Ordered fallback chain of extraction strategies for one format.
 */

#pragma once
#include <memory>
#include <string>
#include <vector>
#include "domain/ExtractionOutcome.hpp"
#include "domain/ExtractionStrategy.hpp"

namespace docingest::application {

/**
 * @struct ChainStep
 * @brief One strategy plus the policy that decides whether the chain advances past it.
 */
struct ChainStep {
    std::shared_ptr<domain::ExtractionStrategy> strategy;
    /// Quality gate: output shorter than this advances to the next step (0 disables).
    size_t minTextLength = 0;
    /// A failure moves on to the next step instead of ending the chain.
    bool advanceOnFailure = true;
    /// A failure yields empty text with a warning instead of a Failure outcome.
    bool bestEffort = false;
};

/**
 * @class StrategyChain
 * @brief Runs steps in order and aggregates every failure cause.
 *
 * Before any step runs the input is checked for existence and non-zero size so
 * that library code never sees structurally unusable files.
 */
class StrategyChain {
public:
    StrategyChain() = default;
    explicit StrategyChain(std::vector<ChainStep> steps) : m_steps(std::move(steps)) {}

    StrategyChain& then(ChainStep step) {
        m_steps.push_back(std::move(step));
        return *this;
    }

    bool empty() const { return m_steps.empty(); }
    size_t size() const { return m_steps.size(); }

    domain::ExtractionOutcome run(const std::string& localPath) const;

private:
    static domain::StrategyResult runGuarded(domain::ExtractionStrategy& strategy, const std::string& localPath);

    std::vector<ChainStep> m_steps;
};

} // namespace docingest::application
