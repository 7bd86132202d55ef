/**
 * @file engine_config.hpp
 * @brief EngineConfig.
 */
#pragma once
#include "incrgraph/common/common.hpp"
#include "incrgraph/engine/engine_observer.hpp"

namespace incrgraph
{

/**
 * @brief Configuration for engine behavior.
 */
struct EngineConfig
{
    /**
     * @brief Whether to maintain the counters reported by `Engine::stats()`.
     */
    bool collect_stats{false};

    /**
     * @brief Maximum number of derived nodes evaluating at once (nesting depth).
     * @details 0 means unlimited. Exceeding the limit throws `EngineError`
     *          with `EvaluationDepthExceeded` from the read that would nest deeper.
     */
    size_t max_evaluation_depth{0};

    /**
     * @brief Lifecycle observers installed at construction.
     */
    std::vector<IEngineObserver::ptr> observers{};
};

} // namespace incrgraph
