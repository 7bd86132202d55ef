/**
 * @file engine_stats.hpp
 * @brief Definition of EngineStats returned by Engine::stats().
 */
#pragma once
#include "incrgraph/common/common.hpp"

namespace incrgraph
{

/**
 * @brief Counters describing the work an Engine has done.
 *
 * @details
 * Only maintained when `EngineConfig::collect_stats` is set; otherwise all
 * counters stay zero.
 */
struct EngineStats
{
    size_t nodes_created{0};
    size_t nodes_disposed{0};

    /// Completed evaluations of derived nodes.
    size_t evaluations{0};

    /// Evaluations that ended with an exception.
    size_t evaluation_failures{0};

    /// Reads of clean derived nodes served from the cache.
    size_t cache_hits{0};

    /// Evaluations whose result compared equal to the cached value.
    size_t unchanged_results{0};

    /// Writes to source nodes, including skipped ones.
    size_t writes{0};

    /// Writes discarded because the value compared equal.
    size_t writes_skipped{0};

    size_t propagations{0};

    /// Derived nodes whose dirty flag was set by propagation.
    size_t nodes_dirtied{0};

    /// Individual observer callback invocations.
    size_t notifications{0};

    /**
     * @brief Get a summary string for logging.
     */
    std::string summary() const
    {
        std::string result = "Engine stats";
        result += " (nodes=" + std::to_string(nodes_created);
        result += ", disposed=" + std::to_string(nodes_disposed);
        result += ", evaluations=" + std::to_string(evaluations);
        result += ", failures=" + std::to_string(evaluation_failures);
        result += ", cache_hits=" + std::to_string(cache_hits);
        result += ", unchanged=" + std::to_string(unchanged_results);
        result += ", writes=" + std::to_string(writes);
        result += ", skipped=" + std::to_string(writes_skipped);
        result += ", propagations=" + std::to_string(propagations);
        result += ", dirtied=" + std::to_string(nodes_dirtied);
        result += ", notifications=" + std::to_string(notifications) + ")";
        return result;
    }
};

} // namespace incrgraph
