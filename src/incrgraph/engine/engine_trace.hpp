/**
 * @file engine_trace.hpp
 * @brief EngineTrace, an IEngineObserver that logs engine activity.
 */
#pragma once
#include "incrgraph/common/common.hpp"
#include "incrgraph/engine/engine_observer.hpp"

namespace incrgraph
{

/**
 * @brief Logs the steps the engine takes, one line per event.
 *
 * @details
 * This is voluminous but helpful for tracking down unexpected recomputation
 * or notification. Lines have the form
 * `[incrgraph] <event> <node name> <details>` where the node name is
 * `label#id` or `#id`.
 *
 * @par Filtering
 * When `filter` is set, only events whose node name contains it are logged.
 * Propagation summaries name several nodes and are logged only without a
 * filter.
 */
class EngineTrace : public IEngineObserver
{
public:
    /**
     * @param out Stream to write to. Must outlive the trace.
     * @param filter Substring a node name must contain to be logged.
     * @param lifecycle Log node creation and disposal.
     * @param eval Log evaluations.
     * @param write Log writes and propagation.
     * @param notify Log observer notification.
     */
    explicit EngineTrace(std::ostream& out = std::cerr,
                         std::optional<std::string> filter = std::nullopt,
                         bool lifecycle = true,
                         bool eval = true,
                         bool write = true,
                         bool notify = true);

    void on_node_created(const NodeRecord& node) override;
    void on_before_evaluation(const NodeRecord& node) override;
    void on_after_evaluation(const NodeRecord& node, bool value_changed) override;
    void on_evaluation_failed(const NodeRecord& node, std::exception_ptr error) override;
    void on_write(const NodeRecord& node) override;
    void on_write_skipped(const NodeRecord& node) override;
    void on_propagation(const PropagationResult& result) override;
    void on_notify(const NodeRecord& node, size_t observer_count) override;
    void on_dispose(const NodeRecord& node) override;

    /**
     * @brief Number of lines written so far.
     */
    size_t line_count() const noexcept
    {
        return m_line_count;
    }

private:
    std::ostream& m_out;
    std::optional<std::string> m_filter;
    bool m_lifecycle;
    bool m_eval;
    bool m_write;
    bool m_notify;
    size_t m_line_count{0};

    void print(const std::string& msg);
    void print_node(const NodeRecord& node, const std::string& event, const std::string& details = {});
    bool should_log(const NodeRecord& node) const;
};

} // namespace incrgraph
