/**
 * @file engine_trace.cpp
 */
#include "incrgraph/engine/engine_trace.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>

namespace incrgraph
{

EngineTrace::EngineTrace(std::ostream& out,
                         std::optional<std::string> filter,
                         bool lifecycle,
                         bool eval,
                         bool write,
                         bool notify)
    : m_out(out)
    , m_filter(std::move(filter))
    , m_lifecycle(lifecycle)
    , m_eval(eval)
    , m_write(write)
    , m_notify(notify)
{
}

void EngineTrace::print(const std::string& msg)
{
    m_out << fmt::format("[incrgraph] {}", msg) << '\n';
    ++m_line_count;
}

void EngineTrace::print_node(const NodeRecord& node, const std::string& event, const std::string& details)
{
    if (details.empty())
    {
        print(fmt::format("{} {} {}", event, to_string(node.kind()), node.name()));
    }
    else
    {
        print(fmt::format("{} {} {} {}", event, to_string(node.kind()), node.name(), details));
    }
}

bool EngineTrace::should_log(const NodeRecord& node) const
{
    if (!m_filter.has_value())
    {
        return true;
    }
    return node.name().find(m_filter.value()) != std::string::npos;
}

void EngineTrace::on_node_created(const NodeRecord& node)
{
    if (m_lifecycle && should_log(node))
    {
        print_node(node, "create");
    }
}

void EngineTrace::on_before_evaluation(const NodeRecord& node)
{
    if (m_eval && should_log(node))
    {
        print_node(node, "eval>>");
    }
}

void EngineTrace::on_after_evaluation(const NodeRecord& node, bool value_changed)
{
    if (m_eval && should_log(node))
    {
        print_node(node, "eval<<", value_changed ? "(changed)" : "(unchanged)");
    }
}

void EngineTrace::on_evaluation_failed(const NodeRecord& node, std::exception_ptr error)
{
    if (!m_eval || !should_log(node))
    {
        return;
    }

    std::string reason = "unknown exception";
    if (error)
    {
        try
        {
            std::rethrow_exception(error);
        }
        catch (const std::exception& e)
        {
            reason = e.what();
        }
        catch (...)
        {
            reason = "non-standard exception";
        }
    }
    print_node(node, "eval!!", fmt::format("failed: {}", reason));
}

void EngineTrace::on_write(const NodeRecord& node)
{
    if (m_write && should_log(node))
    {
        print_node(node, "write");
    }
}

void EngineTrace::on_write_skipped(const NodeRecord& node)
{
    if (m_write && should_log(node))
    {
        print_node(node, "write", "(equal, skipped)");
    }
}

void EngineTrace::on_propagation(const PropagationResult& result)
{
    if (m_write && !m_filter.has_value())
    {
        print(fmt::format("propagate #{} -> [{}] dirtied={}",
                          result.origin,
                          fmt::join(result.visited, ", "),
                          result.newly_dirtied));
    }
}

void EngineTrace::on_notify(const NodeRecord& node, size_t observer_count)
{
    if (m_notify && should_log(node))
    {
        print_node(node, "notify", fmt::format("observers={}", observer_count));
    }
}

void EngineTrace::on_dispose(const NodeRecord& node)
{
    if (m_lifecycle && should_log(node))
    {
        print_node(node, "dispose");
    }
}

} // namespace incrgraph
