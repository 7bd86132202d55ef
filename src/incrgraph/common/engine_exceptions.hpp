/**
 * @file engine_exceptions.hpp
 */
#pragma once
#include "incrgraph/common/common.hpp"
#include "incrgraph/common/engine_enums.hpp"

namespace incrgraph
{

/**
 * @brief Error codes for Engine operations.
 *
 * @note Failures raised by user computations and equality predicates are not
 * wrapped; they propagate to the caller with their original type.
 */
enum class EngineErrorCode
{
    UnknownNode,
    NodeKindMismatch,
    ReentrantEvaluation,
    EvaluationDepthExceeded,
    InvalidState
};

/**
 * @brief Exception class for Engine errors.
 *
 * @details
 * `EngineError` is thrown by `Engine` and its components when a node id does
 * not refer to a live node, an operation is applied to the wrong node kind,
 * or the evaluation discipline is violated (re-entrant evaluation, depth
 * limit, disposal of a node under evaluation). Each exception carries an
 * error code and a descriptive message.
 *
 * @par Thread safety
 * - The exception object itself follows standard exception semantics.
 * - Safe to copy and rethrow across threads.
 */
class EngineError : public std::exception
{
public:
    /**
     * @brief Construct an EngineError.
     * @param code The error code indicating the type of error.
     * @param message A descriptive message explaining the error.
     */
    EngineError(EngineErrorCode code, std::string message)
        : m_code(code)
        , m_message(std::move(message))
    {
    }

    /**
     * @brief Get the error code.
     */
    EngineErrorCode code() const noexcept
    {
        return m_code;
    }

    const char* what() const noexcept override
    {
        return m_message.c_str();
    }

private:
    EngineErrorCode m_code;
    std::string m_message;
};

} // namespace incrgraph
