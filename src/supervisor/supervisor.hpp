#pragma once

#include <gradebox/common/class_traits.hpp>
#include <gradebox/grading_session.hpp>

namespace gradebox {

/// Produces exactly one ResultRecord for each ExecutionRequest
class Supervisor : NonCopyable
{
public:
    virtual ~Supervisor() = default;

    /// Must never throw; every failure is reported through the returned record
    virtual ResultRecord execute(const ExecutionRequest& request) noexcept = 0;
};

} // namespace gradebox
