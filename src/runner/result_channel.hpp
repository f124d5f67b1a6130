#pragma once

#include <gradebox/common/class_traits.hpp>
#include <gradebox/common/expected.hpp>
#include <gradebox/protocol/result_message.hpp>

namespace gradebox {

/// The runner's stdout, reserved for exactly one result message
///
/// Reserving duplicates stdout into a private close-on-exec descriptor and points stdout at stderr,
/// so that anything printed by loaded modules ends up in the runner's diagnostic output.
class ResultChannel : NonMovable
{
public:
    ResultChannel() = default;

    Expected<> reserve();

    /// Writes ``msg``. Only the first call has any effect; the fatal signal handlers are
    /// disarmed beforehand, so a message is never written twice.
    Expected<> emit(const protocol::ResultMessage& msg);

    int get_fd() const { return fd_; }

    bool has_emitted() const { return emitted_; }

private:
    int fd_ = -1;
    bool emitted_ = false;
};

} // namespace gradebox
