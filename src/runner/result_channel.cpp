#include "runner/result_channel.hpp"

#include "runner/fatal_signals.hpp"

#include <gradebox/common/error_types.hpp>
#include <gradebox/common/expected.hpp>
#include <gradebox/common/posix.hpp>
#include <gradebox/logging.hpp>
#include <gradebox/protocol/result_message.hpp>

#include <libassert/assert.hpp>

#include <cstdio>
#include <system_error>

#include <unistd.h>

namespace gradebox {

Expected<> ResultChannel::reserve() {
    ASSERT(fd_ == -1, "the result channel may only be reserved once");

    // Anything buffered so far belongs on the old stdout
    std::fflush(stdout);

    fd_ = TRY(posix::dup(STDOUT_FILENO));

    TRY(posix::dup2(STDERR_FILENO, STDOUT_FILENO));

    return {};
}

Expected<> ResultChannel::emit(const protocol::ResultMessage& msg) {
    ASSERT(fd_ != -1, "emit called before the result channel was reserved");

    if (emitted_) {
        LOG_WARN("Dropping extra result message: {}", msg);
        return {};
    }

    // Disarm the fatal signal handlers first; a fault from here on must not produce a second message
    finish_runner_phase();
    emitted_ = true;

    // Output from loaded modules may still be sitting in stdio's buffer
    std::fflush(stdout);

    return posix::write_all(fd_, protocol::encode(msg));
}

} // namespace gradebox
