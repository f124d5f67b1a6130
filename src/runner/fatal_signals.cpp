#include "runner/fatal_signals.hpp"

#include <gradebox/common/expected.hpp>
#include <gradebox/common/posix.hpp>
#include <gradebox/logging.hpp>
#include <gradebox/protocol/result_message.hpp>

#include <fmt/format.h>

#include <array>
#include <atomic>
#include <cerrno>
#include <csignal>
#include <cstddef>
#include <string>

#include <signal.h>
#include <unistd.h>

namespace gradebox {

namespace {

constexpr std::array FATAL_SIGNALS = {SIGSEGV, SIGBUS, SIGFPE, SIGILL, SIGABRT};

constexpr std::size_t NUM_PHASES = static_cast<std::size_t>(RunnerPhase::Finished) + 1;

/// Large enough to run the handler after a stack overflow
constexpr std::size_t ALT_STACK_SIZE = 64 * 1024;

std::atomic<RunnerPhase> current_phase{RunnerPhase::Startup};
static_assert(std::atomic<RunnerPhase>::is_always_lock_free);

volatile std::sig_atomic_t result_fd = -1;

// Indexed by [phase][position in FATAL_SIGNALS]
std::array<std::array<std::string, FATAL_SIGNALS.size()>, NUM_PHASES> rendered_results;

alignas(std::max_align_t) std::array<char, ALT_STACK_SIZE> alt_stack;

std::size_t signal_index(int signal_num) {
    for (std::size_t i = 0; i < FATAL_SIGNALS.size(); ++i) {
        if (FATAL_SIGNALS[i] == signal_num) {
            return i;
        }
    }
    return FATAL_SIGNALS.size();
}

void handle_fatal_signal(int signal_num) {
    const int saved_errno = errno;
    const auto phase = current_phase.exchange(RunnerPhase::Finished);
    const std::size_t idx = signal_index(signal_num);

    if (phase != RunnerPhase::Finished && idx < FATAL_SIGNALS.size() && result_fd != -1) {
        const std::string& msg = rendered_results[static_cast<std::size_t>(phase)][idx];
        const char* data = msg.data();
        std::size_t remaining = msg.size();

        // Only async-signal-safe calls from here on
        while (remaining > 0) {
            ssize_t res = ::write(result_fd, data, remaining);
            if (res == -1) {
                if (errno == EINTR) {
                    continue;
                }
                break;
            }
            data += res;
            remaining -= static_cast<std::size_t>(res);
        }
    }

    errno = saved_errno;

    // SA_RESETHAND has restored the default disposition
    ::raise(signal_num);
}

} // namespace

std::string render_fatal_signal_result(RunnerPhase phase, int signal_num) {
    namespace msgs = protocol::messages;

    const posix::Signal sig{signal_num};
    const std::string description = fmt::format("{} ({})", sig.name(), sig.description());

    switch (phase) {
    case RunnerPhase::Startup:
        return protocol::encode(protocol::ResultMessage::failure(
            std::string{msgs::RUNNER_FAULT}, fmt::format("{} raised during runner startup", description)));
    case RunnerPhase::LoadingSubmission:
        return protocol::encode(protocol::ResultMessage::failure(
            std::string{msgs::SUBMISSION_LOAD_FAILED},
            fmt::format("{} raised while loading the submission", description)));
    case RunnerPhase::LoadingSupport:
        return protocol::encode(protocol::ResultMessage::failure(
            std::string{msgs::SUPPORT_LOAD_FAILED},
            fmt::format("{} raised while loading a support module", description)));
    case RunnerPhase::LoadingTest:
        return protocol::encode(protocol::ResultMessage::failure(
            std::string{msgs::TEST_MODULE_LOAD_FAILED},
            fmt::format("{} raised while loading the test module", description)));
    case RunnerPhase::RunningTest:
        return protocol::encode(protocol::ResultMessage::failure(std::string{msgs::TEST_EXCEPTION}, description));
    case RunnerPhase::Finished:
        return "";
    }

    return "";
}

Expected<> install_fatal_signal_handlers(int fd) {
    for (std::size_t phase = 0; phase < NUM_PHASES; ++phase) {
        for (std::size_t i = 0; i < FATAL_SIGNALS.size(); ++i) {
            rendered_results.at(phase).at(i) =
                render_fatal_signal_result(static_cast<RunnerPhase>(phase), FATAL_SIGNALS.at(i));
        }
    }

    result_fd = fd;

    stack_t stack{};
    stack.ss_sp = alt_stack.data();
    stack.ss_size = alt_stack.size();
    stack.ss_flags = 0;

    if (::sigaltstack(&stack, nullptr) == -1) {
        auto err = posix::make_error_code();
        LOG_DEBUG("sigaltstack failed: '{}'", err.message());
        return err;
    }

    struct sigaction action{};
    action.sa_handler = &handle_fatal_signal;
    action.sa_flags = SA_RESETHAND | SA_ONSTACK; // NOLINT(hicpp-signed-bitwise)
    sigemptyset(&action.sa_mask);

    for (int sig : FATAL_SIGNALS) {
        if (::sigaction(sig, &action, nullptr) == -1) {
            auto err = posix::make_error_code();
            LOG_DEBUG("sigaction({}) failed: '{}'", sig, err.message());
            return err;
        }
    }

    return {};
}

void set_runner_phase(RunnerPhase phase) {
    current_phase.store(phase);
}

RunnerPhase finish_runner_phase() {
    return current_phase.exchange(RunnerPhase::Finished);
}

} // namespace gradebox
