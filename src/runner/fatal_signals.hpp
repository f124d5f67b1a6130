#pragma once

#include <gradebox/common/expected.hpp>

#include <string>

namespace gradebox {

/// What the runner is doing; decides which failure is reported if a fatal signal arrives
enum class RunnerPhase { Startup, LoadingSubmission, LoadingSupport, LoadingTest, RunningTest, Finished };

/// Installs handlers for SIGSEGV, SIGBUS, SIGFPE, SIGILL and SIGABRT.
///
/// On a fatal signal, the handler writes the result message for the current phase to ``result_fd``
/// (unless the phase is Finished) and re-raises the signal with its default disposition.
/// Every message is rendered here, since nothing may be allocated inside the handler.
Expected<> install_fatal_signal_handlers(int result_fd);

void set_runner_phase(RunnerPhase phase);

/// Sets the phase to Finished and returns the previous one.
/// Once Finished, the handlers no longer write anything.
RunnerPhase finish_runner_phase();

/// The encoded result reported for a fatal signal ``signal_num`` during ``phase``. Empty for Finished.
std::string render_fatal_signal_result(RunnerPhase phase, int signal_num);

} // namespace gradebox
