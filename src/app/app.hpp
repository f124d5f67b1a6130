#pragma once

#include "app/trace_exception.hpp"
#include "user/program_options.hpp"

#include <gradebox/common/class_traits.hpp>

#include <optional>
#include <utility>

namespace gradebox {

class App : NonCopyable
{
public:
    explicit App(ProgramOptions opts)
        : OPTS{std::move(opts)} {}

    virtual ~App() = default;

    const ProgramOptions& get_opts() const noexcept { return OPTS; }

    /// Exit code of run_impl, or INTERNAL_ERROR if it threw
    int run() noexcept {
        std::optional res = wrap_throwable_fn(&App::run_impl, this);

        return res.value_or(INTERNAL_ERROR);
    }

    static constexpr int SUCCESS = 0;
    static constexpr int SETUP_FAULT = 1;
    static constexpr int INTERNAL_ERROR = 2;

    const ProgramOptions OPTS;

protected:
    virtual int run_impl() = 0;
};

} // namespace gradebox
