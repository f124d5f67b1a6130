#include "app/grader_app.hpp"
#include "app/trace_exception.hpp"
#include "user/cl_args.hpp"
#include "user/program_options.hpp"

#include <gradebox/logging.hpp>

#include <cstddef>
#include <optional>
#include <span>
#include <utility>

int main(int argc, const char* argv[]) {
    gradebox::init_loggers();

    std::span<const char*> args{argv, static_cast<std::size_t>(argc)};

    std::optional options =
        gradebox::wrap_throwable_fn(&gradebox::parse_args_or_exit, args, gradebox::App::SETUP_FAULT);

    if (!options) {
        return gradebox::App::INTERNAL_ERROR;
    }

    return gradebox::GraderApp{std::move(*options)}.run();
}
