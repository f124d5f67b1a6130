#pragma once

#include <boost/stacktrace/stacktrace.hpp>
#include <fmt/format.h>
#include <fmt/ostream.h>

#include <concepts>
#include <exception>
#include <functional>
#include <iostream>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>

namespace gradebox {

template <typename T>
void trace_exception(const T& exception) {
    // Captured within the handler, so the frames point at the catch site
    boost::stacktrace::stacktrace trace;
    std::string except_str = fmt::format("Unhandled exception: {}", exception);
    fmt::print(std::cerr, "{}\n", except_str);
    fmt::print(std::cerr, "{}\n", std::string(except_str.size(), '='));

    std::string stacktrace_str = fmt::to_string(fmt::streamed(trace));
    fmt::print(std::cerr, "Stacktrace:\n{}\n", stacktrace_str.empty() ? " <unavailable>" : stacktrace_str);
}

template <typename Func, typename... Args>
    requires(std::invocable<Func, Args...>)
std::optional<std::invoke_result_t<Func, Args...>> wrap_throwable_fn(Func&& fn, Args&&... args) {
    try {
        return std::invoke(std::forward<Func>(fn), std::forward<Args>(args)...);
    } catch (const std::exception& ex) {
        trace_exception(ex.what());
    } catch (...) {
        trace_exception("<unknown - not derived from std::exception>");
    }

    return std::nullopt;
}

} // namespace gradebox
