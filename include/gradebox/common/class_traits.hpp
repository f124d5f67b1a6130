#pragma once

#include <type_traits>

namespace gradebox {

/// Movable, but not copyable.
/// Use as a base class to annotate a class owning a unique resource (fd, pid, dl handle).
class NonCopyable
{
public:
    NonCopyable() = default;

    NonCopyable(const NonCopyable&) = delete;
    NonCopyable& operator=(const NonCopyable&) = delete;

    NonCopyable(NonCopyable&&) = default;
    NonCopyable& operator=(NonCopyable&&) = default;

    ~NonCopyable() = default;
};

/// Neither movable nor copyable.
class NonMovable : public NonCopyable
{
public:
    NonMovable() = default;

    NonMovable(const NonMovable&) = delete;
    NonMovable& operator=(const NonMovable&) = delete;

    NonMovable(NonMovable&&) = delete;
    NonMovable& operator=(NonMovable&&) = delete;

    ~NonMovable() = default;
};

static_assert(!std::is_copy_constructible_v<NonCopyable> && std::is_move_constructible_v<NonCopyable>);
static_assert(!std::is_copy_constructible_v<NonMovable> && !std::is_move_constructible_v<NonMovable>);

} // namespace gradebox
