#include <gradebox/test_api.hpp>

#include <csignal>

extern "C" int add(int lhs, int rhs);

GRADEBOX_TEST_CASE() {
    if (add(1, 2) == 3) {
        std::raise(SIGSEGV);
    }

    return {false, "unreachable"};
}
