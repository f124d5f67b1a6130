// Calls into the submission before drawing its inputs, and reports what it drew
#include <gradebox/test_api.hpp>

extern "C" int add(int lhs, int rhs);

GRADEBOX_TEST_CASE() {
    if (add(0, 0) != 0) {
        return {false, "add(0, 0) returned {}", add(0, 0)};
    }

    const auto first = gradebox::test_rng()();
    const auto second = gradebox::test_rng()();

    return {true, "drew {} then {}", first, second};
}
