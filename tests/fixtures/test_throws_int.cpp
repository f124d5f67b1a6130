#include <gradebox/test_api.hpp>

GRADEBOX_TEST_CASE() {
    throw 42;
}
