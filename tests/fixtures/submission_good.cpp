// A correct submission
extern "C" int add(int lhs, int rhs) {
    return lhs + rhs;
}
