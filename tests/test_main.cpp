// tests/test_main.cpp
//
// This must be the ONLY translation unit in the test executable that defines
// DOCTEST_CONFIG_IMPLEMENT. All other test .cpp files just include doctest.
#define DOCTEST_CONFIG_IMPLEMENT
#include <doctest/doctest.h>

#include <cstdlib> // std::getenv
#include <cstring> // std::strcmp

namespace {

bool env_truthy(const char* v) {
    // Any non-empty value except "0" counts as true.
    return v != nullptr && v[0] != '\0' && std::strcmp(v, "0") != 0;
}

bool running_in_ci() {
    return env_truthy(std::getenv("CI")) ||
           env_truthy(std::getenv("GITHUB_ACTIONS"));
}

} // namespace

int main(int argc, char** argv) {
    doctest::Context context;

    context.setOption("order-by", "name");        // deterministic ordering
    context.setOption("no-path-filenames", true);

    if (running_in_ci()) {
        context.setOption("no-breaks", true);
        context.setOption("no-colors", true);
    }

    // Let command-line arguments override the defaults above.
    context.applyCommandLine(argc, argv);

    return context.run();
}
