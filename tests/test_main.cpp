#define DOCTEST_CONFIG_IMPLEMENT
#include <doctest/doctest.h>

#include "netbeacon/log.hpp"

#include <cstdio>
#include <cstdlib>

int main(int argc, char** argv) {
    // Quiet by default; NETBEACON_TEST_LOG=debug turns logging back on.
    const char* env = std::getenv("NETBEACON_TEST_LOG");
    const char* level = env ? env : "off";
    if (!netbeacon::set_log_level(level)) {
        std::fprintf(stderr, "unknown NETBEACON_TEST_LOG level: %s\n", level);
        return 2;
    }

    doctest::Context ctx;
    ctx.applyCommandLine(argc, argv);
    return ctx.run();
}
