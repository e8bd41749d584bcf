#include <iostream>
#include <string>
#include <vector>

#include "hostcaps/console/cli.h"
#include "hostcaps/core/logging.h"
#include "hostcaps/platform/host_runtime.h"

using namespace hostcaps;

static const char* TAG = "hostcaps";

int main(int argc, char** argv)
{
    auto hostFs = platform::create_host_filesystem();
    auto host   = platform::create_host_runtime();
    if (!hostFs || !host) {
        HC_LOGE(TAG, "Failed to create host runtime");
        return console::ExitCommandFailed;
    }

    console::CliContext ctx{
        .host = *host,
        .fs = *hostFs,
        .in = std::cin,
        .out = std::cout,
        .err = std::cerr,
        .defaultProbe = &platform::default_feature_probe(),
    };

    const std::vector<std::string> args(argv + 1, argv + argc);
    return console::run_cli(args, ctx);
}
