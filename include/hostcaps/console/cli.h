#pragma once

#include <iosfwd>
#include <string>
#include <vector>

#include "hostcaps/fs/filesystem.h"
#include "hostcaps/probe/feature_probe.h"
#include "hostcaps/probe/host_runtime.h"

namespace hostcaps::console {

enum CliExit : int {
    ExitOk = 0,
    ExitCommandFailed = 1,
    ExitUsage = 2,
};

// Everything the command-line tool touches. The config file named by -c is
// read through `fs`; without one, `defaultProbe` answers when set.
struct CliContext {
    probe::IHostRuntime& host;
    fs::IFileSystem&     fs;
    std::istream&        in;
    std::ostream&        out;
    std::ostream&        err;

    probe::FeatureProbe* defaultProbe{nullptr};
};

// hostcaps [-c <config.yaml>] [--dump-config] [command [args...]]
//
// `args` excludes the program name. Returns ExitOk when every dispatched
// command answered Ok, ExitCommandFailed otherwise, ExitUsage when the
// options themselves are malformed.
int run_cli(const std::vector<std::string>& args, CliContext& ctx);

} // namespace hostcaps::console
