#include "hostcaps/console/cli.h"

#include "hostcaps/config/probe_config.h"
#include "hostcaps/config/probe_config_yaml_store.h"
#include "hostcaps/console/console_parse.h"
#include "hostcaps/core/logging.h"
#include "hostcaps/diag/diagnostic_provider.h"
#include "hostcaps/diag/diagnostic_registry.h"

#include <boost/program_options.hpp>

#include <istream>
#include <memory>
#include <ostream>
#include <string_view>

namespace po = boost::program_options;

namespace hostcaps {
std::string_view version();
} // namespace hostcaps

namespace hostcaps::console {

static constexpr const char* TAG = "cli";

namespace {

struct CliOptions {
    std::string configPath;
    bool dumpConfig{false};
    bool help{false};
    std::vector<std::string> command;
};

po::options_description visible_options(CliOptions& o)
{
    po::options_description desc("Options");
    desc.add_options()
        ("help,h",      po::bool_switch(&o.help),                 "Show this help")
        ("config,c",    po::value<std::string>(&o.configPath),    "YAML probe settings")
        ("dump-config", po::bool_switch(&o.dumpConfig),           "Print the effective settings")
        ;
    return desc;
}

void print_usage(std::ostream& os, const po::options_description& desc)
{
    os << "usage: hostcaps [-c <config.yaml>] [--dump-config] [command [args...]]\n"
          "       hostcaps [-c <config.yaml>] -        (commands from stdin)\n"
          "       hostcaps help                        (list commands)\n"
       << desc;
}

void print_commands(std::ostream& os, const diag::DiagnosticRegistry& registry)
{
    std::vector<diag::DiagCommandSpec> cmds;
    registry.list_all_commands(cmds);
    for (const auto& c : cmds) {
        os << c.usage << "\n    " << c.summary << "\n";
    }
}

// Run one command and print its output. Returns true when it answered Ok.
bool run_command(CliContext& ctx,
                 diag::DiagnosticRegistry& registry,
                 std::string_view line,
                 const std::vector<std::string_view>& argv)
{
    diag::DiagArgsView args;
    args.line = line;
    args.argv = argv;

    const diag::DiagResult r = registry.dispatch(args);
    if (r.status != diag::DiagStatus::Ok) {
        ctx.err << "error (" << diag::to_string(r.status) << "): " << r.text << "\n";
        return false;
    }
    ctx.out << r.text;
    return true;
}

} // namespace

int run_cli(const std::vector<std::string>& args, CliContext& ctx)
{
    CliOptions opts;
    const po::options_description desc = visible_options(opts);

    po::options_description hidden;
    hidden.add_options()
        ("command", po::value<std::vector<std::string>>(&opts.command), "Command and its arguments")
        ;

    po::options_description all;
    all.add(desc).add(hidden);

    po::positional_options_description positional;
    positional.add("command", -1);

    try {
        po::variables_map vm;
        po::store(po::command_line_parser(args).options(all).positional(positional).run(), vm);
        po::notify(vm);
    } catch (const po::error& ex) {
        ctx.err << "hostcaps: " << ex.what() << "\n";
        print_usage(ctx.err, desc);
        return ExitUsage;
    }

    if (opts.help) {
        print_usage(ctx.out, desc);
        return ExitOk;
    }

    HC_LOGI(TAG, "hostcaps %.*s starting",
            static_cast<int>(hostcaps::version().size()), hostcaps::version().data());

    config::ProbeConfig cfg{};
    if (!opts.configPath.empty()) {
        config::YamlProbeConfigStoreFs store(ctx.fs, opts.configPath);
        cfg = store.load();
    }

    if (opts.dumpConfig) {
        ctx.out << config::to_yaml_string(cfg);
        if (opts.command.empty()) {
            return ExitOk;
        }
    }

    std::unique_ptr<probe::FeatureProbe> configured;
    if (!opts.configPath.empty() || !ctx.defaultProbe) {
        configured = std::make_unique<probe::FeatureProbe>(ctx.host, ctx.fs, cfg);
    }
    probe::FeatureProbe& featureProbe = configured ? *configured : *ctx.defaultProbe;

    auto provider = diag::create_probe_diagnostic_provider(featureProbe);
    diag::DiagnosticRegistry registry;
    registry.add_provider(*provider);

    if (opts.command.empty()) {
        return run_command(ctx, registry, "probe.report", {"probe.report"}) ? ExitOk : ExitCommandFailed;
    }

    if (opts.command.size() == 1 && opts.command[0] == "help") {
        print_commands(ctx.out, registry);
        return ExitOk;
    }

    if (opts.command.size() == 1 && opts.command[0] == "-") {
        bool allOk = true;
        std::string line;
        while (std::getline(ctx.in, line)) {
            if (is_comment_or_blank(line)) {
                continue;
            }
            const auto tokens = split_ws(line);
            allOk = run_command(ctx, registry, line, tokens) && allOk;
        }
        return allOk ? ExitOk : ExitCommandFailed;
    }

    std::string line;
    std::vector<std::string_view> tokens;
    for (const auto& c : opts.command) {
        if (!line.empty()) {
            line += ' ';
        }
        line += c;
        tokens.emplace_back(c);
    }
    return run_command(ctx, registry, line, tokens) ? ExitOk : ExitCommandFailed;
}

} // namespace hostcaps::console
