#include "hostcaps/diag/diagnostic_provider.h"

#include "hostcaps/probe/feature_probe.h"
#include "hostcaps/probe/version_compare.h"

#include <optional>
#include <string>

namespace hostcaps {
std::string_view version();
} // namespace hostcaps

namespace hostcaps::diag {

namespace {

std::string yes_no(bool v)
{
    return v ? "yes" : "no";
}

std::string path_or_none(const std::optional<std::string>& p)
{
    return p ? *p : std::string("(not found)");
}

class ProbeDiagnosticProvider final : public IDiagnosticProvider {
public:
    explicit ProbeDiagnosticProvider(probe::FeatureProbe& probe)
        : _probe(probe)
    {}

    std::string_view provider_id() const noexcept override { return "probe"; }

    void list_commands(std::vector<DiagCommandSpec>& out) const override
    {
        out.push_back(DiagCommandSpec{
            .name = "probe.report",
            .summary = "all host capabilities",
            .usage = "probe.report",
        });
        out.push_back(DiagCommandSpec{
            .name = "probe.os",
            .summary = "operating system classification",
            .usage = "probe.os",
        });
        out.push_back(DiagCommandSpec{
            .name = "probe.ext",
            .summary = "is a module loaded (at a minimum version)",
            .usage = "probe.ext <name> [min_version]",
        });
        out.push_back(DiagCommandSpec{
            .name = "probe.fn",
            .summary = "is a callable symbol available",
            .usage = "probe.fn <name>",
        });
        out.push_back(DiagCommandSpec{
            .name = "probe.which",
            .summary = "search the PATH for an executable",
            .usage = "probe.which <file>",
        });
        out.push_back(DiagCommandSpec{
            .name = "probe.vercmp",
            .summary = "compare two version strings",
            .usage = "probe.vercmp <a> <b>",
        });
        out.push_back(DiagCommandSpec{
            .name = "probe.modules",
            .summary = "list loaded modules",
            .usage = "probe.modules",
        });
    }

    DiagResult execute(const DiagArgsView& args) override
    {
        if (args.argv.empty()) {
            return DiagResult::invalid_args("missing command");
        }

        const std::string_view cmd = args.argv[0];
        if (cmd == "probe.report")  return cmd_report();
        if (cmd == "probe.os")      return cmd_os();
        if (cmd == "probe.ext")     return cmd_ext(args);
        if (cmd == "probe.fn")      return cmd_fn(args);
        if (cmd == "probe.which")   return cmd_which(args);
        if (cmd == "probe.vercmp")  return cmd_vercmp(args);
        if (cmd == "probe.modules") return cmd_modules();

        return DiagResult::not_found("unknown probe command");
    }

private:
    DiagResult cmd_report()
    {
        const auto os = _probe.osClassification();

        DiagResult r = DiagResult::ok();
        r.add("version", std::string(hostcaps::version()));
        r.add("os", probe::display_name(os));
        r.add("hardlink", yes_no(_probe.supportsHardLink()));
        r.add("symlink", yes_no(_probe.supportsSymLink()));
        r.add("userid", yes_no(_probe.supportsUserId()));
        r.add("image_convert", path_or_none(_probe.getImageConvertExecutable()));
        r.add("image_identify", path_or_none(_probe.getImageIdentifyExecutable()));
        return r;
    }

    DiagResult cmd_os()
    {
        const auto os = _probe.osClassification();
        if (os.name.empty()) {
            return DiagResult::error("operating system name unavailable");
        }

        DiagResult r = DiagResult::ok();
        r.add("family", std::string(probe::to_string(os.family)));
        r.add("name", os.name);
        r.add("unix_like", yes_no(probe::is_unix_like(os)));
        return r;
    }

    DiagResult cmd_ext(const DiagArgsView& args)
    {
        if (args.argv.size() < 2 || args.argv.size() > 3) {
            return DiagResult::invalid_args("usage: probe.ext <name> [min_version]");
        }

        const std::string_view name = args.argv[1];
        std::optional<std::string_view> minVersion;
        if (args.argv.size() == 3) {
            minVersion = args.argv[2];
        }

        const auto loaded = _probe.loadedModuleVersion(name);

        DiagResult r = DiagResult::ok();
        r.add("module", std::string(name));
        r.add("loaded", yes_no(loaded.has_value()));
        if (loaded) {
            r.add("loaded_version", loaded->empty() ? std::string("(none)") : *loaded);
        }
        if (minVersion) {
            r.add("min_version", std::string(*minVersion));
        }
        r.add("supported", yes_no(_probe.hasExtensionSupport(name, minVersion)));
        return r;
    }

    DiagResult cmd_fn(const DiagArgsView& args)
    {
        if (args.argv.size() != 2) {
            return DiagResult::invalid_args("usage: probe.fn <name>");
        }

        DiagResult r = DiagResult::ok();
        r.add("function", std::string(args.argv[1]));
        r.add("available", yes_no(_probe.hasFunction(args.argv[1])));
        return r;
    }

    DiagResult cmd_which(const DiagArgsView& args)
    {
        if (args.argv.size() != 2) {
            return DiagResult::invalid_args("usage: probe.which <file>");
        }

        const auto path = _probe.resolveExecutablePath(args.argv[1]);

        DiagResult r = DiagResult::ok();
        r.add("file", std::string(args.argv[1]));
        r.add("found", yes_no(path.has_value()));
        r.add("path", path_or_none(path));
        return r;
    }

    DiagResult cmd_vercmp(const DiagArgsView& args)
    {
        if (args.argv.size() != 3) {
            return DiagResult::invalid_args("usage: probe.vercmp <a> <b>");
        }

        const int c = probe::compare_versions(args.argv[1], args.argv[2]);
        const char* rel = c < 0 ? "<" : (c > 0 ? ">" : "=");

        DiagResult r = DiagResult::ok();
        r.add("result", rel);
        return r;
    }

    DiagResult cmd_modules()
    {
        DiagResult r = DiagResult::ok();
        for (const auto& name : _probe.loadedModuleNames()) {
            const auto v = _probe.loadedModuleVersion(name);
            r.add(name, v && !v->empty() ? *v : std::string("(none)"));
        }
        return r;
    }

    probe::FeatureProbe& _probe;
};

} // namespace

std::unique_ptr<IDiagnosticProvider> create_probe_diagnostic_provider(probe::FeatureProbe& probe)
{
    return std::make_unique<ProbeDiagnosticProvider>(probe);
}

} // namespace hostcaps::diag
