#include "hostcaps/diag/diagnostic_registry.h"

namespace hostcaps::diag {

std::string_view to_string(DiagStatus status)
{
    switch (status) {
    case DiagStatus::Ok:          return "ok";
    case DiagStatus::Error:       return "error";
    case DiagStatus::NotFound:    return "not found";
    case DiagStatus::InvalidArgs: return "invalid arguments";
    }
    return "unknown";
}

void DiagnosticRegistry::add_provider(IDiagnosticProvider& p)
{
    std::lock_guard<std::mutex> lock(_mutex);
    _providers.push_back(&p);
}

void DiagnosticRegistry::list_all_commands(std::vector<DiagCommandSpec>& out) const
{
    std::lock_guard<std::mutex> lock(_mutex);
    for (const auto* p : _providers) {
        p->list_commands(out);
    }
}

DiagResult DiagnosticRegistry::dispatch(const DiagArgsView& args)
{
    if (args.argv.empty()) {
        return DiagResult::invalid_args("missing command");
    }

    std::lock_guard<std::mutex> lock(_mutex);
    for (auto* p : _providers) {
        DiagResult r = p->execute(args);
        if (r.status != DiagStatus::NotFound) {
            return r;
        }
    }
    return DiagResult::not_found("Unknown command");
}

} // namespace hostcaps::diag
