#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace hostcaps::diag {

enum class DiagStatus : std::uint8_t {
    Ok = 0,
    Error,
    NotFound,
    InvalidArgs,
};

struct DiagResult {
    DiagStatus status{DiagStatus::Ok};

    // Human-readable output. Keep it line-oriented.
    std::string text;

    // Structured output: key/value strings in report order.
    std::vector<std::pair<std::string, std::string>> kv;

    static DiagResult ok(std::string t = {}) {
        DiagResult r;
        r.status = DiagStatus::Ok;
        r.text = std::move(t);
        return r;
    }

    static DiagResult error(std::string t) {
        DiagResult r;
        r.status = DiagStatus::Error;
        r.text = std::move(t);
        return r;
    }

    static DiagResult invalid_args(std::string t) {
        DiagResult r;
        r.status = DiagStatus::InvalidArgs;
        r.text = std::move(t);
        return r;
    }

    static DiagResult not_found(std::string t) {
        DiagResult r;
        r.status = DiagStatus::NotFound;
        r.text = std::move(t);
        return r;
    }

    // Append "key: value" to both the text and the structured output.
    void add(std::string key, std::string value) {
        text += key;
        text += ": ";
        text += value;
        text += "\n";
        kv.emplace_back(std::move(key), std::move(value));
    }

    // Look up a structured value; empty when absent.
    std::string_view value(std::string_view key) const {
        for (const auto& [k, v] : kv) {
            if (k == key) return v;
        }
        return {};
    }
};

struct DiagCommandSpec {
    // Fully-qualified command name, e.g. "probe.report", "probe.ext"
    std::string name;

    // Short help line
    std::string summary;

    // Usage string, e.g. "probe.ext <name> [min_version]"
    std::string usage;
};

// A lightweight, immutable view of argv
struct DiagArgsView {
    std::string_view line;
    std::vector<std::string_view> argv;  // argv[0] is command, rest are args
};

std::string_view to_string(DiagStatus status);

} // namespace hostcaps::diag
