/**
 * PTCG Core - Rule Violations
 *
 * Violations describe why an action is illegal. They are data, never a
 * crash signal; severity lets callers let warnings through.
 */

#pragma once

#include "types.hpp"

namespace ptcg {

enum class ViolationSeverity : uint8_t {
    WARNING,
    ERROR,
    FATAL
};

inline const char* to_string(ViolationSeverity severity) {
    switch (severity) {
        case ViolationSeverity::WARNING: return "Warning";
        case ViolationSeverity::ERROR: return "Error";
        case ViolationSeverity::FATAL: return "Fatal";
        default: return "Unknown";
    }
}

struct RuleViolation {
    std::string rule_name;
    std::string message;
    ViolationSeverity severity = ViolationSeverity::ERROR;

    RuleViolation() = default;
    RuleViolation(std::string rule, std::string msg, ViolationSeverity sev)
        : rule_name(std::move(rule))
        , message(std::move(msg))
        , severity(sev)
    {}

    bool is_blocking() const {
        return severity == ViolationSeverity::ERROR || severity == ViolationSeverity::FATAL;
    }

    bool operator==(const RuleViolation& other) const {
        return rule_name == other.rule_name && message == other.message && severity == other.severity;
    }
};

/**
 * Result of validating and applying one action.
 *
 * success is false when a blocking violation stopped the action; violations
 * may still hold warnings on success.
 */
struct ActionResult {
    bool success = false;
    std::vector<RuleViolation> violations;

    bool has_blocking_violation() const {
        for (const auto& v : violations) {
            if (v.is_blocking()) return true;
        }
        return false;
    }
};

} // namespace ptcg
