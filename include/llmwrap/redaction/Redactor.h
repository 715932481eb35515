//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Redactor.h
// Purpose: Secret redaction applied to every string that leaves the process (results, errors, log lines)
//==========================================================================================================

#pragma once

#include <string>
#include <vector>

namespace llmwrap {
namespace redaction {

// Replacement text used in tool results and error messages.
constexpr const char* ResultPlaceholder = "(API key redacted due to security reasons)";
// Replacement text used in log lines.
constexpr const char* LogPlaceholder = "***REDACTED***";

//==========================================================================================================
// RedactionRule
// Purpose: Exact-substring replacement of secretValue by placeholder.
//==========================================================================================================
struct RedactionRule {
    std::string secretValue;
    std::string placeholder;
};

//==========================================================================================================
// Redactor
// Purpose: Immutable set of rules loaded once at startup. Redact() is const and touches no shared
//          mutable state, so any number of threads may call it concurrently.
// Notes:
//   A rule whose secret is empty never matches.
//   A rule whose placeholder contains any configured secret is rejected (std::invalid_argument),
//   which keeps Redact idempotent and guarantees the output never contains a secret.
//==========================================================================================================
class Redactor {
public:
    Redactor() = default;
    explicit Redactor(std::vector<RedactionRule> rules);

    // Convenience for the common single-credential case.
    static Redactor ForSecret(const std::string& secret, const std::string& placeholder = ResultPlaceholder);

    std::string Redact(const std::string& text) const;

    // True when text contains any non-empty secret.
    bool Contains(const std::string& text) const;

    bool Empty() const { return rules_.empty(); }

private:
    std::vector<RedactionRule> rules_;
};

} // namespace redaction
} // namespace llmwrap
