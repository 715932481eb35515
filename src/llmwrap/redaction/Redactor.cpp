//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Redactor.cpp
// Purpose: Redactor implementation
//==========================================================================================================

#include "llmwrap/redaction/Redactor.h"

#include <algorithm>
#include <stdexcept>

namespace llmwrap {
namespace redaction {

namespace {
constexpr int MaxPasses = 8;

void replaceAll(std::string& text, const std::string& needle, const std::string& with) {
    std::size_t pos = 0;
    while ((pos = text.find(needle, pos)) != std::string::npos) {
        text.replace(pos, needle.size(), with);
        pos += with.size();
    }
}
} // namespace

Redactor::Redactor(std::vector<RedactionRule> rules) {
    for (auto& r : rules) {
        if (r.secretValue.empty()) {
            continue;
        }
        rules_.push_back(std::move(r));
    }
    for (const auto& outer : rules_) {
        for (const auto& inner : rules_) {
            if (outer.placeholder.find(inner.secretValue) != std::string::npos) {
                throw std::invalid_argument("Redaction placeholder must not contain a secret value");
            }
        }
    }
    // Longest secrets first so a secret that contains another is replaced as a whole
    std::stable_sort(rules_.begin(), rules_.end(), [](const RedactionRule& a, const RedactionRule& b) {
        return a.secretValue.size() > b.secretValue.size();
    });
}

Redactor Redactor::ForSecret(const std::string& secret, const std::string& placeholder) {
    return Redactor(std::vector<RedactionRule>{RedactionRule{secret, placeholder}});
}

std::string Redactor::Redact(const std::string& text) const {
    std::string out = text;
    // A placeholder spliced next to leftover text can form a secret again; rescan until clean.
    for (int pass = 0; pass < MaxPasses && Contains(out); ++pass) {
        for (const auto& r : rules_) {
            replaceAll(out, r.secretValue, r.placeholder);
        }
    }
    if (Contains(out)) {
        return rules_.front().placeholder;
    }
    return out;
}

bool Redactor::Contains(const std::string& text) const {
    return std::any_of(rules_.begin(), rules_.end(), [&text](const RedactionRule& r) {
        return text.find(r.secretValue) != std::string::npos;
    });
}

} // namespace redaction
} // namespace llmwrap
