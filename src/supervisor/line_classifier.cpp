/*
 * line_classifier.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-05

Description: Line classifier and built-in marker tables

**************************************************/

#include "line_classifier.hpp"

#include "port_allocator.hpp"

#include <charconv>

namespace wayfarer::supervisor {

namespace {

auto parsePort(std::string_view text) -> std::optional<int> {
    int value = 0;
    auto [ptr, ec] =
        std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size() ||
        !PortAllocator::isValidPort(value)) {
        return std::nullopt;
    }
    return value;
}

/// Rules shared by every JVM based engine
void appendJvmFailureRules(std::vector<MarkerRule>& rules) {
    rules.push_back(MarkerRule::literal(Phase::Serve, LineKind::BindFailure,
                                        "BindException"));
    rules.push_back(MarkerRule::literal(Phase::Serve, LineKind::BindFailure,
                                        "Address already in use"));
    rules.push_back(MarkerRule::literal(std::nullopt, LineKind::EngineError,
                                        "OutOfMemoryError"));
    rules.push_back(MarkerRule::literal(std::nullopt, LineKind::EngineError,
                                        "Exception in thread"));
    rules.push_back(MarkerRule::literal(std::nullopt, LineKind::EngineError,
                                        "ZipException"));
    rules.push_back(MarkerRule::literal(std::nullopt, LineKind::EngineError,
                                        "Unable to read"));
}

}  // namespace

auto toString(LineKind kind) noexcept -> std::string_view {
    switch (kind) {
        case LineKind::Activity:
            return "Activity";
        case LineKind::BuildComplete:
            return "BuildComplete";
        case LineKind::ServeReady:
            return "ServeReady";
        case LineKind::EngineError:
            return "EngineError";
        case LineKind::BindFailure:
            return "BindFailure";
    }
    return "Unknown";
}

auto MarkerRule::literal(std::optional<Phase> phase, LineKind kind,
                         std::string text) -> MarkerRule {
    return MarkerRule{phase, kind, std::move(text), false, false};
}

auto MarkerRule::regex(std::optional<Phase> phase, LineKind kind,
                       std::string expression, bool capturesPort)
    -> MarkerRule {
    return MarkerRule{phase, kind, std::move(expression), true, capturesPort};
}

LineClassifier::LineClassifier(std::vector<MarkerRule> rules) {
    compiled_.reserve(rules.size());
    for (auto& rule : rules) {
        CompiledRule compiled{std::move(rule), std::nullopt};
        if (compiled.rule.isRegex) {
            compiled.expression.emplace(compiled.rule.pattern,
                                        std::regex::ECMAScript);
        }
        compiled_.push_back(std::move(compiled));
    }
}

auto LineClassifier::classify(std::string_view line, Phase phase) const
    -> Classification {
    for (const auto& [rule, expression] : compiled_) {
        if (rule.phase && *rule.phase != phase) {
            continue;
        }

        if (!expression) {
            if (line.find(rule.pattern) != std::string_view::npos) {
                return {rule.kind, std::nullopt, rule.pattern};
            }
            continue;
        }

        std::match_results<std::string_view::const_iterator> match;
        if (std::regex_search(line.begin(), line.end(), match, *expression)) {
            Classification result{rule.kind, std::nullopt, rule.pattern};
            if (rule.capturesPort && match.size() > 1 && match[1].matched) {
                result.port = parsePort(
                    std::string_view(&*match[1].first,
                                     static_cast<std::size_t>(match[1].length())));
            }
            return result;
        }
    }
    return {};
}

auto LineClassifier::rules() const -> std::vector<MarkerRule> {
    std::vector<MarkerRule> rules;
    rules.reserve(compiled_.size());
    for (const auto& compiled : compiled_) {
        rules.push_back(compiled.rule);
    }
    return rules;
}

auto otpMarkers() -> std::vector<MarkerRule> {
    std::vector<MarkerRule> rules;
    appendJvmFailureRules(rules);

    rules.push_back(MarkerRule::literal(Phase::Build, LineKind::BuildComplete,
                                        "Graph written"));
    rules.push_back(MarkerRule::literal(Phase::Build, LineKind::BuildComplete,
                                        "Graph built"));

    rules.push_back(MarkerRule::regex(Phase::Serve, LineKind::ServeReady,
                                      R"(Server started on port (\d+))",
                                      true));
    rules.push_back(MarkerRule::literal(Phase::Serve, LineKind::ServeReady,
                                        "Grizzly server running"));
    return rules;
}

auto graphHopperMarkers() -> std::vector<MarkerRule> {
    std::vector<MarkerRule> rules;
    appendJvmFailureRules(rules);

    rules.push_back(MarkerRule::literal(Phase::Build, LineKind::BuildComplete,
                                        "flushing graph"));
    rules.push_back(MarkerRule::literal(Phase::Build, LineKind::BuildComplete,
                                        "loaded graph"));

    rules.push_back(MarkerRule::regex(Phase::Serve, LineKind::ServeReady,
                                      R"(Started server at HTTP (\d+))", true));
    rules.push_back(MarkerRule::literal(Phase::Serve, LineKind::ServeReady,
                                        "Started ServerConnector"));
    return rules;
}

}  // namespace wayfarer::supervisor
