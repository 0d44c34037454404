/*
 * line_classifier.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-05

Description: Marker table matching engine output lines to lifecycle events

**************************************************/

#ifndef WAYFARER_SUPERVISOR_LINE_CLASSIFIER_HPP
#define WAYFARER_SUPERVISOR_LINE_CLASSIFIER_HPP

#include "types.hpp"

#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

namespace wayfarer::supervisor {

/**
 * @brief Meaning of one output line
 */
enum class LineKind {
    Activity,       ///< No marker matched, only proves the engine is alive
    BuildComplete,  ///< Graph was written
    ServeReady,     ///< Engine accepts requests
    EngineError,    ///< Fatal engine condition
    BindFailure     ///< Engine could not bind its port
};

[[nodiscard]] auto toString(LineKind kind) noexcept -> std::string_view;

/**
 * @brief One entry of a marker table
 */
struct MarkerRule {
    std::optional<Phase> phase;  ///< nullopt applies to both phases
    LineKind kind{LineKind::Activity};
    std::string pattern;
    bool isRegex{false};
    bool capturesPort{false};  ///< First regex group is the bound port

    static auto literal(std::optional<Phase> phase, LineKind kind,
                        std::string text) -> MarkerRule;
    static auto regex(std::optional<Phase> phase, LineKind kind,
                      std::string expression, bool capturesPort = false)
        -> MarkerRule;
};

struct Classification {
    LineKind kind{LineKind::Activity};
    std::optional<int> port;
    std::string pattern;  ///< Pattern of the rule that matched
};

/**
 * @brief Ordered first-match classifier
 *
 * Rules are evaluated in table order and the first match wins, so error
 * and bind rules come before success rules in the built-in tables.
 */
class LineClassifier {
public:
    /**
     * @throws std::regex_error if a regex rule does not compile
     */
    explicit LineClassifier(std::vector<MarkerRule> rules);

    [[nodiscard]] auto classify(std::string_view line, Phase phase) const
        -> Classification;

    [[nodiscard]] auto rules() const -> std::vector<MarkerRule>;

private:
    struct CompiledRule {
        MarkerRule rule;
        std::optional<std::regex> expression;
    };

    std::vector<CompiledRule> compiled_;
};

/**
 * @brief Built-in marker table for OpenTripPlanner 1.x
 */
[[nodiscard]] auto otpMarkers() -> std::vector<MarkerRule>;

/**
 * @brief Built-in marker table for GraphHopper
 */
[[nodiscard]] auto graphHopperMarkers() -> std::vector<MarkerRule>;

}  // namespace wayfarer::supervisor

#endif  // WAYFARER_SUPERVISOR_LINE_CLASSIFIER_HPP
