/*
 * command_builder.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-03

Description: Engine command line description and fluent builder

*************************************************/

#pragma once

#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>
#include <unordered_map>
#include <vector>

namespace wayfarer::supervisor {

/**
 * @brief Everything needed to spawn one engine process
 */
struct ProcessConfig {
    std::filesystem::path executable;
    std::vector<std::string> arguments;
    std::optional<std::filesystem::path> workingDirectory;
    std::unordered_map<std::string, std::string> environment;
};

/**
 * @brief Command line argument builder with fluent interface
 */
class CommandBuilder {
public:
    explicit CommandBuilder(std::string_view executable);

    /**
     * @brief Add a flag (e.g., --inMemory)
     */
    auto addFlag(std::string_view flag) -> CommandBuilder&;

    auto addFlagIf(bool condition, std::string_view flag) -> CommandBuilder&;

    /**
     * @brief Add an option with value (e.g., --port 8080)
     */
    auto addOption(std::string_view option, std::string_view value)
        -> CommandBuilder&;

    auto addOption(std::string_view option, int value) -> CommandBuilder&;

    /**
     * @brief Add a key=value property (GraphHopper style)
     */
    auto addProperty(std::string_view key, std::string_view value)
        -> CommandBuilder&;

    /**
     * @brief Add an optional value (only if has_value)
     */
    template <typename T>
    auto addOptional(std::string_view option, const std::optional<T>& value)
        -> CommandBuilder& {
        if (value) {
            if constexpr (std::is_same_v<T, std::string>) {
                return addOption(option, *value);
            } else {
                return addOption(option, std::to_string(*value));
            }
        }
        return *this;
    }

    auto addArg(std::string_view arg) -> CommandBuilder&;

    auto addArgs(std::span<const std::string> args) -> CommandBuilder&;

    auto setWorkingDirectory(const std::filesystem::path& path)
        -> CommandBuilder&;

    auto setEnv(std::string_view key, std::string_view value) -> CommandBuilder&;

    [[nodiscard]] auto build() const -> ProcessConfig;

    /**
     * @brief Render the command line for logging
     */
    [[nodiscard]] auto toString() const -> std::string;

    [[nodiscard]] static auto toString(const ProcessConfig& config)
        -> std::string;

private:
    ProcessConfig config_;
};

}  // namespace wayfarer::supervisor
