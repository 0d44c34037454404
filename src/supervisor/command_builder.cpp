/*
 * command_builder.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-03

Description: Command builder implementation

*************************************************/

#include "command_builder.hpp"

#include <sstream>

namespace wayfarer::supervisor {

CommandBuilder::CommandBuilder(std::string_view executable) {
    config_.executable = executable;
}

auto CommandBuilder::addFlag(std::string_view flag) -> CommandBuilder& {
    config_.arguments.emplace_back(flag);
    return *this;
}

auto CommandBuilder::addFlagIf(bool condition, std::string_view flag)
    -> CommandBuilder& {
    if (condition) {
        config_.arguments.emplace_back(flag);
    }
    return *this;
}

auto CommandBuilder::addOption(std::string_view option, std::string_view value)
    -> CommandBuilder& {
    config_.arguments.emplace_back(option);
    config_.arguments.emplace_back(value);
    return *this;
}

auto CommandBuilder::addOption(std::string_view option, int value)
    -> CommandBuilder& {
    return addOption(option, std::to_string(value));
}

auto CommandBuilder::addProperty(std::string_view key, std::string_view value)
    -> CommandBuilder& {
    std::string property(key);
    property += '=';
    property += value;
    config_.arguments.push_back(std::move(property));
    return *this;
}

auto CommandBuilder::addArg(std::string_view arg) -> CommandBuilder& {
    config_.arguments.emplace_back(arg);
    return *this;
}

auto CommandBuilder::addArgs(std::span<const std::string> args)
    -> CommandBuilder& {
    for (const auto& arg : args) {
        config_.arguments.push_back(arg);
    }
    return *this;
}

auto CommandBuilder::setWorkingDirectory(const std::filesystem::path& path)
    -> CommandBuilder& {
    config_.workingDirectory = path;
    return *this;
}

auto CommandBuilder::setEnv(std::string_view key, std::string_view value)
    -> CommandBuilder& {
    config_.environment[std::string(key)] = std::string(value);
    return *this;
}

auto CommandBuilder::build() const -> ProcessConfig { return config_; }

auto CommandBuilder::toString() const -> std::string {
    return toString(config_);
}

auto CommandBuilder::toString(const ProcessConfig& config) -> std::string {
    std::ostringstream cmd;

    auto quoted = [&cmd](const std::string& text) {
        if (text.empty()) {
            cmd << "\"\"";
        } else if (text.find(' ') != std::string::npos && text.front() != '"') {
            cmd << "\"" << text << "\"";
        } else {
            cmd << text;
        }
    };

    quoted(config.executable.string());
    for (const auto& arg : config.arguments) {
        cmd << " ";
        quoted(arg);
    }

    return cmd.str();
}

}  // namespace wayfarer::supervisor
