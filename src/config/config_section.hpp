/*
 * config_section.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-06

Description: ConfigSection CRTP base class for JSON configuration sections

**************************************************/

#ifndef WAYFARER_CONFIG_CONFIG_SECTION_HPP
#define WAYFARER_CONFIG_CONFIG_SECTION_HPP

#include <nlohmann/json.hpp>

#include <concepts>
#include <string>
#include <string_view>

namespace wayfarer::config {

using json = nlohmann::json;

/**
 * @brief Concept for valid ConfigSection derived types
 */
template <typename T>
concept ConfigSectionDerived = requires(T t, const json& j) {
    { T::PATH } -> std::convertible_to<std::string_view>;
    { t.serialize() } -> std::convertible_to<json>;
    { T::deserialize(j) } -> std::convertible_to<T>;
    { T::generateSchema() } -> std::convertible_to<json>;
};

/**
 * @brief CRTP base class for configuration sections
 *
 * Derived classes define:
 *
 * 1. a static constexpr PATH naming the section in the config file
 * 2. serialize() converting to JSON
 * 3. static deserialize(const json&), taking defaults for missing keys
 * 4. static generateSchema() returning a JSON Schema
 * 5. validate() returning an empty string when the values are usable
 *
 * @tparam Derived The derived configuration struct type (CRTP)
 */
template <typename Derived>
class ConfigSection {
public:
    [[nodiscard]] static constexpr std::string_view path() noexcept {
        return Derived::PATH;
    }

    [[nodiscard]] json toJson() const {
        return static_cast<const Derived*>(this)->serialize();
    }

    [[nodiscard]] static Derived fromJson(const json& j) {
        return Derived::deserialize(j);
    }

    [[nodiscard]] static json schema() { return Derived::generateSchema(); }

    [[nodiscard]] static Derived defaults() { return Derived{}; }

    /**
     * @brief Read the section stored under PATH in a larger document
     *
     * A missing section yields the defaults.
     */
    [[nodiscard]] static Derived fromParent(const json& parent) {
        auto key = std::string(Derived::PATH);
        if (parent.is_object() && parent.contains(key) &&
            parent[key].is_object()) {
            return Derived::deserialize(parent[key]);
        }
        return Derived{};
    }

    [[nodiscard]] bool operator==(const ConfigSection& other) const {
        return toJson() == static_cast<const Derived&>(other).toJson();
    }
};

}  // namespace wayfarer::config

#endif  // WAYFARER_CONFIG_CONFIG_SECTION_HPP
