/*
 * bounding_box.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-06

Description: Geographic bounding box used to select map and transit data

**************************************************/

#ifndef WAYFARER_FETCH_BOUNDING_BOX_HPP
#define WAYFARER_FETCH_BOUNDING_BOX_HPP

#include <fmt/format.h>

#include <string>

namespace wayfarer::fetch {

/**
 * @brief WGS84 bounding box in degrees
 */
struct BoundingBox {
    double left{0.0};    ///< Western longitude
    double bottom{0.0};  ///< Southern latitude
    double right{0.0};   ///< Eastern longitude
    double top{0.0};     ///< Northern latitude

    [[nodiscard]] constexpr auto isValid() const noexcept -> bool {
        return left >= -180.0 && right <= 180.0 && bottom >= -90.0 &&
               top <= 90.0 && left < right && bottom < top;
    }

    /**
     * @brief left,bottom,right,top with fixed precision
     */
    [[nodiscard]] auto toString() const -> std::string {
        return fmt::format("{:f},{:f},{:f},{:f}", left, bottom, right, top);
    }

    auto operator==(const BoundingBox&) const -> bool = default;
};

}  // namespace wayfarer::fetch

#endif  // WAYFARER_FETCH_BOUNDING_BOX_HPP
