/*
 * port_allocator.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-03

Description: TCP port selection and verification for the serve phase

**************************************************/

#ifndef WAYFARER_SUPERVISOR_PORT_ALLOCATOR_HPP
#define WAYFARER_SUPERVISOR_PORT_ALLOCATOR_HPP

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace wayfarer::supervisor {

/**
 * @brief Inclusive range of candidate ports
 */
struct PortRange {
    int first{8100};
    int last{8199};

    [[nodiscard]] constexpr auto contains(int port) const noexcept -> bool {
        return port >= first && port <= last;
    }
};

/**
 * @brief Picks or validates TCP ports before the engine binds them
 *
 * Dynamic allocation binds a socket to port 0 and releases it again, so the
 * port can be taken by someone else before the engine binds it. Callers
 * must treat an engine bind failure as retryable.
 */
class PortAllocator {
public:
    /**
     * @brief Construct allocator
     * @param range Scan this range instead of asking the OS for a port
     */
    explicit PortAllocator(std::optional<PortRange> range = std::nullopt);

    /**
     * @brief Allocate one port
     * @param preferred Fixed port to verify instead of choosing one
     * @return A port that was free at the time of the call
     * @throws PortUnavailable if the preferred port is busy or none is free
     */
    [[nodiscard]] auto allocate(std::optional<int> preferred = std::nullopt)
        -> int;

    /**
     * @brief Allocate several distinct ports
     * @param count Number of ports
     * @param preferred Fixed first port, the rest are chosen dynamically
     * @throws PortUnavailable
     */
    [[nodiscard]] auto allocateMany(int count,
                                    std::optional<int> preferred = std::nullopt)
        -> std::vector<int>;

    /**
     * @brief Check whether a port can be bound on the local host
     */
    [[nodiscard]] static auto isPortFree(int port) -> bool;

    /**
     * @brief Check whether something accepts TCP connections on host:port
     */
    [[nodiscard]] static auto probe(const std::string& host, int port,
                                    std::chrono::milliseconds timeout) -> bool;

    [[nodiscard]] static constexpr auto isValidPort(int port) noexcept
        -> bool {
        return port > 0 && port <= 65535;
    }

    [[nodiscard]] auto range() const noexcept -> const std::optional<PortRange>& {
        return range_;
    }

private:
    std::optional<PortRange> range_;
};

}  // namespace wayfarer::supervisor

#endif  // WAYFARER_SUPERVISOR_PORT_ALLOCATOR_HPP
