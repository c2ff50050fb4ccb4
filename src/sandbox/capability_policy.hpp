/**
 * @file capability_policy.hpp
 * @brief Default-deny rule set over named operations available to executed code.
 * @author CodeVerdict contributors
 */

#pragma once

#include "core/result.hpp"

#include <array>
#include <bitset>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace code_verdict {

/**
 * @brief Operations that executed code may only perform when explicitly allowed.
 */
enum class Capability : uint8_t {
    ProcessSpawn,       ///< fork/vfork/clone of a new process, any execve after the interpreter's own
    Network,            ///< Socket creation
    FilesystemWrite,    ///< Any mutation of a path outside the scratch directory
    EnvironmentAccess,  ///< Reading or writing environment variables
    ProcessControl      ///< Signalling processes that do not belong to the execution
};

inline constexpr std::array<Capability, 5> kAllCapabilities = {
    Capability::ProcessSpawn,
    Capability::Network,
    Capability::FilesystemWrite,
    Capability::EnvironmentAccess,
    Capability::ProcessControl
};

[[nodiscard]] constexpr std::string_view to_string(Capability capability) noexcept {
    switch (capability) {
        case Capability::ProcessSpawn:      return "process_spawn";
        case Capability::Network:           return "network";
        case Capability::FilesystemWrite:   return "filesystem_write";
        case Capability::EnvironmentAccess: return "environment_access";
        case Capability::ProcessControl:    return "process_control";
    }
    return "unknown";
}

[[nodiscard]] constexpr std::optional<Capability> parse_capability(std::string_view name) noexcept {
    for (auto capability : kAllCapabilities) {
        if (to_string(capability) == name) return capability;
    }
    return std::nullopt;
}

/**
 * @brief Default-deny capability set.
 *
 * A default-constructed policy denies everything. Explicit deny entries win
 * over allow entries regardless of the order in which they were added.
 */
class CapabilityPolicy {
public:
    CapabilityPolicy() = default;

    /// Build from configuration names; unknown names are a Config error.
    static Result<CapabilityPolicy> from_names(const std::vector<std::string>& allow,
                                               const std::vector<std::string>& deny);

    CapabilityPolicy& allow(Capability capability) noexcept;
    CapabilityPolicy& deny(Capability capability) noexcept;

    [[nodiscard]] bool allows(Capability capability) const noexcept;
    [[nodiscard]] std::vector<Capability> denied() const;
    [[nodiscard]] std::vector<Capability> allowed() const;

    bool operator==(const CapabilityPolicy&) const = default;

private:
    static constexpr size_t index(Capability capability) noexcept {
        return static_cast<size_t>(capability);
    }

    std::bitset<kAllCapabilities.size()> allowed_;
    std::bitset<kAllCapabilities.size()> denied_;
};

}  // namespace code_verdict
