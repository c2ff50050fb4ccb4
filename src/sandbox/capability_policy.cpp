/**
 * @file capability_policy.cpp
 * @brief CapabilityPolicy implementation.
 * @author CodeVerdict contributors
 */

#include "sandbox/capability_policy.hpp"

namespace code_verdict {

Result<CapabilityPolicy> CapabilityPolicy::from_names(const std::vector<std::string>& allow,
                                                      const std::vector<std::string>& deny) {
    CapabilityPolicy policy;
    for (const auto& name : allow) {
        auto capability = parse_capability(name);
        if (!capability) {
            return Error{ErrorCode::Config, "Unknown capability '" + name + "' in allow list"};
        }
        policy.allow(*capability);
    }
    for (const auto& name : deny) {
        auto capability = parse_capability(name);
        if (!capability) {
            return Error{ErrorCode::Config, "Unknown capability '" + name + "' in deny list"};
        }
        policy.deny(*capability);
    }
    return policy;
}

CapabilityPolicy& CapabilityPolicy::allow(Capability capability) noexcept {
    allowed_.set(index(capability));
    return *this;
}

CapabilityPolicy& CapabilityPolicy::deny(Capability capability) noexcept {
    denied_.set(index(capability));
    return *this;
}

bool CapabilityPolicy::allows(Capability capability) const noexcept {
    return allowed_.test(index(capability)) && !denied_.test(index(capability));
}

std::vector<Capability> CapabilityPolicy::denied() const {
    std::vector<Capability> out;
    for (auto capability : kAllCapabilities) {
        if (!allows(capability)) out.push_back(capability);
    }
    return out;
}

std::vector<Capability> CapabilityPolicy::allowed() const {
    std::vector<Capability> out;
    for (auto capability : kAllCapabilities) {
        if (allows(capability)) out.push_back(capability);
    }
    return out;
}

}  // namespace code_verdict
