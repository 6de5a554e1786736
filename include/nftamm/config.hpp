#ifndef NFTAMM_CONFIG_HPP
#define NFTAMM_CONFIG_HPP

// Factory deployment configuration, loaded from JSON:
//
// {
//   "factory_address": "0x...",
//   "owner": "0x...",
//   "templates": {
//     "enumerable_native": "0x...", "missing_enumerable_native": "0x...",
//     "enumerable_token": "0x...",  "missing_enumerable_token": "0x..."
//   },
//   "protocol_fee": { "recipient": "0x...", "multiplier": "0.005" },
//   "log_level": "info",
//   "routers": ["0x..."],
//   "call_targets": ["0x..."]
// }

#include <string>
#include <string_view>
#include <vector>

#include "clone_deployer.hpp"
#include "types.hpp"

namespace nftamm {

class FactoryConfig {
public:
    Address factory_address{};
    Address owner{};
    TemplateSet templates{};
    Address protocol_fee_recipient{};
    U128 protocol_fee_multiplier{0};   // X18
    std::string log_level = "info";
    std::vector<Address> routers;
    std::vector<Address> call_targets;

    FactoryConfig() = default;

    // Throws std::runtime_error naming the offending field
    static FactoryConfig from_file(std::string_view path);
    static FactoryConfig from_json(std::string_view content);

    FactoryConfig& with_factory_address(const Address& addr) {
        factory_address = addr;
        return *this;
    }

    FactoryConfig& with_owner(const Address& addr) {
        owner = addr;
        return *this;
    }

    FactoryConfig& with_template(PairVariant variant, const Address& addr) {
        templates[static_cast<size_t>(variant)] = addr;
        return *this;
    }

    FactoryConfig& with_protocol_fee(const Address& recipient, U128 multiplier) {
        protocol_fee_recipient = recipient;
        protocol_fee_multiplier = multiplier;
        return *this;
    }

    FactoryConfig& with_router(const Address& router) {
        routers.push_back(router);
        return *this;
    }

    FactoryConfig& with_call_target(const Address& target) {
        call_targets.push_back(target);
        return *this;
    }

    FactoryConfig& set_log_level(std::string_view level) {
        log_level = std::string(level);
        return *this;
    }
};

} // namespace nftamm

#endif // NFTAMM_CONFIG_HPP
