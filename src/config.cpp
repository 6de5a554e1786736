// =============================================================================
// config.cpp - JSON factory configuration
// =============================================================================

#include "nftamm/config.hpp"
#include "nftamm/logger.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <sstream>
#include <stdexcept>

namespace nftamm {

using json = nlohmann::json;

namespace {

const char* template_key(PairVariant variant) {
    switch (variant) {
        case PairVariant::ENUMERABLE_NATIVE: return "enumerable_native";
        case PairVariant::MISSING_ENUMERABLE_NATIVE: return "missing_enumerable_native";
        case PairVariant::ENUMERABLE_TOKEN: return "enumerable_token";
        case PairVariant::MISSING_ENUMERABLE_TOKEN: return "missing_enumerable_token";
    }
    return "unknown";
}

const json& require(const json& obj, const char* key, const std::string& path) {
    auto it = obj.find(key);
    if (it == obj.end()) {
        throw std::runtime_error("Config: missing field '" + path + key + "'");
    }
    return *it;
}

Address parse_address(const json& value, const std::string& field) {
    if (!value.is_string()) {
        throw std::runtime_error("Config: field '" + field + "' must be a hex address string");
    }
    auto addr = address_from_hex(value.get<std::string>());
    if (!addr) {
        throw std::runtime_error("Config: field '" + field + "' is not a valid address");
    }
    return *addr;
}

std::vector<Address> parse_address_list(const json& root, const char* key) {
    std::vector<Address> out;
    auto it = root.find(key);
    if (it == root.end()) return out;
    if (!it->is_array()) {
        throw std::runtime_error(std::string("Config: field '") + key + "' must be an array");
    }
    for (size_t i = 0; i < it->size(); ++i) {
        out.push_back(parse_address((*it)[i], std::string(key) + "[" + std::to_string(i) + "]"));
    }
    return out;
}

} // namespace

FactoryConfig FactoryConfig::from_file(std::string_view path) {
    std::string path_str{path};
    std::ifstream file{path_str};
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open config file: " + path_str);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return from_json(buffer.str());
}

FactoryConfig FactoryConfig::from_json(std::string_view content) {
    json root;
    try {
        root = json::parse(content);
    } catch (const json::parse_error& e) {
        throw std::runtime_error(std::string("Config: malformed JSON: ") + e.what());
    }
    if (!root.is_object()) {
        throw std::runtime_error("Config: top level must be an object");
    }

    FactoryConfig config;
    config.factory_address = parse_address(require(root, "factory_address", ""), "factory_address");
    config.owner = parse_address(require(root, "owner", ""), "owner");

    const json& templates = require(root, "templates", "");
    for (size_t i = 0; i < PAIR_VARIANT_COUNT; ++i) {
        const char* key = template_key(static_cast<PairVariant>(i));
        config.templates[i] = parse_address(require(templates, key, "templates."),
                                            std::string("templates.") + key);
    }

    const json& fee = require(root, "protocol_fee", "");
    config.protocol_fee_recipient = parse_address(require(fee, "recipient", "protocol_fee."),
                                                  "protocol_fee.recipient");
    const json& multiplier = require(fee, "multiplier", "protocol_fee.");
    if (!multiplier.is_string()) {
        throw std::runtime_error("Config: field 'protocol_fee.multiplier' must be a decimal string");
    }
    auto parsed = x18::parse(multiplier.get<std::string>());
    if (!parsed) {
        throw std::runtime_error("Config: field 'protocol_fee.multiplier' is not a valid decimal");
    }
    config.protocol_fee_multiplier = *parsed;

    if (auto it = root.find("log_level"); it != root.end()) {
        if (!it->is_string() || !parse_log_level(it->get<std::string>())) {
            throw std::runtime_error("Config: field 'log_level' is not a known level");
        }
        config.log_level = it->get<std::string>();
    }

    config.routers = parse_address_list(root, "routers");
    config.call_targets = parse_address_list(root, "call_targets");
    return config;
}

} // namespace nftamm
