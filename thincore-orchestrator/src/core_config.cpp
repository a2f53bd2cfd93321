#include "core_config.hpp"
#include "config_parser.hpp"
#include "cost_guard.hpp"
#include "logger.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <sstream>

using json = nlohmann::json;

namespace thincore {
namespace orchestrator {

namespace {

const char* ENV_PREFIX = "THINCORE_";

int64_t parse_integer(const std::string& key, const std::string& value) {
    try {
        size_t consumed = 0;
        long long parsed = std::stoll(value, &consumed);
        if (consumed != value.size()) {
            throw ConfigurationError(key + " must be an integer, got '" + value + "'");
        }
        return parsed;
    } catch (const std::logic_error&) {
        throw ConfigurationError(key + " must be an integer, got '" + value + "'");
    }
}

bool parse_bool(const std::string& key, const std::string& value) {
    std::string lower = value;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "1" || lower == "true" || lower == "yes" || lower == "on") return true;
    if (lower == "0" || lower == "false" || lower == "no" || lower == "off") return false;
    throw ConfigurationError(key + " must be a boolean, got '" + value + "'");
}

std::vector<std::string> split_list(const std::string& value) {
    std::vector<std::string> items;
    std::stringstream ss(value);
    std::string item;
    while (std::getline(ss, item, ',')) {
        item.erase(0, item.find_first_not_of(" \t"));
        item.erase(item.find_last_not_of(" \t") + 1);
        if (!item.empty()) {
            items.push_back(item);
        }
    }
    return items;
}

std::string env_name(const std::string& key) {
    std::string name = ENV_PREFIX;
    for (char c : key) {
        name += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    return name;
}

} // namespace

std::string config_source_to_string(ConfigSource source) {
    switch (source) {
        case ConfigSource::DEFAULT: return "default";
        case ConfigSource::CONFIG_FILE: return "config_file";
        case ConfigSource::ENVIRONMENT: return "environment";
        case ConfigSource::EXPLICIT: return "explicit";
        default: return "unknown";
    }
}

CoreConfig::CoreConfig()
    : queue_url("local"),
      store_url("file://./.thincore/artifacts"),
      state_dir("./.thincore/state"),
      gateway_url(""),
      consumer_group("workers"),
      key_prefix("thincore"),
      lease_timeout_ms(300000),
      max_attempts(3),
      cost_ceiling(10 * COST_UNITS_PER_CURRENCY),
      log_level("INFO"),
      log_file(""),
      log_json(false),
      local_workers(2),
      claim_timeout_ms(1000) {}

RouterConfig CoreConfig::router_config() const {
    RouterConfig router;
    router.lease_timeout = std::chrono::milliseconds(lease_timeout_ms);
    router.max_attempts = max_attempts;
    return router;
}

ConfigSource CoreConfig::source_of(const std::string& key) const {
    auto it = sources.find(key);
    return it == sources.end() ? ConfigSource::DEFAULT : it->second;
}

std::string CoreConfig::to_string() const {
    std::ostringstream oss;
    oss << "queue=" << Logger::mask_url(queue_url)
        << " store=" << Logger::mask_url(store_url)
        << " state_dir=" << state_dir
        << " group=" << consumer_group
        << " lease_ms=" << lease_timeout_ms
        << " max_attempts=" << max_attempts
        << " ceiling=" << CostGuard::format_units(cost_ceiling);
    if (!gateway_url.empty()) {
        oss << " gateway=" << Logger::mask_url(gateway_url);
    }
    return oss.str();
}

const std::vector<std::string>& config_keys() {
    static const std::vector<std::string> keys = {
        "queue_url", "store_url", "state_dir", "gateway_url", "consumer_group",
        "key_prefix", "lease_timeout_ms", "max_attempts", "cost_ceiling",
        "log_level", "log_file", "log_json", "local_workers", "claim_timeout_ms",
        "consult_runs"
    };
    return keys;
}

int64_t parse_cost_ceiling(const std::string& text) {
    std::string lower = text;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "unlimited") {
        return UNLIMITED_CEILING;
    }

    double amount = 0.0;
    try {
        size_t consumed = 0;
        amount = std::stod(text, &consumed);
        if (consumed != text.size()) {
            throw ConfigurationError("cost_ceiling must be an amount or 'unlimited', got '" + text + "'");
        }
    } catch (const std::logic_error&) {
        throw ConfigurationError("cost_ceiling must be an amount or 'unlimited', got '" + text + "'");
    }
    if (amount < 0.0 || !std::isfinite(amount)) {
        throw ConfigurationError("cost_ceiling must not be negative, got '" + text + "'");
    }
    return CostGuard::to_units(amount);
}

void apply_setting(CoreConfig& config, const std::string& key, const std::string& value, ConfigSource source) {
    if (key == "queue_url") config.queue_url = value;
    else if (key == "store_url") config.store_url = value;
    else if (key == "state_dir") config.state_dir = value;
    else if (key == "gateway_url") config.gateway_url = value;
    else if (key == "consumer_group") config.consumer_group = value;
    else if (key == "key_prefix") config.key_prefix = value;
    else if (key == "lease_timeout_ms") config.lease_timeout_ms = parse_integer(key, value);
    else if (key == "max_attempts") config.max_attempts = static_cast<int>(parse_integer(key, value));
    else if (key == "cost_ceiling") config.cost_ceiling = parse_cost_ceiling(value);
    else if (key == "log_level") {
        std::string upper = value;
        std::transform(upper.begin(), upper.end(), upper.begin(),
                       [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
        if (upper != "DEBUG" && upper != "INFO" && upper != "WARN" && upper != "WARNING" && upper != "ERROR") {
            throw ConfigurationError("log_level must be DEBUG, INFO, WARN or ERROR, got '" + value + "'");
        }
        config.log_level = upper;
    }
    else if (key == "log_file") config.log_file = value;
    else if (key == "log_json") config.log_json = parse_bool(key, value);
    else if (key == "local_workers") config.local_workers = static_cast<int>(parse_integer(key, value));
    else if (key == "claim_timeout_ms") config.claim_timeout_ms = parse_integer(key, value);
    else if (key == "consult_runs") config.consult_runs = split_list(value);
    else {
        throw ConfigurationError("Unknown setting: " + key);
    }
    config.sources[key] = source;
}

void apply_config_file(CoreConfig& config, const std::string& file_path) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        throw ConfigParseError("Failed to open config file: " + file_path);
    }

    json j;
    try {
        j = json::parse(file);
    } catch (const json::parse_error& e) {
        throw ConfigParseError(std::string("JSON parse error in ") + file_path + ": " + e.what());
    }
    if (!j.is_object()) {
        throw ConfigParseError("Config file must contain a JSON object: " + file_path);
    }

    for (auto it = j.begin(); it != j.end(); ++it) {
        std::string value;
        if (it.value().is_string()) {
            value = expand_environment_variables(it.value().get<std::string>());
        } else if (it.value().is_array()) {
            for (const auto& item : it.value()) {
                if (!value.empty()) value += ",";
                value += item.is_string() ? item.get<std::string>() : item.dump();
            }
        } else {
            value = it.value().dump();
        }
        apply_setting(config, it.key(), value, ConfigSource::CONFIG_FILE);
    }
}

void apply_environment(CoreConfig& config) {
    for (const auto& key : config_keys()) {
        const char* value = std::getenv(env_name(key).c_str());
        if (value) {
            apply_setting(config, key, value, ConfigSource::ENVIRONMENT);
        }
    }
}

void validate_core_config(const CoreConfig& config) {
    if (config.queue_url.empty()) {
        throw ConfigurationError("queue_url cannot be empty");
    }
    if (!config.is_local() && config.queue_url.rfind("redis://", 0) != 0 &&
        config.queue_url.rfind("rediss://", 0) != 0) {
        throw ConfigurationError("queue_url must be 'local' or a redis:// URL, got '" +
                                 Logger::mask_url(config.queue_url) + "'");
    }
    if (config.store_url.empty()) {
        throw ConfigurationError("store_url cannot be empty");
    }
    if (config.state_dir.empty()) {
        throw ConfigurationError("state_dir cannot be empty");
    }
    if (config.consumer_group.empty()) {
        throw ConfigurationError("consumer_group cannot be empty");
    }
    if (config.key_prefix.empty()) {
        throw ConfigurationError("key_prefix cannot be empty");
    }
    if (config.lease_timeout_ms <= 0) {
        throw ConfigurationError("lease_timeout_ms must be greater than 0");
    }
    if (config.max_attempts < 1) {
        throw ConfigurationError("max_attempts must be at least 1");
    }
    if (config.cost_ceiling < 0 && config.cost_ceiling != UNLIMITED_CEILING) {
        throw ConfigurationError("cost_ceiling must not be negative");
    }
    if (config.local_workers < 1) {
        throw ConfigurationError("local_workers must be at least 1");
    }
    if (config.claim_timeout_ms <= 0) {
        throw ConfigurationError("claim_timeout_ms must be greater than 0");
    }
}

CoreConfig load_core_config(const std::string& config_file_path, const ConfigOverrides& overrides) {
    CoreConfig config;

    if (!config_file_path.empty()) {
        apply_config_file(config, config_file_path);
    }
    apply_environment(config);
    for (const auto& [key, value] : overrides) {
        apply_setting(config, key, value, ConfigSource::EXPLICIT);
    }

    validate_core_config(config);
    return config;
}

} // namespace orchestrator
} // namespace thincore
