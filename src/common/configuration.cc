#include "configuration.h"
#include <cstdlib>
#include <glog/logging.h>
#include <yaml-cpp/yaml.h>

namespace SalKafka {

// Global function to get configuration instance
const Configuration& GetConfig() {
    return Configuration::getInstance();
}

// Template specializations for environment variable parsing
template<>
std::optional<int> ConfigValue<int>::getEnvValue() const {
    const char* env_val = std::getenv(env_var_.c_str());
    if (env_val) {
        try {
            return std::stoi(env_val);
        } catch (const std::exception& e) {
            LOG(WARNING) << "Failed to parse env var " << env_var_ << ": " << e.what();
        }
    }
    return std::nullopt;
}

template<>
std::optional<std::string> ConfigValue<std::string>::getEnvValue() const {
    const char* env_val = std::getenv(env_var_.c_str());
    if (env_val) {
        return std::string(env_val);
    }
    return std::nullopt;
}

Configuration& Configuration::getInstance() {
    static Configuration instance;
    return instance;
}

bool Configuration::loadFromFile(const std::string& filename) {
    try {
        YAML::Node yaml = YAML::LoadFile(filename);
        applyYAML(yaml);
        return validate();
    } catch (const YAML::Exception& e) {
        LOG(ERROR) << "Failed to parse configuration file " << filename << ": " << e.what();
        return false;
    }
}

bool Configuration::loadFromString(const std::string& yaml_content) {
    try {
        YAML::Node yaml = YAML::Load(yaml_content);
        applyYAML(yaml);
        return validate();
    } catch (const YAML::Exception& e) {
        LOG(ERROR) << "Failed to parse configuration string: " << e.what();
        return false;
    }
}

void Configuration::applyYAML(const YAML::Node& yaml) {
    if (!yaml["salkafka"]) {
        LOG(WARNING) << "Configuration has no 'salkafka' root; using defaults";
        return;
    }
    auto root = yaml["salkafka"];

    // Broker
    if (root["broker"]) {
        auto broker = root["broker"];
        if (broker["bootstrap_servers"]) config_.broker.bootstrap_servers.set(broker["bootstrap_servers"].as<std::string>());
        if (broker["admin_timeout_ms"]) config_.broker.admin_timeout_ms.set(broker["admin_timeout_ms"].as<int>());
        if (broker["list_topics_timeout_ms"]) config_.broker.list_topics_timeout_ms.set(broker["list_topics_timeout_ms"].as<int>());
        if (broker["replication_factor"]) config_.broker.replication_factor.set(broker["replication_factor"].as<int>());
        if (broker["sentinel_topic"]) config_.broker.sentinel_topic.set(broker["sentinel_topic"].as<std::string>());
        if (broker["message_max_bytes"]) config_.broker.message_max_bytes.set(broker["message_max_bytes"].as<int>());
    }

    // Schema registry
    if (root["registry"]) {
        auto registry = root["registry"];
        if (registry["url"]) config_.registry.url.set(registry["url"].as<std::string>());
        if (registry["timeout_ms"]) config_.registry.timeout_ms.set(registry["timeout_ms"].as<int>());
    }

    // Bridge
    if (root["bridge"]) {
        auto bridge = root["bridge"];
        if (bridge["worker_threads"]) config_.bridge.worker_threads.set(bridge["worker_threads"].as<int>());
        if (bridge["admin_threads"]) config_.bridge.admin_threads.set(bridge["admin_threads"].as<int>());
        if (bridge["poll_timeout_ms"]) config_.bridge.poll_timeout_ms.set(bridge["poll_timeout_ms"].as<int>());
        if (bridge["flush_timeout_ms"]) config_.bridge.flush_timeout_ms.set(bridge["flush_timeout_ms"].as<int>());
    }

    if (root["consumer"]) {
        auto consumer = root["consumer"];
        if (consumer["auto_offset_reset"]) config_.consumer.auto_offset_reset.set(consumer["auto_offset_reset"].as<std::string>());
    }

    if (root["metadata"]) {
        auto metadata = root["metadata"];
        if (metadata["directory"]) config_.metadata.directory.set(metadata["directory"].as<std::string>());
        if (metadata["topic_subname"]) config_.metadata.topic_subname.set(metadata["topic_subname"].as<std::string>());
    }

    if (root["run"]) {
        auto run = root["run"];
        if (run["exit_delay_ms"]) config_.run.exit_delay_ms.set(run["exit_delay_ms"].as<int>());
    }

    if (root["results"]) {
        auto results = root["results"];
        if (results["directory"]) config_.results.directory.set(results["directory"].as<std::string>());
    }
}

bool Configuration::validate() const {
    validation_errors_.clear();

    if (config_.broker.bootstrap_servers.get().empty()) {
        validation_errors_.push_back("Bootstrap servers must not be empty");
    }

    // Validate timeouts
    if (config_.broker.admin_timeout_ms.get() <= 0) {
        validation_errors_.push_back("Admin timeout must be positive");
    }
    if (config_.broker.list_topics_timeout_ms.get() <= 0) {
        validation_errors_.push_back("List topics timeout must be positive");
    }
    if (config_.registry.timeout_ms.get() <= 0) {
        validation_errors_.push_back("Registry timeout must be positive");
    }
    if (config_.bridge.poll_timeout_ms.get() <= 0) {
        validation_errors_.push_back("Poll timeout must be positive");
    }
    if (config_.bridge.flush_timeout_ms.get() <= 0) {
        validation_errors_.push_back("Flush timeout must be positive");
    }

    // Validate thread counts
    // Each broker client is driven from a single thread
    if (config_.bridge.worker_threads.get() != 1) {
        validation_errors_.push_back("Worker threads must be exactly 1");
    }
    if (config_.bridge.admin_threads.get() < 1) {
        validation_errors_.push_back("Admin threads must be at least 1");
    }

    if (config_.broker.replication_factor.get() < 1) {
        validation_errors_.push_back("Replication factor must be at least 1");
    }

    const std::string reset = config_.consumer.auto_offset_reset.get();
    if (reset != "latest" && reset != "earliest") {
        validation_errors_.push_back("auto_offset_reset must be 'latest' or 'earliest'");
    }

    if (config_.run.exit_delay_ms.get() < 0) {
        validation_errors_.push_back("Exit delay cannot be negative");
    }

    return validation_errors_.empty();
}

std::vector<std::string> Configuration::getValidationErrors() const {
    return validation_errors_;
}

} // namespace SalKafka
