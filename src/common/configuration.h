#ifndef SALKAFKA_CONFIGURATION_H_
#define SALKAFKA_CONFIGURATION_H_

#include <string>
#include <optional>
#include <vector>
#include <cstdint>

namespace YAML {
class Node;
}

namespace SalKafka {

/**
 * Configuration value that can be overridden by environment variables
 */
template<typename T>
class ConfigValue {
public:
    ConfigValue() = default;
    ConfigValue(T default_value, const std::string& env_var = "")
        : value_(default_value), env_var_(env_var) {}

    T get() const {
        if (!env_var_.empty()) {
            auto env_value = getEnvValue();
            if (env_value.has_value()) {
                return env_value.value();
            }
        }
        return value_;
    }

    void set(T value) { value_ = value; }
    const std::string& env_var() const { return env_var_; }

private:
    T value_;
    std::string env_var_;

    std::optional<T> getEnvValue() const;
};

/**
 * Main configuration structure
 */
struct SalKafkaConfig {
    // Kafka broker and admin client
    struct Broker {
        ConfigValue<std::string> bootstrap_servers{"broker:29092", "SALKAFKA_BOOTSTRAP_SERVERS"};
        ConfigValue<int> admin_timeout_ms{10000, "SALKAFKA_ADMIN_TIMEOUT_MS"};
        ConfigValue<int> list_topics_timeout_ms{10000, "SALKAFKA_LIST_TOPICS_TIMEOUT_MS"};
        ConfigValue<int> replication_factor{1, "SALKAFKA_REPLICATION_FACTOR"};
        // Never created; describe-config on it must report "unknown topic".
        ConfigValue<std::string> sentinel_topic{"not_a_topic_name", "SALKAFKA_SENTINEL_TOPIC"};
        ConfigValue<int> message_max_bytes{2097152, "SALKAFKA_MESSAGE_MAX_BYTES"};
    } broker;

    // Confluent-compatible schema registry
    struct Registry {
        ConfigValue<std::string> url{"http://schema-registry:8081", "SALKAFKA_REGISTRY_URL"};
        ConfigValue<int> timeout_ms{10000, "SALKAFKA_REGISTRY_TIMEOUT_MS"};
    } registry;

    // Worker pools hosting the blocking client calls
    struct Bridge {
        ConfigValue<int> worker_threads{1, "SALKAFKA_WORKER_THREADS"};
        ConfigValue<int> admin_threads{1, "SALKAFKA_ADMIN_THREADS"};
        ConfigValue<int> poll_timeout_ms{100, "SALKAFKA_POLL_TIMEOUT_MS"};
        ConfigValue<int> flush_timeout_ms{10000, "SALKAFKA_FLUSH_TIMEOUT_MS"};
    } bridge;

    struct Consumer {
        ConfigValue<std::string> auto_offset_reset{"latest", "SALKAFKA_AUTO_OFFSET_RESET"};
    } consumer;

    // Component definitions
    struct Metadata {
        ConfigValue<std::string> directory{"data/components", "SALKAFKA_METADATA_DIR"};
        ConfigValue<std::string> topic_subname{"lsst.sal", "SALKAFKA_TOPIC_SUBNAME"};
    } metadata;

    struct Run {
        // Lets a concurrently running reader finish before this process exits.
        ConfigValue<int> exit_delay_ms{1000, "SALKAFKA_EXIT_DELAY_MS"};
    } run;

    struct Results {
        ConfigValue<std::string> directory{"results", "SALKAFKA_RESULTS_DIR"};
    } results;
};

/**
 * Configuration manager singleton
 */
class Configuration {
public:
    static Configuration& getInstance();

    // Load configuration from file
    bool loadFromFile(const std::string& filename);

    // Load configuration from YAML string
    bool loadFromString(const std::string& yaml_content);

    // Get the configuration
    const SalKafkaConfig& config() const { return config_; }
    SalKafkaConfig& config() { return config_; }

    // Helper methods for common access patterns
    std::string getBootstrapServers() const { return config_.broker.bootstrap_servers.get(); }
    std::string getRegistryUrl() const { return config_.registry.url.get(); }
    int getPollTimeoutMs() const { return config_.bridge.poll_timeout_ms.get(); }
    int getWorkerThreads() const { return config_.bridge.worker_threads.get(); }

    // Validation
    bool validate() const;
    std::vector<std::string> getValidationErrors() const;

private:
    Configuration() = default;
    Configuration(const Configuration&) = delete;
    Configuration& operator=(const Configuration&) = delete;

    SalKafkaConfig config_;
    mutable std::vector<std::string> validation_errors_;

    // Applies every recognized key under the "salkafka" root
    void applyYAML(const YAML::Node& root);
};

// Global accessor used by the executables
const Configuration& GetConfig();

// Template specializations for getEnvValue
template<>
std::optional<int> ConfigValue<int>::getEnvValue() const;

template<>
std::optional<std::string> ConfigValue<std::string>::getEnvValue() const;

} // namespace SalKafka

#endif // SALKAFKA_CONFIGURATION_H_
