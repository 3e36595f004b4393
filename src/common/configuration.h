#ifndef WHARF_CONFIGURATION_H_
#define WHARF_CONFIGURATION_H_

#include <string>
#include <optional>
#include <vector>
#include <cstdint>

#include "config.h"

namespace YAML {
class Node;
}

namespace Wharf {

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
struct WharfConfig {
    // Version information
    struct Version {
        ConfigValue<int> major{1, "WHARF_VERSION_MAJOR"};
        ConfigValue<int> minor{0, "WHARF_VERSION_MINOR"};
    } version;

    // Page storage and per-message policy
    struct Queue {
        ConfigValue<size_t> heap_size{kDefaultPageHeapSize, "WHARF_QUEUE_HEAP_SIZE"};
        // Consecutive TemporaryFailure outcomes tolerated before a message is
        // parked as overweight. No default: deployments must choose it.
        ConfigValue<int> max_temporary_failures{0, "WHARF_QUEUE_MAX_TEMPORARY_FAILURES"};
        // 0 services the first page touched in a turn to completion.
        ConfigValue<int> max_messages_per_turn{kDefaultMaxMessagesPerTurn, "WHARF_QUEUE_MAX_MESSAGES_PER_TURN"};
        // A message whose handler asks for more than this is parked as
        // overweight instead of waiting forever. 0 disables the check.
        ConfigValue<size_t> max_message_weight{0, "WHARF_QUEUE_MAX_MESSAGE_WEIGHT"};
    } queue;

    // Budgets handed to Service() by the block hooks
    struct Service {
        ConfigValue<size_t> service_weight{kDefaultServiceWeight, "WHARF_SERVICE_WEIGHT"};
        ConfigValue<size_t> idle_max_service_weight{kDefaultIdleMaxServiceWeight, "WHARF_IDLE_MAX_SERVICE_WEIGHT"};
    } service;

    // Overhead weight table charged on top of handler-reported weight
    struct Weights {
        ConfigValue<size_t> service_queue_base{0, "WHARF_WEIGHT_SERVICE_QUEUE_BASE"};
        ConfigValue<size_t> service_page_base{0, "WHARF_WEIGHT_SERVICE_PAGE_BASE"};
        ConfigValue<size_t> service_page_item{0, "WHARF_WEIGHT_SERVICE_PAGE_ITEM"};
        ConfigValue<size_t> bump_service_head{0, "WHARF_WEIGHT_BUMP_SERVICE_HEAD"};
        ConfigValue<size_t> execute_overweight_base{0, "WHARF_WEIGHT_EXECUTE_OVERWEIGHT_BASE"};
    } weights;
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

    // Override with command line arguments
    void overrideFromCommandLine(int argc, char* argv[]);

    // Get the configuration
    const WharfConfig& config() const { return config_; }
    WharfConfig& config() { return config_; }

    // Restore every value to its compiled-in default
    void reset() { config_ = WharfConfig{}; }

    // Helper methods for common access patterns
    size_t getHeapSize() const { return config_.queue.heap_size.get(); }
    int getMaxTemporaryFailures() const { return config_.queue.max_temporary_failures.get(); }
    size_t getServiceWeight() const { return config_.service.service_weight.get(); }

    // Validation
    bool validate() const;
    std::vector<std::string> getValidationErrors() const;

private:
    Configuration() = default;
    Configuration(const Configuration&) = delete;
    Configuration& operator=(const Configuration&) = delete;

    WharfConfig config_;
    mutable std::vector<std::string> validation_errors_;

    // Helper methods for parsing
    void applyYAML(const YAML::Node& root);
    bool validateConfig();
};

// Template specializations for getEnvValue
template<>
std::optional<int> ConfigValue<int>::getEnvValue() const;

template<>
std::optional<size_t> ConfigValue<size_t>::getEnvValue() const;

template<>
std::optional<std::string> ConfigValue<std::string>::getEnvValue() const;

template<>
std::optional<bool> ConfigValue<bool>::getEnvValue() const;

} // namespace Wharf

#endif // WHARF_CONFIGURATION_H_
