#include "configuration.h"
#include "wire_formats.h"
#include <algorithm>
#include <cstdlib>
#include <getopt.h>
#include <glog/logging.h>
#include <yaml-cpp/yaml.h>

namespace Wharf {

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
std::optional<size_t> ConfigValue<size_t>::getEnvValue() const {
    const char* env_val = std::getenv(env_var_.c_str());
    if (env_val) {
        try {
            return std::stoull(env_val);
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

template<>
std::optional<bool> ConfigValue<bool>::getEnvValue() const {
    const char* env_val = std::getenv(env_var_.c_str());
    if (env_val) {
        std::string val(env_val);
        std::transform(val.begin(), val.end(), val.begin(), ::tolower);
        if (val == "true" || val == "1" || val == "yes" || val == "on") {
            return true;
        } else if (val == "false" || val == "0" || val == "no" || val == "off") {
            return false;
        }
        LOG(WARNING) << "Invalid boolean value for env var " << env_var_ << ": " << env_val;
    }
    return std::nullopt;
}

Configuration& Configuration::getInstance() {
    static Configuration instance;
    return instance;
}

void Configuration::applyYAML(const YAML::Node& yaml) {
    if (!yaml["wharf"]) {
        LOG(WARNING) << "Configuration has no top-level 'wharf' key, keeping defaults";
        return;
    }
    auto root = yaml["wharf"];

    // Version
    if (root["version"]) {
        auto version = root["version"];
        if (version["major"]) config_.version.major.set(version["major"].as<int>());
        if (version["minor"]) config_.version.minor.set(version["minor"].as<int>());
    }

    // Queue
    if (root["queue"]) {
        auto queue = root["queue"];
        if (queue["heap_size"]) config_.queue.heap_size.set(queue["heap_size"].as<size_t>());
        if (queue["max_temporary_failures"]) config_.queue.max_temporary_failures.set(queue["max_temporary_failures"].as<int>());
        if (queue["max_messages_per_turn"]) config_.queue.max_messages_per_turn.set(queue["max_messages_per_turn"].as<int>());
        if (queue["max_message_weight"]) config_.queue.max_message_weight.set(queue["max_message_weight"].as<size_t>());
    }

    // Service budgets
    if (root["service"]) {
        auto service = root["service"];
        if (service["service_weight"]) config_.service.service_weight.set(service["service_weight"].as<size_t>());
        if (service["idle_max_service_weight"]) config_.service.idle_max_service_weight.set(service["idle_max_service_weight"].as<size_t>());
    }

    // Weight table
    if (root["weights"]) {
        auto weights = root["weights"];
        if (weights["service_queue_base"]) config_.weights.service_queue_base.set(weights["service_queue_base"].as<size_t>());
        if (weights["service_page_base"]) config_.weights.service_page_base.set(weights["service_page_base"].as<size_t>());
        if (weights["service_page_item"]) config_.weights.service_page_item.set(weights["service_page_item"].as<size_t>());
        if (weights["bump_service_head"]) config_.weights.bump_service_head.set(weights["bump_service_head"].as<size_t>());
        if (weights["execute_overweight_base"]) config_.weights.execute_overweight_base.set(weights["execute_overweight_base"].as<size_t>());
    }
}

bool Configuration::loadFromFile(const std::string& filename) {
    try {
        YAML::Node yaml = YAML::LoadFile(filename);
        applyYAML(yaml);
        return validateConfig();
    } catch (const YAML::Exception& e) {
        LOG(ERROR) << "Failed to parse configuration file " << filename << ": " << e.what();
        return false;
    }
}

bool Configuration::loadFromString(const std::string& yaml_content) {
    try {
        YAML::Node yaml = YAML::Load(yaml_content);
        applyYAML(yaml);
        return validateConfig();
    } catch (const YAML::Exception& e) {
        LOG(ERROR) << "Failed to parse configuration string: " << e.what();
        return false;
    }
}

void Configuration::overrideFromCommandLine(int argc, char* argv[]) {
    static struct option long_options[] = {
        {"heap-size", required_argument, 0, 'H'},
        {"max-temporary-failures", required_argument, 0, 'r'},
        {"messages-per-turn", required_argument, 0, 'm'},
        {"service-weight", required_argument, 0, 'w'},
        {"config", required_argument, 0, 'f'},
        {0, 0, 0, 0}
    };

    int option_index = 0;
    int c;
    // Suppress getopt_long default error messages for unknown options
    opterr = 0;
    // Reset getopt state in case other parsers were used earlier
    optind = 1;

    while ((c = getopt_long(argc, argv, "H:r:m:w:f:", long_options, &option_index)) != -1) {
        try {
            switch (c) {
                case 'H':
                    config_.queue.heap_size.set(std::stoull(optarg));
                    break;
                case 'r':
                    config_.queue.max_temporary_failures.set(std::stoi(optarg));
                    break;
                case 'm':
                    config_.queue.max_messages_per_turn.set(std::stoi(optarg));
                    break;
                case 'w':
                    config_.service.service_weight.set(std::stoull(optarg));
                    break;
                case 'f':
                    loadFromFile(optarg);
                    break;
                default:
                    // Ignore unknown flags; the app parser handles them
                    break;
            }
        } catch (const std::exception& e) {
            LOG(WARNING) << "Ignoring malformed value for option -" << static_cast<char>(c)
                         << ": " << e.what();
        }
    }
    optind = 1;
}

bool Configuration::validate() const {
    validation_errors_.clear();

    const size_t heap_size = config_.queue.heap_size.get();
    if (heap_size < wire::MIN_PAGE_HEAP_SIZE) {
        validation_errors_.push_back("Queue heap size must hold at least one non-empty item");
    }
    if (heap_size > wire::MAX_PAGE_HEAP_SIZE) {
        validation_errors_.push_back("Queue heap size must fit in 32-bit page offsets");
    }

    if (config_.queue.max_temporary_failures.get() < 1) {
        validation_errors_.push_back("Max temporary failures must be set to at least 1");
    }

    if (config_.queue.max_messages_per_turn.get() < 0) {
        validation_errors_.push_back("Max messages per turn cannot be negative");
    }

    if (config_.service.idle_max_service_weight.get() > config_.service.service_weight.get()) {
        validation_errors_.push_back("Idle service weight cannot exceed the block service weight");
    }

    const size_t max_message_weight = config_.queue.max_message_weight.get();
    if (max_message_weight != 0 && max_message_weight > config_.service.service_weight.get()) {
        validation_errors_.push_back("Max message weight cannot exceed the block service weight");
    }

    return validation_errors_.empty();
}

std::vector<std::string> Configuration::getValidationErrors() const {
    return validation_errors_;
}

bool Configuration::validateConfig() {
    bool ok = validate();
    for (const auto& error : validation_errors_) {
        LOG(ERROR) << "Invalid configuration: " << error;
    }
    return ok;
}

} // namespace Wharf
