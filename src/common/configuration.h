#ifndef SLUICE_CONFIGURATION_H_
#define SLUICE_CONFIGURATION_H_

#include <string>
#include <optional>
#include <vector>
#include <cstdint>

#include "common/config.h"

namespace YAML {
class Node;
}

namespace Sluice {

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
struct SluiceConfig {
    // Dispatcher core
    struct Dispatcher {
        ConfigValue<int> worker_count{DEFAULT_WORKER_COUNT, "SLUICE_WORKER_COUNT"};
        ConfigValue<size_t> queue_capacity{DEFAULT_QUEUE_CAPACITY, "SLUICE_QUEUE_CAPACITY"};
        ConfigValue<size_t> admission_limit{DEFAULT_ADMISSION_LIMIT, "SLUICE_ADMISSION_LIMIT"};
        // "wait" suspends submitters at the limit, "reject" refuses them
        ConfigValue<std::string> admission_policy{"wait", "SLUICE_ADMISSION_POLICY"};
        ConfigValue<int64_t> enqueue_timeout_ms{DEFAULT_ENQUEUE_TIMEOUT_MS, "SLUICE_ENQUEUE_TIMEOUT_MS"};
        ConfigValue<int64_t> per_request_timeout_ms{DEFAULT_PER_REQUEST_TIMEOUT_MS, "SLUICE_PER_REQUEST_TIMEOUT_MS"};
        ConfigValue<int64_t> shutdown_grace_period_ms{DEFAULT_SHUTDOWN_GRACE_PERIOD_MS, "SLUICE_SHUTDOWN_GRACE_MS"};
        ConfigValue<size_t> stats_queue_capacity{DEFAULT_STATS_QUEUE_CAPACITY, "SLUICE_STATS_QUEUE_CAPACITY"};
    } dispatcher;

    // Synthetic load driven by the sluice executable
    struct Workload {
        ConfigValue<int> num_requests{DEFAULT_NUM_REQUESTS, "SLUICE_NUM_REQUESTS"};
        ConfigValue<int64_t> arrival_interval_ms{DEFAULT_ARRIVAL_INTERVAL_MS, "SLUICE_ARRIVAL_INTERVAL_MS"};
        ConfigValue<int64_t> base_cost_ms{DEFAULT_BASE_COST_MS, "SLUICE_BASE_COST_MS"};
        ConfigValue<int64_t> cost_step_ms{DEFAULT_COST_STEP_MS, "SLUICE_COST_STEP_MS"};
        ConfigValue<int> cost_buckets{DEFAULT_COST_BUCKETS, "SLUICE_COST_BUCKETS"};
        ConfigValue<int> failure_modulus{DEFAULT_FAILURE_MODULUS, "SLUICE_FAILURE_MODULUS"};
        ConfigValue<int64_t> response_timeout_ms{DEFAULT_RESPONSE_TIMEOUT_MS, "SLUICE_RESPONSE_TIMEOUT_MS"};
        ConfigValue<int64_t> monitor_interval_ms{DEFAULT_MONITOR_INTERVAL_MS, "SLUICE_MONITOR_INTERVAL_MS"};
    } workload;
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
    const SluiceConfig& config() const { return config_; }
    SluiceConfig& config() { return config_; }

    // Helper methods for common access patterns
    int getWorkerCount() const { return config_.dispatcher.worker_count.get(); }
    size_t getQueueCapacity() const { return config_.dispatcher.queue_capacity.get(); }
    size_t getAdmissionLimit() const { return config_.dispatcher.admission_limit.get(); }

    // Restore compiled-in defaults (tests reuse the singleton)
    void reset() { config_ = SluiceConfig(); validation_errors_.clear(); }

    // Validation
    bool validate() const;
    std::vector<std::string> getValidationErrors() const;

private:
    Configuration() = default;
    Configuration(const Configuration&) = delete;
    Configuration& operator=(const Configuration&) = delete;

    SluiceConfig config_;
    mutable std::vector<std::string> validation_errors_;

    // Applies every recognized key below the "sluice" root
    void parseRoot(const YAML::Node& root);
};

// Template specializations for getEnvValue
template<>
std::optional<int> ConfigValue<int>::getEnvValue() const;

template<>
std::optional<int64_t> ConfigValue<int64_t>::getEnvValue() const;

template<>
std::optional<size_t> ConfigValue<size_t>::getEnvValue() const;

template<>
std::optional<std::string> ConfigValue<std::string>::getEnvValue() const;

} // namespace Sluice

#endif // SLUICE_CONFIGURATION_H_
