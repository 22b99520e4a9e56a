#include "configuration.h"
#include <cstdlib>
#include <glog/logging.h>
#include <yaml-cpp/yaml.h>

namespace Sluice {

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
std::optional<int64_t> ConfigValue<int64_t>::getEnvValue() const {
    const char* env_val = std::getenv(env_var_.c_str());
    if (env_val) {
        try {
            return static_cast<int64_t>(std::stoll(env_val));
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
            return static_cast<size_t>(std::stoull(env_val));
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

void Configuration::parseRoot(const YAML::Node& root) {
    // Dispatcher
    if (root["dispatcher"]) {
        auto dispatcher = root["dispatcher"];
        if (dispatcher["worker_count"]) config_.dispatcher.worker_count.set(dispatcher["worker_count"].as<int>());
        if (dispatcher["queue_capacity"]) config_.dispatcher.queue_capacity.set(dispatcher["queue_capacity"].as<size_t>());
        if (dispatcher["admission_limit"]) config_.dispatcher.admission_limit.set(dispatcher["admission_limit"].as<size_t>());
        if (dispatcher["admission_policy"]) config_.dispatcher.admission_policy.set(dispatcher["admission_policy"].as<std::string>());
        if (dispatcher["enqueue_timeout_ms"]) config_.dispatcher.enqueue_timeout_ms.set(dispatcher["enqueue_timeout_ms"].as<int64_t>());
        if (dispatcher["per_request_timeout_ms"]) config_.dispatcher.per_request_timeout_ms.set(dispatcher["per_request_timeout_ms"].as<int64_t>());
        if (dispatcher["shutdown_grace_period_ms"]) config_.dispatcher.shutdown_grace_period_ms.set(dispatcher["shutdown_grace_period_ms"].as<int64_t>());
        if (dispatcher["stats_queue_capacity"]) config_.dispatcher.stats_queue_capacity.set(dispatcher["stats_queue_capacity"].as<size_t>());
    }

    // Workload
    if (root["workload"]) {
        auto workload = root["workload"];
        if (workload["num_requests"]) config_.workload.num_requests.set(workload["num_requests"].as<int>());
        if (workload["arrival_interval_ms"]) config_.workload.arrival_interval_ms.set(workload["arrival_interval_ms"].as<int64_t>());
        if (workload["base_cost_ms"]) config_.workload.base_cost_ms.set(workload["base_cost_ms"].as<int64_t>());
        if (workload["cost_step_ms"]) config_.workload.cost_step_ms.set(workload["cost_step_ms"].as<int64_t>());
        if (workload["cost_buckets"]) config_.workload.cost_buckets.set(workload["cost_buckets"].as<int>());
        if (workload["failure_modulus"]) config_.workload.failure_modulus.set(workload["failure_modulus"].as<int>());
        if (workload["response_timeout_ms"]) config_.workload.response_timeout_ms.set(workload["response_timeout_ms"].as<int64_t>());
        if (workload["monitor_interval_ms"]) config_.workload.monitor_interval_ms.set(workload["monitor_interval_ms"].as<int64_t>());
    }
}

bool Configuration::loadFromFile(const std::string& filename) {
    try {
        YAML::Node yaml = YAML::LoadFile(filename);
        if (yaml["sluice"]) {
            parseRoot(yaml["sluice"]);
        } else {
            LOG(WARNING) << "No 'sluice' section in " << filename << ", keeping defaults";
        }
        return validate();
    } catch (const YAML::Exception& e) {
        LOG(ERROR) << "Failed to parse configuration file: " << e.what();
        return false;
    }
}

bool Configuration::loadFromString(const std::string& yaml_content) {
    try {
        YAML::Node yaml = YAML::Load(yaml_content);
        if (yaml["sluice"]) {
            parseRoot(yaml["sluice"]);
        }
        return validate();
    } catch (const YAML::Exception& e) {
        LOG(ERROR) << "Failed to parse configuration string: " << e.what();
        return false;
    }
}

bool Configuration::validate() const {
    validation_errors_.clear();

    const auto& d = config_.dispatcher;
    const auto& w = config_.workload;

    // Validate pool sizing
    if (d.worker_count.get() < 1) {
        validation_errors_.push_back("Worker count must be at least 1");
    }
    if (d.queue_capacity.get() < 1) {
        validation_errors_.push_back("Queue capacity must be at least 1");
    }
    if (d.admission_limit.get() < 1) {
        validation_errors_.push_back("Admission limit must be at least 1");
    }
    if (d.stats_queue_capacity.get() < 1) {
        validation_errors_.push_back("Stats queue capacity must be at least 1");
    }

    std::string policy = d.admission_policy.get();
    if (policy != "wait" && policy != "reject") {
        validation_errors_.push_back("Admission policy must be 'wait' or 'reject', got '" + policy + "'");
    }

    // Validate durations
    if (d.enqueue_timeout_ms.get() < 0) {
        validation_errors_.push_back("Enqueue timeout cannot be negative");
    }
    if (d.per_request_timeout_ms.get() < 0) {
        validation_errors_.push_back("Per-request timeout cannot be negative");
    }
    if (d.shutdown_grace_period_ms.get() < 0) {
        validation_errors_.push_back("Shutdown grace period cannot be negative");
    }

    // Validate workload
    if (w.num_requests.get() < 0) {
        validation_errors_.push_back("Number of requests cannot be negative");
    }
    if (w.arrival_interval_ms.get() < 0 || w.base_cost_ms.get() < 0 || w.cost_step_ms.get() < 0) {
        validation_errors_.push_back("Workload timings cannot be negative");
    }
    if (w.cost_buckets.get() < 1) {
        validation_errors_.push_back("Cost buckets must be at least 1");
    }
    if (w.failure_modulus.get() < 0) {
        validation_errors_.push_back("Failure modulus cannot be negative");
    }
    if (w.response_timeout_ms.get() < 1 || w.monitor_interval_ms.get() < 1) {
        validation_errors_.push_back("Response timeout and monitor interval must be positive");
    }

    return validation_errors_.empty();
}

std::vector<std::string> Configuration::getValidationErrors() const {
    return validation_errors_;
}

} // namespace Sluice
