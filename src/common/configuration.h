#ifndef TAGLEDGER_CONFIGURATION_H_
#define TAGLEDGER_CONFIGURATION_H_

#include <string>
#include <optional>
#include <vector>
#include <cstdint>

namespace YAML {
class Node;
}

namespace TagLedger {

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
struct TagLedgerConfig {
    // Durable ledger (SQLite file)
    struct Store {
        ConfigValue<std::string> path{"tagledger.db", "TAGLEDGER_DB_PATH"};
        ConfigValue<int> busy_timeout_ms{5000, "TAGLEDGER_BUSY_TIMEOUT_MS"};
        // WAL lets previews and audits read while an allocation holds the write lock.
        ConfigValue<std::string> journal_mode{"WAL", "TAGLEDGER_JOURNAL_MODE"};
    } store;

    // Tag format. PREFIX/PADDING kept as the names the label printer already uses.
    struct Tags {
        ConfigValue<std::string> default_prefix{"W12", "TAGLEDGER_PREFIX"};
        ConfigValue<int> padding{4, "TAGLEDGER_PADDING"};
    } tags;

    struct Allocator {
        ConfigValue<int> max_attempts{8, "TAGLEDGER_ALLOC_MAX_ATTEMPTS"};
        ConfigValue<int> retry_backoff_ms{2, "TAGLEDGER_ALLOC_RETRY_BACKOFF_MS"};
    } allocator;

    struct Auditor {
        // A reservation older than this without a confirmation is reported as stale.
        ConfigValue<int> stale_after_minutes{24 * 60, "TAGLEDGER_STALE_AFTER_MINUTES"};
    } auditor;

    struct Service {
        ConfigValue<std::string> listen_address{"0.0.0.0", "TAGLEDGER_LISTEN_ADDRESS"};
        ConfigValue<int> port{50061, "TAGLEDGER_PORT"};
        ConfigValue<std::string> server_address{"127.0.0.1:50061", "TAGLEDGER_SERVER_ADDRESS"};
        ConfigValue<int> client_deadline_ms{3000, "TAGLEDGER_CLIENT_DEADLINE_MS"};
    } service;
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
    const TagLedgerConfig& config() const { return config_; }
    TagLedgerConfig& config() { return config_; }

    // Helper methods for common access patterns
    std::string getStorePath() const { return config_.store.path.get(); }
    std::string getDefaultPrefix() const { return config_.tags.default_prefix.get(); }
    int getPadding() const { return config_.tags.padding.get(); }
    int getStaleAfterMinutes() const { return config_.auditor.stale_after_minutes.get(); }
    int getServicePort() const { return config_.service.port.get(); }

    // Restore compiled-in defaults. Used by tests that share the singleton.
    void reset() { config_ = TagLedgerConfig(); }

    // Validation
    bool validate() const;
    std::vector<std::string> getValidationErrors() const;

private:
    Configuration() = default;
    Configuration(const Configuration&) = delete;
    Configuration& operator=(const Configuration&) = delete;

    TagLedgerConfig config_;
    mutable std::vector<std::string> validation_errors_;

    void applyYAML(const YAML::Node& yaml);
};

// Template specializations for getEnvValue
template<>
std::optional<int> ConfigValue<int>::getEnvValue() const;

template<>
std::optional<std::string> ConfigValue<std::string>::getEnvValue() const;

template<>
std::optional<bool> ConfigValue<bool>::getEnvValue() const;

} // namespace TagLedger

#endif // TAGLEDGER_CONFIGURATION_H_
