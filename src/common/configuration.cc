#include "configuration.h"
#include "config.h"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <getopt.h>
#include <glog/logging.h>
#include <yaml-cpp/yaml.h>

namespace TagLedger {

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
    if (!yaml["tagledger"]) {
        LOG(WARNING) << "Configuration has no 'tagledger' root; keeping defaults";
        return;
    }
    auto root = yaml["tagledger"];

    // Store
    if (root["store"]) {
        auto store = root["store"];
        if (store["path"]) config_.store.path.set(store["path"].as<std::string>());
        if (store["busy_timeout_ms"]) config_.store.busy_timeout_ms.set(store["busy_timeout_ms"].as<int>());
        if (store["journal_mode"]) config_.store.journal_mode.set(store["journal_mode"].as<std::string>());
    }

    // Tags
    if (root["tags"]) {
        auto tags = root["tags"];
        if (tags["default_prefix"]) config_.tags.default_prefix.set(tags["default_prefix"].as<std::string>());
        if (tags["padding"]) config_.tags.padding.set(tags["padding"].as<int>());
    }

    // Allocator
    if (root["allocator"]) {
        auto allocator = root["allocator"];
        if (allocator["max_attempts"]) config_.allocator.max_attempts.set(allocator["max_attempts"].as<int>());
        if (allocator["retry_backoff_ms"]) config_.allocator.retry_backoff_ms.set(allocator["retry_backoff_ms"].as<int>());
    }

    // Auditor
    if (root["auditor"]) {
        auto auditor = root["auditor"];
        if (auditor["stale_after_minutes"]) config_.auditor.stale_after_minutes.set(auditor["stale_after_minutes"].as<int>());
    }

    // Service
    if (root["service"]) {
        auto service = root["service"];
        if (service["listen_address"]) config_.service.listen_address.set(service["listen_address"].as<std::string>());
        if (service["port"]) config_.service.port.set(service["port"].as<int>());
        if (service["server_address"]) config_.service.server_address.set(service["server_address"].as<std::string>());
        if (service["client_deadline_ms"]) config_.service.client_deadline_ms.set(service["client_deadline_ms"].as<int>());
    }
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

void Configuration::overrideFromCommandLine(int argc, char* argv[]) {
    static struct option long_options[] = {
        {"db", required_argument, 0, 'd'},
        {"port", required_argument, 0, 'p'},
        {"prefix", required_argument, 0, 'x'},
        {"padding", required_argument, 0, 'w'},
        // Accept flags owned by the binaries so getopt_long doesn't error.
        // --config is loaded by the caller before overrides are applied.
        {"config", required_argument, 0, 0},
        {"log_level", required_argument, 0, 0},
        {"server", required_argument, 0, 0},
        {"help", no_argument, 0, 0},
        {0, 0, 0, 0}
    };

    int option_index = 0;
    int c;
    // Suppress getopt_long default error messages for unknown options
    opterr = 0;
    // Reset getopt state in case other parsers were used earlier
    optind = 1;

    while ((c = getopt_long(argc, argv, "d:p:x:w:", long_options, &option_index)) != -1) {
        try {
            switch (c) {
                case 'd':
                    config_.store.path.set(optarg);
                    break;
                case 'p':
                    config_.service.port.set(std::stoi(optarg));
                    break;
                case 'x':
                    config_.tags.default_prefix.set(optarg);
                    break;
                case 'w':
                    config_.tags.padding.set(std::stoi(optarg));
                    break;
                case 0:
                    // Known app flags we intentionally ignore here (handled elsewhere)
                    break;
                default:
                    break;
            }
        } catch (const std::exception& e) {
            LOG(WARNING) << "Ignoring malformed command line value for option '"
                << static_cast<char>(c) << "': " << e.what();
        }
    }
}

bool Configuration::validate() const {
    validation_errors_.clear();

    const std::string prefix = config_.tags.default_prefix.get();
    if (prefix.empty()) {
        validation_errors_.push_back("Default prefix must not be empty");
    } else if (prefix.find(kTagSeparator) != std::string::npos) {
        validation_errors_.push_back(std::string("Default prefix must not contain the tag separator '") +
                kTagSeparator + "'");
    } else if (prefix.size() > kMaxPrefixLength) {
        validation_errors_.push_back("Default prefix is longer than " + std::to_string(kMaxPrefixLength) + " characters");
    }

    if (config_.tags.padding.get() < 0 || config_.tags.padding.get() > kMaxPaddingWidth) {
        validation_errors_.push_back("Padding must be between 0 and " + std::to_string(kMaxPaddingWidth));
    }

    if (config_.store.path.get().empty()) {
        validation_errors_.push_back("Store path must not be empty");
    }

    if (config_.store.busy_timeout_ms.get() < 0) {
        validation_errors_.push_back("Store busy timeout cannot be negative");
    }

    const std::string journal_mode = config_.store.journal_mode.get();
    if (journal_mode != "WAL" && journal_mode != "DELETE" && journal_mode != "TRUNCATE") {
        validation_errors_.push_back("Journal mode must be one of WAL, DELETE, TRUNCATE");
    }

    if (config_.allocator.max_attempts.get() < 1) {
        validation_errors_.push_back("Allocator max attempts must be at least 1");
    }

    if (config_.allocator.retry_backoff_ms.get() < 0) {
        validation_errors_.push_back("Allocator retry backoff cannot be negative");
    }

    if (config_.auditor.stale_after_minutes.get() < 0) {
        validation_errors_.push_back("Stale threshold cannot be negative");
    }

    // Validate port ranges
    if (config_.service.port.get() < 1024 || config_.service.port.get() > 65535) {
        validation_errors_.push_back("Service port must be between 1024 and 65535");
    }

    if (config_.service.client_deadline_ms.get() < 1) {
        validation_errors_.push_back("Client deadline must be at least 1ms");
    }

    return validation_errors_.empty();
}

std::vector<std::string> Configuration::getValidationErrors() const {
    return validation_errors_;
}

} // namespace TagLedger
