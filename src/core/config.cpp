#include "postrelay/core/config.hpp"
#include "postrelay/core/logger.hpp"
#include "postrelay/core/utils.hpp"
#include <array>
#include <cstdlib>

namespace postrelay::core {

using utils::StringUtils;

namespace {

constexpr std::array<const char*, 10> KNOWN_KEYS = {
    "server.base_url",
    "server.timeout_ms",
    "storage.database",
    "storage.temp_dir",
    "delivery.strategy",
    "resumable.chunk_size",
    "queue.failure_pause_ms",
    "queue.drain_timeout_ms",
    "log.level",
    "log.file",
};

// Values may be written bare or wrapped in double quotes.
std::string unquote(const std::string& value) {
    if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
        return value.substr(1, value.size() - 2);
    }
    return value;
}

}

Config& Config::instance() {
    static Config instance;
    return instance;
}

bool Config::load_from_file(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        return false;
    }

    std::string line;
    int line_number = 0;
    while (std::getline(file, line)) {
        line_number++;
        line = StringUtils::trim(line);

        if (line.empty() || line[0] == '#') {
            continue;
        }

        auto eq_pos = line.find('=');
        if (eq_pos == std::string::npos) {
            LOG_WARN("{}:{}: expected key=value, ignoring line", filename, line_number);
            continue;
        }

        std::string key = StringUtils::trim(line.substr(0, eq_pos));
        if (key.empty()) {
            LOG_WARN("{}:{}: missing key, ignoring line", filename, line_number);
            continue;
        }
        if (!is_known_key(key)) {
            LOG_WARN("{}:{}: unknown key {}", filename, line_number, key);
        }

        values_[key] = unquote(StringUtils::trim(line.substr(eq_pos + 1)));
    }

    LOG_DEBUG("Loaded configuration from {}", filename);
    return true;
}

bool Config::save_to_file(const std::string& filename) const {
    std::ofstream file(filename);
    if (!file.is_open()) {
        return false;
    }

    file << "# postrelay configuration\n\n";

    for (const auto& [key, value] : values_) {
        file << key << "=" << value << "\n";
    }

    return static_cast<bool>(file);
}

void Config::set(const std::string& key, const std::string& value) {
    values_[key] = value;
}

std::optional<std::string> Config::get(const std::string& key) const {
    auto it = values_.find(key);
    if (it == values_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool Config::get_bool(const std::string& key, bool default_value) const {
    auto value = get(key);
    if (!value) return default_value;

    auto lower = StringUtils::to_lower(*value);
    return lower == "true" || lower == "1" || lower == "yes";
}

int Config::get_int(const std::string& key, int default_value) const {
    return get_as<int>(key).value_or(default_value);
}

std::string Config::get_string(const std::string& key, const std::string& default_value) const {
    return get(key).value_or(default_value);
}

void Config::set_defaults() {
    values_["server.base_url"] = "http://localhost:8080";
    values_["server.timeout_ms"] = "30000";
    values_["storage.database"] = "postrelay.db";
    values_["storage.temp_dir"] = utils::FileUtils::get_temp_dir().string();
    values_["delivery.strategy"] = "level2";
    values_["resumable.chunk_size"] = "524288";
    values_["queue.failure_pause_ms"] = "1500";
    values_["queue.drain_timeout_ms"] = "10000";
    values_["log.level"] = "info";
    values_["log.file"] = "postrelay.log";
}

void Config::apply_environment_overrides() {
    static const std::pair<const char*, const char*> overrides[] = {
        {"POSTRELAY_SERVER_URL", "server.base_url"},
        {"POSTRELAY_DATABASE", "storage.database"},
        {"POSTRELAY_LOG_LEVEL", "log.level"},
    };

    for (const auto& [env_name, key] : overrides) {
        const char* value = std::getenv(env_name);
        if (value && *value) {
            values_[key] = value;
        }
    }
}

std::vector<std::string> Config::validate() const {
    std::vector<std::string> problems;

    if (auto url = get("server.base_url"); url && !StringUtils::starts_with(*url, "http://")) {
        problems.push_back("server.base_url must start with http://, got " + *url);
    }

    if (auto strategy = get("delivery.strategy")) {
        auto lower = StringUtils::to_lower(*strategy);
        if (lower != "level1" && lower != "level2" && lower != "level3" && lower != "level4") {
            problems.push_back("delivery.strategy must be one of level1..level4, got " + *strategy);
        }
    }

    if (get("resumable.chunk_size")) {
        auto chunk_size = get_as<long long>("resumable.chunk_size");
        if (!chunk_size || *chunk_size <= 0) {
            problems.push_back("resumable.chunk_size must be a positive byte count");
        }
    }

    for (const char* key : {"server.timeout_ms", "queue.failure_pause_ms", "queue.drain_timeout_ms"}) {
        if (!get(key)) continue;
        auto millis = get_as<int>(key);
        if (!millis || *millis < 0) {
            problems.push_back(std::string(key) + " must be a non-negative number of milliseconds");
        }
    }

    return problems;
}

bool Config::is_known_key(const std::string& key) {
    for (const char* known : KNOWN_KEYS) {
        if (key == known) return true;
    }
    return false;
}

}
