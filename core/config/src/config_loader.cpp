/**
 * @file config_loader.cpp
 * @brief Configuration loader implementation
 */

#include <netfetch/config/config_loader.hpp>

#include <netfetch/common/debug.hpp>

#include <json/json.h>
#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <memory>
#include <sstream>

namespace netfetch::config {

using namespace common::debug;
using common::ErrorCode;

// ============================================================================
// FORMAT DETECTION
// ============================================================================

ConfigFormat detect_format(const std::filesystem::path& path) {
    auto ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (ext == ".json") {
        return ConfigFormat::JSON;
    }
    return ConfigFormat::YAML;
}

ConfigFormat detect_format_from_content(std::string_view content) {
    size_t pos = 0;
    while (pos < content.size() && std::isspace(static_cast<unsigned char>(content[pos]))) {
        ++pos;
    }

    if (pos < content.size() && (content[pos] == '{' || content[pos] == '[')) {
        return ConfigFormat::JSON;
    }
    return ConfigFormat::YAML;
}

// ============================================================================
// YAML PARSING
// ============================================================================

namespace {

template<typename T>
T yaml_get(const YAML::Node& node, const char* key, T default_value) {
    if (!node.IsMap()) {
        return default_value;
    }
    auto value = node[key];
    if (!value) {
        return default_value;
    }
    try {
        return value.template as<T>();
    } catch (const YAML::Exception& e) {
        NETFETCH_LOG_WARN(category::CONFIG,
                          "Ignoring invalid value for '" << key << "': " << e.what());
        return default_value;
    }
}

std::vector<std::string> yaml_get_list(const YAML::Node& node, const char* key) {
    std::vector<std::string> items;
    if (!node.IsMap() || !node[key]) {
        return items;
    }

    auto value = node[key];
    try {
        if (value.IsScalar()) {
            items.push_back(value.as<std::string>());
        } else if (value.IsSequence()) {
            for (const auto& item : value) {
                items.push_back(item.as<std::string>());
            }
        }
    } catch (const YAML::Exception& e) {
        NETFETCH_LOG_WARN(category::CONFIG,
                          "Ignoring invalid list '" << key << "': " << e.what());
        items.clear();
    }
    return items;
}

TransportConfig parse_transport_yaml(const YAML::Node& node) {
    TransportConfig config;
    config.connect_timeout_ms = yaml_get(node, "connect_timeout_ms", config.connect_timeout_ms);
    config.low_speed_limit    = yaml_get(node, "low_speed_limit", config.low_speed_limit);
    config.low_speed_time_ms  = yaml_get(node, "low_speed_time_ms", config.low_speed_time_ms);
    config.follow_redirects   = yaml_get(node, "follow_redirects", config.follow_redirects);
    config.max_redirects      = yaml_get(node, "max_redirects", config.max_redirects);
    config.user_agent         = yaml_get(node, "user_agent", config.user_agent);
    return config;
}

TlsConfig parse_tls_yaml(const YAML::Node& node) {
    TlsConfig config;
    config.root_cert_files = yaml_get_list(node, "root_cert_files");
    config.verify_peer     = yaml_get(node, "verify_peer", config.verify_peer);
    return config;
}

LoggingConfig parse_logging_yaml(const YAML::Node& node) {
    LoggingConfig config;
    config.level             = yaml_get(node, "level", config.level);
    config.output            = yaml_get(node, "output", config.output);
    config.file_path         = yaml_get(node, "file_path", config.file_path);
    config.max_file_size_mb  = yaml_get(node, "max_file_size_mb", config.max_file_size_mb);
    config.max_files         = yaml_get(node, "max_files", config.max_files);
    config.include_timestamp = yaml_get(node, "include_timestamp", config.include_timestamp);
    config.include_thread_id = yaml_get(node, "include_thread_id", config.include_thread_id);
    config.use_colors        = yaml_get(node, "use_colors", config.use_colors);
    return config;
}

NetfetchConfig parse_config_yaml(const YAML::Node& root) {
    NetfetchConfig config;
    if (root["transport"]) {
        config.transport = parse_transport_yaml(root["transport"]);
    }
    if (root["tls"]) {
        config.tls = parse_tls_yaml(root["tls"]);
    }
    if (root["logging"]) {
        config.logging = parse_logging_yaml(root["logging"]);
    }
    return config;
}

// ============================================================================
// JSON PARSING
// ============================================================================

const Json::Value* json_member(const Json::Value& node, const char* key) {
    if (!node.isObject() || !node.isMember(key)) {
        return nullptr;
    }
    return &node[key];
}

void warn_type(const char* key) {
    NETFETCH_LOG_WARN(category::CONFIG, "Ignoring value of wrong type for '" << key << "'");
}

uint32_t json_get(const Json::Value& node, const char* key, uint32_t default_value) {
    const auto* value = json_member(node, key);
    if (!value) {
        return default_value;
    }
    if (!value->isUInt()) {
        warn_type(key);
        return default_value;
    }
    return value->asUInt();
}

bool json_get(const Json::Value& node, const char* key, bool default_value) {
    const auto* value = json_member(node, key);
    if (!value) {
        return default_value;
    }
    if (!value->isBool()) {
        warn_type(key);
        return default_value;
    }
    return value->asBool();
}

std::string json_get(const Json::Value& node, const char* key, const std::string& default_value) {
    const auto* value = json_member(node, key);
    if (!value) {
        return default_value;
    }
    if (!value->isString()) {
        warn_type(key);
        return default_value;
    }
    return value->asString();
}

std::vector<std::string> json_get_list(const Json::Value& node, const char* key) {
    std::vector<std::string> items;
    const auto* value = json_member(node, key);
    if (!value) {
        return items;
    }

    if (value->isString()) {
        items.push_back(value->asString());
    } else if (value->isArray()) {
        for (const auto& item : *value) {
            if (!item.isString()) {
                warn_type(key);
                return {};
            }
            items.push_back(item.asString());
        }
    } else {
        warn_type(key);
    }
    return items;
}

TransportConfig parse_transport_json(const Json::Value& node) {
    TransportConfig config;
    config.connect_timeout_ms = json_get(node, "connect_timeout_ms", config.connect_timeout_ms);
    config.low_speed_limit    = json_get(node, "low_speed_limit", config.low_speed_limit);
    config.low_speed_time_ms  = json_get(node, "low_speed_time_ms", config.low_speed_time_ms);
    config.follow_redirects   = json_get(node, "follow_redirects", config.follow_redirects);
    config.max_redirects      = json_get(node, "max_redirects", config.max_redirects);
    config.user_agent         = json_get(node, "user_agent", config.user_agent);
    return config;
}

TlsConfig parse_tls_json(const Json::Value& node) {
    TlsConfig config;
    config.root_cert_files = json_get_list(node, "root_cert_files");
    config.verify_peer     = json_get(node, "verify_peer", config.verify_peer);
    return config;
}

LoggingConfig parse_logging_json(const Json::Value& node) {
    LoggingConfig config;
    config.level             = json_get(node, "level", config.level);
    config.output            = json_get(node, "output", config.output);
    config.file_path         = json_get(node, "file_path", config.file_path);
    config.max_file_size_mb  = json_get(node, "max_file_size_mb", config.max_file_size_mb);
    config.max_files         = json_get(node, "max_files", config.max_files);
    config.include_timestamp = json_get(node, "include_timestamp", config.include_timestamp);
    config.include_thread_id = json_get(node, "include_thread_id", config.include_thread_id);
    config.use_colors        = json_get(node, "use_colors", config.use_colors);
    return config;
}

NetfetchConfig parse_config_json(const Json::Value& root) {
    NetfetchConfig config;
    if (const auto* node = json_member(root, "transport")) {
        config.transport = parse_transport_json(*node);
    }
    if (const auto* node = json_member(root, "tls")) {
        config.tls = parse_tls_json(*node);
    }
    if (const auto* node = json_member(root, "logging")) {
        config.logging = parse_logging_json(*node);
    }
    return config;
}

}  // anonymous namespace

// ============================================================================
// LOADING
// ============================================================================

common::Result<NetfetchConfig> parse_config(std::string_view content, ConfigFormat format) {
    if (format == ConfigFormat::AUTO) {
        format = detect_format_from_content(content);
    }

    if (format == ConfigFormat::JSON) {
        Json::CharReaderBuilder builder;
        std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
        Json::Value root;
        std::string errors;

        if (!reader->parse(content.data(), content.data() + content.size(), &root, &errors)) {
            return common::Result<NetfetchConfig>(ErrorCode::CONFIG_PARSE_ERROR,
                                                  "JSON parse error: " + errors);
        }
        if (!root.isObject() && !root.isNull()) {
            return common::Result<NetfetchConfig>(ErrorCode::CONFIG_PARSE_ERROR,
                                                  "JSON configuration must be an object");
        }
        return parse_config_json(root);
    }

    YAML::Node root;
    try {
        root = YAML::Load(std::string(content));
    } catch (const YAML::Exception& e) {
        return common::Result<NetfetchConfig>(ErrorCode::CONFIG_PARSE_ERROR,
                                              std::string("YAML parse error: ") + e.what());
    }

    if (root.IsNull()) {
        return NetfetchConfig{};
    }
    if (!root.IsMap()) {
        return common::Result<NetfetchConfig>(ErrorCode::CONFIG_PARSE_ERROR,
                                              "YAML configuration must be a mapping");
    }
    return parse_config_yaml(root);
}

common::Result<NetfetchConfig> load_config(const std::filesystem::path& path,
                                           ConfigFormat format) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return common::Result<NetfetchConfig>(ErrorCode::CONFIG_FILE_NOT_FOUND,
                                              "configuration file not found: " + path.string());
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return common::Result<NetfetchConfig>(ErrorCode::FILE_ACCESS_DENIED,
                                              "cannot open configuration file: " + path.string());
    }
    std::ostringstream content;
    content << file.rdbuf();

    if (format == ConfigFormat::AUTO) {
        auto ext = path.extension().string();
        if (ext == ".json" || ext == ".yaml" || ext == ".yml") {
            format = detect_format(path);
        }
    }

    NETFETCH_LOG_DEBUG(category::CONFIG, "Loading configuration from " << path.string());

    auto result = parse_config(content.str(), format);
    if (result.is_error()) {
        return common::Result<NetfetchConfig>(ErrorCode::CONFIG_PARSE_ERROR,
                                              path.string() + ": " + result.message());
    }
    return result;
}

// ============================================================================
// APPLYING
// ============================================================================

transport::http::DownloadOptions to_download_options(const NetfetchConfig& config) {
    transport::http::DownloadOptions options;
    options.connect_timeout  = std::chrono::milliseconds(config.transport.connect_timeout_ms);
    options.low_speed_limit  = config.transport.low_speed_limit;
    options.low_speed_time   = std::chrono::milliseconds(config.transport.low_speed_time_ms);
    options.follow_redirects = config.transport.follow_redirects;
    options.max_redirects    = config.transport.max_redirects;
    options.user_agent       = config.transport.user_agent;
    options.verify_peer      = config.tls.verify_peer;
    options.root_cert_files  = config.tls.root_cert_files;
    return options;
}

common::Result<void> apply_logging_config(const LoggingConfig& config) {
    std::shared_ptr<ILogSink> sink;

    if (config.output == "file") {
        if (config.file_path.empty()) {
            return common::err(ErrorCode::CONFIG_INVALID_VALUE,
                               "logging.file_path is required for file output");
        }
        FileSink::Config file_config;
        file_config.file_path     = config.file_path;
        file_config.max_file_size = static_cast<size_t>(config.max_file_size_mb) * 1024 * 1024;
        file_config.max_files     = config.max_files;

        auto file_sink = std::make_shared<FileSink>(file_config);
        if (!file_sink->is_ready()) {
            return common::err(ErrorCode::FILE_ACCESS_DENIED,
                               "cannot open log file " + config.file_path);
        }
        sink = std::move(file_sink);
    } else if (config.output == "console") {
        ConsoleSink::Config console_config;
        console_config.use_colors        = config.use_colors;
        console_config.include_timestamp = config.include_timestamp;
        console_config.include_thread_id = config.include_thread_id;
        sink = std::make_shared<ConsoleSink>(console_config);
    } else {
        return common::err(ErrorCode::CONFIG_INVALID_VALUE,
                           "unknown logging output '" + config.output + "'");
    }

    auto& logger = Logger::instance();
    logger.clear_sinks();
    logger.add_sink(std::move(sink));
    init_logging(parse_log_level(config.level));
    return common::ok();
}

}  // namespace netfetch::config
