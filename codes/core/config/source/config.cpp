// =============================================================================
//  H2 Mux Client - Config Module
//  文件: config.cpp
//  描述: 客户端会话配置实现
//  版权: Copyright (c) 2026
// =============================================================================
#include "config/config.hpp"
#include "utils/logger.hpp"
#include <fstream>
#include <iterator>

// 仅在cpp文件中包含nlohmann/json，头文件不暴露
#include <nlohmann/json.hpp>

namespace h2_mux_client {
namespace config {

using json = nlohmann::json;
using utils::ErrorCode;
using utils::Result;
using utils::make_ok;
using utils::make_err;

namespace {

constexpr uint32_t kMaxWindowSize = 0x7FFFFFFF;
constexpr uint32_t kMinFrameSize = 16384;
constexpr uint32_t kMaxFrameSize = 16777215;

// 解析json到配置结构体，字段缺省时保留原值
Result<void> parse_json_to_config(const json& j,
                                  SessionConfig& session,
                                  Http2Config& http2,
                                  LoggingConfig& logging) {
    if (!j.is_object()) {
        return make_err(ErrorCode::CONFIG_PARSE_ERROR, "Config root must be a JSON object");
    }

    // session
    if (j.contains("session")) {
        const auto& s = j["session"];
        if (s.contains("idle_timeout_seconds")) {
            session.idle_timeout_seconds = s["idle_timeout_seconds"].get<uint32_t>();
        }
        if (s.contains("download_maxsize")) session.download_maxsize = s["download_maxsize"].get<int64_t>();
        if (s.contains("download_warnsize")) session.download_warnsize = s["download_warnsize"].get<int64_t>();
    }

    // http2
    if (j.contains("http2")) {
        const auto& h = j["http2"];
        if (h.contains("header_table_size")) http2.header_table_size = h["header_table_size"].get<uint32_t>();
        if (h.contains("enable_push")) http2.enable_push = h["enable_push"].get<bool>();
        if (h.contains("max_concurrent_streams")) {
            http2.max_concurrent_streams = h["max_concurrent_streams"].get<uint32_t>();
        }
        if (h.contains("initial_window_size")) {
            http2.initial_window_size = h["initial_window_size"].get<uint32_t>();
        }
        if (h.contains("max_frame_size")) http2.max_frame_size = h["max_frame_size"].get<uint32_t>();
    }

    // logging
    if (j.contains("logging")) {
        const auto& l = j["logging"];
        if (l.contains("level")) logging.level = l["level"].get<std::string>();
        if (l.contains("file")) logging.file = l["file"].get<std::string>();
        if (l.contains("console_output")) logging.console_output = l["console_output"].get<bool>();
    }

    return make_ok();
}

} // anonymous namespace

Result<void> Config::load_from_file(const std::string& file_path) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        return make_err(ErrorCode::FILE_NOT_FOUND, "Cannot open config file: " + file_path);
    }

    std::string content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    if (file.bad()) {
        return make_err(ErrorCode::FILE_READ_ERROR, "Cannot read config file: " + file_path);
    }
    return load_from_string(content);
}

Result<void> Config::load_from_string(const std::string& json_str) {
    // 解析到副本，失败时不修改当前配置
    SessionConfig session = session_;
    Http2Config http2 = http2_;
    LoggingConfig logging = logging_;

    try {
        json j = json::parse(json_str);
        Result<void> ret = parse_json_to_config(j, session, http2, logging);
        if (ret.is_err()) {
            return ret;
        }
    } catch (const json::parse_error& e) {
        return make_err(ErrorCode::CONFIG_PARSE_ERROR, std::string("JSON parse error: ") + e.what());
    } catch (const json::type_error& e) {
        return make_err(ErrorCode::CONFIG_INVALID_VALUE, std::string("JSON type error: ") + e.what());
    } catch (const json::out_of_range& e) {
        return make_err(ErrorCode::CONFIG_INVALID_VALUE, std::string("JSON value out of range: ") + e.what());
    } catch (const std::exception& e) {
        return make_err(ErrorCode::CONFIG_PARSE_ERROR, std::string("Failed to load config: ") + e.what());
    }

    session_ = session;
    http2_ = http2;
    logging_ = logging;
    LOG_DEBUG("Config", "Config loaded: idle_timeout=%us max_concurrent_streams=%u",
              session_.idle_timeout_seconds, http2_.max_concurrent_streams);
    return make_ok();
}

Result<void> Config::validate() const {
    if (session_.idle_timeout_seconds == 0) {
        return make_err(ErrorCode::CONFIG_INVALID_VALUE, "idle_timeout_seconds must be positive");
    }
    if (session_.download_maxsize < 0 || session_.download_warnsize < 0) {
        return make_err(ErrorCode::CONFIG_INVALID_VALUE, "download sizes must not be negative");
    }
    if (session_.download_maxsize > 0 && session_.download_warnsize > session_.download_maxsize) {
        return make_err(ErrorCode::CONFIG_INVALID_VALUE,
                        "download_warnsize (" + std::to_string(session_.download_warnsize) +
                        ") exceeds download_maxsize (" + std::to_string(session_.download_maxsize) + ")");
    }

    if (http2_.initial_window_size > kMaxWindowSize) {
        return make_err(ErrorCode::CONFIG_INVALID_VALUE,
                        "Invalid initial_window_size: " + std::to_string(http2_.initial_window_size));
    }
    if (http2_.max_frame_size < kMinFrameSize || http2_.max_frame_size > kMaxFrameSize) {
        return make_err(ErrorCode::CONFIG_INVALID_VALUE,
                        "Invalid max_frame_size: " + std::to_string(http2_.max_frame_size));
    }
    if (http2_.max_concurrent_streams == 0) {
        return make_err(ErrorCode::CONFIG_INVALID_VALUE, "max_concurrent_streams must be positive");
    }

    bool level_valid = false;
    utils::string_to_log_level(logging_.level, &level_valid);
    if (!level_valid) {
        return make_err(ErrorCode::CONFIG_INVALID_LOG_LEVEL, "Invalid log level: " + logging_.level);
    }

    return make_ok();
}

Result<std::string> Config::to_json_string() const {
    json j;
    j["session"]["idle_timeout_seconds"] = session_.idle_timeout_seconds;
    j["session"]["download_maxsize"] = session_.download_maxsize;
    j["session"]["download_warnsize"] = session_.download_warnsize;

    j["http2"]["header_table_size"] = http2_.header_table_size;
    j["http2"]["enable_push"] = http2_.enable_push;
    j["http2"]["max_concurrent_streams"] = http2_.max_concurrent_streams;
    j["http2"]["initial_window_size"] = http2_.initial_window_size;
    j["http2"]["max_frame_size"] = http2_.max_frame_size;

    j["logging"]["level"] = logging_.level;
    j["logging"]["file"] = logging_.file;
    j["logging"]["console_output"] = logging_.console_output;

    try {
        return make_ok(j.dump(4));
    } catch (const json::type_error& e) {
        return make_err<std::string>(ErrorCode::OPERATION_FAILED,
                                     std::string("Failed to serialize config: ") + e.what());
    }
}

void Config::reset() {
    session_ = SessionConfig();
    http2_ = Http2Config();
    logging_ = LoggingConfig();
}

Result<void> apply_logging_config(const LoggingConfig& logging) {
    bool level_valid = false;
    utils::LogLevel level = utils::string_to_log_level(logging.level, &level_valid);
    if (!level_valid) {
        return make_err(ErrorCode::CONFIG_INVALID_LOG_LEVEL, "Invalid log level: " + logging.level);
    }
    if (utils::Logger::instance().init(level, logging.file, logging.console_output) != 0) {
        return make_err(ErrorCode::FILE_NOT_FOUND, "Cannot open log file: " + logging.file);
    }
    return make_ok();
}

} // namespace config
} // namespace h2_mux_client

// 文件结束
