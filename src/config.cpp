#include "config.h"
#include "logger.h"
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace calcvox {

namespace {

const char* const API_KEY_ENV_VARS[] = {"CALCVOX_API_KEY", "GEMINI_API_KEY", "API_KEY"};

void apply_audio(AudioConfig& a, const json& j) {
    if (j.contains("input_device") && j["input_device"].is_string()) a.input_device = j["input_device"].get<std::string>();
    if (j.contains("output_device") && j["output_device"].is_string()) a.output_device = j["output_device"].get<std::string>();
    if (j.contains("input_sample_rate") && j["input_sample_rate"].is_number_integer()) a.input_sample_rate = j["input_sample_rate"].get<int>();
    if (j.contains("output_sample_rate") && j["output_sample_rate"].is_number_integer()) a.output_sample_rate = j["output_sample_rate"].get<int>();
    if (j.contains("capture_frame_samples") && j["capture_frame_samples"].is_number_integer()) a.capture_frame_samples = j["capture_frame_samples"].get<int>();
}

void apply_session(SessionConfig& s, const json& j) {
    if (j.contains("endpoint") && j["endpoint"].is_string()) s.endpoint = j["endpoint"].get<std::string>();
    if (j.contains("model") && j["model"].is_string()) s.model = j["model"].get<std::string>();
    if (j.contains("api_key") && j["api_key"].is_string()) s.api_key = j["api_key"].get<std::string>();
    if (j.contains("connect_timeout_ms") && j["connect_timeout_ms"].is_number_integer())
        s.connect_timeout_ms = j["connect_timeout_ms"].get<int>();
    if (j.contains("system_instruction")) {
        const auto& si = j["system_instruction"];
        if (si.is_string()) {
            s.system_instruction = si.get<std::string>();
        } else if (si.is_array()) {
            // Multi-line prompts are easier to keep in JSON as an array of lines
            std::string joined;
            for (const auto& line : si) {
                if (!line.is_string()) continue;
                if (!joined.empty()) joined += "\n";
                joined += line.get<std::string>();
            }
            s.system_instruction = joined;
        }
    }
}

void apply_logging(LoggingConfig& l, const json& j) {
    if (j.contains("level") && j["level"].is_string()) l.level = j["level"].get<std::string>();
    if (j.contains("file") && j["file"].is_string()) l.file = j["file"].get<std::string>();
}

Result<void> validate(const Config& cfg) {
    if (cfg.audio.input_sample_rate <= 0 || cfg.audio.output_sample_rate <= 0) {
        return make_error(ErrorType::ConfigError, "sample rates must be positive");
    }
    if (cfg.audio.capture_frame_samples <= 0) {
        return make_error(ErrorType::ConfigError, "capture_frame_samples must be positive");
    }
    if (cfg.session.endpoint.empty() || cfg.session.model.empty()) {
        return make_error(ErrorType::ConfigError, "session.endpoint and session.model are required");
    }
    return {};
}

} // namespace

Result<Config> Config::parse(const std::string& json_text) {
    json j;
    try {
        j = json::parse(json_text);
    } catch (const json::exception& e) {
        return make_error(ErrorType::ConfigError, std::string("JSON parse error: ") + e.what());
    }
    if (!j.is_object()) {
        return make_error(ErrorType::ConfigError, "config root must be an object");
    }

    Config cfg;
    try {
        if (j.contains("audio") && j["audio"].is_object()) apply_audio(cfg.audio, j["audio"]);
        if (j.contains("session") && j["session"].is_object()) apply_session(cfg.session, j["session"]);
        if (j.contains("logging") && j["logging"].is_object()) apply_logging(cfg.logging, j["logging"]);
    } catch (const json::exception& e) {
        return make_error(ErrorType::ConfigError, std::string("invalid config value: ") + e.what());
    }

    auto valid = validate(cfg);
    if (!valid) {
        return valid.error();
    }
    return cfg;
}

Config Config::load_from_file(const std::string& path) {
    Config cfg;

    std::ifstream file(path);
    if (!file.is_open()) {
        Logger::warn("Config file not found: " + path + " (using defaults)");
    } else {
        std::stringstream ss;
        ss << file.rdbuf();
        auto parsed = parse(ss.str());
        if (parsed) {
            cfg = parsed.value();
            Logger::info("Loaded config from " + path);
        } else {
            Logger::error("Failed to load config " + path + ": " + parsed.error().message + " (using defaults)");
        }
    }

    if (const char* level = std::getenv("CALCVOX_LOG_LEVEL")) {
        cfg.logging.level = level;
    }
    return cfg;
}

Result<std::string> resolve_api_key(const SessionConfig& session) {
    for (const char* name : API_KEY_ENV_VARS) {
        const char* value = std::getenv(name);
        if (value && *value) {
            return std::string(value);
        }
    }
    if (!session.api_key.empty()) {
        return session.api_key;
    }
    return make_credential_error("API key not found (set CALCVOX_API_KEY or GEMINI_API_KEY)");
}

} // namespace calcvox
