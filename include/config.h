#pragma once

#include "common.h"
#include "errors.h"
#include <string>

namespace calcvox {

struct AudioConfig {
    std::string input_device = "default";
    std::string output_device = "default";
    int input_sample_rate = INPUT_SAMPLE_RATE;
    int output_sample_rate = OUTPUT_SAMPLE_RATE;
    int capture_frame_samples = CAPTURE_FRAME_SAMPLES;
};

struct SessionConfig {
    /// WebSocket endpoint; "?key=<api key>" is appended at connect time
    std::string endpoint = "wss://generativelanguage.googleapis.com/ws/"
                           "google.ai.generativelanguage.v1beta.GenerativeService.BidiGenerateContent";
    std::string model = "gemini-2.5-flash-native-audio-preview-12-2025";
    /// Inline key (discouraged); environment variables win when set
    std::string api_key;
    int connect_timeout_ms = 10000;
    std::string system_instruction =
        "あなたは超高速で反応する日本語音声計算機です。\n"
        "【ルール】\n"
        "1. ユーザーが数式（例：「3たす5」「100わる20」）を話したら、即座に計算してください。\n"
        "2. 計算結果が出たら、間髪入れずに 'displayResult' ツールを呼び出してください。\n"
        "3. 音声での返答は極めて短くしてください（例：「8です」「はい」）。\n"
        "4. 「リセット」「クリア」などの言葉には 'resetApp' ツールで反応してください。\n"
        "5. ユーザーがまだ言い終わっていないように聞こえても、計算可能な数式が成立した時点で計算して構いません。スピード重視です。";
};

struct LoggingConfig {
    std::string level = "info";
    std::string file;   ///< Empty = console only
};

struct Config {
    AudioConfig audio;
    SessionConfig session;
    LoggingConfig logging;

    /**
     * @brief Load configuration from a JSON file
     *
     * Missing sections keep their defaults. A missing or malformed file
     * yields the default config (logged). CALCVOX_LOG_LEVEL overrides
     * logging.level.
     */
    static Config load_from_file(const std::string& path);

    /// Apply a JSON document (already read) onto the defaults
    static Result<Config> parse(const std::string& json_text);
};

/**
 * @brief Resolve the API credential for a session
 *
 * Lookup order: CALCVOX_API_KEY, GEMINI_API_KEY, API_KEY, then
 * session.api_key from the config file.
 * @return Key, or CredentialMissing
 */
Result<std::string> resolve_api_key(const SessionConfig& session);

} // namespace calcvox
