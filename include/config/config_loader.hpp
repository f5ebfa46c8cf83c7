#pragma once

#include "engine/request_parser.hpp"
#include "record/delimited_codec.hpp"

#include <toml++/toml.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace scrambler {

// ============================================================================
// Logging Config
// ============================================================================

struct LoggingConfig {
    std::string level = "info";
};

// ============================================================================
// Engine Config
// ============================================================================

struct EngineConfig {
    std::string output_dir = "processed";
    std::optional<int64_t> seed;        // Absent: seeded from the OS CSPRNG
};

// ============================================================================
// Delimited Format Config
// ============================================================================

struct DelimitedConfig {
    std::string delimiter = ",";
    std::string quote = "\"";
    std::string line_terminator = "\r\n";

    /// Only meaningful after validation (single-character delimiter/quote)
    [[nodiscard]] DelimitedDialect to_dialect() const;
};

// ============================================================================
// ScramblerConfig - Complete parsed configuration
// ============================================================================

struct ScramblerConfig {
    LoggingConfig logging;
    EngineConfig engine;
    DelimitedConfig delimited;
    RequestFields request;          // [request] defaults, overridden by CLI flags
};

// ============================================================================
// ConfigLoader - Extract typed config from TOML
// ============================================================================

class ConfigLoader {
public:
    struct LoadResult {
        bool success;
        std::string error_message;
        ScramblerConfig config;

        static LoadResult ok(ScramblerConfig cfg) {
            LoadResult result;
            result.success = true;
            result.config = std::move(cfg);
            return result;
        }

        static LoadResult error(std::string message) {
            LoadResult result;
            result.success = false;
            result.error_message = std::move(message);
            return result;
        }
    };

    /**
     * @brief Load complete config from TOML file
     * @param config_path Path to scrambler.toml
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path);

    /**
     * @brief Load complete config from TOML string
     * @param toml_content TOML content
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);

    /// Every problem in the config, empty when valid
    [[nodiscard]] static std::vector<std::string> validate_config(const ScramblerConfig& config);

private:
    static LoggingConfig extract_logging(const toml::table& root);
    static EngineConfig extract_engine(const toml::table& root);
    static DelimitedConfig extract_delimited(const toml::table& root);
    static RequestFields extract_request(const toml::table& root);

    static ScramblerConfig extract_all_sections(const toml::table& root);
    static LoadResult validate_and_return(ScramblerConfig config);
};

} // namespace scrambler
