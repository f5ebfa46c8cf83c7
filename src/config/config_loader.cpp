#include "config/config_loader.hpp"
#include "core/utils.hpp"

#include <cstdlib>
#include <format>
#include <stdexcept>

using namespace std::string_literals;

namespace scrambler {

// ============================================================================
// TOML Parsing Helpers (env expansion)
// ============================================================================

namespace {

/**
 * @brief Expand ${VAR_NAME} patterns in a string with environment variables.
 */
std::string expand_env_vars(const std::string& input) {
    if (input.find("${") == std::string::npos) return input;

    std::string result;
    result.reserve(input.size());
    size_t i = 0;
    while (i < input.size()) {
        if (i + 1 < input.size() && input[i] == '$' && input[i + 1] == '{') {
            const size_t close = input.find('}', i + 2);
            if (close == std::string::npos) {
                throw std::runtime_error(
                    std::format("Unclosed env var substitution at position {}", i));
            }
            const std::string var_name = input.substr(i + 2, close - i - 2);
            const char* env_val = std::getenv(var_name.c_str());
            if (env_val) result += env_val;
            i = close + 1;
        } else {
            result += input[i++];
        }
    }
    return result;
}

void expand_env_vars_recursive(toml::table& tbl) {
    for (auto& [key, val] : tbl) {
        if (val.is_string()) {
            auto& s = *val.as_string();
            auto expanded = expand_env_vars(s.get());
            if (expanded != s.get()) {
                s = std::move(expanded);
            }
        } else if (val.is_table()) {
            expand_env_vars_recursive(*val.as_table());
        }
    }
}

toml::table parse_toml_string(const std::string& content) {
    auto result = toml::parse(content);
    expand_env_vars_recursive(result);
    return result;
}

toml::table parse_toml_file(const std::string& file_path) {
    auto result = toml::parse_file(file_path);
    expand_env_vars_recursive(result);
    return result;
}

// ---- Extraction helpers ----------------------------------------------------

// Scalar as text: strings verbatim, integers and booleans formatted
std::optional<std::string> toml_scalar_string(const toml::table& tbl, const std::string_view key) {
    const auto node = tbl[key];
    if (const auto* s = node.as_string()) return std::string(s->get());
    if (const auto* i = node.as_integer()) return std::to_string(i->get());
    if (const auto* b = node.as_boolean()) return std::string(utils::booltostr(b->get()));
    return std::nullopt;
}

} // anonymous namespace

// ============================================================================
// DelimitedConfig
// ============================================================================

DelimitedDialect DelimitedConfig::to_dialect() const {
    DelimitedDialect dialect;
    if (!delimiter.empty()) dialect.delimiter = delimiter[0];
    if (!quote.empty()) dialect.quote = quote[0];
    dialect.line_terminator = line_terminator;
    return dialect;
}

// ============================================================================
// ConfigLoader Implementation
// ============================================================================

// ---- Section extractors ----------------------------------------------------

LoggingConfig ConfigLoader::extract_logging(const toml::table& root) {
    LoggingConfig cfg;
    const auto* logging = root["logging"].as_table();
    if (!logging) return cfg;

    cfg.level = (*logging)["level"].value_or("info"s);
    return cfg;
}

EngineConfig ConfigLoader::extract_engine(const toml::table& root) {
    EngineConfig cfg;
    const auto* engine = root["engine"].as_table();
    if (!engine) return cfg;
    const auto& e = *engine;

    cfg.output_dir = e["output_dir"].value_or("processed"s);
    if (auto seed = e["seed"].value<int64_t>()) {
        cfg.seed = *seed;
    }
    return cfg;
}

DelimitedConfig ConfigLoader::extract_delimited(const toml::table& root) {
    DelimitedConfig cfg;
    const auto* delimited = root["delimited"].as_table();
    if (!delimited) return cfg;
    const auto& d = *delimited;

    cfg.delimiter = d["delimiter"].value_or(","s);
    cfg.quote = d["quote"].value_or("\""s);
    cfg.line_terminator = d["line_terminator"].value_or("\r\n"s);
    return cfg;
}

RequestFields ConfigLoader::extract_request(const toml::table& root) {
    RequestFields fields;
    const auto* request = root["request"].as_table();
    if (!request) return fields;
    const auto& r = *request;

    fields.format = r["format"].value_or(""s);
    fields.start_pos = toml_scalar_string(r, "start_pos").value_or("");
    fields.end_pos = toml_scalar_string(r, "end_pos");
    fields.data_type = r["data_type"].value_or(""s);
    fields.method = r["strategy"].value_or(""s);
    fields.has_header = toml_scalar_string(r, "has_header");
    fields.letter_replacement = toml_scalar_string(r, "letter_replacement");
    fields.digit_replacement = toml_scalar_string(r, "digit_replacement");
    return fields;
}

ScramblerConfig ConfigLoader::extract_all_sections(const toml::table& tbl) {
    ScramblerConfig config;
    config.logging = extract_logging(tbl);
    config.engine = extract_engine(tbl);
    config.delimited = extract_delimited(tbl);
    config.request = extract_request(tbl);
    return config;
}

ConfigLoader::LoadResult ConfigLoader::validate_and_return(ScramblerConfig config) {
    const auto errors = validate_config(config);
    if (!errors.empty()) {
        std::string combined = "Config validation failed:";
        for (const auto& err : errors) { combined += "\n  - "; combined += err; }
        return ConfigLoader::LoadResult::error(std::move(combined));
    }
    return ConfigLoader::LoadResult::ok(std::move(config));
}

// ---- Public API ------------------------------------------------------------

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path) {
    try {
        const auto tbl = parse_toml_file(config_path);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to load config: {}", e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content) {
    try {
        const auto tbl = parse_toml_string(toml_content);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to parse config: {}", e.what()));
    }
}

// ============================================================================
// Config Validation
// ============================================================================

std::vector<std::string> ConfigLoader::validate_config(const ScramblerConfig& config) {
    std::vector<std::string> errors;

    if (!utils::log::parse_level(config.logging.level)) {
        errors.push_back(std::format(
            "logging.level must be debug, info, warn or error, got '{}'", config.logging.level));
    }

    if (config.engine.output_dir.empty()) {
        errors.push_back("engine.output_dir must not be empty");
    }
    if (config.engine.seed && *config.engine.seed < 0) {
        errors.push_back(std::format("engine.seed must be >= 0, got {}", *config.engine.seed));
    }

    const auto& d = config.delimited;
    if (d.delimiter.size() != 1) {
        errors.push_back(std::format(
            "delimited.delimiter must be a single character, got '{}'", d.delimiter));
    }
    if (d.quote.size() != 1) {
        errors.push_back(std::format(
            "delimited.quote must be a single character, got '{}'", d.quote));
    }
    if (d.delimiter == d.quote) {
        errors.push_back("delimited.delimiter and delimited.quote must differ");
    }
    for (const auto& s : {d.delimiter, d.quote}) {
        if (s == "\r" || s == "\n") {
            errors.push_back("delimited.delimiter and delimited.quote must not be line breaks");
            break;
        }
    }
    if (d.line_terminator != "\r\n" && d.line_terminator != "\n") {
        errors.push_back("delimited.line_terminator must be \"\\r\\n\" or \"\\n\"");
    }

    // Names in [request] are checked here so a bad job file fails at load time
    const auto& r = config.request;
    if (!r.format.empty() && !parse_record_format(r.format)) {
        errors.push_back(std::format("request.format unknown: '{}'", r.format));
    }
    if (!r.data_type.empty() && !parse_data_type(r.data_type)) {
        errors.push_back(std::format("request.data_type unknown: '{}'", r.data_type));
    }
    if (!r.method.empty() && !parse_method(r.method)) {
        errors.push_back(std::format("request.strategy unknown: '{}'", r.method));
    }

    return errors;
}

} // namespace scrambler
