#pragma once

#include "config/config_types.hpp"

#include <toml++/toml.hpp>

#include <string>
#include <vector>

namespace tracehook {

/// Environment variable overriding [tracing] disabled ("true" / "false")
inline constexpr const char* kTracingDisabledEnvVar = "AWS_XRAY_TRACING_DISABLED";

// ============================================================================
// ConfigLoader - Extract typed config from parsed TOML
// ============================================================================

/**
 * @brief Loads InterceptorConfig from TOML
 *
 * Supports ${VAR} environment expansion inside string values and
 * `include = "other.toml"` (or an array of paths) relative to the including
 * file; the including file wins on conflicts.
 */
class ConfigLoader {
public:
    struct LoadResult {
        bool success;
        std::string error_message;
        InterceptorConfig config;

        static LoadResult ok(InterceptorConfig cfg) {
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

    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path);
    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);

    /// Validation errors for an already-extracted config (empty = valid)
    [[nodiscard]] static std::vector<std::string> validate_config(const InterceptorConfig& config);

private:
    static ServiceConfig extract_service(const toml::table& root);
    static TracingSettings extract_tracing(const toml::table& root, std::vector<std::string>& errors);
    static SamplingConfig extract_sampling(const toml::table& root);
    static LoggingConfig extract_logging(const toml::table& root);
    static ServerConfig extract_server(const toml::table& root);

    static void apply_env_overrides(InterceptorConfig& config, std::vector<std::string>& errors);

    static LoadResult extract_and_validate(const toml::table& root);
};

} // namespace tracehook
