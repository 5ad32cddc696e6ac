#include "config/config_loader.hpp"
#include "core/utils.hpp"

#include <cstdlib>
#include <filesystem>
#include <format>
#include <stdexcept>
#include <unordered_set>

using namespace std::string_literals;

namespace tracehook {

// ============================================================================
// TOML Parsing Helpers (env expansion, layered includes)
// ============================================================================

namespace {

namespace fs = std::filesystem;

constexpr int kMaxIncludeDepth = 10;

/// Replace each ${NAME} with the environment value (unset -> empty)
std::string expand_env_vars(std::string_view input) {
    std::string out;
    out.reserve(input.size());
    size_t pos = 0;
    while (true) {
        const size_t open = input.find("${", pos);
        if (open == std::string_view::npos) {
            out.append(input.substr(pos));
            return out;
        }
        const size_t close = input.find('}', open + 2);
        if (close == std::string_view::npos) {
            throw std::runtime_error(std::format("Unclosed ${{...}} in config value '{}'", input));
        }
        out.append(input.substr(pos, open - pos));
        const std::string name(input.substr(open + 2, close - open - 2));
        if (const char* value = std::getenv(name.c_str())) out += value;
        pos = close + 1;
    }
}

/// Values sit at most one table deep ([section] key = value)
void expand_env_in_place(toml::table& root) {
    const auto expand = [](toml::node& node) {
        if (auto* s = node.as_string(); s && s->get().find("${") != std::string::npos) {
            *s = expand_env_vars(s->get());
        }
    };
    for (auto& [key, node] : root) {
        if (auto* section = node.as_table()) {
            for (auto& [name, value] : *section) expand(value);
        } else {
            expand(node);
        }
    }
}

/// Keys of `top` replace the same keys of `base`, section by section
void overlay_sections(toml::table& base, const toml::table& top) {
    for (const auto& [key, node] : top) {
        auto* base_section = base.get_as<toml::table>(key.str());
        const auto* top_section = node.as_table();
        if (base_section && top_section) {
            for (const auto& [name, value] : *top_section) {
                base_section->insert_or_assign(name.str(), value);
            }
        } else {
            base.insert_or_assign(key.str(), node);
        }
    }
}

/**
 * @brief Parse a config file and fold in the file named by its `include` key
 *
 * The included file is the base layer; the including file overrides it.
 * `chain` holds the canonical paths already on the include chain.
 */
toml::table load_layered_file(const fs::path& path, std::unordered_set<std::string>& chain,
                              const int depth) {
    if (depth > kMaxIncludeDepth) {
        throw std::runtime_error(std::format("Config include depth exceeds {}", kMaxIncludeDepth));
    }
    const auto canonical = fs::canonical(path);
    if (!chain.insert(canonical.string()).second) {
        throw std::runtime_error(
            std::format("Circular config include detected: {}", canonical.string()));
    }

    auto table = toml::parse_file(canonical.string());
    const auto* include = table.get("include");
    if (!include) return table;

    const auto* target = include->as_string();
    if (!target) {
        throw std::runtime_error(
            std::format("{}: include must be a single file path", canonical.string()));
    }
    auto layered = load_layered_file(canonical.parent_path() / target->get(), chain, depth + 1);
    table.erase("include");
    overlay_sections(layered, table);
    return layered;
}

toml::table parse_toml_string(const std::string& content) {
    auto table = toml::parse(content);
    expand_env_in_place(table);
    return table;
}

toml::table parse_toml_file(const std::string& file_path) {
    std::unordered_set<std::string> chain;
    auto table = load_layered_file(file_path, chain, 0);
    expand_env_in_place(table);
    return table;
}

std::optional<bool> parse_bool(std::string_view value) {
    const auto lower = utils::to_lower(utils::trim(value));
    if (lower == "true" || lower == "1" || lower == "yes") return true;
    if (lower == "false" || lower == "0" || lower == "no") return false;
    return std::nullopt;
}

} // anonymous namespace

// ============================================================================
// ConfigLoader Implementation
// ============================================================================

// ---- Section extractors ----------------------------------------------------

ServiceConfig ConfigLoader::extract_service(const toml::table& root) {
    ServiceConfig cfg;
    const auto* service = root["service"].as_table();
    if (!service) return cfg;
    const auto& s = *service;

    cfg.name = s["name"].value_or(cfg.name);
    cfg.origin = s["origin"].value_or(""s);
    cfg.host_pattern = s["host_pattern"].value_or(""s);
    return cfg;
}

TracingSettings ConfigLoader::extract_tracing(const toml::table& root,
                                              std::vector<std::string>& errors) {
    TracingSettings cfg;
    const auto* tracing = root["tracing"].as_table();
    if (!tracing) return cfg;
    const auto& t = *tracing;

    cfg.disabled = t["disabled"].value_or(false);

    const std::string context_missing = t["context_missing"].value_or("log_error"s);
    if (const auto strategy = parse_context_missing_strategy(context_missing)) {
        cfg.context_missing = *strategy;
    } else {
        errors.push_back(std::format(
            "tracing.context_missing must be log_error, runtime_error or ignore, got '{}'",
            context_missing));
    }
    return cfg;
}

SamplingConfig ConfigLoader::extract_sampling(const toml::table& root) {
    SamplingConfig cfg;
    const auto* sampling = root["sampling"].as_table();
    if (!sampling) return cfg;
    const auto& s = *sampling;

    cfg.rate = s["rate"].value_or(cfg.rate);
    cfg.rule_name = s["rule_name"].value_or(cfg.rule_name);
    return cfg;
}

LoggingConfig ConfigLoader::extract_logging(const toml::table& root) {
    LoggingConfig cfg;
    const auto* logging = root["logging"].as_table();
    if (!logging) return cfg;

    cfg.level = (*logging)["level"].value_or("info"s);
    return cfg;
}

ServerConfig ConfigLoader::extract_server(const toml::table& root) {
    ServerConfig cfg;
    const auto* server = root["server"].as_table();
    if (!server) return cfg;
    const auto& s = *server;

    cfg.host = s["host"].value_or("0.0.0.0"s);
    cfg.port = static_cast<int>(s["port"].value_or(int64_t{8080}));
    cfg.thread_pool_size = static_cast<size_t>(s["threads"].value_or(int64_t{4}));
    return cfg;
}

void ConfigLoader::apply_env_overrides(InterceptorConfig& config, std::vector<std::string>& errors) {
    const char* disabled = std::getenv(kTracingDisabledEnvVar);
    if (disabled == nullptr || *disabled == '\0') return;

    if (const auto value = parse_bool(disabled)) {
        config.tracing.disabled = *value;
    } else {
        errors.push_back(std::format("{} must be true or false, got '{}'",
            kTracingDisabledEnvVar, disabled));
    }
}

// ---- Shared extraction + validation ----------------------------------------

ConfigLoader::LoadResult ConfigLoader::extract_and_validate(const toml::table& root) {
    std::vector<std::string> errors;

    InterceptorConfig config;
    config.service = extract_service(root);
    config.tracing = extract_tracing(root, errors);
    config.sampling = extract_sampling(root);
    config.logging = extract_logging(root);
    config.server = extract_server(root);
    apply_env_overrides(config, errors);

    for (auto& err : validate_config(config)) {
        errors.push_back(std::move(err));
    }

    if (!errors.empty()) {
        std::string combined = "Config validation failed:";
        for (const auto& err : errors) { combined += "\n  - "; combined += err; }
        return LoadResult::error(std::move(combined));
    }
    return LoadResult::ok(std::move(config));
}

// ---- Public API ------------------------------------------------------------

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path) {
    try {
        const auto tbl = parse_toml_file(config_path);
        return extract_and_validate(tbl);
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to load config: {}", e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content) {
    try {
        const auto tbl = parse_toml_string(toml_content);
        return extract_and_validate(tbl);
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to parse config: {}", e.what()));
    }
}

// ============================================================================
// Config Validation
// ============================================================================

std::vector<std::string> ConfigLoader::validate_config(const InterceptorConfig& config) {
    std::vector<std::string> errors;

    if (utils::trim(config.service.name).empty()) {
        errors.emplace_back("service.name must not be empty");
    }

    if (config.sampling.rate < 0.0 || config.sampling.rate > 1.0) {
        errors.push_back(std::format("sampling.rate must be within [0, 1], got {}",
            config.sampling.rate));
    }

    if (!utils::log::parse_level(config.logging.level)) {
        errors.push_back(std::format("logging.level must be debug, info, warn or error, got '{}'",
            config.logging.level));
    }

    if (config.server.port < 1 || config.server.port > 65535) {
        errors.push_back(std::format("server.port must be 1-65535, got {}", config.server.port));
    }

    if (config.server.thread_pool_size == 0) {
        errors.emplace_back("server.threads must be at least 1");
    }

    return errors;
}

} // namespace tracehook
