/// @file config.cpp
/// @brief loom.toml parsing

#include <loom/derive/config.hpp>

#include <toml++/toml.hpp>

#include <fstream>
#include <sstream>

namespace loom_derive {

namespace {

loom_core::Result<std::set<std::string>> read_string_set(const toml::table& tbl, const char* key,
                                                         std::set<std::string> fallback) {
    const toml::node* node = tbl.get(key);
    if (!node) {
        return fallback;
    }

    const toml::array* arr = node->as_array();
    if (!arr) {
        return loom_core::Error(loom_core::ConfigError::invalid_value(key, "expected an array of strings"));
    }

    std::set<std::string> out;
    for (const auto& item : *arr) {
        auto value = item.value<std::string>();
        if (!value) {
            return loom_core::Error(loom_core::ConfigError::invalid_value(key, "expected an array of strings"));
        }
        out.insert(*value);
    }
    return out;
}

loom_core::Result<void> parse_derive(const toml::table& tbl, DeriveConfig& config) {
    config.library_namespace = tbl["library_namespace"].value_or(config.library_namespace);
    config.flags_suffix = tbl["flags_suffix"].value_or(config.flags_suffix);
    config.strict_parents = tbl["strict_parents"].value_or(config.strict_parents);

    auto top_level = read_string_set(tbl, "top_level", config.top_level);
    if (!top_level) {
        return top_level.error();
    }
    config.top_level = std::move(top_level.value());

    auto auto_parent = read_string_set(tbl, "auto_parent", config.auto_parent);
    if (!auto_parent) {
        return auto_parent.error();
    }
    config.auto_parent = std::move(auto_parent.value());

    auto enums = read_string_set(tbl, "qualified_enum_params", config.qualified_enum_params);
    if (!enums) {
        return enums.error();
    }
    config.qualified_enum_params = std::move(enums.value());

    if (auto markers = tbl["markers"].as_table()) {
        MarkerNames& m = config.markers;
        m.control = (*markers)["control"].value_or(m.control);
        m.resource = (*markers)["resource"].value_or(m.resource);
        m.layout = (*markers)["layout"].value_or(m.layout);
        m.layout_item = (*markers)["layout_item"].value_or(m.layout_item);
        m.partial = (*markers)["partial"].value_or(m.partial);
        m.events = (*markers)["events"].value_or(m.events);
    }

    return loom_core::Ok();
}

loom_core::Result<void> parse_log(const toml::table& tbl, loom_core::LogConfig& config) {
    if (auto level = tbl["level"].value<std::string>()) {
        auto parsed = loom_core::parse_log_level(*level);
        if (!parsed) {
            return loom_core::Error(loom_core::ConfigError::invalid_value("log.level", "unknown level '" + *level + "'"));
        }
        config.level = *parsed;
    }

    config.console_enabled = tbl["console"].value_or(config.console_enabled);
    config.file_enabled = tbl["file"].value_or(config.file_enabled);
    config.log_directory = tbl["directory"].value_or(config.log_directory);

    if (auto max_size = tbl["max_file_size"].value<std::int64_t>()) {
        if (*max_size <= 0) {
            return loom_core::Error(loom_core::ConfigError::invalid_value("log.max_file_size", "must be positive"));
        }
        config.max_file_size = static_cast<std::size_t>(*max_size);
    }
    if (auto max_files = tbl["max_files"].value<std::int64_t>()) {
        if (*max_files <= 0) {
            return loom_core::Error(loom_core::ConfigError::invalid_value("log.max_files", "must be positive"));
        }
        config.max_files = static_cast<std::size_t>(*max_files);
    }

    if (auto levels = tbl["levels"].as_table()) {
        for (const auto& [key, node] : *levels) {
            const std::string name(key.str());
            const std::string slot = "log.levels." + name;
            auto text = node.value<std::string>();
            if (!text) {
                return loom_core::Error(loom_core::ConfigError::invalid_value(slot, "expected a level name"));
            }
            auto parsed = loom_core::parse_log_level(*text);
            if (!parsed) {
                return loom_core::Error(loom_core::ConfigError::invalid_value(slot, "unknown level '" + *text + "'"));
            }
            // Short names address the subsystem loggers: derive -> loom.derive
            const std::string logger = (name == "loom" || name.rfind("loom.", 0) == 0) ? name : "loom." + name;
            config.subsystem_levels[logger] = *parsed;
        }
    }

    return loom_core::Ok();
}

} // anonymous namespace

// =============================================================================
// ConfigLoader Implementation
// =============================================================================

loom_core::Result<LoomConfig> ConfigLoader::load(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        m_last_error = "Failed to open config file: " + path.string();
        return loom_core::Err<LoomConfig>(loom_core::ConfigError::io_failed(path.string()));
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    return load_string(buffer.str(), path.string());
}

loom_core::Result<LoomConfig> ConfigLoader::load_string(const std::string& content,
                                                        const std::string& source_name) {
    LoomConfig config;

    try {
        toml::table tbl = toml::parse(content, source_name);

        if (auto derive = tbl["derive"].as_table()) {
            auto result = parse_derive(*derive, config.derive);
            if (!result) {
                m_last_error = result.error().message();
                return result.error();
            }
        }

        if (auto log = tbl["log"].as_table()) {
            auto result = parse_log(*log, config.log);
            if (!result) {
                m_last_error = result.error().message();
                return result.error();
            }
        }
    } catch (const toml::parse_error& err) {
        const auto& where = err.source().begin;
        m_last_error = std::string(err.description()) + " at line " + std::to_string(where.line) +
                       ", column " + std::to_string(where.column);
        return loom_core::Err<LoomConfig>(loom_core::ConfigError::parse_failed(source_name, m_last_error));
    }

    m_last_error.clear();
    return config;
}

} // namespace loom_derive
