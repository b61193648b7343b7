#pragma once

/// @file config.hpp
/// @brief Compiler configuration and loom.toml loading

#include "fwd.hpp"

#include <loom/core/error.hpp>
#include <loom/core/log.hpp>

#include <filesystem>
#include <set>
#include <string>

namespace loom_derive {

/// Annotation marker names recognised by the classifier
struct MarkerNames {
    std::string control = "control";
    std::string resource = "resource";
    std::string layout = "layout";
    std::string layout_item = "layout_item";
    std::string partial = "partial";
    std::string events = "events";
};

/// @brief Settings of the UI graph compiler
struct DeriveConfig {
    /// Namespace prefixed to control types, flags and enum values in generated code
    std::string library_namespace = "loom";

    /// Suffix of a control's flags type (`Button` + `Flags`)
    std::string flags_suffix = "Flags";

    /// Types that never take an implicit parent
    std::set<std::string> top_level = {"Window", "CanvasWindow", "MessageWindow"};

    /// Types that may be picked as the implicit parent of later controls
    std::set<std::string> auto_parent = {
        "Window", "CanvasWindow", "TabsContainer", "Tab", "Frame", "MessageWindow"};

    /// Parameters whose path values are qualified with `library_namespace`
    std::set<std::string> qualified_enum_params = {
        "h_align", "v_align", "check_state", "layout_type",
        "flex_direction", "justify_content", "align_items", "align_content",
        "flex_wrap", "position_type"};

    /// Reject parentless controls that are not top level
    bool strict_parents = false;

    MarkerNames markers;

    [[nodiscard]] bool is_top_level(const std::string& type) const { return top_level.count(type) > 0; }
    [[nodiscard]] bool is_auto_parent(const std::string& type) const { return auto_parent.count(type) > 0; }
};

/// Everything loom.toml configures
struct LoomConfig {
    DeriveConfig derive;
    loom_core::LogConfig log;
};

/// @brief Loads loom.toml
class ConfigLoader {
public:
    /// Parse a config file; a missing file is an error
    [[nodiscard]] loom_core::Result<LoomConfig> load(const std::filesystem::path& path);

    /// Parse config text
    [[nodiscard]] loom_core::Result<LoomConfig> load_string(const std::string& content,
                                                            const std::string& source_name = "loom.toml");

    [[nodiscard]] const std::string& last_error() const noexcept { return m_last_error; }

private:
    std::string m_last_error;
};

} // namespace loom_derive
