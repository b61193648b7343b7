// loom_derive configuration loading tests

#include <catch2/catch_test_macros.hpp>
#include <loom/derive/config.hpp>

using namespace loom_derive;

TEST_CASE("Default configuration", "[derive][config]") {
    DeriveConfig config;
    REQUIRE(config.library_namespace == "loom");
    REQUIRE(config.is_top_level("Window"));
    REQUIRE_FALSE(config.is_top_level("Frame"));
    REQUIRE(config.is_auto_parent("Frame"));
    REQUIRE(config.is_auto_parent("Tab"));
    REQUIRE_FALSE(config.is_auto_parent("Button"));
    REQUIRE_FALSE(config.strict_parents);
}

TEST_CASE("Configuration from TOML", "[derive][config]") {
    ConfigLoader loader;

    SECTION("empty document keeps defaults") {
        auto config = loader.load_string("");
        REQUIRE(config.is_ok());
        REQUIRE(config.value().derive.library_namespace == "loom");
        REQUIRE(config.value().log.level == spdlog::level::info);
    }

    SECTION("derive table") {
        auto config = loader.load_string(R"(
[derive]
library_namespace = "nwg"
strict_parents = true
auto_parent = ["Window", "Panel"]

[derive.markers]
control = "nwg_control"
)");
        REQUIRE(config.is_ok());
        const DeriveConfig& derive = config.value().derive;
        REQUIRE(derive.library_namespace == "nwg");
        REQUIRE(derive.strict_parents);
        REQUIRE(derive.is_auto_parent("Panel"));
        REQUIRE_FALSE(derive.is_auto_parent("Frame"));
        REQUIRE(derive.is_top_level("Window"));
        REQUIRE(derive.markers.control == "nwg_control");
        REQUIRE(derive.markers.layout == "layout");
    }

    SECTION("log table") {
        auto config = loader.load_string(R"(
[log]
level = "debug"
console = false
max_files = 2
)");
        REQUIRE(config.is_ok());
        REQUIRE(config.value().log.level == spdlog::level::debug);
        REQUIRE_FALSE(config.value().log.console_enabled);
        REQUIRE(config.value().log.max_files == 2);
    }

    SECTION("subsystem levels") {
        auto config = loader.load_string(R"(
[log]
level = "warn"

[log.levels]
derive = "trace"
"loom.layout" = "error"
)");
        REQUIRE(config.is_ok());
        const auto& log = config.value().log;
        REQUIRE(log.subsystem_levels.at("loom.derive") == spdlog::level::trace);
        REQUIRE(log.level_for("loom.layout") == spdlog::level::err);
        REQUIRE(log.level_for("loom") == spdlog::level::warn);
    }
}

TEST_CASE("Configuration errors", "[derive][config]") {
    ConfigLoader loader;

    SECTION("syntax error") {
        auto config = loader.load_string("[derive\nstrict = ");
        REQUIRE(config.is_err());
        REQUIRE(config.error().is<loom_core::ConfigError>());
        REQUIRE(config.error().as<loom_core::ConfigError>()->kind == loom_core::ConfigError::Kind::ParseFailed);
        REQUIRE_FALSE(loader.last_error().empty());
    }

    SECTION("wrong value type") {
        auto config = loader.load_string("[derive]\ntop_level = \"Window\"\n");
        REQUIRE(config.is_err());
        REQUIRE(config.error().as<loom_core::ConfigError>()->kind == loom_core::ConfigError::Kind::InvalidValue);
    }

    SECTION("unknown log level") {
        REQUIRE(loader.load_string("[log]\nlevel = \"loud\"\n").is_err());
        REQUIRE(loader.load_string("[log.levels]\nderive = \"loud\"\n").is_err());
        REQUIRE(loader.load_string("[log.levels]\nderive = 3\n").is_err());
    }

    SECTION("missing file") {
        auto config = loader.load("/nonexistent/loom.toml");
        REQUIRE(config.is_err());
        REQUIRE(config.error().code() == loom_core::ErrorCode::IOError);
    }

    SECTION("errors clear on success") {
        REQUIRE(loader.load_string("[log]\nlevel = \"loud\"\n").is_err());
        REQUIRE(loader.load_string("").is_ok());
        REQUIRE(loader.last_error().empty());
    }
}
