// loom_core logging tests

#include <catch2/catch_test_macros.hpp>
#include <loom/core/log.hpp>

using namespace loom_core;

TEST_CASE("Log level parsing", "[core][log]") {
    SECTION("known names") {
        REQUIRE(parse_log_level("trace") == spdlog::level::trace);
        REQUIRE(parse_log_level("debug") == spdlog::level::debug);
        REQUIRE(parse_log_level("warning") == spdlog::level::warn);
        REQUIRE(parse_log_level("err") == spdlog::level::err);
        REQUIRE(parse_log_level("off") == spdlog::level::off);
    }

    SECTION("unknown name") {
        REQUIRE_FALSE(parse_log_level("loud").has_value());
    }

    SECTION("names round trip") {
        REQUIRE(std::string(log_level_name(spdlog::level::warn)) == "warn");
        REQUIRE(parse_log_level(log_level_name(spdlog::level::critical)) == spdlog::level::critical);
    }
}

TEST_CASE("Named loggers", "[core][log]") {
    SECTION("same name gives the same logger") {
        auto a = get_logger("loom.test");
        auto b = get_logger("loom.test");
        REQUIRE(a == b);
        REQUIRE(a->name() == "loom.test");
    }

    SECTION("subsystem loggers") {
        REQUIRE(derive_logger()->name() == "loom.derive");
        REQUIRE(layout_logger()->name() == "loom.layout");
        REQUIRE(core_logger()->name() == "loom");
    }

    SECTION("configuration reaches existing loggers") {
        auto logger = get_logger("loom.test.config");

        LogConfig config;
        config.level = spdlog::level::err;
        configure_logging(config);
        REQUIRE(logger->level() == spdlog::level::err);

        config.subsystem_levels["loom.test"] = spdlog::level::debug;
        configure_logging(config);
        REQUIRE(logger->level() == spdlog::level::debug);

        configure_logging(LogConfig{});
        REQUIRE(logger->level() == spdlog::level::info);
    }

    SECTION("loggers created after configuration use its levels") {
        LogConfig config;
        config.subsystem_levels["loom.test.late"] = spdlog::level::trace;
        configure_logging(config);
        REQUIRE(get_logger("loom.test.late")->level() == spdlog::level::trace);
        configure_logging(LogConfig{});
    }
}

TEST_CASE("Subsystem level lookup", "[core][log]") {
    LogConfig config;
    config.level = spdlog::level::warn;
    config.subsystem_levels["loom.derive"] = spdlog::level::debug;
    config.subsystem_levels["loom.derive.resolver"] = spdlog::level::trace;

    SECTION("exact name") {
        REQUIRE(config.level_for("loom.derive") == spdlog::level::debug);
    }

    SECTION("nested name takes the longest match") {
        REQUIRE(config.level_for("loom.derive.emitter") == spdlog::level::debug);
        REQUIRE(config.level_for("loom.derive.resolver") == spdlog::level::trace);
    }

    SECTION("shared prefix without a dot is not nested") {
        REQUIRE(config.level_for("loom.deriveX") == spdlog::level::warn);
    }

    SECTION("unlisted names use the global level") {
        REQUIRE(config.level_for("loom.layout") == spdlog::level::warn);
    }
}
