// Catch2 tests for key binding configuration and selection options

#include <catch2/catch.hpp>

#include <navpick/config/config_helpers.h>
#include <navpick/config/selection_config.h>
#include <navpick/core/logging.h>

#include <spdlog/spdlog.h>

#include <chrono>
#include <cstdlib>
#include <map>
#include <string>

using namespace navpick;
using namespace navpick::config;
using navpick::input::KeyAction;

TEST_CASE("KeyBindingsConfig defaults", "[config][keybindings][catch2]") {
    auto cfg = KeyBindingsConfig::defaults();

    SECTION("Default table") {
        CHECK(cfg.bindings.at(KeyAction::MoveDown) == "j");
        CHECK(cfg.bindings.at(KeyAction::MoveUp) == "k");
        CHECK(cfg.bindings.at(KeyAction::Enter) == "l");
        CHECK(cfg.bindings.at(KeyAction::Back) == "h");
        CHECK(cfg.bindings.at(KeyAction::Top) == "gg");
        CHECK(cfg.bindings.at(KeyAction::Bottom) == "G");
        CHECK(cfg.bindings.at(KeyAction::Search) == "/");
        CHECK(cfg.bindings.at(KeyAction::Command) == ":");
        CHECK(cfg.bindings.at(KeyAction::Refresh) == "r");
        CHECK(cfg.bindings.at(KeyAction::Info) == "i");
        CHECK(cfg.bindings.at(KeyAction::Help) == "?");
        CHECK(cfg.bindings.at(KeyAction::Download) == "d");
        CHECK(cfg.bindings.count(KeyAction::PageDown) == 0);
        CHECK(cfg.bindings.count(KeyAction::Cancel) == 0);
        CHECK(cfg.sequenceTimeout == std::chrono::milliseconds(1000));
    }

    SECTION("Defaults validate") {
        CHECK(cfg.validate());
    }

    SECTION("Lookups") {
        CHECK(cfg.actionFor("gg") == KeyAction::Top);
        CHECK(cfg.actionFor("G") == KeyAction::Bottom);
        CHECK_FALSE(cfg.actionFor("g").has_value());
        CHECK(cfg.isStrictPrefix("g"));
        CHECK_FALSE(cfg.isStrictPrefix("gg"));
        CHECK_FALSE(cfg.isStrictPrefix("x"));
    }
}

TEST_CASE("KeyBindingsConfig validation", "[config][keybindings][catch2]") {
    auto cfg = KeyBindingsConfig::defaults();

    SECTION("Duplicate sequence is rejected") {
        cfg.bindings[KeyAction::Help] = "j";
        auto r = cfg.validate();
        REQUIRE_FALSE(r);
        CHECK(r.error().code == ErrorCode::InvalidArgument);
    }

    SECTION("Empty sequence is rejected") {
        cfg.bindings[KeyAction::Help] = "";
        auto r = cfg.validate();
        REQUIRE_FALSE(r);
        CHECK(r.error().code == ErrorCode::InvalidArgument);
    }

    SECTION("Prefix of another sequence is rejected") {
        cfg.bindings[KeyAction::Help] = "g";
        auto r = cfg.validate();
        REQUIRE_FALSE(r);
        CHECK(r.error().code == ErrorCode::InvalidArgument);
        CHECK(r.error().message.find("prefix") != std::string::npos);
    }

    SECTION("Prefix allowed when waiting for the longer match") {
        cfg.bindings[KeyAction::Help] = "g";
        cfg.waitForLongerMatch = true;
        CHECK(cfg.validate());
    }

    SECTION("Non-positive timeout is rejected") {
        cfg.sequenceTimeout = std::chrono::milliseconds(0);
        CHECK_FALSE(cfg.validate());
    }
}

TEST_CASE("KeyBindingsConfig fromMap", "[config][keybindings][catch2]") {
    SECTION("Overrides by case-insensitive action name") {
        auto r = KeyBindingsConfig::fromMap({{"TOP", "tt"}, {"move_down", "n"}},
                                            std::chrono::milliseconds(400));
        REQUIRE(r);
        const auto& cfg = r.value();
        CHECK(cfg.actionFor("tt") == KeyAction::Top);
        CHECK(cfg.actionFor("n") == KeyAction::MoveDown);
        CHECK_FALSE(cfg.actionFor("j").has_value());
        CHECK(cfg.sequenceTimeout == std::chrono::milliseconds(400));
    }

    SECTION("Quoted space binds the space key") {
        auto r = KeyBindingsConfig::fromMap({{"page_down", "\" \""}});
        REQUIRE(r);
        CHECK(r.value().actionFor(" ") == KeyAction::PageDown);
    }

    SECTION("Empty value removes a binding") {
        auto r = KeyBindingsConfig::fromMap({{"download", ""}});
        REQUIRE(r);
        CHECK(r.value().bindings.count(KeyAction::Download) == 0);
    }

    SECTION("Unknown action") {
        auto r = KeyBindingsConfig::fromMap({{"teleport", "t"}});
        REQUIRE_FALSE(r);
        CHECK(r.error().code == ErrorCode::InvalidArgument);
    }

    SECTION("Resulting table is validated") {
        auto r = KeyBindingsConfig::fromMap({{"help", "j"}});
        REQUIRE_FALSE(r);
        CHECK(r.error().code == ErrorCode::InvalidArgument);
    }
}

TEST_CASE("SelectionOptions effective values", "[config][options][catch2]") {
    SelectionOptions opts;
    CHECK(opts.effectiveMaxVisible() == 15);
    CHECK(opts.effectivePrefetchDistance() == 15);

    opts.maxVisibleItems = 2;
    CHECK(opts.effectiveMaxVisible() == SelectionOptions::kMinVisibleItems);

    opts.prefetchDistance = 3;
    CHECK(opts.effectivePrefetchDistance() == 3);
}

TEST_CASE("Config string helpers", "[config][helpers][catch2]") {
    CHECK(trimmed("  stor \t") == "stor");
    CHECK(toLower("MyStorage") == "mystorage");
    CHECK(unquote(" 'gg' ") == "gg");
}

TEST_CASE("Log level names", "[config][logging][catch2]") {
    CHECK(logging::parseLevel("DEBUG") == spdlog::level::debug);
    CHECK(logging::parseLevel("warning") == spdlog::level::warn);
    CHECK(logging::parseLevel("off") == spdlog::level::off);
    CHECK_FALSE(logging::parseLevel("loud").has_value());
}

TEST_CASE("Log level from the environment", "[config][logging][catch2]") {
    const auto saved = spdlog::get_level();
    spdlog::set_level(spdlog::level::info);

    SECTION("A known level is applied") {
        setenv(logging::kLogLevelEnv, "Debug", 1);
        auto applied = logging::applyLogLevelFromEnv();
        REQUIRE(applied.has_value());
        CHECK(*applied == spdlog::level::debug);
        CHECK(spdlog::get_level() == spdlog::level::debug);
    }

    SECTION("An unknown level keeps the current one") {
        setenv(logging::kLogLevelEnv, "loud", 1);
        CHECK_FALSE(logging::applyLogLevelFromEnv().has_value());
        CHECK(spdlog::get_level() == spdlog::level::info);
    }

    SECTION("Unset or empty leaves the level alone") {
        unsetenv(logging::kLogLevelEnv);
        CHECK_FALSE(logging::applyLogLevelFromEnv().has_value());
        setenv(logging::kLogLevelEnv, "", 1);
        CHECK_FALSE(logging::applyLogLevelFromEnv().has_value());
        CHECK(spdlog::get_level() == spdlog::level::info);
    }

    unsetenv(logging::kLogLevelEnv);
    spdlog::set_level(saved);
}
