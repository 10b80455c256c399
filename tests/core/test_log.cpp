/*
 * Pounce Logging Tests
 *
 * Tests for level filtering, subsystem tags, callbacks and the log file.
 */

#include <catch2/catch_test_macros.hpp>
#include "pounce/error.h"
#include "pounce/log.h"
#include <cstdio>
#include <string>
#include <vector>

struct LoggedLine {
    Pounce_LogLevel level;
    Pounce_LogSubsystem subsystem;
    std::string message;
};

static void collect(Pounce_LogLevel level, Pounce_LogSubsystem subsystem,
                    const char *message, void *userdata) {
    static_cast<std::vector<LoggedLine> *>(userdata)->push_back({ level, subsystem, message });
}

static void ignore(Pounce_LogLevel, Pounce_LogSubsystem, const char *, void *) {}

/* ============================================================================
 * Names
 * ============================================================================ */

TEST_CASE("Log level names", "[log][names]") {
    Pounce_LogLevel level = POUNCE_LOG_LEVEL_INFO;

    REQUIRE(pounce_log_level_from_name("debug", &level));
    REQUIRE(level == POUNCE_LOG_LEVEL_DEBUG);
    REQUIRE(pounce_log_level_from_name("Warning", &level));
    REQUIRE(level == POUNCE_LOG_LEVEL_WARNING);
    REQUIRE(pounce_log_level_from_name("ERROR", &level));
    REQUIRE(level == POUNCE_LOG_LEVEL_ERROR);

    REQUIRE_FALSE(pounce_log_level_from_name("loud", &level));
    REQUIRE(level == POUNCE_LOG_LEVEL_ERROR);
    REQUIRE_FALSE(pounce_log_level_from_name(nullptr, &level));
}

TEST_CASE("Subsystem tags", "[log][names]") {
    REQUIRE(std::string(pounce_log_subsystem_name(POUNCE_LOG_GAME)) == "Game");
    REQUIRE(std::string(pounce_log_subsystem_name(POUNCE_LOG_SPAWNER)) == "Spawner");
    REQUIRE(std::string(pounce_log_subsystem_name(POUNCE_LOG_SAVE)) == "Save");
    REQUIRE(std::string(pounce_log_subsystem_name(POUNCE_LOG_INPUT)) == "Input");
    REQUIRE(std::string(pounce_log_subsystem_name(POUNCE_LOG_SUBSYSTEM_COUNT)) == "?");
}

/* ============================================================================
 * Filtering and Callbacks
 * ============================================================================ */

TEST_CASE("Callbacks receive messages that pass the level", "[log][callback]") {
    std::vector<LoggedLine> lines;
    uint32_t handle = pounce_log_add_callback(collect, &lines);
    REQUIRE(handle != 0);

    SECTION("Default level drops debug") {
        pounce_log_debug(POUNCE_LOG_SPAWNER, "hidden");
        pounce_log_info(POUNCE_LOG_SPAWNER, "spawned %s", "bird");
        REQUIRE(lines.size() == 1);
        REQUIRE(lines[0].level == POUNCE_LOG_LEVEL_INFO);
        REQUIRE(lines[0].subsystem == POUNCE_LOG_SPAWNER);
        REQUIRE(lines[0].message == "spawned bird");
    }

    SECTION("Raising the level") {
        pounce_log_set_level(POUNCE_LOG_LEVEL_DEBUG);
        pounce_log_debug(POUNCE_LOG_COLLISION, "overlap");
        REQUIRE(lines.size() == 1);
    }

    SECTION("Errors pass even the strictest level") {
        pounce_log_set_level(POUNCE_LOG_LEVEL_ERROR);
        pounce_log_warning(POUNCE_LOG_SAVE, "dropped");
        pounce_log_error(POUNCE_LOG_SAVE, "kept");
        REQUIRE(lines.size() == 1);
        REQUIRE(lines[0].message == "kept");
    }

    SECTION("Removed callbacks stop receiving") {
        pounce_log_remove_callback(handle);
        handle = 0;
        pounce_log_warning(POUNCE_LOG_GAME, "unheard");
        REQUIRE(lines.empty());
    }

    pounce_log_set_level(POUNCE_LOG_LEVEL_INFO);
    pounce_log_remove_callback(handle);
}

TEST_CASE("Callback slots are limited", "[log][callback]") {
    REQUIRE(pounce_log_add_callback(nullptr, nullptr) == 0);

    std::vector<uint32_t> handles;
    for (int i = 0; i < 64; i++) {
        uint32_t h = pounce_log_add_callback(ignore, nullptr);
        if (h == 0) break;
        handles.push_back(h);
    }
    REQUIRE_FALSE(handles.empty());
    REQUIRE(handles.size() < 64);

    // A freed slot can be reused
    pounce_log_remove_callback(handles.back());
    uint32_t again = pounce_log_add_callback(ignore, nullptr);
    REQUIRE(again != 0);
    REQUIRE(again != handles.back());
    handles.back() = again;

    for (uint32_t h : handles) pounce_log_remove_callback(h);
}

/* ============================================================================
 * Log File
 * ============================================================================ */

TEST_CASE("Messages are appended to the log file", "[log][file]") {
    const char *path = "test_pounce_log.log";
    remove(path);

    REQUIRE(pounce_log_init(path));
    pounce_log_warning(POUNCE_LOG_SAVE, "high score unreadable");
    pounce_log_debug(POUNCE_LOG_SAVE, "not written");
    pounce_log_shutdown();

    FILE *fp = fopen(path, "r");
    REQUIRE(fp != nullptr);
    std::string contents;
    char buf[256];
    while (fgets(buf, sizeof(buf), fp)) contents += buf;
    fclose(fp);
    remove(path);

    REQUIRE(contents.find("[WARNING] [Save     ] high score unreadable") != std::string::npos);
    REQUIRE(contents.find("not written") == std::string::npos);
}

TEST_CASE("Logging without a file still reaches callbacks", "[log][file]") {
    std::vector<LoggedLine> lines;
    uint32_t handle = pounce_log_add_callback(collect, &lines);

    REQUIRE(pounce_log_init(nullptr));
    pounce_log_info(POUNCE_LOG_GAME, "round started");
    pounce_log_shutdown();

    REQUIRE(lines.size() == 1);
    pounce_log_remove_callback(handle);
}

TEST_CASE("An unopenable log file sets the error", "[log][file]") {
    pounce_clear_error();
    REQUIRE_FALSE(pounce_log_init("/nonexistent-pounce-dir/pounce.log"));
    REQUIRE(pounce_has_error());
    pounce_log_shutdown();
    pounce_clear_error();
}
