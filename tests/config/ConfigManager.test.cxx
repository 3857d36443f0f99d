// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#include "unity.h"
#include "config/ConfigManager.hxx"

#include <fstream>
#include <unistd.h>

using namespace blynkCtl;

static constexpr char VALID_JSON[] = R"({
    "server": "http://10.0.0.5:8080/",
    "devices": {
        "hall_light": {"pin": "V1", "auth": "tok1", "default": 0, "group": "hall"},
        "porch_light": {"pin": "D4", "auth": "tok1", "default": 1, "group": "outside"},
        "hall_dimmer": {"pin": "V2", "auth": "tok2", "default": 0, "group": "hall"},
        "outside_temp": {"pin": "V9", "auth": "tok2"}
    },
    "exclude": ["outside_temp"],
    "groups": ["hall", "outside"]
})";

// Temporary file removed on scope exit
class TempFile {
public:
    explicit TempFile(const std::string& contents) {
        char tmpl[] = "/tmp/blynkctl_cfg_XXXXXX";
        const int fd = mkstemp(tmpl);
        if (fd >= 0) close(fd);
        m_path = tmpl;
        std::ofstream(m_path) << contents;
    }
    ~TempFile() { unlink(m_path.c_str()); }
    [[nodiscard]] const std::string& path() const { return m_path; }
private:
    std::string m_path;
};

// Restores an environment variable on scope exit
class ScopedEnv {
public:
    ScopedEnv(const char* name, const char* value) : m_name(name) {
        if (const char* old = std::getenv(name)) m_old = old;
        if (value) setenv(name, value, 1); else unsetenv(name);
    }
    ~ScopedEnv() {
        if (m_old) setenv(m_name, m_old->c_str(), 1); else unsetenv(m_name);
    }
private:
    const char* m_name;
    std::optional<std::string> m_old;
};

static void test_default_config_matches_builtin_table() {
    const AppConfig cfg = ConfigManager::defaultConfig();

    TEST_ASSERT_EQUAL_STRING(BLYNKCTL_DEFAULT_SERVER, cfg.server.c_str());
    TEST_ASSERT_EQUAL(4, cfg.devices.size());
    TEST_ASSERT_EQUAL_STRING("bedroom_light", cfg.devices[0].name.c_str());
    TEST_ASSERT_EQUAL_STRING("humidity", cfg.devices[3].name.c_str());

    const Device* kitchen = cfg.findDevice("kitchen_light");
    TEST_ASSERT_NOT_NULL(kitchen);
    TEST_ASSERT_EQUAL_STRING("d2", kitchen->pin.c_str());
    TEST_ASSERT_EQUAL(1, *kitchen->default_state);
    TEST_ASSERT_EQUAL_STRING("kitchen", kitchen->group->c_str());

    TEST_ASSERT_TRUE(cfg.isExcluded("temperature"));
    TEST_ASSERT_FALSE(cfg.isExcluded("bedroom_light"));
    TEST_ASSERT_TRUE(cfg.isGroup("bedroom"));
    TEST_ASSERT_FALSE(cfg.isGroup("bedroom_light"));
    TEST_ASSERT_EQUAL(BlynkErr::Ok, ConfigManager::validate(cfg));
}

static void test_load_from_json_keeps_file_order() {
    ConfigManager manager;
    TEST_ASSERT_EQUAL(BlynkErr::Ok, manager.loadFromJson(VALID_JSON));

    const AppConfig& cfg = manager.getConfig();
    TEST_ASSERT_EQUAL_STRING("http://10.0.0.5:8080", cfg.server.c_str());
    TEST_ASSERT_EQUAL(4, cfg.devices.size());
    TEST_ASSERT_EQUAL_STRING("hall_light", cfg.devices[0].name.c_str());
    TEST_ASSERT_EQUAL_STRING("porch_light", cfg.devices[1].name.c_str());
    TEST_ASSERT_EQUAL_STRING("hall_dimmer", cfg.devices[2].name.c_str());
    TEST_ASSERT_EQUAL_STRING("outside_temp", cfg.devices[3].name.c_str());

    TEST_ASSERT_FALSE(cfg.devices[3].default_state.has_value());
    TEST_ASSERT_FALSE(cfg.devices[3].group.has_value());
    TEST_ASSERT_TRUE(cfg.isExcluded("outside_temp"));
    TEST_ASSERT_EQUAL(2, cfg.groups.size());
}

static void test_groups_are_derived_when_not_listed() {
    ConfigManager manager;
    TEST_ASSERT_EQUAL(BlynkErr::Ok, manager.loadFromJson(R"({"devices": {
        "a": {"pin": "V1", "auth": "t", "default": 0, "group": "upstairs"},
        "b": {"pin": "V2", "auth": "t", "default": 0, "group": "downstairs"},
        "c": {"pin": "V3", "auth": "t", "default": 1, "group": "upstairs"}}})"));

    const AppConfig& cfg = manager.getConfig();
    TEST_ASSERT_EQUAL_STRING(BLYNKCTL_DEFAULT_SERVER, cfg.server.c_str());
    TEST_ASSERT_EQUAL(2, cfg.groups.size());
    TEST_ASSERT_EQUAL_STRING("upstairs", cfg.groups[0].c_str());
    TEST_ASSERT_EQUAL_STRING("downstairs", cfg.groups[1].c_str());
}

static void test_switchable_device_requires_default() {
    ConfigManager manager;
    TEST_ASSERT_EQUAL(BlynkErr::InvalidConfig, manager.loadFromJson(
        R"({"devices": {"lamp": {"pin": "V1", "auth": "t"}}})"));
    TEST_ASSERT_EQUAL(BlynkErr::InvalidConfig, manager.loadFromJson(
        R"({"devices": {"lamp": {"pin": "V1", "auth": "t", "default": 2}}})"));
    TEST_ASSERT_EQUAL(BlynkErr::InvalidConfig, manager.loadFromJson(
        R"({"devices": {"lamp": {"pin": "V1", "auth": "t", "default": "1"}}})"));

    // a rejected document leaves the previous table in place
    TEST_ASSERT_EQUAL_STRING("bedroom_light", manager.getConfig().devices[0].name.c_str());
}

static void test_malformed_documents_are_rejected() {
    ConfigManager manager;
    TEST_ASSERT_EQUAL(BlynkErr::InvalidConfig, manager.loadFromJson("not json"));
    TEST_ASSERT_EQUAL(BlynkErr::InvalidConfig, manager.loadFromJson("[1, 2]"));
    TEST_ASSERT_EQUAL(BlynkErr::InvalidConfig, manager.loadFromJson(R"({"server": "http://x"})"));
    TEST_ASSERT_EQUAL(BlynkErr::InvalidConfig, manager.loadFromJson(
        R"({"devices": {"lamp": {"pin": 3, "auth": "t", "default": 0}}})"));
    TEST_ASSERT_EQUAL(BlynkErr::InvalidConfig, manager.loadFromJson(
        R"({"devices": {"lamp": {"pin": "V1", "auth": "t", "default": 0}}, "exclude": "lamp"})"));
    TEST_ASSERT_EQUAL(BlynkErr::InvalidConfig, manager.loadFromJson(
        R"({"devices": {"lamp": {"pin": "V1", "auth": "t", "default": 0, "group": 5}}})"));
    TEST_ASSERT_EQUAL(BlynkErr::InvalidConfig, manager.loadFromJson(
        R"({"devices": {"lamp": {"pin": "V1", "auth": "t", "default": 0},
                        "lamp": {"pin": "V2", "auth": "t", "default": 0}}})"));
}

static void test_load_uses_explicit_config_path() {
    const TempFile file(VALID_JSON);
    const ScopedEnv config_env(CONFIG_PATH_ENV, file.path().c_str());
    const ScopedEnv server_env(SERVER_ENV, nullptr);

    ConfigManager manager;
    TEST_ASSERT_EQUAL(BlynkErr::Ok, manager.load());
    TEST_ASSERT_EQUAL_STRING(file.path().c_str(), manager.getSource().c_str());
    TEST_ASSERT_NOT_NULL(manager.getConfig().findDevice("porch_light"));
}

static void test_load_fails_for_missing_explicit_path() {
    const ScopedEnv config_env(CONFIG_PATH_ENV, "/nonexistent/blynkctl/devices.json");

    ConfigManager manager;
    TEST_ASSERT_EQUAL(BlynkErr::InvalidConfig, manager.load());
}

static void test_load_falls_back_to_builtin_table() {
    const ScopedEnv config_env(CONFIG_PATH_ENV, nullptr);
    const ScopedEnv xdg_env("XDG_CONFIG_HOME", "/nonexistent/xdg");
    const ScopedEnv server_env(SERVER_ENV, "http://192.168.1.20:8080/");

    ConfigManager manager;
    TEST_ASSERT_EQUAL(BlynkErr::Ok, manager.load());
    TEST_ASSERT_EQUAL_STRING("built-in", manager.getSource().c_str());
    TEST_ASSERT_EQUAL_STRING("http://192.168.1.20:8080", manager.getConfig().server.c_str());
    TEST_ASSERT_NOT_NULL(manager.getConfig().findDevice("kitchen_light"));
}

void run_config_manager_tests() {
    RUN_TEST(test_default_config_matches_builtin_table);
    RUN_TEST(test_load_from_json_keeps_file_order);
    RUN_TEST(test_groups_are_derived_when_not_listed);
    RUN_TEST(test_switchable_device_requires_default);
    RUN_TEST(test_malformed_documents_are_rejected);
    RUN_TEST(test_load_uses_explicit_config_path);
    RUN_TEST(test_load_fails_for_missing_explicit_path);
    RUN_TEST(test_load_falls_back_to_builtin_table);
}
