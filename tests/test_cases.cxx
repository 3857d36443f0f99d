// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#include "unity.h"
#include "system/Logging.hxx"

void run_pin_value_tests();
void run_config_manager_tests();
void run_http_client_tests();
void run_blynk_client_tests();
void run_action_tests();
void run_device_resolver_tests();
void run_action_dispatcher_tests();
void run_presentation_tests();

extern "C" void setUp(void) {}
extern "C" void tearDown(void) {}

int main() {
    blynkCtl::logging::init();
    // failure paths are exercised on purpose
    blynkCtl::logging::setLevel(spdlog::level::off);

    UNITY_BEGIN();

    run_pin_value_tests();
    run_config_manager_tests();
    run_http_client_tests();
    run_blynk_client_tests();
    run_action_tests();
    run_device_resolver_tests();
    run_action_dispatcher_tests();
    run_presentation_tests();

    return UNITY_END();
}
