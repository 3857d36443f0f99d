// Copyright (c) 2026 Alice-Trade Inc.
// SPDX-License-Identifier: GPL-2.0-or-later

#include <iostream>

#include "blynk/BlynkClient.hxx"
#include "cli/Action.hxx"
#include "cli/ActionDispatcher.hxx"
#include "cli/DeviceResolver.hxx"
#include "config/ConfigManager.hxx"
#include "http/HttpClient.hxx"
#include "system/Logging.hxx"

static constexpr char TAG[] = "Main";

static constexpr char USAGE[] = R"(Usage: blynkctl [DEVICE(S)] [ACTION]

Read and switch devices through the Blynk HTTP API.

Devices:
  NAME...    One or more configured device names
  a(ll)      Every device (sensors only for print/status)
  GROUP      Every device of a configured group

Actions:
  on         Turn the device(s) on
  of(f)      Turn the device(s) off
  f(lip)     Flip the device(s)
  j(ust)     Turn the device(s) on and turn off every other device in the same group
  p(rint)    Print the status of the device(s) as a table
  s(tatus)   Print the status of the device(s) in JSON format
  any int/float for setting a pin to an arbitrary value

Environment:
  BLYNKCTL_CONFIG      Device table (JSON), default $XDG_CONFIG_HOME/)" BLYNKCTL_CONFIG_FILE_NAME R"(
  BLYNKCTL_SERVER      Override the server URL
  BLYNKCTL_LOG_LEVEL   trace|debug|info|warn|error|critical|off (default: warn))";

int main(const int argc, char* argv[]) {
    blynkCtl::logging::init();
    const auto log = blynkCtl::logging::get(TAG);

    if (argc < 3) {
        std::cout << USAGE << std::endl;
        return EXIT_SUCCESS;
    }

    const std::vector<std::string> selectors(argv + 1, argv + argc - 1);
    const std::string action_token = argv[argc - 1];
    log->debug("blynkctl v{}: action '{}', {} selector(s)", BLYNKCTL_VERSION, action_token, selectors.size());

    blynkCtl::ConfigManager config_manager;
    if (const auto err = config_manager.load(); err != blynkCtl::BlynkErr::Ok) {
        log->critical("Failed to load configuration: {}", blynkCtl::errToName(err));
        return EXIT_FAILURE;
    }
    const blynkCtl::AppConfig& config = config_manager.getConfig();

    const auto action = blynkCtl::parseAction(action_token);
    if (!action) {
        log->critical("'{}' is neither an action nor a number: {}", action_token,
                      blynkCtl::errToName(blynkCtl::BlynkErr::InvalidArg));
        return EXIT_FAILURE;
    }

    const blynkCtl::DeviceResolver resolver(config);
    const auto devices = resolver.resolve(selectors, *action);

    blynkCtl::BeastHttpTransport transport;
    blynkCtl::BlynkClient client(config, transport);
    blynkCtl::ActionDispatcher dispatcher(config, client, std::cout);

    if (const auto err = dispatcher.dispatch(*action, devices); err != blynkCtl::BlynkErr::Ok) {
        log->critical("'{}' failed: {}", blynkCtl::actionName(action->kind), blynkCtl::errToName(err));
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}
