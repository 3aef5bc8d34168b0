/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "core/Logger.hpp"
#include "core/RouteErrors.hpp"
#include "io/RouteRequestCodec.hpp"
#include "managers/RouteEngine.hpp"
#include "managers/SettingsManager.hpp"
#include <cstdio>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>

namespace {

constexpr int EXIT_ROUTE_FOUND = 0;
constexpr int EXIT_NO_PATH = 1;
constexpr int EXIT_MALFORMED_INPUT = 2;
constexpr int EXIT_IO_ERROR = 3;

const std::string DEFAULT_SETTINGS_PATH{"res/settings.json"};

struct CommandLine {
  std::string requestPath;
  std::string settingsPath{DEFAULT_SETTINGS_PATH};
  bool settingsExplicit{false};
  std::optional<std::string> algorithm;
  bool quiet{false};
};

void printUsage(const char* program) {
  std::fprintf(stderr,
               "Usage: %s --request <file.json> [--settings <file.json>] "
               "[--algorithm optimal|balanced|fast] [--quiet]\n",
               program);
}

std::optional<CommandLine> parseCommandLine(int argc, char* argv[]) {
  CommandLine cmd;
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    const bool hasValue = i + 1 < argc;
    if (arg == "--request" && hasValue) {
      cmd.requestPath = argv[++i];
    } else if (arg == "--settings" && hasValue) {
      cmd.settingsPath = argv[++i];
      cmd.settingsExplicit = true;
    } else if (arg == "--algorithm" && hasValue) {
      cmd.algorithm = argv[++i];
    } else if (arg == "--quiet") {
      cmd.quiet = true;
    } else {
      ENGINE_ERROR("Unknown or incomplete argument: " + arg);
      return std::nullopt;
    }
  }
  if (cmd.requestPath.empty()) {
    ENGINE_ERROR("Missing --request <file.json>");
    return std::nullopt;
  }
  return cmd;
}

std::optional<std::string> readFile(const std::string& path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    return std::nullopt;
  }
  std::stringstream buffer;
  buffer << file.rdbuf();
  return buffer.str();
}

} // namespace

int main(int argc, char* argv[]) {
  auto cmd = parseCommandLine(argc, argv);
  if (!cmd) {
    printUsage(argv[0]);
    return EXIT_IO_ERROR;
  }

  if (cmd->quiet) {
    GRIDROUTE_ENABLE_BENCHMARK_MODE();
  }

  auto& settings = GridRoute::SettingsManager::Instance();
  if (!settings.loadFromFile(cmd->settingsPath)) {
    if (cmd->settingsExplicit) {
      ENGINE_CRITICAL("Could not load settings from " + cmd->settingsPath);
      return EXIT_IO_ERROR;
    }
    ENGINE_WARN("Failed to load " + cmd->settingsPath + " - using defaults");
  }

  if (settings.get<bool>("logging", "quiet", false)) {
    GRIDROUTE_ENABLE_BENCHMARK_MODE();
  }

  auto text = readFile(cmd->requestPath);
  if (!text) {
    ENGINE_CRITICAL("Could not read request file: " + cmd->requestPath);
    return EXIT_IO_ERROR;
  }

  try {
    GridRoute::RouteRequest request = GridRoute::RouteCodec::parseRequestText(*text);
    if (cmd->algorithm) {
      request.algorithm = *cmd->algorithm;
    }
    GridRoute::RouteCodec::validatePoints(request);

    GridRoute::RouteEngine engine(GridRoute::RouteEngine::configFromSettings(settings));
    const GridRoute::RouteResult result = engine.plan(request);

    std::cout << GridRoute::RouteCodec::encodeResult(result).toPrettyString() << std::endl;
    return result.found() ? EXIT_ROUTE_FOUND : EXIT_NO_PATH;
  } catch (const GridRoute::RequestFormatError& e) {
    ENGINE_ERROR(std::string("Invalid request: ") + e.what());
    std::cout << GridRoute::RouteCodec::encodeError("InvalidRequest", e.what()).toPrettyString() << std::endl;
    return EXIT_MALFORMED_INPUT;
  } catch (const GridRoute::MalformedGridError& e) {
    ENGINE_ERROR(std::string("Malformed grid: ") + e.what());
    std::cout << GridRoute::RouteCodec::encodeError("MalformedGrid", e.what()).toPrettyString() << std::endl;
    return EXIT_MALFORMED_INPUT;
  } catch (const GridRoute::InvalidWaypointError& e) {
    ENGINE_ERROR(std::string("Invalid pickup points: ") + e.what());
    std::cout << GridRoute::RouteCodec::encodeError("InvalidWaypoint", e.what()).toPrettyString() << std::endl;
    return EXIT_MALFORMED_INPUT;
  } catch (const std::exception& e) {
    ENGINE_CRITICAL(std::string("Route planning failed: ") + e.what());
    return EXIT_IO_ERROR;
  }
}
