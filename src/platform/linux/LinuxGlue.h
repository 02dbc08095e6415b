#pragma once

#include "RedirectablePrint.h"
#include "graphics/PlannerConfig.h"
#include <stdint.h>
#include <string>

// Everything the daemon reads from config.yaml
struct inkdelta_config_struct {
    graphics::PlannerConfig planner;
    uint16_t panelWidth = EINK_PANEL_WIDTH;
    uint16_t panelHeight = EINK_PANEL_HEIGHT;

    log_output_level logoutputlevel = level_info;
    std::string traceFilename;
    bool ascii_logs = false;
    bool ascii_logs_explicit = false;
};

// Everything the daemon reads from its command line
struct inkdelta_cli_struct {
    const char *configPath = nullptr;
    bool verbose = false;
    uint32_t cycles = 20;
    uint32_t failEvery = 0;
};

/**
 * Read a YAML config file over the defaults already in config. Missing sections and keys keep their value,
 * out of range values are clamped with a warning.
 * @return false if the file could not be read or parsed, config may then be partly updated
 */
bool loadConfig(const char *configPath, inkdelta_config_struct &config);

/// "error", "warn", "info", "debug" or "trace", anything else gives fallback
log_output_level parseLogLevel(const std::string &name, log_output_level fallback);

/// Point the console at the configured level, colours and trace file
void applyLoggingConfig(const inkdelta_config_struct &config);

/// argp based, exits on --help, --version and malformed options like any argp program
bool parseArguments(int argc, char **argv, inkdelta_cli_struct &cli);
