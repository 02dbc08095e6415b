#include "LinuxGlue.h"
#include "configuration.h"
#include <argp.h>
#include <errno.h>
#include <stdio.h>
#include <unistd.h>
#include <yaml-cpp/yaml.h>

const char *argp_program_version = optstr(APP_VERSION);

namespace
{

uint16_t readPanelEdge(const YAML::Node &node, uint16_t current, const char *name)
{
    if (!node)
        return current;
    int v = node.as<int>(current);
    if (v < 8 || v > EINK_MAX_PANEL_EDGE) {
        LOG_WARN("Panel %s %d out of range, keeping %u", name, v, current);
        return current;
    }
    return (uint16_t)v;
}

} // namespace

log_output_level parseLogLevel(const std::string &name, log_output_level fallback)
{
    if (name == "trace")
        return level_trace;
    if (name == "debug")
        return level_debug;
    if (name == "info")
        return level_info;
    if (name == "warn")
        return level_warn;
    if (name == "error")
        return level_error;
    return fallback;
}

bool loadConfig(const char *configPath, inkdelta_config_struct &config)
{
    YAML::Node yamlConfig;
    try {
        yamlConfig = YAML::LoadFile(configPath);

        if (yamlConfig["Logging"]) {
            config.logoutputlevel = parseLogLevel(yamlConfig["Logging"]["LogLevel"].as<std::string>("info"), level_info);
            config.traceFilename = yamlConfig["Logging"]["TraceFile"].as<std::string>("");
            if (yamlConfig["Logging"]["AsciiLogs"]) {
                // Default is !isatty(1) but can be set explicitly in config.yaml
                config.ascii_logs = yamlConfig["Logging"]["AsciiLogs"].as<bool>();
                config.ascii_logs_explicit = true;
            }
        }

        if (yamlConfig["Panel"]) {
            config.panelWidth = readPanelEdge(yamlConfig["Panel"]["Width"], config.panelWidth, "Width");
            config.panelHeight = readPanelEdge(yamlConfig["Panel"]["Height"], config.panelHeight, "Height");
        }

        if (yamlConfig["Planner"]) {
            const YAML::Node planner = yamlConfig["Planner"];
            graphics::PlannerConfig &p = config.planner;

            p.mergeDistancePx = planner["MergeDistance"].as<int>(p.mergeDistancePx);
            p.minRegionPx = planner["MinRegionSize"].as<int>(p.minRegionPx);
            p.maxRegionsPerCycle = planner["MaxRegions"].as<int>(p.maxRegionsPerCycle);
            p.regionPaddingPx = planner["Padding"].as<int>(p.regionPaddingPx);
            p.byteAlignment = planner["ByteAlignment"].as<int>(p.byteAlignment);
            int connectivity = planner["Connectivity"].as<int>(p.connectivity);
            if (connectivity == 4 || connectivity == 8)
                p.connectivity = (uint8_t)connectivity;
            else
                LOG_WARN("Connectivity %d not supported, using %u", connectivity, p.connectivity);
            p.maxConsecutivePartials = planner["FullRefreshEvery"].as<unsigned>(p.maxConsecutivePartials);

            if (planner["Polarity"]) {
                std::string polarity = planner["Polarity"].as<std::string>("");
                if (!graphics::parsePolarity(polarity.c_str(), p.polarity))
                    LOG_WARN("Unknown Polarity '%s', using %s", polarity.c_str(), graphics::polarityName(p.polarity));
            }
            if (planner["EmptyAfterFilter"]) {
                std::string policy = planner["EmptyAfterFilter"].as<std::string>("");
                if (!graphics::parseEmptyPolicy(policy.c_str(), p.emptyPolicy))
                    LOG_WARN("Unknown EmptyAfterFilter '%s', using %s", policy.c_str(), graphics::emptyPolicyName(p.emptyPolicy));
            }
        }
    } catch (YAML::Exception &e) {
        LOG_ERROR("Could not load %s: %s", configPath, e.what());
        return false;
    }

    config.planner.sanitize();
    return true;
}

void applyLoggingConfig(const inkdelta_config_struct &config)
{
    if (!console)
        return;
    console->setLogLevel(config.logoutputlevel);
    console->setColor(config.ascii_logs_explicit ? !config.ascii_logs : isatty(1));
    if (!console->setTraceFile(config.traceFilename))
        LOG_ERROR("Could not open trace file %s", config.traceFilename.c_str());
}

static error_t parse_opt(int key, char *arg, struct argp_state *state)
{
    inkdelta_cli_struct *cli = static_cast<inkdelta_cli_struct *>(state->input);

    switch (key) {
    case 'c':
        cli->configPath = arg;
        break;
    case 'v':
        cli->verbose = true;
        break;
    case 'n':
        if (sscanf(arg, "%u", &cli->cycles) < 1) {
            argp_error(state, "bad cycle count '%s'", arg);
            return EINVAL;
        }
        break;
    case 's':
        if (sscanf(arg, "%u", &cli->failEvery) < 1) {
            argp_error(state, "bad fail interval '%s'", arg);
            return EINVAL;
        }
        break;
    case ARGP_KEY_ARG:
        return 0;
    default:
        return ARGP_ERR_UNKNOWN;
    }
    return 0;
}

bool parseArguments(int argc, char **argv, inkdelta_cli_struct &cli)
{
    static struct argp_option options[] = {{"config", 'c', "CONFIG_PATH", 0, "Full path of the .yaml config file to use."},
                                           {"verbose", 'v', 0, 0, "Set log level to full debug"},
                                           {"cycles", 'n', "N", 0, "Number of simulated update cycles (default 20)."},
                                           {"fail-every", 's', "N", 0, "Simulated panel rejects every Nth partial update."},
                                           {0}};
    static char doc[] = "inkdelta partial refresh simulator.";
    static char args_doc[] = "";
    static struct argp argp = {options, parse_opt, args_doc, doc, 0, 0, 0};

    return argp_parse(&argp, argc, argv, 0, nullptr, &cli) == 0;
}
