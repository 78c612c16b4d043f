/*
 * Copyright (c) 2025, NVIDIA CORPORATION.  All rights reserved.
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */
#include "CommandLineParser.h"
#include "ChdiagTCLAP.h"
#include "chdiag_common.h"

#include <ChdLogging.h>

#include <tclap/ArgException.h>
#include <tclap/CmdLine.h>

#include <cstdint>
#include <functional>
#include <iostream>
#include <stdexcept>
#include <vector>

using namespace ChdNs::NodeDiag;

#define CHECK_TCLAP_ARG_POSITIVE_VALUE(arg, name) \
    if (arg.getValue() <= 0)                      \
    throw TCLAP::CmdLineParseException("Positive value expected", name)

static std::string const g_logFileHelpText
    = "Log file. Use - to log to the console. [default = CHD_LOG_FILE or " CHD_LOGGING_DEFAULT_CHDIAG_FILE "]";
static std::string const g_logLevelHelpText = "Log severity, one of " CHD_LOGGING_SEVERITY_OPTIONS
                                              ". [default = CHD_LOG_LVL or " CHD_LOGGING_DEFAULT_CHDIAG_SEVERITY "]";

/*****************************************************************************
 * The following classes/functions process the command line parameters and
 * display help if needed using the TCLAP library.
 */


CommandLineParser::StaticConstructor::StaticConstructor()
{
    // fill in the available subsystems and their appropriate pointers
    m_functionMap.insert(std::make_pair("detect", &CommandLineParser::ProcessDetectCommandLine));
    m_functionMap.insert(std::make_pair("analyze", &CommandLineParser::ProcessAnalyzeCommandLine));
    m_functionMap.insert(std::make_pair("isolate", &CommandLineParser::ProcessIsolateCommandLine));
}

/* Entry method into this class for a given command line provided by main()
 */
int CommandLineParser::ProcessCommandLine(int argc, char const *const *argv)
{
    try
    {
        TCLAP::CmdLine cmd(_CHDIAG_FORMAL_NAME, ' ', CHDIAG_VERSION);
        cmd.setExceptionHandling(false);

        TCLAP::UnlabeledValueArg<std::string> subsystemArg("subsystem",
                                                           "The desired subsystem to be accessed."
                                                           "\n Subsystems Available:"
                                                           "\n  detect  - Find bad nodes with benchmark runs"
                                                           "\n  analyze - Find slow nodes in saved results"
                                                           "\n  isolate - Exclude bad nodes from scheduling",
                                                           true,
                                                           "",
                                                           "subsystem",
                                                           cmd);

        // normally we would pass all of argc and argv.  But for this, we want just the first two
        if (argc < 2)
        {
            cmd.parse(argc, argv);
        }

        std::vector<std::string> args;
        for (int i = 0; i < 2; i++)
        {
            args.emplace_back(argv[i]);
        }
        cmd.parse(args);

        // call the correct subsystem
        auto it = m_functionMap.find(subsystemArg.getValue());
        if (it == m_functionMap.end())
        {
            std::cout << "ERROR: Invalid subsystem." << std::endl << std::endl;
            cmd.getOutput()->usage(cmd);
            return CHD_EXIT_CONFIG_ERROR;
        }
        return std::invoke(it->second, argc, argv);
    }
    catch (TCLAP::ArgException &e)
    {
        std::cerr << "Error: " << e.error();
        if (e.argId().size() > 10)
        {
            // Substring needed since `argId()` prepends 'Argument: ' to the argument name
            std::cerr << " for arg " << e.argId().substr(10);
        }
        std::cerr << "." << std::endl;
        return CHD_EXIT_CONFIG_ERROR;
    }
    catch (TCLAP::ExitException &e)
    {
        // --help and --version
        return e.getExitStatus();
    }
}

/*****************************************************************************/
ChdNs::NodeDiag::DetectionMode CommandLineParser::ParseDetectionMode(std::string const &mode)
{
    if (mode == "bisection")
    {
        return DetectionMode::Bisection;
    }
    if (mode == "pairwise")
    {
        return DetectionMode::Pairwise;
    }
    if (mode == "both")
    {
        return DetectionMode::Both;
    }
    throw TCLAP::CmdLineParseException("Unknown detection mode '" + mode + "'", "mode");
}

/*****************************************************************************/
void CommandLineParser::InitLogging(LoggingParams const &logging)
{
    if (!logging.logLevel.empty() && !IsValidSeverity(logging.logLevel.c_str()))
    {
        throw TCLAP::CmdLineParseException("Log severity must be one of " CHD_LOGGING_SEVERITY_OPTIONS, "log-level");
    }

    std::string const logFile
        = GetLogFilenameFromArgAndEnv(logging.logFile, CHD_LOGGING_DEFAULT_CHDIAG_FILE, CHD_LOGGING_ENV_PREFIX);
    std::string const logSeverity
        = GetLogSeverityFromArgAndEnv(logging.logLevel, CHD_LOGGING_DEFAULT_CHDIAG_SEVERITY, CHD_LOGGING_ENV_PREFIX);

    ChdLoggingInit(logFile.c_str(),
                   LoggingSeverityFromString(logSeverity.c_str(), ChdLoggingSeverityWarning),
                   ChdLoggingSeverityNone);

    log_info("Initialized chdiag logger");
}

// the below subsystem processing commands assume two things
// 1) that the calling structure is already in a try block
// 2) that the argc and argv commands have not been modified
DetectParams CommandLineParser::ParseDetectParams(int argc, char const *const *argv)
{
    ChdiagSubsystemCmdLine cmd("detect", _CHDIAG_FORMAL_NAME, CHDIAG_VERSION);

    std::vector<std::string> modes { "bisection", "pairwise", "both" };
    TCLAP::ValuesConstraint<std::string> modeConstraint(modes);

    // args are displayed in reverse order to this list
    TCLAP::ValueArg<std::string> logLevel("", "log-level", g_logLevelHelpText, false, "", "severity", cmd);
    TCLAP::ValueArg<std::string> logFile("", "log-file", g_logFileHelpText, false, "", "path", cmd);
    TCLAP::SwitchArg json("j", "json", "Print the combined report as JSON.", cmd, false);
    TCLAP::ValueArg<std::string> benchmark(
        "b",
        "benchmark",
        "Path to the all_reduce_perf binary. [default = CHD_BENCHMARK_PATH or /usr/local/bin/all_reduce_perf]",
        false,
        "",
        "path",
        cmd);
    TCLAP::ValueArg<int> timeout("",
                                 "timeout",
                                 "Timeout of a single benchmark run in seconds. [default = 300]",
                                 false,
                                 static_cast<int>(NodeDiagConstants::DEFAULT_TEST_TIMEOUT.count()),
                                 "seconds",
                                 cmd);
    TCLAP::ValueArg<std::uint64_t> seed(
        "", "seed", "Seed for pair sampling. A random seed is used and reported when omitted.", false, 0, "seed", cmd);
    TCLAP::ValueArg<int> maxPairs(
        "", "max-pairs", "Test at most this many randomly sampled node pairs.", false, 0, "count", cmd);
    TCLAP::ValueArg<std::string> outputDir("o",
                                           "output-dir",
                                           "Directory for reports and raw benchmark logs. [default = ./results]",
                                           false,
                                           std::string(NodeDiagConstants::DEFAULT_OUTPUT_DIR),
                                           "dir",
                                           cmd);
    TCLAP::ValueArg<double> threshold(
        "t",
        "threshold",
        "Bandwidth threshold in GB/s. Calibrated to 80% of a two node baseline when omitted.",
        false,
        0.0,
        "GB/s",
        cmd);
    TCLAP::ValueArg<int> processesPerNode("p",
                                          "processes-per-node",
                                          "Benchmark processes (GPUs) per node. [default = 8]",
                                          false,
                                          static_cast<int>(NodeDiagConstants::DEFAULT_PROCESSES_PER_NODE),
                                          "count",
                                          cmd);
    TCLAP::ValueArg<std::string> mode(
        "m", "mode", "Detection mode. [default = bisection]", false, "bisection", &modeConstraint, cmd);
    TCLAP::ValueArg<std::string> hostfile(
        "f", "hostfile", "Hostfile listing the nodes to test, one per line.", true, "", "hostfile", cmd);

    cmd.parse(argc, argv);

    CHECK_TCLAP_ARG_POSITIVE_VALUE(processesPerNode, "processes-per-node");
    CHECK_TCLAP_ARG_POSITIVE_VALUE(timeout, "timeout");
    if (threshold.isSet())
    {
        CHECK_TCLAP_ARG_POSITIVE_VALUE(threshold, "threshold");
    }
    if (maxPairs.isSet())
    {
        CHECK_TCLAP_ARG_POSITIVE_VALUE(maxPairs, "max-pairs");
    }

    DetectParams params;
    params.hostfile         = hostfile.getValue();
    params.mode             = ParseDetectionMode(mode.getValue());
    params.processesPerNode = static_cast<unsigned int>(processesPerNode.getValue());
    params.outputDir        = outputDir.getValue();
    params.timeout          = std::chrono::seconds(timeout.getValue());
    params.benchmarkPath    = benchmark.getValue();
    params.json             = json.getValue();
    params.logging          = { logFile.getValue(), logLevel.getValue() };
    if (threshold.isSet())
    {
        params.threshold = threshold.getValue();
    }
    if (maxPairs.isSet())
    {
        params.maxPairs = static_cast<std::size_t>(maxPairs.getValue());
    }
    if (seed.isSet())
    {
        params.seed = seed.getValue();
    }
    return params;
}

/*****************************************************************************/
AnalyzeParams CommandLineParser::ParseAnalyzeParams(int argc, char const *const *argv)
{
    ChdiagSubsystemCmdLine cmd("analyze", _CHDIAG_FORMAL_NAME, CHDIAG_VERSION);

    // args are displayed in reverse order to this list
    TCLAP::ValueArg<std::string> logLevel("", "log-level", g_logLevelHelpText, false, "", "severity", cmd);
    TCLAP::ValueArg<std::string> logFile("", "log-file", g_logFileHelpText, false, "", "path", cmd);
    TCLAP::ValueArg<std::string> output(
        "o", "output", "Also write the text report to this file.", false, "", "file", cmd);
    TCLAP::ValueArg<double> threshold(
        "t", "threshold", "Z-score threshold for outlier detection. [default = 2.0]", false, 2.0, "zscore", cmd);
    TCLAP::SwitchArg json("j", "json", "Print the analysis as JSON.", cmd, false);
    TCLAP::SwitchArg raw(
        "r", "raw", "Treat the input as raw benchmark output even if it is named *.json.", cmd, false);
    TCLAP::ValueArg<std::string> input(
        "i", "input", "Benchmark results document (*.json) or raw benchmark log.", true, "", "file", cmd);

    cmd.parse(argc, argv);

    CHECK_TCLAP_ARG_POSITIVE_VALUE(threshold, "threshold");

    AnalyzeParams params;
    params.input           = input.getValue();
    params.raw             = raw.getValue();
    params.json            = json.getValue();
    params.zscoreThreshold = threshold.getValue();
    params.logging         = { logFile.getValue(), logLevel.getValue() };
    if (output.isSet())
    {
        params.outputFile = output.getValue();
    }
    return params;
}

/*****************************************************************************/
IsolateParams CommandLineParser::ParseIsolateParams(int argc, char const *const *argv)
{
    ChdiagSubsystemCmdLine cmd("isolate", _CHDIAG_FORMAL_NAME, CHDIAG_VERSION);

    // args are displayed in reverse order to this list
    TCLAP::ValueArg<std::string> logLevel("", "log-level", g_logLevelHelpText, false, "", "severity", cmd);
    TCLAP::ValueArg<std::string> logFile("", "log-file", g_logFileHelpText, false, "", "path", cmd);
    TCLAP::ValueArg<std::string> reportDir(
        "", "report-dir", "Directory for the isolation report. [default = .]", false, ".", "dir", cmd);
    TCLAP::SwitchArg slurm("", "slurm", "Print a SLURM exclude directive.", cmd, false);
    TCLAP::SwitchArg k8s("", "k8s", "Print a Kubernetes node affinity snippet.", cmd, false);
    TCLAP::SwitchArg noBackup("", "no-backup", "Do not back up the hostfile before rewriting it.", cmd, false);
    TCLAP::ValueArg<std::string> output(
        "o", "output", "Write the updated hostfile here instead of updating it in place.", false, "", "file", cmd);
    TCLAP::ValueArg<std::string> hostfile(
        "f", "hostfile", "Hostfile in which bad nodes are commented out.", false, "", "hostfile", cmd);
    TCLAP::MultiArg<std::string> nodes("n", "nodes", "Comma separated list of bad nodes.", false, "node1,node2", cmd);
    TCLAP::MultiArg<std::string> reports(
        "r", "report", "Detection report to load bad nodes from. May be repeated.", false, "file", cmd);

    cmd.parse(argc, argv);

    if (output.isSet() && !hostfile.isSet())
    {
        throw TCLAP::CmdLineParseException("--output requires --hostfile", "output");
    }

    IsolateParams params;
    params.reports   = reports.getValue();
    params.nodes     = nodes.getValue();
    params.backup    = !noBackup.getValue();
    params.k8s       = k8s.getValue();
    params.slurm     = slurm.getValue();
    params.reportDir = reportDir.getValue();
    params.logging   = { logFile.getValue(), logLevel.getValue() };
    if (hostfile.isSet())
    {
        params.hostfile = hostfile.getValue();
    }
    if (output.isSet())
    {
        params.output = output.getValue();
    }
    return params;
}

/*****************************************************************************/
int CommandLineParser::ProcessDetectCommandLine(int argc, char const *const *argv)
{
    DetectParams params = ParseDetectParams(argc, argv);
    InitLogging(params.logging);
    return StartDetect(std::move(params)).Execute();
}

/*****************************************************************************/
int CommandLineParser::ProcessAnalyzeCommandLine(int argc, char const *const *argv)
{
    AnalyzeParams params = ParseAnalyzeParams(argc, argv);
    InitLogging(params.logging);
    return AnalyzeResults(std::move(params)).Execute();
}

/*****************************************************************************/
int CommandLineParser::ProcessIsolateCommandLine(int argc, char const *const *argv)
{
    IsolateParams params = ParseIsolateParams(argc, argv);
    InitLogging(params.logging);
    return IsolateNodes(std::move(params)).Execute();
}
