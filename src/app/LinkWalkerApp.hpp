/**
 * @file LinkWalkerApp.hpp
 * @brief Command-line front end for LinkWalker.
 */

#pragma once

#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "application/AppServices.hpp"
#include "infrastructure/ConfigLoader.hpp"

namespace linkwalker::app {

/**
 * @class LinkWalkerApp
 * @brief Parses the command line, wires the services and runs one subcommand.
 *
 * Results are printed to stdout as JSON. Request-level problems (missing path,
 * missing search text, unknown link target) print {"error": ...} and return 1.
 */
class LinkWalkerApp {
public:
    /**
     * @brief Runs the selected subcommand.
     * @return Process exit code (0 for success).
     */
    int Run(int argc, char** argv);

private:
    struct Options {
        std::optional<std::string> configPath;
        std::string path;
        std::string outputPath;
        std::optional<std::string> findText;
        std::optional<std::string> replaceText;
        std::string target = "both";
        bool noSaveCopies = false;
    };

    /**
     * @brief Loads settings and builds the service graph (composition root).
     */
    void Init();

    int runScan();
    int runLinks();
    int runExport();
    int runFindReplace();
    int runLinksFindReplace();
    int runAnalyze();

    std::optional<std::string> backupRootFor(const std::string& scanRoot) const;
    void printJson(const nlohmann::json& value) const;
    int reportError(const std::string& message, int exitCode = 1) const;

    Options m_options;
    infrastructure::AppConfig m_config;
    application::AppServices m_services;
};

} // namespace linkwalker::app
