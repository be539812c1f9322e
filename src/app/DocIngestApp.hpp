/**
 * @file DocIngestApp.hpp
 * @brief Command-line front end of DocIngest.
 */

#pragma once

#include <string>
#include <vector>
#include "application/AppServices.hpp"

namespace docingest::app {

/**
 * @class DocIngestApp
 * @brief Parses the command line, wires the services and runs one command.
 *
 * Commands: extract, process, manifest, serve. Every command accepts --config.
 */
class DocIngestApp {
public:
    /**
     * @brief Runs the command named in argv.
     * @return Exit code (0 for success).
     */
    int Run(int argc, char** argv);

    /** @brief Builds every service from settings. Returns false on a configuration error. */
    bool Init(const application::PipelineSettings& settings);

    const application::AppServices& services() const { return m_services; }

private:
    int runExtract(std::vector<std::string>& args);
    int runProcess(std::vector<std::string>& args);
    int runManifest(std::vector<std::string>& args);
    int runServe(std::vector<std::string>& args);

    application::AppServices m_services;
};

} // namespace docingest::app
