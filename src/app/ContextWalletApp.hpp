/**
 * @file ContextWalletApp.hpp
 * @brief Command line front end of the context wallet.
 */

#pragma once

#include <string>
#include <vector>
#include "application/AppServices.hpp"

namespace contextwallet::app {

/**
 * @class ContextWalletApp
 * @brief Wires the services from settings.json and dispatches one command.
 *
 * Usage: contextwallet [--root DIR] pack|preview|extract|status [options]
 */
class ContextWalletApp {
public:
    /**
     * @brief Parses the arguments, runs the command and returns the process exit code.
     */
    int Run(int argc, char** argv);

private:
    bool Init(const std::string& projectRoot);

    int RunPack(const std::vector<std::string>& args);
    int RunPreview(const std::vector<std::string>& args);
    int RunExtract(const std::vector<std::string>& args);
    int RunStatus();

    static void PrintUsage();

    application::AppServices m_services;
    std::string m_projectRoot;
};

} // namespace contextwallet::app
