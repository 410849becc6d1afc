#pragma once

#include "platform.hpp"

#include <map>
#include <string>
#include <vector>

namespace bundle::validation {

/**
 * \brief One build-and-run case after bundle-mode expansion.
 *
 * `attributes` are carried into the reports untouched; the engine never
 * interprets them.
 */
struct Scenario {
    std::string id;
    std::string suite;
    std::string script;    ///< relative to the scripts directory unless absolute
    std::string app_name;  ///< empty: named after the script stem
    BundleMode mode{BundleMode::OneDir};
    std::vector<std::string> tool_args;
    std::vector<std::string> app_args;
    std::string manifest;  ///< manifest base name; empty: the application name
    std::map<std::string, std::string> attributes;
};

/**
 * \brief Convenience bundle carrying multiple scenarios emitted from one file.
 */
struct ScenarioPack {
    std::string source_file;
    std::vector<Scenario> scenarios;
};

}  // namespace bundle::validation
