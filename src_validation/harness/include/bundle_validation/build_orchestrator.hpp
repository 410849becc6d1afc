#pragma once

#include "build_request.hpp"

#include <string>
#include <vector>

namespace bundle::validation {

/**
 * \brief Invokes the packaging tool for one request.
 *
 * The argument list is, in order:
 *   1. the script,
 *   2. `--debug --noupx --specpath <spec> --distpath <dist> --workpath <build> --log-level=DEBUG`,
 *      followed by `--paths <modules_dir>` (absolute) when the request has one,
 *   3. `--onedir` or `--onefile`,
 *   4. the request's extra arguments, then `--name <app>` when the name was given,
 * so anything the caller passes can override a default.
 */
class BuildOrchestrator {
public:
    explicit BuildOrchestrator(PackagingTool& tool) : tool_(tool) {}

    [[nodiscard]] static std::vector<std::string> compose_arguments(const BuildRequest& request);

    /**
     * Builds `request`. The tool gets its own deep copy of `shared_graph`; the
     * caller's value is never handed out.
     */
    [[nodiscard]] BuildOutcome build(const BuildRequest& request,
                                     const DependencyGraph& shared_graph) const;

private:
    PackagingTool& tool_;
};

}  // namespace bundle::validation
