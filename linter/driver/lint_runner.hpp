#pragma once

#include "../common/diagnostic.hpp"
#include "command_line.hpp"

#include <string>

namespace escapelint
{
    void reportFatal(DiagnosticSink& sink, std::string code, std::string message);

    /**
     * Parses the compiler output, scans the package tree and reconciles the
     * two. Returns the process exit code: 0 when everything holds or
     * `noFail` is set, 1 otherwise.
     */
    int runLint(const CommandLineOptions& options, DiagnosticSink& sink);
} // namespace escapelint
