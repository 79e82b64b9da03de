#include "../common/diagnostic.hpp"
#include "command_line.hpp"
#include "lint_runner.hpp"

#include <iostream>

#ifndef ESCAPE_LINT_VERSION
#define ESCAPE_LINT_VERSION "0.1.0-local"
#endif

namespace escapelint
{
    void printHelp()
    {
        std::cout << "escape-lint - check optimization annotations against compiler diagnostics\n"
                  << "Usage: escape-lint -f <compiler-output> [-pkg <dir>] [-no-fail]\n\n"
                  << "Options:\n"
                  << "  -f <path>       Path to the compiler output file (required).\n"
                  << "  -pkg <path>     Path to the package directory. Default: '.'.\n"
                  << "  -no-fail        Exit with status code 0 even if errors are found.\n"
                  << "  -help           Show this help text and exit.\n"
                  << "  -version        Show version information and exit.\n";
    }

    void printVersion()
    {
        std::cout << "escape-lint " << ESCAPE_LINT_VERSION << '\n';
    }
} // namespace escapelint

int main(int argc, char** argv)
{
    escapelint::CommandLineParser parser;
    const auto parsed = parser.parse(argc, argv);

    if (parsed.showHelp)
    {
        escapelint::printHelp();
        return 0;
    }

    if (parsed.showVersion)
    {
        escapelint::printVersion();
        return 0;
    }

    escapelint::StreamDiagnosticSink sink{std::cout};

    if (parsed.hasError)
    {
        escapelint::reportFatal(sink, "ESCL-E1000", "error: " + parsed.errorMessage);
        escapelint::printHelp();
        return parsed.missingCompilerOutput ? 1 : 2;
    }

    return escapelint::runLint(parsed.options, sink);
}
