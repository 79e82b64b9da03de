#include "lint_runner.hpp"

#include "../compiler_output/compiler_output_parser.hpp"
#include "../reconcile/reconciler.hpp"
#include "../source/annotation_scanner.hpp"
#include "../source/source_walker.hpp"

#include <utility>

namespace escapelint
{
    void reportFatal(DiagnosticSink& sink, std::string code, std::string message)
    {
        Diagnostic diagnostic;
        diagnostic.code = std::move(code);
        diagnostic.message = std::move(message);
        diagnostic.severity = Severity::Error;
        sink.report(std::move(diagnostic));
    }

    int runLint(const CommandLineOptions& options, DiagnosticSink& sink)
    {
        const auto hints = compiler_output::parseCompilerOutputFile(options.compilerOutputPath);
        if (hints.hasError)
        {
            reportFatal(sink, "ESCL-E1001", "error parsing compiler output: " + hints.errorMessage);
            return 1;
        }

        source::SourceWalker walker;
        source::AnnotationScanner scanner{walker, sink};
        const auto scan = scanner.scan(options.packagePath);
        if (scan.hasError)
        {
            reportFatal(sink, "ESCL-E1002", "error parsing source code: " + scan.errorMessage);
            return 1;
        }

        const auto reconciled = reconcile::reconcile(hints.hints, scan.annotations, sink);

        if ((!scan.annotationsValid || !reconciled.valid) && !options.noFail)
        {
            return 1;
        }

        return 0;
    }
} // namespace escapelint
