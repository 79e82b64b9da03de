#include "reconciler.hpp"

#include <algorithm>
#include <string>
#include <utility>

namespace escapelint::reconcile
{
    namespace
    {
        bool contains(const std::vector<CompilerHint>& hints, CompilerHint hint)
        {
            return std::find(hints.begin(), hints.end(), hint) != hints.end();
        }

        Diagnostic makeViolationDiagnostic(const Position& position, Annotation annotation)
        {
            const std::string where = formatPosition(position);
            const std::string marker{toString(annotation)};

            Diagnostic diagnostic;
            diagnostic.position = position;
            diagnostic.severity = Severity::Error;

            switch (annotation)
            {
            case Annotation::NoEscape:
                diagnostic.code = "ESCL-E3001";
                diagnostic.message = "variable at " + where + " is marked as " + marker + " but escapes to heap";
                break;
            case Annotation::NoBoundsCheck:
                diagnostic.code = "ESCL-E3002";
                diagnostic.message = "variable at " + where + " is marked as " + marker + " but bounds check is not eliminated";
                break;
            case Annotation::MustInline:
                diagnostic.code = "ESCL-E3003";
                diagnostic.message = "function at " + where + " is marked as " + marker + " but is not inlined";
                break;
            }

            return diagnostic;
        }
    } // namespace

    bool isViolated(Annotation annotation, const std::vector<CompilerHint>& hints)
    {
        switch (annotation)
        {
        case Annotation::NoEscape:
            return contains(hints, CompilerHint::EscapesToHeap) || contains(hints, CompilerHint::MovedToHeap);
        case Annotation::NoBoundsCheck:
            return contains(hints, CompilerHint::FoundIsInBounds);
        case Annotation::MustInline:
            return !contains(hints, CompilerHint::Inlined);
        }

        return false;
    }

    ReconcileResult reconcile(const HintIndex& hints, const AnnotationIndex& annotations, DiagnosticSink& sink)
    {
        static const std::vector<CompilerHint> noHints;

        ReconcileResult result;

        for (const auto& [position, recorded] : annotations)
        {
            auto found = hints.find(position);
            const std::vector<CompilerHint>& observed = found != hints.end() ? found->second : noHints;

            for (Annotation annotation : recorded)
            {
                if (!isViolated(annotation, observed))
                {
                    continue;
                }

                Violation violation;
                violation.position = position;
                violation.annotation = annotation;
                violation.observedHints = observed;
                result.violations.emplace_back(std::move(violation));
                result.valid = false;

                sink.report(makeViolationDiagnostic(position, annotation));
            }
        }

        return result;
    }
} // namespace escapelint::reconcile
