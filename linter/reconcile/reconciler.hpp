#pragma once

#include "../common/diagnostic.hpp"
#include "../common/facts.hpp"

#include <vector>

namespace escapelint::reconcile
{
    struct Violation
    {
        Position position;
        Annotation annotation{Annotation::NoEscape};
        std::vector<CompilerHint> observedHints;
    };

    struct ReconcileResult
    {
        std::vector<Violation> violations;
        bool valid{true};
    };

    /**
     * Checks every annotation against the hints recorded for its position.
     * One error diagnostic is reported per violated annotation, in position
     * order. Hints without a matching annotation are ignored.
     */
    [[nodiscard]] ReconcileResult reconcile(const HintIndex& hints, const AnnotationIndex& annotations, DiagnosticSink& sink);

    // True when `hints` contradict `annotation`.
    [[nodiscard]] bool isViolated(Annotation annotation, const std::vector<CompilerHint>& hints);
} // namespace escapelint::reconcile
