#include "protocol/progression.h"

namespace optum {

StepId next_step(const StepGraph& graph, const StepId& current,
                 ResponseQuality verdict, bool red_flag) {
    if (red_flag) return kEscalateStep;
    if (verdict != ResponseQuality::Clear) return current;

    const ProtocolStep& step = graph.at(current);
    if (step.is_terminal()) return current;
    return *step.successor;
}

} // namespace optum
