#pragma once

#include "protocol/step_graph.h"
#include "quality/quality_gate.h"

namespace optum {

// Red flag wins outright; anything short of clear repeats the step;
// otherwise advance along the graph.
StepId next_step(const StepGraph& graph, const StepId& current,
                 ResponseQuality verdict, bool red_flag);

} // namespace optum
