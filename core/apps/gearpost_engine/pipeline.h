/**
 * Modification pipeline
 *
 * Runs the fixed step sequence bore -> recess -> hub -> spokes -> chamfer
 * over a gear blank. Order matters: the hub grows from the recessed face
 * and the chamfer sees the final rim.
 */

#pragma once

#include <memory>
#include <string>
#include <vector>

#include <TopoDS_Shape.hxx>

#include "gear_frame.h"
#include "modification_step.h"
#include "parameters.h"

namespace gearpost {

/**
 * Outcome of one step in the last run
 */
struct StepReport {
    std::string name;
    bool applied;        // false when the trigger was absent
    double elapsed_ms;

    StepReport()
        : applied(false)
        , elapsed_ms(0.0)
    {}
};

class ModificationPipeline {
public:
    explicit ModificationPipeline(const GearFrame& frame);
    ~ModificationPipeline();

    /**
     * Apply every step in order and return the final body
     *
     * The input body is never modified. Any error aborts the run.
     * @throws PostProcessError
     */
    TopoDS_Shape Apply(const TopoDS_Shape& body, const ParameterPool& pool);

    /**
     * Steps in execution order
     */
    const std::vector<std::unique_ptr<ModificationStep>>& GetSteps() const { return steps_; }

    /**
     * Per-step reports of the last Apply()
     */
    const std::vector<StepReport>& GetReports() const { return reports_; }

    const GearFrame& GetFrame() const { return frame_; }

private:
    TopoDS_Shape RunStep(const ModificationStep& step, const TopoDS_Shape& body,
                         const ParameterPool& pool, StepReport& report);

    GearFrame frame_;
    std::vector<std::unique_ptr<ModificationStep>> steps_;
    std::vector<StepReport> reports_;
};

} // namespace gearpost
