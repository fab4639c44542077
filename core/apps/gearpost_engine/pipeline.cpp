/**
 * Modification pipeline implementation
 */

#include "pipeline.h"
#include "errors.h"

#include <chrono>
#include <iostream>

#include <Standard_Failure.hxx>
#include <Standard_Type.hxx>

#include "bore_step.h"
#include "chamfer_step.h"
#include "hub_step.h"
#include "recess_step.h"
#include "spokes_step.h"

namespace gearpost {

ModificationPipeline::ModificationPipeline(const GearFrame& frame)
    : frame_(frame)
{
    steps_.push_back(std::make_unique<BoreStep>(frame_));
    steps_.push_back(std::make_unique<RecessStep>(frame_));
    steps_.push_back(std::make_unique<HubStep>(frame_));
    steps_.push_back(std::make_unique<SpokesStep>(frame_));
    steps_.push_back(std::make_unique<ChamferStep>(frame_));
}

ModificationPipeline::~ModificationPipeline() {
}

TopoDS_Shape ModificationPipeline::Apply(const TopoDS_Shape& body, const ParameterPool& pool) {
    reports_.clear();

    frame_.Validate();
    if (body.IsNull()) {
        throw_geometry("", "input", "body is null");
    }

    TopoDS_Shape current = body;
    for (const auto& step : steps_) {
        StepReport report;
        report.name = step->Descriptor().name;

        current = RunStep(*step, current, pool, report);
        reports_.push_back(report);
    }

    return current;
}

TopoDS_Shape ModificationPipeline::RunStep(const ModificationStep& step,
                                           const TopoDS_Shape& body,
                                           const ParameterPool& pool,
                                           StepReport& report)
{
    const std::string& name = step.Descriptor().name;
    auto start_time = std::chrono::high_resolution_clock::now();

    TopoDS_Shape result;
    try {
        // Bound fresh for every step, nothing carries over
        BoundParams bound = ParameterBinder::Bind(step.Descriptor(), pool);

        if (!bound.triggered()) {
            std::cout << "  - Skipping " << name << " step (not requested)\n";
            return body;
        }

        std::cout << "  - Running " << name << " step...\n";
        result = step.Apply(body, bound);
        report.applied = true;
    }
    catch (const PostProcessError& e) {
        if (!e.step().empty()) throw;
        throw PostProcessError(e.kind(), name, e.subject(), e.detail());
    }
    catch (const Standard_Failure& e) {
        const char* message = e.GetMessageString();
        throw_geometry(name, e.DynamicType()->Name(),
                       (message != nullptr && message[0] != '\0') ? message : "kernel exception");
    }

    auto end_time = std::chrono::high_resolution_clock::now();
    report.elapsed_ms = std::chrono::duration<double, std::milli>(end_time - start_time).count();

    std::cout << "  ✓ " << name << " applied (" << report.elapsed_ms << "ms)\n";

    return result;
}

} // namespace gearpost
