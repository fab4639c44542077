/**
 * Recess step
 *
 * Cuts a blind pocket into the +Z face. With a hub diameter the pocket is
 * an annulus that leaves a central disk standing for the hub.
 * Trigger: recess (depth).
 */

#pragma once

#include "modification_step.h"

namespace gearpost {

class RecessStep : public ModificationStep {
public:
    explicit RecessStep(const GearFrame& frame);

    const StepDescriptor& Descriptor() const override;

    TopoDS_Shape Apply(const TopoDS_Shape& body, const BoundParams& params) const override;

private:
    // Cutter starts this far above the selected face
    static constexpr double FACE_OVERLAP = 0.01;
};

} // namespace gearpost
