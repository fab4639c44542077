/**
 * Hub step
 *
 * Extrudes a cylindrical boss from the +Z face, hollow when a bore
 * diameter is given. Runs after the recess so it grows from the
 * recessed face.
 * Trigger: hub_length.
 */

#pragma once

#include "modification_step.h"

namespace gearpost {

class HubStep : public ModificationStep {
public:
    explicit HubStep(const GearFrame& frame);

    const StepDescriptor& Descriptor() const override;

    TopoDS_Shape Apply(const TopoDS_Shape& body, const BoundParams& params) const override;
};

} // namespace gearpost
