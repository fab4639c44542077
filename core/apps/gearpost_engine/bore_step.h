/**
 * Bore step
 *
 * Cuts a cylindrical through-hole on the rotation axis.
 * Trigger: bore_d.
 */

#pragma once

#include "modification_step.h"

namespace gearpost {

class BoreStep : public ModificationStep {
public:
    explicit BoreStep(const GearFrame& frame);

    const StepDescriptor& Descriptor() const override;

    TopoDS_Shape Apply(const TopoDS_Shape& body, const BoundParams& params) const override;
};

} // namespace gearpost
