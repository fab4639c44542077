/**
 * Chamfer step
 *
 * Bevels the outer rim at the top and/or bottom face by subtracting a
 * revolved triangle anchored at the addendum radius.
 * Triggers: chamfer, chamfer_top, chamfer_bottom.
 *
 * chamfer seeds whichever of chamfer_top / chamfer_bottom is absent.
 * Each value is a width (equal axial and radial extent) or an
 * (axial, radial) pair.
 */

#pragma once

#include <optional>

#include "kernel.h"
#include "modification_step.h"

namespace gearpost {

/**
 * Chamfer size in the axial plane
 */
struct ChamferExtent {
    double axial;
    double radial;

    bool operator==(const ChamferExtent& other) const {
        return axial == other.axial && radial == other.radial;
    }
};

/**
 * Which rim edges get chamfered, and how much
 */
struct ChamferPlan {
    std::optional<ChamferExtent> top;
    std::optional<ChamferExtent> bottom;

    bool empty() const { return !top && !bottom; }
};

/**
 * Resolve chamfer / chamfer_top / chamfer_bottom into a plan
 * Throws PostProcessError(InvalidParameter) for non-positive extents.
 */
ChamferPlan ResolveChamfers(const BoundParams& params);

class ChamferStep : public ModificationStep {
public:
    explicit ChamferStep(const GearFrame& frame);

    const StepDescriptor& Descriptor() const override;

    TopoDS_Shape Apply(const TopoDS_Shape& body, const BoundParams& params) const override;

    /**
     * Cutter triangle in the axial plane (u = radius, v = axial position)
     */
    Profile2D CutterProfile(const ChamferExtent& extent, bool top) const;

private:
    // Cutter overshoot past the rim and the end face
    static constexpr double OVERLAP = 0.01;
};

} // namespace gearpost
