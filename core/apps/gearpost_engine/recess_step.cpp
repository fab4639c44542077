/**
 * Recess step implementation
 */

#include "recess_step.h"
#include "errors.h"
#include "kernel.h"

#include <iostream>

namespace gearpost {

RecessStep::RecessStep(const GearFrame& frame)
    : ModificationStep(frame)
{
}

const StepDescriptor& RecessStep::Descriptor() const {
    static const StepDescriptor descriptor{
        "recess",
        {param::RECESS},
        {
            ParamSpec::Optional(param::RECESS, ParamType::LENGTH),
            ParamSpec::Required(param::RECESS_D, ParamType::LENGTH),
            ParamSpec::Optional(param::HUB_D, ParamType::LENGTH),
        }
    };
    return descriptor;
}

TopoDS_Shape RecessStep::Apply(const TopoDS_Shape& body, const BoundParams& params) const {
    std::optional<double> depth = params.OptionalLength(param::RECESS);
    if (!depth) {
        return body;
    }

    double recess_d = params.RequireLength(param::RECESS_D);
    std::optional<double> hub_d = params.OptionalLength(param::HUB_D);

    if (!(*depth > 0.0)) {
        throw_invalid(name(), param::RECESS, "depth must be positive");
    }
    if (!(recess_d > 0.0)) {
        throw_invalid(name(), param::RECESS_D, "diameter must be positive");
    }
    if (hub_d && !(*hub_d > 0.0 && *hub_d < recess_d)) {
        throw_invalid(name(), param::HUB_D, "must be positive and smaller than recess_d");
    }

    std::cout << "    Recess depth " << *depth << "mm, diameter " << recess_d << "mm";
    if (hub_d) {
        std::cout << " around hub " << *hub_d << "mm";
    }
    std::cout << "\n";

    // Sketch on the +Z face, cut downwards (negative offset)
    const gp_Ax1 axis = GearFrame::RotationAxis();
    AxialFace top = kernel::SelectAxialFace(body, axis, true);

    gp_Vec up(axis.Direction());
    gp_Ax2 plane(axis.Location().Translated(up * (top.level + FACE_OVERLAP)), axis.Direction());

    std::optional<double> inner_r;
    if (hub_d) {
        inner_r = *hub_d / 2.0;
    }

    // A recess wider than the body simply clips at the outer surface
    TopoDS_Face annulus = kernel::MakeAnnulusFace(plane, recess_d / 2.0, inner_r);
    TopoDS_Shape cutter = kernel::Extrude(annulus, up * -(*depth + FACE_OVERLAP));

    return kernel::Cut(body, cutter);
}

} // namespace gearpost
