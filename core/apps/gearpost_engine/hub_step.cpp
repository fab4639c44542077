/**
 * Hub step implementation
 */

#include "hub_step.h"
#include "errors.h"
#include "kernel.h"

#include <iostream>

namespace gearpost {

HubStep::HubStep(const GearFrame& frame)
    : ModificationStep(frame)
{
}

const StepDescriptor& HubStep::Descriptor() const {
    static const StepDescriptor descriptor{
        "hub",
        {param::HUB_LENGTH},
        {
            ParamSpec::Optional(param::HUB_LENGTH, ParamType::LENGTH),
            ParamSpec::Required(param::HUB_D, ParamType::LENGTH),
            ParamSpec::Optional(param::BORE_D, ParamType::LENGTH),
        }
    };
    return descriptor;
}

TopoDS_Shape HubStep::Apply(const TopoDS_Shape& body, const BoundParams& params) const {
    std::optional<double> hub_length = params.OptionalLength(param::HUB_LENGTH);
    if (!hub_length) {
        return body;
    }

    // Explicitly disabling the diameter is still a missing diameter
    double hub_d = params.RequireLength(param::HUB_D);
    std::optional<double> bore_d = params.OptionalLength(param::BORE_D);

    if (!(*hub_length > 0.0)) {
        throw_invalid(name(), param::HUB_LENGTH, "length must be positive");
    }
    if (!(hub_d > 0.0)) {
        throw_invalid(name(), param::HUB_D, "diameter must be positive");
    }
    if (bore_d && !(*bore_d > 0.0 && *bore_d < hub_d)) {
        throw_invalid(name(), param::BORE_D, "must be positive and smaller than hub_d");
    }

    std::cout << "    Hub diameter " << hub_d << "mm, length " << *hub_length << "mm\n";

    const gp_Ax1 axis = GearFrame::RotationAxis();
    AxialFace top = kernel::SelectAxialFace(body, axis, true);

    gp_Vec up(axis.Direction());
    gp_Ax2 plane(axis.Location().Translated(up * top.level), axis.Direction());

    std::optional<double> inner_r;
    if (bore_d) {
        inner_r = *bore_d / 2.0;
    }

    TopoDS_Face section = kernel::MakeAnnulusFace(plane, hub_d / 2.0, inner_r);
    TopoDS_Shape boss = kernel::Extrude(section, up * *hub_length);

    return kernel::Fuse(body, boss);
}

} // namespace gearpost
