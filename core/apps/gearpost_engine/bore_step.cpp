/**
 * Bore step implementation
 */

#include "bore_step.h"
#include "errors.h"
#include "kernel.h"

#include <iostream>

namespace gearpost {

BoreStep::BoreStep(const GearFrame& frame)
    : ModificationStep(frame)
{
}

const StepDescriptor& BoreStep::Descriptor() const {
    static const StepDescriptor descriptor{
        "bore",
        {param::BORE_D},
        {
            ParamSpec::Optional(param::BORE_D, ParamType::LENGTH),
        }
    };
    return descriptor;
}

TopoDS_Shape BoreStep::Apply(const TopoDS_Shape& body, const BoundParams& params) const {
    std::optional<double> bore_d = params.OptionalLength(param::BORE_D);
    if (!bore_d) {
        return body;
    }

    if (!(*bore_d > 0.0)) {
        throw_invalid(name(), param::BORE_D, "diameter must be positive");
    }

    std::cout << "    Bore diameter " << *bore_d << "mm\n";

    return kernel::CutThrough(body, GearFrame::RotationAxis(), *bore_d / 2.0);
}

} // namespace gearpost
