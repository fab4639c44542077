/**
 * Chamfer step implementation
 */

#include "chamfer_step.h"
#include "errors.h"

#include <iostream>

namespace gearpost {

namespace {

const char* STEP_NAME = "chamfer";

std::optional<ChamferExtent> to_extent(const BoundParams& params, const char* name) {
    const ParamValue& value = params.Get(name);
    if (value.is_absent()) {
        return std::nullopt;
    }

    // A scalar is read as (value, value)
    std::pair<double, double> extents = value.pair();
    ChamferExtent extent{extents.first, extents.second};

    if (!(extent.axial > 0.0) || !(extent.radial > 0.0)) {
        throw_invalid(STEP_NAME, name, "chamfer extents must be positive");
    }
    return extent;
}

} // namespace

ChamferPlan ResolveChamfers(const BoundParams& params) {
    ChamferPlan plan;
    std::optional<ChamferExtent> both = to_extent(params, param::CHAMFER);

    plan.top = to_extent(params, param::CHAMFER_TOP);
    plan.bottom = to_extent(params, param::CHAMFER_BOTTOM);

    if (!plan.top) plan.top = both;
    if (!plan.bottom) plan.bottom = both;

    return plan;
}

ChamferStep::ChamferStep(const GearFrame& frame)
    : ModificationStep(frame)
{
}

const StepDescriptor& ChamferStep::Descriptor() const {
    static const StepDescriptor descriptor{
        STEP_NAME,
        {param::CHAMFER, param::CHAMFER_TOP, param::CHAMFER_BOTTOM},
        {
            ParamSpec::Optional(param::CHAMFER, ParamType::LENGTH_OR_PAIR),
            ParamSpec::Optional(param::CHAMFER_TOP, ParamType::LENGTH_OR_PAIR),
            ParamSpec::Optional(param::CHAMFER_BOTTOM, ParamType::LENGTH_OR_PAIR),
        }
    };
    return descriptor;
}

Profile2D ChamferStep::CutterProfile(const ChamferExtent& extent, bool top) const {
    const double ra = frame_.addendum_radius;
    const double w = frame_.width;
    const double e = OVERLAP;

    Profile2D profile;
    if (top) {
        profile.start = gp_Pnt2d(ra - extent.radial, w + e);
        profile.segments.push_back(ProfileSegment::Line(gp_Pnt2d(ra + e, w + e)));
        profile.segments.push_back(ProfileSegment::Line(gp_Pnt2d(ra + e, w - extent.axial)));
    } else {
        profile.start = gp_Pnt2d(ra + e, extent.axial);
        profile.segments.push_back(ProfileSegment::Line(gp_Pnt2d(ra + e, -e)));
        profile.segments.push_back(ProfileSegment::Line(gp_Pnt2d(ra - extent.radial, -e)));
    }
    profile.segments.push_back(ProfileSegment::Line(profile.start));
    return profile;
}

TopoDS_Shape ChamferStep::Apply(const TopoDS_Shape& body, const BoundParams& params) const {
    ChamferPlan plan = ResolveChamfers(params);
    if (plan.empty()) {
        return body;
    }

    const gp_Ax1 axis = GearFrame::RotationAxis();
    TopoDS_Shape result = body;

    if (plan.top) {
        std::cout << "    Top chamfer axial " << plan.top->axial
                  << "mm, radial " << plan.top->radial << "mm\n";
        TopoDS_Face face = kernel::MakeProfileFace(CutterProfile(*plan.top, true),
                                                   GearFrame::AxialPlane());
        result = kernel::Cut(result, kernel::Revolve(face, axis));
    }

    if (plan.bottom) {
        std::cout << "    Bottom chamfer axial " << plan.bottom->axial
                  << "mm, radial " << plan.bottom->radial << "mm\n";
        TopoDS_Face face = kernel::MakeProfileFace(CutterProfile(*plan.bottom, false),
                                                   GearFrame::AxialPlane());
        result = kernel::Cut(result, kernel::Revolve(face, axis));
    }

    return result;
}

} // namespace gearpost
