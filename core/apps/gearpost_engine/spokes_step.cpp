/**
 * Spokes step implementation
 */

#include "spokes_step.h"
#include "errors.h"

#include <algorithm>
#include <cmath>
#include <iostream>

// Define M_PI if not already defined
#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

namespace gearpost {

namespace {

const char* STEP_NAME = "spokes";

// Radius nudge: relative to the outer cutout radius, with a floor
constexpr double NUDGE_RELATIVE = 1e-5;
constexpr double NUDGE_MIN = 1e-6;

gp_Pnt2d polar(double angle, double radius) {
    return gp_Pnt2d(std::cos(angle) * radius, std::sin(angle) * radius);
}

} // namespace

Profile2D SpokeWedge::Profile() const {
    double a3 = tau - a2;
    double a4 = tau - a1;
    double mid = tau / 2.0;

    Profile2D profile;
    if (pointed) {
        profile.start = polar(mid, r1);
        profile.segments.push_back(ProfileSegment::Line(polar(a2, r2)));
        profile.segments.push_back(ProfileSegment::Arc(polar(mid, r2), polar(a3, r2)));
        profile.segments.push_back(ProfileSegment::Line(profile.start));
        return profile;
    }

    profile.start = polar(a1, r1);
    profile.segments.push_back(ProfileSegment::Line(polar(a2, r2)));
    profile.segments.push_back(ProfileSegment::Arc(polar(mid, r2), polar(a3, r2)));
    profile.segments.push_back(ProfileSegment::Line(polar(a4, r1)));
    profile.segments.push_back(ProfileSegment::Arc(polar(mid, r1), polar(a1, r1)));
    return profile;
}

SpokeWedge ComputeSpokeWedge(int n_spokes,
                             std::optional<double> spokes_id,
                             double spokes_od,
                             double spoke_width)
{
    if (n_spokes <= 1) {
        throw_invalid(STEP_NAME, param::N_SPOKES, "number of spokes must be > 1");
    }
    if (!(spoke_width > 0.0)) {
        throw_invalid(STEP_NAME, param::SPOKE_WIDTH, "width must be positive");
    }
    if (!(spokes_od > 0.0)) {
        throw_invalid(STEP_NAME, param::SPOKES_OD, "diameter must be positive");
    }
    if (spokes_id && !(*spokes_id > 0.0)) {
        throw_invalid(STEP_NAME, param::SPOKES_ID, "diameter must be positive");
    }

    SpokeWedge wedge;
    wedge.n_spokes = n_spokes;
    wedge.tau = 2.0 * M_PI / n_spokes;

    double half_width = spoke_width / 2.0;

    // Adjacent spoke edges meet at this radius; a window cannot start closer in
    double r_meet = half_width / std::sin(wedge.tau / 2.0);

    double r1 = r_meet;
    wedge.pointed = true;
    if (spokes_id && *spokes_id / 2.0 > r_meet) {
        r1 = *spokes_id / 2.0;
        wedge.pointed = false;
    }
    double r2 = spokes_od / 2.0;

    wedge.epsilon = std::max(NUDGE_MIN, NUDGE_RELATIVE * r2);
    wedge.r1 = r1 + wedge.epsilon;
    wedge.r2 = r2 - wedge.epsilon;

    if (!(wedge.r1 < wedge.r2)) {
        throw_invalid(STEP_NAME, param::SPOKES_OD,
                      "no room for spoke windows inside the inner radius " +
                      std::to_string(r1));
    }

    wedge.a1 = std::asin(half_width / wedge.r1);
    wedge.a2 = std::asin(half_width / wedge.r2);

    return wedge;
}

SpokesStep::SpokesStep(const GearFrame& frame)
    : ModificationStep(frame)
{
}

const StepDescriptor& SpokesStep::Descriptor() const {
    static const StepDescriptor descriptor{
        STEP_NAME,
        {param::N_SPOKES},
        {
            ParamSpec::Optional(param::N_SPOKES, ParamType::COUNT),
            ParamSpec::Optional(param::SPOKES_ID, ParamType::LENGTH),
            ParamSpec::Required(param::SPOKES_OD, ParamType::LENGTH),
            ParamSpec::Required(param::SPOKE_WIDTH, ParamType::LENGTH),
            ParamSpec::Optional(param::SPOKE_FILLET, ParamType::LENGTH),
        }
    };
    return descriptor;
}

TopoDS_Shape SpokesStep::MakeCutter(const SpokeWedge& wedge, std::optional<double> fillet) const {
    const gp_Ax1 axis = GearFrame::RotationAxis();
    gp_Vec up(axis.Direction());

    gp_Ax2 sketch = GearFrame::WorkingPlane();
    sketch.SetLocation(sketch.Location().Translated(up * -BOTTOM_OFFSET));

    TopoDS_Face face = kernel::MakeProfileFace(wedge.Profile(), sketch);
    TopoDS_Shape cutter = kernel::Extrude(face, up * (frame_.width + EXTRA_HEIGHT));

    if (fillet) {
        cutter = kernel::FilletAxialEdges(cutter, axis, *fillet);
    }
    return cutter;
}

TopoDS_Shape SpokesStep::Apply(const TopoDS_Shape& body, const BoundParams& params) const {
    std::optional<int> n_spokes = params.OptionalCount(param::N_SPOKES);
    if (!n_spokes) {
        return body;
    }

    double spokes_od = params.RequireLength(param::SPOKES_OD);
    double spoke_width = params.RequireLength(param::SPOKE_WIDTH);
    std::optional<double> spokes_id = params.OptionalLength(param::SPOKES_ID);
    std::optional<double> fillet = params.OptionalLength(param::SPOKE_FILLET);

    if (fillet && !(*fillet > 0.0)) {
        throw_invalid(name(), param::SPOKE_FILLET, "radius must be positive");
    }

    SpokeWedge wedge = ComputeSpokeWedge(*n_spokes, spokes_id, spokes_od, spoke_width);

    std::cout << "    " << wedge.n_spokes << " spokes, width " << spoke_width
              << "mm, window r1=" << wedge.r1 << " r2=" << wedge.r2 << "\n";

    TopoDS_Shape cutter = MakeCutter(wedge, fillet);
    const gp_Ax1 axis = GearFrame::RotationAxis();

    TopoDS_Shape result = body;
    for (int i = 0; i < wedge.n_spokes; i++) {
        result = kernel::Cut(result, kernel::Rotate(cutter, axis, wedge.tau * i));
    }
    return result;
}

} // namespace gearpost
