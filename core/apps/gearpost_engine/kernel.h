/**
 * Geometry kernel facade
 *
 * The handful of OpenCASCADE operations the post-processing steps need.
 * Every function returns a new shape and leaves its inputs untouched.
 * Failures are reported as PostProcessError(GeometryFailure); the step
 * name is filled in by the pipeline.
 */

#pragma once

#include <optional>
#include <vector>

#include <TopoDS_Face.hxx>
#include <TopoDS_Shape.hxx>
#include <gp_Ax1.hxx>
#include <gp_Ax2.hxx>
#include <gp_Pnt.hxx>
#include <gp_Pnt2d.hxx>
#include <gp_Vec.hxx>

namespace gearpost {

/**
 * Line or three-point arc ending at `end`
 */
struct ProfileSegment {
    enum class Type {
        LINE,
        ARC
    };

    Type type;
    gp_Pnt2d through;   // Interior point, arcs only
    gp_Pnt2d end;

    static ProfileSegment Line(const gp_Pnt2d& end) {
        return ProfileSegment{Type::LINE, gp_Pnt2d(), end};
    }
    static ProfileSegment Arc(const gp_Pnt2d& through, const gp_Pnt2d& end) {
        return ProfileSegment{Type::ARC, through, end};
    }
};

/**
 * Closed planar outline: start point plus segments, the last of which
 * must end back at `start`
 */
struct Profile2D {
    gp_Pnt2d start;
    std::vector<ProfileSegment> segments;
};

/**
 * Planar face selected on the rotation axis
 */
struct AxialFace {
    TopoDS_Face face;
    double level = 0.0;   // Axial coordinate of the face plane
};

namespace kernel {

/**
 * Map sketch coordinates (u, v) on `plane` to 3D
 */
gp_Pnt ToPlane(const gp_Ax2& plane, const gp_Pnt2d& uv);

/**
 * Build a face from a closed profile sketched on `plane`
 */
TopoDS_Face MakeProfileFace(const Profile2D& profile, const gp_Ax2& plane);

/**
 * Disk (or annulus, when `inner_radius` is given) centered on the plane origin
 */
TopoDS_Face MakeAnnulusFace(const gp_Ax2& plane, double outer_radius,
                            std::optional<double> inner_radius);

TopoDS_Shape Extrude(const TopoDS_Shape& profile, const gp_Vec& direction);
TopoDS_Shape Revolve(const TopoDS_Shape& profile, const gp_Ax1& axis);

TopoDS_Shape Cut(const TopoDS_Shape& body, const TopoDS_Shape& tool);
TopoDS_Shape Fuse(const TopoDS_Shape& body, const TopoDS_Shape& tool);

/**
 * Remove a cylinder of `radius` around `axis` through the full body
 */
TopoDS_Shape CutThrough(const TopoDS_Shape& body, const gp_Ax1& axis, double radius);

/**
 * Planar face facing +axis (`positive`) or -axis with the extreme centroid
 */
AxialFace SelectAxialFace(const TopoDS_Shape& body, const gp_Ax1& axis, bool positive);

/**
 * Fillet every straight edge parallel to `axis`
 */
TopoDS_Shape FilletAxialEdges(const TopoDS_Shape& solid, const gp_Ax1& axis, double radius);

TopoDS_Shape Rotate(const TopoDS_Shape& shape, const gp_Ax1& axis, double angle);

double Volume(const TopoDS_Shape& shape);
int CountSolids(const TopoDS_Shape& shape);

} // namespace kernel

} // namespace gearpost
