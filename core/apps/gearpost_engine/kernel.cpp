/**
 * Geometry kernel facade implementation (OpenCASCADE)
 */

#include "kernel.h"
#include "errors.h"

#include <algorithm>
#include <cmath>
#include <limits>

// Define M_PI if not already defined
#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

// OpenCASCADE includes
#include <BRepAdaptor_Curve.hxx>
#include <BRepAdaptor_Surface.hxx>
#include <BRepAlgoAPI_Cut.hxx>
#include <BRepAlgoAPI_Fuse.hxx>
#include <BRepBndLib.hxx>
#include <BRepBuilderAPI_MakeEdge.hxx>
#include <BRepBuilderAPI_MakeFace.hxx>
#include <BRepBuilderAPI_MakeWire.hxx>
#include <BRepBuilderAPI_Transform.hxx>
#include <BRepFilletAPI_MakeFillet.hxx>
#include <BRepGProp.hxx>
#include <BRepPrimAPI_MakeCylinder.hxx>
#include <BRepPrimAPI_MakePrism.hxx>
#include <BRepPrimAPI_MakeRevol.hxx>
#include <Bnd_Box.hxx>
#include <GC_MakeArcOfCircle.hxx>
#include <GProp_GProps.hxx>
#include <GeomAbs_CurveType.hxx>
#include <GeomAbs_SurfaceType.hxx>
#include <Geom_TrimmedCurve.hxx>
#include <TopExp.hxx>
#include <TopExp_Explorer.hxx>
#include <TopTools_IndexedMapOfShape.hxx>
#include <TopoDS.hxx>
#include <TopoDS_Edge.hxx>
#include <TopoDS_Wire.hxx>
#include <gp_Ax3.hxx>
#include <gp_Circ.hxx>
#include <gp_Pln.hxx>
#include <gp_Trsf.hxx>

namespace gearpost {
namespace kernel {

namespace {

// Closure tolerance for sketched profiles
constexpr double PROFILE_CLOSURE_TOL = 1e-6;

// Angular tolerance for "parallel to the axis" tests (radians)
constexpr double AXIS_ANGULAR_TOL = 1e-6;

/**
 * Unwrap a boolean result: single solid when there is exactly one,
 * the compound otherwise
 */
TopoDS_Shape solid_result(const TopoDS_Shape& result, const char* operation) {
    if (result.IsNull()) {
        throw_geometry("", operation, "kernel returned a null shape");
    }

    TopoDS_Shape first;
    int count = 0;
    for (TopExp_Explorer exp(result, TopAbs_SOLID); exp.More(); exp.Next()) {
        if (count == 0) first = exp.Current();
        count++;
    }

    if (count == 0) {
        throw_geometry("", operation, "result contains no solid");
    }
    return count == 1 ? first : result;
}

TopoDS_Edge make_edge(const gp_Pnt& from, const ProfileSegment& segment, const gp_Ax2& plane) {
    gp_Pnt to = ToPlane(plane, segment.end);

    if (segment.type == ProfileSegment::Type::LINE) {
        BRepBuilderAPI_MakeEdge edge(from, to);
        if (!edge.IsDone()) {
            throw_geometry("", "profile", "degenerate line segment");
        }
        return edge.Edge();
    }

    GC_MakeArcOfCircle arc(from, ToPlane(plane, segment.through), to);
    if (!arc.IsDone()) {
        throw_geometry("", "profile", "arc points are collinear or coincident");
    }

    BRepBuilderAPI_MakeEdge edge(arc.Value());
    if (!edge.IsDone()) {
        throw_geometry("", "profile", "failed to build arc edge");
    }
    return edge.Edge();
}

TopoDS_Wire make_circle_wire(const gp_Ax2& plane, double radius) {
    gp_Circ circle(plane, radius);
    BRepBuilderAPI_MakeEdge edge(circle);
    if (!edge.IsDone()) {
        throw_geometry("", "circle", "failed to build circle edge");
    }
    BRepBuilderAPI_MakeWire wire(edge.Edge());
    if (!wire.IsDone()) {
        throw_geometry("", "circle", "failed to build circle wire");
    }
    return wire.Wire();
}

} // namespace

gp_Pnt ToPlane(const gp_Ax2& plane, const gp_Pnt2d& uv) {
    gp_Vec offset = gp_Vec(plane.XDirection()) * uv.X() + gp_Vec(plane.YDirection()) * uv.Y();
    return plane.Location().Translated(offset);
}

TopoDS_Face MakeProfileFace(const Profile2D& profile, const gp_Ax2& plane) {
    if (profile.segments.size() < 2) {
        throw_geometry("", "profile", "a closed profile needs at least two segments");
    }
    if (profile.segments.back().end.Distance(profile.start) > PROFILE_CLOSURE_TOL) {
        throw_geometry("", "profile", "profile is not closed");
    }

    BRepBuilderAPI_MakeWire wire;
    gp_Pnt current = ToPlane(plane, profile.start);

    for (const ProfileSegment& segment : profile.segments) {
        wire.Add(make_edge(current, segment, plane));
        if (!wire.IsDone()) {
            throw_geometry("", "profile", "segments do not connect");
        }
        current = ToPlane(plane, segment.end);
    }

    BRepBuilderAPI_MakeFace face(wire.Wire(), Standard_True);
    if (!face.IsDone()) {
        throw_geometry("", "profile", "wire does not bound a planar face");
    }
    return face.Face();
}

TopoDS_Face MakeAnnulusFace(const gp_Ax2& plane, double outer_radius,
                            std::optional<double> inner_radius)
{
    if (!(outer_radius > 0.0)) {
        throw_geometry("", "annulus", "outer radius must be positive");
    }

    BRepBuilderAPI_MakeFace face(gp_Pln(gp_Ax3(plane)), make_circle_wire(plane, outer_radius));
    if (!face.IsDone()) {
        throw_geometry("", "annulus", "failed to build disk face");
    }

    if (inner_radius) {
        if (!(*inner_radius > 0.0) || *inner_radius >= outer_radius) {
            throw_geometry("", "annulus", "inner radius must lie strictly inside the outer radius");
        }
        // Holes run opposite to the outer boundary
        TopoDS_Wire hole = make_circle_wire(plane, *inner_radius);
        hole.Reverse();
        face.Add(hole);
        if (!face.IsDone()) {
            throw_geometry("", "annulus", "failed to add inner boundary");
        }
    }

    return face.Face();
}

TopoDS_Shape Extrude(const TopoDS_Shape& profile, const gp_Vec& direction) {
    BRepPrimAPI_MakePrism prism(profile, direction);
    prism.Build();
    if (!prism.IsDone()) {
        throw_geometry("", "extrude", "prism construction failed");
    }
    return prism.Shape();
}

TopoDS_Shape Revolve(const TopoDS_Shape& profile, const gp_Ax1& axis) {
    BRepPrimAPI_MakeRevol revol(profile, axis, 2.0 * M_PI);
    revol.Build();
    if (!revol.IsDone()) {
        throw_geometry("", "revolve", "revolution failed");
    }
    return revol.Shape();
}

TopoDS_Shape Cut(const TopoDS_Shape& body, const TopoDS_Shape& tool) {
    BRepAlgoAPI_Cut op(body, tool);
    if (!op.IsDone() || op.HasErrors()) {
        throw_geometry("", "cut", "boolean subtraction failed");
    }
    return solid_result(op.Shape(), "cut");
}

TopoDS_Shape Fuse(const TopoDS_Shape& body, const TopoDS_Shape& tool) {
    BRepAlgoAPI_Fuse op(body, tool);
    if (!op.IsDone() || op.HasErrors()) {
        throw_geometry("", "fuse", "boolean union failed");
    }
    return solid_result(op.Shape(), "fuse");
}

TopoDS_Shape CutThrough(const TopoDS_Shape& body, const gp_Ax1& axis, double radius) {
    Bnd_Box bbox;
    BRepBndLib::Add(body, bbox);
    if (bbox.IsVoid()) {
        throw_geometry("", "cut_through", "body has an empty bounding box");
    }

    double xmin, ymin, zmin, xmax, ymax, zmax;
    bbox.Get(xmin, ymin, zmin, xmax, ymax, zmax);

    // Axial extent of the box: project its corners onto the axis
    gp_Vec dir(axis.Direction());
    double tmin = std::numeric_limits<double>::max();
    double tmax = -std::numeric_limits<double>::max();
    for (int i = 0; i < 8; i++) {
        gp_Pnt corner((i & 1) ? xmax : xmin, (i & 2) ? ymax : ymin, (i & 4) ? zmax : zmin);
        double t = gp_Vec(axis.Location(), corner).Dot(dir);
        tmin = std::min(tmin, t);
        tmax = std::max(tmax, t);
    }

    double margin = 1.0 + 0.1 * (tmax - tmin);
    gp_Ax2 base(axis.Location().Translated(dir * (tmin - margin)), axis.Direction());

    BRepPrimAPI_MakeCylinder cylinder(base, radius, (tmax - tmin) + 2.0 * margin);
    cylinder.Build();
    if (!cylinder.IsDone()) {
        throw_geometry("", "cut_through", "cylinder construction failed");
    }

    return Cut(body, cylinder.Shape());
}

AxialFace SelectAxialFace(const TopoDS_Shape& body, const gp_Ax1& axis, bool positive) {
    gp_Dir wanted = positive ? axis.Direction() : axis.Direction().Reversed();
    gp_Vec along(axis.Direction());

    AxialFace best;
    bool found = false;

    for (TopExp_Explorer exp(body, TopAbs_FACE); exp.More(); exp.Next()) {
        TopoDS_Face face = TopoDS::Face(exp.Current());

        BRepAdaptor_Surface surface(face);
        if (surface.GetType() != GeomAbs_Plane) continue;

        gp_Dir normal = surface.Plane().Axis().Direction();
        if (face.Orientation() == TopAbs_REVERSED) {
            normal.Reverse();
        }
        if (!normal.IsEqual(wanted, AXIS_ANGULAR_TOL)) continue;

        GProp_GProps props;
        BRepGProp::SurfaceProperties(face, props);
        double level = gp_Vec(axis.Location(), props.CentreOfMass()).Dot(along);

        bool better = positive ? level > best.level : level < best.level;
        if (!found || better) {
            best.face = face;
            best.level = level;
            found = true;
        }
    }

    if (!found) {
        throw_geometry("", "select_face", positive ? "no planar face facing +axis"
                                                   : "no planar face facing -axis");
    }
    return best;
}

TopoDS_Shape FilletAxialEdges(const TopoDS_Shape& solid, const gp_Ax1& axis, double radius) {
    TopTools_IndexedMapOfShape edges;
    TopExp::MapShapes(solid, TopAbs_EDGE, edges);

    BRepFilletAPI_MakeFillet fillet(solid);
    int added = 0;

    for (int i = 1; i <= edges.Extent(); i++) {
        TopoDS_Edge edge = TopoDS::Edge(edges(i));
        BRepAdaptor_Curve curve(edge);

        if (curve.GetType() != GeomAbs_Line) continue;
        if (!curve.Line().Direction().IsParallel(axis.Direction(), AXIS_ANGULAR_TOL)) continue;

        fillet.Add(radius, edge);
        added++;
    }

    if (added == 0) {
        return solid;
    }

    fillet.Build();
    if (!fillet.IsDone()) {
        throw_geometry("", "fillet", "fillet of axial edges failed");
    }
    return fillet.Shape();
}

TopoDS_Shape Rotate(const TopoDS_Shape& shape, const gp_Ax1& axis, double angle) {
    gp_Trsf rotation;
    rotation.SetRotation(axis, angle);

    BRepBuilderAPI_Transform transform(shape, rotation, Standard_True);
    if (!transform.IsDone()) {
        throw_geometry("", "rotate", "transformation failed");
    }
    return transform.Shape();
}

double Volume(const TopoDS_Shape& shape) {
    GProp_GProps props;
    BRepGProp::VolumeProperties(shape, props);
    return props.Mass();
}

int CountSolids(const TopoDS_Shape& shape) {
    int count = 0;
    for (TopExp_Explorer exp(shape, TopAbs_SOLID); exp.More(); exp.Next()) {
        count++;
    }
    return count;
}

} // namespace kernel
} // namespace gearpost
