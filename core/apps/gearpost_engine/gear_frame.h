/**
 * Gear frame - fixed geometric constants supplied by the tooth generator
 */

#pragma once

#include <TopoDS_Shape.hxx>
#include <gp.hxx>
#include <gp_Ax1.hxx>
#include <gp_Ax2.hxx>

namespace gearpost {

/**
 * Dimensions and coordinate frame of a finished gear blank
 *
 * The blank is centered on the Z rotation axis and spans z in
 * [0, width]. Profiles are sketched on the working plane (XY) or the
 * axial plane (XZ: local u = radial X, local v = axial Z).
 */
struct GearFrame {
    double addendum_radius;   // Tooth tip radius in mm
    double width;             // Axial extent (face width) in mm

    GearFrame()
        : addendum_radius(0.0)
        , width(0.0)
    {}

    GearFrame(double ra, double w)
        : addendum_radius(ra)
        , width(w)
    {}

    /**
     * Throws PostProcessError(InvalidParameter) on non-positive dimensions
     */
    void Validate() const;

    static gp_Ax1 RotationAxis() { return gp::OZ(); }
    static gp_Ax2 WorkingPlane() { return gp::XOY(); }
    static gp_Ax2 AxialPlane() { return gp_Ax2(gp::Origin(), gp_Dir(0, -1, 0), gp_Dir(1, 0, 0)); }

    /**
     * Derive the frame from a blank's bounding box
     * Radius is the largest radial extent from the Z axis, width the
     * axial extent. Throws PostProcessError(GeometryFailure) on an empty shape.
     */
    static GearFrame FromShape(const TopoDS_Shape& body);
};

} // namespace gearpost
