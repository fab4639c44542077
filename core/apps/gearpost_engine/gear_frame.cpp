/**
 * Gear frame implementation
 */

#include "gear_frame.h"
#include "errors.h"

#include <algorithm>
#include <cmath>

#include <BRepBndLib.hxx>
#include <Bnd_Box.hxx>

namespace gearpost {

void GearFrame::Validate() const {
    if (!(addendum_radius > 0.0)) {
        throw_invalid("", "addendum_radius", "must be positive");
    }
    if (!(width > 0.0)) {
        throw_invalid("", "width", "must be positive");
    }
}

GearFrame GearFrame::FromShape(const TopoDS_Shape& body) {
    if (body.IsNull()) {
        throw_geometry("", "frame", "shape is null");
    }

    Bnd_Box bbox;
    BRepBndLib::AddOptimal(body, bbox, Standard_False, Standard_False);

    if (bbox.IsVoid()) {
        throw_geometry("", "frame", "shape has an empty bounding box");
    }

    double xmin, ymin, zmin, xmax, ymax, zmax;
    bbox.Get(xmin, ymin, zmin, xmax, ymax, zmax);

    double ra = std::max({std::abs(xmin), std::abs(xmax), std::abs(ymin), std::abs(ymax)});

    return GearFrame(ra, zmax - zmin);
}

} // namespace gearpost
