/**
 * Modification step interface and parameter names
 */

#pragma once

#include <TopoDS_Shape.hxx>

#include "gear_frame.h"
#include "parameters.h"

namespace gearpost {

/**
 * Parameter names shared by the steps
 *
 * A name means the same thing in every step that declares it
 * (e.g. hub_d bounds the recess annulus and sizes the hub boss).
 */
namespace param {
constexpr const char* BORE_D = "bore_d";
constexpr const char* RECESS = "recess";
constexpr const char* RECESS_D = "recess_d";
constexpr const char* HUB_D = "hub_d";
constexpr const char* HUB_LENGTH = "hub_length";
constexpr const char* N_SPOKES = "n_spokes";
constexpr const char* SPOKES_ID = "spokes_id";
constexpr const char* SPOKES_OD = "spokes_od";
constexpr const char* SPOKE_WIDTH = "spoke_width";
constexpr const char* SPOKE_FILLET = "spoke_fillet";
constexpr const char* CHAMFER = "chamfer";
constexpr const char* CHAMFER_TOP = "chamfer_top";
constexpr const char* CHAMFER_BOTTOM = "chamfer_bottom";
} // namespace param

/**
 * One geometric post-processing step
 *
 * Apply() consumes a body and returns a new one. When the step's trigger
 * parameter is absent it must return the input body itself, unchanged.
 */
class ModificationStep {
public:
    explicit ModificationStep(const GearFrame& frame) : frame_(frame) {}
    virtual ~ModificationStep() = default;

    virtual const StepDescriptor& Descriptor() const = 0;

    virtual TopoDS_Shape Apply(const TopoDS_Shape& body, const BoundParams& params) const = 0;

protected:
    const std::string& name() const { return Descriptor().name; }

    GearFrame frame_;
};

} // namespace gearpost
