/**
 * Spokes step
 *
 * Cuts n evenly spaced wedge-shaped windows between the hub and the rim,
 * leaving n straight spokes of constant width.
 * Trigger: n_spokes.
 *
 * Wedge geometry (working plane, first window between spokes at 0 and tau):
 *
 *        P(tau-a2, r2)  ____  P(a2, r2)      outer arc at r2
 *                      \    /
 *                       \__/                 edges parallel to the spokes
 *        P(tau-a1, r1)        P(a1, r1)      inner arc at r1
 *
 * a = asin((spoke_width / 2) / r) is the half-angle of the spoke chord
 * at radius r. When r1 sits where adjacent spoke edges meet, the inner
 * arc would be a sliver; the window then closes in a tip at P(tau/2, r1).
 */

#pragma once

#include <optional>

#include "kernel.h"
#include "modification_step.h"

namespace gearpost {

/**
 * Resolved cutout wedge for one spoke window
 */
struct SpokeWedge {
    int n_spokes;
    double tau;       // Angular pitch 2*pi/n
    double r1;        // Inner cutout radius (nudged outwards)
    double r2;        // Outer cutout radius (nudged inwards)
    double a1;        // Chord half-angle at r1
    double a2;        // Chord half-angle at r2
    double epsilon;   // Nudge applied to r1 and r2
    bool pointed;     // Inner boundary collapsed to a tip

    /**
     * Closed wedge outline: line, outer arc, line, inner arc.
     * A pointed wedge starts at the tip and has no inner arc.
     */
    Profile2D Profile() const;

    /**
     * Angle subtended by the window at the outer radius
     */
    double OuterSpan() const { return tau - 2.0 * a2; }
};

/**
 * Compute the wedge for the given spoke parameters
 *
 * Without spokes_id (or with one inside it) the inner boundary sits where
 * the edges of adjacent spokes meet, (w/2) / sin(tau/2), and the wedge is
 * pointed. Throws PostProcessError(InvalidParameter)
 * for n < 2, non-positive sizes, or when no simple wedge fits.
 */
SpokeWedge ComputeSpokeWedge(int n_spokes,
                             std::optional<double> spokes_id,
                             double spokes_od,
                             double spoke_width);

class SpokesStep : public ModificationStep {
public:
    explicit SpokesStep(const GearFrame& frame);

    const StepDescriptor& Descriptor() const override;

    TopoDS_Shape Apply(const TopoDS_Shape& body, const BoundParams& params) const override;

    /**
     * Single window cutter (unrotated), exposed for inspection
     */
    TopoDS_Shape MakeCutter(const SpokeWedge& wedge, std::optional<double> fillet) const;

private:
    // Cutter starts below the bottom face and overshoots the top
    static constexpr double BOTTOM_OFFSET = 0.1;
    static constexpr double EXTRA_HEIGHT = 1.0;
};

} // namespace gearpost
