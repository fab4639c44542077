#include <algorithm>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <functional>
#include <optional>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include <BRepClass3d_SolidClassifier.hxx>
#include <BRepPrimAPI_MakeBox.hxx>
#include <BRepPrimAPI_MakeCylinder.hxx>
#include <Standard_Failure.hxx>
#include <TopAbs_State.hxx>
#include <TopoDS_Shape.hxx>
#include <gp_Pnt.hxx>

#include <tinygltf.h>

#include "bore_step.h"
#include "chamfer_step.h"
#include "engine.h"
#include "errors.h"
#include "hub_step.h"
#include "json_exporter.h"
#include "kernel.h"
#include "parameters.h"
#include "pipeline.h"
#include "recess_step.h"
#include "spokes_step.h"

#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

namespace {

using gearpost::BoundParams;
using gearpost::ChamferExtent;
using gearpost::ChamferPlan;
using gearpost::ChamferStep;
using gearpost::ErrorKind;
using gearpost::GearFrame;
using gearpost::ModificationPipeline;
using gearpost::ModificationStep;
using gearpost::ParamValue;
using gearpost::ParameterBinder;
using gearpost::ParameterPool;
using gearpost::PostProcessError;
using gearpost::Profile2D;
using gearpost::SpokeWedge;
using gearpost::SpokesStep;

struct TestCase {
  const char* name;
  const char* intent;
  std::function<bool(void)> run;
};

const GearFrame kFrame(10.0, 5.0);

bool almost_equal(double a, double b, double eps = 1e-9) {
  return std::abs(a - b) <= eps;
}

bool relative_equal(double a, double b, double rel = 1e-4) {
  return std::abs(a - b) <= rel * std::max(std::abs(a), std::abs(b));
}

TopoDS_Shape make_cylinder(double radius, double height) {
  return BRepPrimAPI_MakeCylinder(radius, height).Shape();
}

bool inside(const TopoDS_Shape& shape, const gp_Pnt& p) {
  BRepClass3d_SolidClassifier classifier(shape, p, 1e-7);
  return classifier.State() == TopAbs_IN;
}

bool raises(ErrorKind kind, const std::function<void(void)>& fn, const std::string& step = "") {
  try {
    fn();
  } catch (const PostProcessError& e) {
    return e.kind() == kind && (step.empty() || e.step() == step);
  }
  return false;
}

// Inside/outside samples on a circle at height z, one per `count` equal angles
std::vector<bool> sample_ring(const TopoDS_Shape& shape, double radius, double z,
                              int count, double phase) {
  std::vector<bool> samples;
  for (int i = 0; i < count; ++i) {
    double angle = phase + 2.0 * M_PI * i / count;
    samples.push_back(inside(shape, gp_Pnt(radius * std::cos(angle), radius * std::sin(angle), z)));
  }
  return samples;
}

// Number of maximal runs equal to `value` on a cyclic sequence
int count_runs(const std::vector<bool>& samples, bool value) {
  int runs = 0;
  for (size_t i = 0; i < samples.size(); ++i) {
    bool prev = samples[(i + samples.size() - 1) % samples.size()];
    if (samples[i] == value && prev != value) {
      ++runs;
    }
  }
  return runs;
}

bool same_point(const gp_Pnt2d& a, const gp_Pnt2d& b) {
  return a.Distance(b) <= 1e-12;
}

bool same_profile(const Profile2D& a, const Profile2D& b) {
  if (!same_point(a.start, b.start) || a.segments.size() != b.segments.size()) {
    return false;
  }
  for (size_t i = 0; i < a.segments.size(); ++i) {
    if (a.segments[i].type != b.segments[i].type || !same_point(a.segments[i].end, b.segments[i].end)) {
      return false;
    }
  }
  return true;
}

// Spokes reference scenario shared by the end-to-end checks
const TopoDS_Shape& spoked_cylinder() {
  static const TopoDS_Shape result = [] {
    ParameterPool pool;
    pool.Set("n_spokes", 5).Set("spokes_od", 18.0).Set("spoke_width", 2.0);
    pool.Set("spokes_id", ParamValue::Absent());
    ModificationPipeline pipeline(kFrame);
    return pipeline.Apply(make_cylinder(10.0, 5.0), pool);
  }();
  return result;
}

// ---------------------------------------------------------------------------
// Parameters and binding
// ---------------------------------------------------------------------------

// Intent: Parameter text from the command line parses to absent, scalar and pair values.
bool test_param_value_parse() {
  return ParamValue::Parse("x", "none").is_absent() &&
         ParamValue::Parse("x", "2.5") == ParamValue::Scalar(2.5) &&
         ParamValue::Parse("x", "1,2") == ParamValue::Pair(1.0, 2.0) &&
         raises(ErrorKind::InvalidParameter, [] { ParamValue::Parse("x", "abc"); }) &&
         raises(ErrorKind::InvalidParameter, [] { ParamValue::Parse("x", "1,2,3"); });
}

// Intent: An untriggered step binds required parameters as absent instead of failing.
bool test_binder_untriggered_binds_absent() {
  gearpost::RecessStep step(kFrame);
  BoundParams bound = ParameterBinder::Bind(step.Descriptor(), ParameterPool());
  return !bound.triggered() &&
         bound.Get("recess").is_absent() &&
         bound.Get("recess_d").is_absent() &&
         bound.Get("hub_d").is_absent();
}

// Intent: A supplied value replaces the declared default.
bool test_binder_override_wins() {
  ChamferStep step(kFrame);
  ParameterPool pool;
  pool.Set("chamfer_top", ParamValue::Pair(0.5, 1.5));
  BoundParams bound = ParameterBinder::Bind(step.Descriptor(), pool);
  return bound.triggered() &&
         bound.Get("chamfer_top") == ParamValue::Pair(0.5, 1.5) &&
         bound.Get("chamfer").is_absent();
}

// Intent: Supplying absent for a trigger disables the step.
bool test_binder_explicit_absent_disables() {
  gearpost::BoreStep step(kFrame);
  ParameterPool pool;
  pool.Set("bore_d", ParamValue::Absent());
  return !ParameterBinder::Bind(step.Descriptor(), pool).triggered();
}

// Intent: A triggered step without a required parameter fails with MissingParameter.
bool test_binder_missing_required() {
  gearpost::RecessStep step(kFrame);
  ParameterPool pool;
  pool.Set("recess", 1.0);
  return raises(ErrorKind::MissingParameter,
                [&] { ParameterBinder::Bind(step.Descriptor(), pool); }, "recess");
}

// Intent: Value shapes are checked against the declared type.
bool test_binder_rejects_wrong_shapes() {
  gearpost::BoreStep bore(kFrame);
  SpokesStep spokes(kFrame);

  ParameterPool pair_bore;
  pair_bore.Set("bore_d", ParamValue::Pair(1.0, 2.0));

  ParameterPool fractional_count;
  fractional_count.Set("n_spokes", 4.5).Set("spokes_od", 18.0).Set("spoke_width", 2.0);

  // Whole numbers beyond int range must not wrap into a small count
  ParameterPool huge_count;
  huge_count.Set("n_spokes", 4294967298.0).Set("spokes_od", 18.0).Set("spoke_width", 2.0);

  ParameterPool overflowing_count;
  overflowing_count.Set("n_spokes", 1e20).Set("spokes_od", 18.0).Set("spoke_width", 2.0);

  ParameterPool negative_count;
  negative_count.Set("n_spokes", -3e9).Set("spokes_od", 18.0).Set("spoke_width", 2.0);

  return raises(ErrorKind::InvalidParameter, [&] { ParameterBinder::Bind(bore.Descriptor(), pair_bore); }) &&
         raises(ErrorKind::InvalidParameter, [&] { ParameterBinder::Bind(spokes.Descriptor(), fractional_count); }) &&
         raises(ErrorKind::InvalidParameter, [&] { ParameterBinder::Bind(spokes.Descriptor(), huge_count); }, "spokes") &&
         raises(ErrorKind::InvalidParameter, [&] { ParameterBinder::Bind(spokes.Descriptor(), overflowing_count); }, "spokes") &&
         raises(ErrorKind::InvalidParameter, [&] { ParameterBinder::Bind(spokes.Descriptor(), negative_count); }, "spokes");
}

// Intent: Shared names bind independently per step and the pool is never modified.
bool test_binder_is_fresh_per_step() {
  gearpost::RecessStep recess(kFrame);
  gearpost::HubStep hub(kFrame);

  ParameterPool pool;
  pool.Set("hub_d", 6.0).Set("teeth_number", 20.0);

  BoundParams a = ParameterBinder::Bind(recess.Descriptor(), pool);
  BoundParams b = ParameterBinder::Bind(hub.Descriptor(), pool);

  return a.Get("hub_d") == ParamValue::Scalar(6.0) &&
         b.Get("hub_d") == ParamValue::Scalar(6.0) &&
         b.Get("bore_d").is_absent() &&
         a.values().size() == 3 && b.values().size() == 3 &&
         pool.size() == 2;
}

// Intent: Overlay replaces stored build parameters with per-run overrides.
bool test_pool_overlay() {
  ParameterPool stored;
  stored.Set("bore_d", 3.0).Set("hub_d", 10.0);

  ParameterPool overrides;
  overrides.Set("bore_d", ParamValue::Absent()).Set("chamfer", 0.5);

  ParameterPool merged = stored.Overlay(overrides);
  return merged.Get("bore_d").is_absent() &&
         merged.Get("hub_d") == ParamValue::Scalar(10.0) &&
         merged.Get("chamfer") == ParamValue::Scalar(0.5) &&
         stored.Get("bore_d") == ParamValue::Scalar(3.0) &&
         merged.size() == 3;
}

// ---------------------------------------------------------------------------
// No-op behaviour
// ---------------------------------------------------------------------------

// Intent: Every step returns the input body itself when its trigger is absent.
bool test_steps_noop_without_trigger() {
  TopoDS_Shape body = make_cylinder(10.0, 5.0);
  ModificationPipeline pipeline(kFrame);

  // Secondary parameters present, triggers absent
  ParameterPool pool;
  pool.Set("recess_d", 16.0).Set("hub_d", 6.0).Set("spokes_od", 18.0).Set("spoke_width", 2.0);

  for (const auto& step : pipeline.GetSteps()) {
    BoundParams bound = ParameterBinder::Bind(step->Descriptor(), pool);
    if (bound.triggered() || !step->Apply(body, bound).IsSame(body)) {
      return false;
    }
  }
  return true;
}

// Intent: The pipeline with no triggers returns the input body and reports nothing applied.
bool test_pipeline_noop() {
  TopoDS_Shape body = make_cylinder(10.0, 5.0);
  ModificationPipeline pipeline(kFrame);
  TopoDS_Shape result = pipeline.Apply(body, ParameterPool());

  bool none_applied = true;
  for (const auto& report : pipeline.GetReports()) {
    none_applied = none_applied && !report.applied;
  }
  return result.IsSame(body) && pipeline.GetReports().size() == 5 && none_applied;
}

// Intent: Steps run in the fixed order bore, recess, hub, spokes, chamfer.
bool test_pipeline_order() {
  ModificationPipeline pipeline(kFrame);
  const char* expected[] = {"bore", "recess", "hub", "spokes", "chamfer"};
  const auto& steps = pipeline.GetSteps();
  if (steps.size() != 5) return false;
  for (size_t i = 0; i < steps.size(); ++i) {
    if (steps[i]->Descriptor().name != expected[i]) return false;
  }
  return true;
}

// ---------------------------------------------------------------------------
// Bore
// ---------------------------------------------------------------------------

// Intent: Bore cuts a through-hole of radius d/2 visible at both end faces.
bool test_bore_through_hole() {
  ParameterPool pool;
  pool.Set("bore_d", 3.0);
  ModificationPipeline pipeline(kFrame);
  TopoDS_Shape result = pipeline.Apply(make_cylinder(10.0, 5.0), pool);

  for (double z : {1e-3, 5.0 - 1e-3}) {
    if (inside(result, gp_Pnt(0.0, 0.0, z)) ||
        inside(result, gp_Pnt(1.45, 0.0, z)) ||
        inside(result, gp_Pnt(0.0, -1.45, z)) ||
        !inside(result, gp_Pnt(1.55, 0.0, z)) ||
        !inside(result, gp_Pnt(-1.55, 0.0, z))) {
      return false;
    }
  }

  double expected = M_PI * (100.0 - 2.25) * 5.0;
  return relative_equal(gearpost::kernel::Volume(result), expected);
}

// Intent: A non-positive bore diameter is rejected.
bool test_bore_rejects_non_positive() {
  ParameterPool pool;
  pool.Set("bore_d", -1.0);
  ModificationPipeline pipeline(kFrame);
  return raises(ErrorKind::InvalidParameter,
                [&] { pipeline.Apply(make_cylinder(10.0, 5.0), pool); }, "bore");
}

// ---------------------------------------------------------------------------
// Recess and hub
// ---------------------------------------------------------------------------

// Intent: Recess with a hub diameter removes only the annulus between the two diameters.
bool test_recess_annulus_volume() {
  ParameterPool pool;
  pool.Set("recess", 1.0).Set("recess_d", 16.0).Set("hub_d", 6.0);
  ModificationPipeline pipeline(kFrame);
  TopoDS_Shape result = pipeline.Apply(make_cylinder(10.0, 5.0), pool);

  double expected = M_PI * 100.0 * 5.0 - M_PI * (64.0 - 9.0) * 1.0;
  return relative_equal(gearpost::kernel::Volume(result), expected) &&
         inside(result, gp_Pnt(0.0, 0.0, 4.5)) &&
         !inside(result, gp_Pnt(5.0, 0.0, 4.5)) &&
         inside(result, gp_Pnt(5.0, 0.0, 3.5));
}

// Intent: A recess wider than the body is clipped instead of failing.
bool test_recess_wider_than_body() {
  ParameterPool pool;
  pool.Set("recess", 1.0).Set("recess_d", 30.0);
  ModificationPipeline pipeline(kFrame);
  TopoDS_Shape result = pipeline.Apply(make_cylinder(10.0, 5.0), pool);
  return relative_equal(gearpost::kernel::Volume(result), M_PI * 100.0 * 4.0);
}

// Intent: Hub length without a hub diameter fails with MissingParameter.
bool test_hub_missing_diameter() {
  ParameterPool not_supplied;
  not_supplied.Set("hub_length", 5.0);

  ParameterPool disabled;
  disabled.Set("hub_length", 5.0).Set("hub_d", ParamValue::Absent());

  ModificationPipeline pipeline(kFrame);
  TopoDS_Shape body = make_cylinder(10.0, 5.0);
  return raises(ErrorKind::MissingParameter, [&] { pipeline.Apply(body, not_supplied); }, "hub") &&
         raises(ErrorKind::MissingParameter, [&] { pipeline.Apply(body, disabled); }, "hub");
}

// Intent: The hub is a hollow boss on the top face consistent with the bore.
bool test_hub_hollow_boss() {
  ParameterPool pool;
  pool.Set("bore_d", 2.0).Set("hub_d", 6.0).Set("hub_length", 4.0);
  ModificationPipeline pipeline(kFrame);
  TopoDS_Shape result = pipeline.Apply(make_cylinder(10.0, 5.0), pool);

  double expected = M_PI * (100.0 - 1.0) * 5.0 + M_PI * (9.0 - 1.0) * 4.0;
  return relative_equal(gearpost::kernel::Volume(result), expected) &&
         gearpost::kernel::CountSolids(result) == 1 &&
         inside(result, gp_Pnt(2.0, 0.0, 8.5)) &&
         !inside(result, gp_Pnt(0.0, 0.0, 8.5)) &&
         !inside(result, gp_Pnt(4.0, 0.0, 8.5));
}

// Intent: The hub grows from the recessed top face when both are requested.
bool test_recess_then_hub() {
  ParameterPool pool;
  pool.Set("recess", 1.0).Set("recess_d", 16.0).Set("hub_d", 6.0).Set("hub_length", 3.0);
  ModificationPipeline pipeline(kFrame);
  TopoDS_Shape result = pipeline.Apply(make_cylinder(10.0, 5.0), pool);

  double expected = M_PI * 100.0 * 5.0 - M_PI * (64.0 - 9.0) * 1.0 + M_PI * 9.0 * 3.0;
  return relative_equal(gearpost::kernel::Volume(result), expected) &&
         gearpost::kernel::CountSolids(result) == 1 &&
         inside(result, gp_Pnt(0.0, 0.0, 7.5));
}

// Intent: Errors raised by a step carry the step name.
bool test_error_names_step() {
  ParameterPool pool;
  pool.Set("recess", 1.0).Set("recess_d", 16.0).Set("hub_d", 20.0);
  ModificationPipeline pipeline(kFrame);
  return raises(ErrorKind::InvalidParameter,
                [&] { pipeline.Apply(make_cylinder(10.0, 5.0), pool); }, "recess");
}

// ---------------------------------------------------------------------------
// Spokes
// ---------------------------------------------------------------------------

// Intent: Spoke count must exceed one.
bool test_spokes_count_must_exceed_one() {
  ParameterPool pool;
  pool.Set("n_spokes", 1).Set("spokes_od", 18.0).Set("spoke_width", 2.0);
  ModificationPipeline pipeline(kFrame);
  return raises(ErrorKind::InvalidParameter,
                [&] { pipeline.Apply(make_cylinder(10.0, 5.0), pool); }, "spokes") &&
         raises(ErrorKind::InvalidParameter,
                [] { gearpost::ComputeSpokeWedge(0, std::nullopt, 18.0, 2.0); });
}

// Intent: For every accepted parameter set the wedge keeps r1 < r2 and stays simple.
bool test_spoke_wedge_sweep() {
  const std::vector<std::optional<double>> inner = {std::nullopt, 1.0, 4.0, 12.0, 30.0};
  const std::vector<double> widths = {0.2, 1.0, 2.0, 5.0};
  const std::vector<double> outers = {2.0, 5.0, 9.0, 18.0, 40.0, 120.0, 1000.0};

  int accepted = 0;
  for (int n = 2; n <= 24; ++n) {
    for (const auto& id : inner) {
      for (double w : widths) {
        for (double od : outers) {
          SpokeWedge wedge;
          try {
            wedge = gearpost::ComputeSpokeWedge(n, id, od, w);
          } catch (const PostProcessError& e) {
            if (e.kind() != ErrorKind::InvalidParameter) return false;
            continue;
          }
          ++accepted;

          bool ok = wedge.r1 < wedge.r2 &&
                    wedge.a2 < wedge.a1 &&
                    wedge.a1 < wedge.tau - wedge.a1 &&
                    wedge.a2 > 0.0 &&
                    std::isfinite(wedge.a1) &&
                    wedge.OuterSpan() > 0.0 &&
                    almost_equal(wedge.r2 * std::sin(wedge.a2), w / 2.0, 1e-9) &&
                    almost_equal(wedge.r1 * std::sin(wedge.a1), w / 2.0, 1e-9) &&
                    wedge.pointed == (!id || *id / 2.0 <= (w / 2.0) / std::sin(wedge.tau / 2.0)) &&
                    wedge.Profile().segments.size() == (wedge.pointed ? 3u : 4u);
          if (!ok) {
            std::cerr << "  wedge failed: n=" << n << " od=" << od << " w=" << w << "\n";
            return false;
          }
        }
      }
    }
  }
  return accepted > 500;
}

// Intent: The wedge profile closes on itself and its corners lie on r1 and r2.
// Without spokes_id the window ends in a tip on the bisector, with one it
// ends in an inner arc.
bool test_spoke_wedge_profile() {
  SpokeWedge wedge = gearpost::ComputeSpokeWedge(5, std::nullopt, 18.0, 2.0);
  Profile2D profile = wedge.Profile();

  double r_start = profile.start.Distance(gp_Pnt2d(0, 0));
  double r_outer = profile.segments[0].end.Distance(gp_Pnt2d(0, 0));
  double r_outer_mid = profile.segments[1].through.Distance(gp_Pnt2d(0, 0));
  double tip_angle = std::atan2(profile.start.Y(), profile.start.X());

  bool pointed_ok = wedge.pointed &&
                    profile.segments.size() == 3 &&
                    same_point(profile.segments.back().end, profile.start) &&
                    almost_equal(tip_angle, M_PI / 5.0, 1e-12) &&
                    almost_equal(r_start, wedge.r1, 1e-12) &&
                    almost_equal(r_outer, wedge.r2, 1e-12) &&
                    almost_equal(r_outer_mid, wedge.r2, 1e-12) &&
                    almost_equal(wedge.r1, 1.0 / std::sin(M_PI / 5.0) + wedge.epsilon, 1e-12);

  SpokeWedge arced = gearpost::ComputeSpokeWedge(5, 6.0, 18.0, 2.0);
  Profile2D arced_profile = arced.Profile();
  double r_inner_mid = arced_profile.segments[3].through.Distance(gp_Pnt2d(0, 0));

  return pointed_ok &&
         !arced.pointed &&
         arced_profile.segments.size() == 4 &&
         same_point(arced_profile.segments.back().end, arced_profile.start) &&
         almost_equal(arced_profile.start.Distance(gp_Pnt2d(0, 0)), arced.r1, 1e-12) &&
         almost_equal(r_inner_mid, arced.r1, 1e-12) &&
         almost_equal(arced.r1, 3.0 + arced.epsilon, 1e-12);
}

// Intent: spoke_fillet rounds the window corners with and without spokes_id,
// leaving a single solid that keeps more material than the sharp cut.
bool test_spokes_fillet() {
  const TopoDS_Shape blank = make_cylinder(10.0, 5.0);
  ModificationPipeline pipeline(kFrame);

  for (const ParamValue& id : {ParamValue::Absent(), ParamValue::Scalar(6.0)}) {
    ParameterPool sharp;
    sharp.Set("n_spokes", 5).Set("spokes_od", 18.0).Set("spoke_width", 2.0);
    sharp.Set("spokes_id", id);

    ParameterPool rounded = sharp;
    rounded.Set("spoke_fillet", 0.5);

    TopoDS_Shape sharp_result = pipeline.Apply(blank, sharp);
    TopoDS_Shape rounded_result = pipeline.Apply(blank, rounded);

    double blank_volume = gearpost::kernel::Volume(blank);
    double sharp_volume = gearpost::kernel::Volume(sharp_result);
    double rounded_volume = gearpost::kernel::Volume(rounded_result);

    if (gearpost::kernel::CountSolids(rounded_result) != 1 ||
        !(sharp_volume < rounded_volume) ||
        !(rounded_volume < blank_volume)) {
      std::cerr << "  fillet volumes: blank=" << blank_volume << " sharp=" << sharp_volume
                << " rounded=" << rounded_volume << "\n";
      return false;
    }
  }
  return true;
}

// Intent: Five spokes leave five solid spokes and five windows of the predicted span.
bool test_spokes_five_regions() {
  const TopoDS_Shape& result = spoked_cylinder();
  SpokeWedge wedge = gearpost::ComputeSpokeWedge(5, std::nullopt, 18.0, 2.0);

  std::vector<bool> ring = sample_ring(result, 8.0, 2.5, 720, 0.0043);
  if (count_runs(ring, true) != 5 || count_runs(ring, false) != 5) {
    return false;
  }

  // Window span just inside the outer cutout radius
  const int count = 3600;
  std::vector<bool> outer = sample_ring(result, 8.99, 2.5, count, 0.0007);
  if (count_runs(outer, false) != 5) {
    return false;
  }

  int out_samples = 0;
  for (bool in : outer) {
    if (!in) ++out_samples;
  }
  double span = (2.0 * M_PI / count) * out_samples / 5.0;

  return almost_equal(span, wedge.OuterSpan(), 0.005) &&
         gearpost::kernel::CountSolids(result) == 1;
}

// Intent: Cutting n rotated windows leaves the body symmetric under rotation by tau.
bool test_spokes_rotational_symmetry() {
  const TopoDS_Shape& result = spoked_cylinder();
  const double tau = 2.0 * M_PI / 5.0;

  for (double r : {1.2, 2.5, 4.0, 6.0, 8.5, 9.5}) {
    for (int k = 0; k < 60; ++k) {
      double angle = 0.0131 + k * 0.1047;
      gp_Pnt p(r * std::cos(angle), r * std::sin(angle), 2.5);
      gp_Pnt q(r * std::cos(angle + tau), r * std::sin(angle + tau), 2.5);
      if (inside(result, p) != inside(result, q)) {
        return false;
      }
    }
  }
  return true;
}

// ---------------------------------------------------------------------------
// Chamfer
// ---------------------------------------------------------------------------

// Intent: chamfer=w is the same cutter as top and bottom pairs (w, w).
bool test_chamfer_scalar_equals_pair() {
  ChamferStep step(kFrame);

  ParameterPool scalar;
  scalar.Set("chamfer", 1.0);

  ParameterPool pairs;
  pairs.Set("chamfer_top", ParamValue::Pair(1.0, 1.0)).Set("chamfer_bottom", ParamValue::Pair(1.0, 1.0));

  ChamferPlan a = gearpost::ResolveChamfers(ParameterBinder::Bind(step.Descriptor(), scalar));
  ChamferPlan b = gearpost::ResolveChamfers(ParameterBinder::Bind(step.Descriptor(), pairs));

  return a.top && a.bottom && b.top && b.bottom &&
         *a.top == *b.top && *a.bottom == *b.bottom &&
         same_profile(step.CutterProfile(*a.top, true), step.CutterProfile(*b.top, true)) &&
         same_profile(step.CutterProfile(*a.bottom, false), step.CutterProfile(*b.bottom, false));
}

// Intent: chamfer only seeds the sides that are not given individually.
bool test_chamfer_seeds_unset_sides() {
  ChamferStep step(kFrame);
  ParameterPool pool;
  pool.Set("chamfer", 1.0).Set("chamfer_top", ParamValue::Pair(0.5, 2.0));

  ChamferPlan plan = gearpost::ResolveChamfers(ParameterBinder::Bind(step.Descriptor(), pool));
  return plan.top && plan.bottom &&
         *plan.top == (ChamferExtent{0.5, 2.0}) &&
         *plan.bottom == (ChamferExtent{1.0, 1.0});
}

// Intent: A pair is read as (axial, radial) when sizing the cutter triangle.
bool test_chamfer_pair_order() {
  ChamferStep step(kFrame);
  Profile2D top = step.CutterProfile(ChamferExtent{2.0, 0.5}, true);
  Profile2D bottom = step.CutterProfile(ChamferExtent{2.0, 0.5}, false);

  return almost_equal(top.start.X(), 10.0 - 0.5) &&
         almost_equal(top.segments[1].end.Y(), 5.0 - 2.0) &&
         almost_equal(bottom.start.Y(), 2.0) &&
         almost_equal(bottom.segments[1].end.X(), 10.0 - 0.5);
}

// Intent: Top and bottom chamfers each remove a revolved triangle from the rim.
bool test_chamfer_volume() {
  ParameterPool pool;
  pool.Set("chamfer", 1.0);
  ModificationPipeline pipeline(kFrame);
  TopoDS_Shape result = pipeline.Apply(make_cylinder(10.0, 5.0), pool);

  // Cutter hypotenuse crosses the rim 0.01 inside the corner (Pappus)
  double leg = 0.99;
  double area = leg * leg / 2.0;
  double centroid_r = (10.0 - leg + 10.0 + 10.0) / 3.0;
  double removed = 2.0 * (2.0 * M_PI * centroid_r * area);

  return relative_equal(gearpost::kernel::Volume(result), M_PI * 100.0 * 5.0 - removed) &&
         !inside(result, gp_Pnt(9.9, 0.0, 4.95)) &&
         !inside(result, gp_Pnt(9.9, 0.0, 0.05)) &&
         inside(result, gp_Pnt(9.9, 0.0, 2.5));
}

// Intent: Non-positive chamfer extents are rejected.
bool test_chamfer_rejects_non_positive() {
  ParameterPool pool;
  pool.Set("chamfer_bottom", ParamValue::Pair(1.0, 0.0));
  ModificationPipeline pipeline(kFrame);
  return raises(ErrorKind::InvalidParameter,
                [&] { pipeline.Apply(make_cylinder(10.0, 5.0), pool); }, "chamfer");
}

// ---------------------------------------------------------------------------
// Kernel, frame and engine
// ---------------------------------------------------------------------------

// Intent: A cut that misses the body leaves its volume unchanged.
bool test_kernel_cut_missing_tool() {
  TopoDS_Shape body = make_cylinder(10.0, 5.0);
  TopoDS_Shape far_box = BRepPrimAPI_MakeBox(gp_Pnt(50, 50, 50), 1.0, 1.0, 1.0).Shape();
  TopoDS_Shape result = gearpost::kernel::Cut(body, far_box);
  return relative_equal(gearpost::kernel::Volume(result), gearpost::kernel::Volume(body));
}

// Intent: The frame derived from a blank matches its radius and width.
bool test_frame_from_shape() {
  GearFrame frame = GearFrame::FromShape(make_cylinder(10.0, 5.0));
  return almost_equal(frame.addendum_radius, 10.0, 1e-2) &&
         almost_equal(frame.width, 5.0, 1e-2) &&
         raises(ErrorKind::InvalidParameter, [] { GearFrame(0.0, 5.0).Validate(); });
}

// Intent: Engine runs overlay per-call overrides on the stored build parameters.
bool test_engine_build_parameter_overlay() {
  gearpost::Engine engine;
  if (!engine.make_cylinder_blank(10.0, 5.0)) return false;

  ParameterPool stored;
  stored.Set("bore_d", 3.0);
  engine.set_build_parameters(stored);

  ParameterPool disable;
  disable.Set("bore_d", ParamValue::Absent());
  engine.run_pipeline(disable);
  bool untouched = engine.get_result().IsSame(engine.get_blank()) && !engine.get_reports()[0].applied;

  engine.run_pipeline();
  bool bored = engine.get_reports()[0].applied &&
               relative_equal(engine.get_result_volume(), M_PI * (100.0 - 2.25) * 5.0);

  return untouched && bored;
}

// Intent: A single frame flag overrides its value and keeps the other from the blank.
bool test_engine_resolve_frame() {
  gearpost::Engine cylinder;
  if (!cylinder.make_cylinder_blank(10.0, 5.0)) return false;
  bool width_only = cylinder.resolve_frame(std::nullopt, 3.0) &&
                    almost_equal(cylinder.get_frame().addendum_radius, 10.0) &&
                    almost_equal(cylinder.get_frame().width, 3.0);

  gearpost::Engine handed_over;
  handed_over.set_blank(make_cylinder(10.0, 5.0));
  bool radius_only = handed_over.resolve_frame(12.0, std::nullopt) &&
                     almost_equal(handed_over.get_frame().addendum_radius, 12.0) &&
                     relative_equal(handed_over.get_frame().width, 5.0, 1e-6);

  gearpost::Engine rejected;
  if (!rejected.make_cylinder_blank(10.0, 5.0)) return false;
  bool non_positive = !rejected.resolve_frame(-1.0, std::nullopt) &&
                      almost_equal(rejected.get_frame().addendum_radius, 10.0);

  return width_only && radius_only && non_positive;
}

// Intent: A bored run writes result.step, mesh.glb and meta.json that read back consistently.
bool test_engine_exports() {
  namespace fs = std::filesystem;
  const fs::path dir = fs::temp_directory_path() / "gearpost_tests_export";
  fs::remove_all(dir);
  fs::create_directories(dir);

  const std::string step_path = (dir / "result.step").string();
  const std::string mesh_path = (dir / "mesh.glb").string();
  const std::string meta_path = (dir / "meta.json").string();

  gearpost::Engine engine;
  if (!engine.make_cylinder_blank(10.0, 5.0)) return false;

  ParameterPool params;
  params.Set("bore_d", 3.0);
  engine.run_pipeline(params);

  gearpost::JsonExporter exporter(engine);
  if (!engine.export_step(step_path) ||
      !engine.export_mesh(mesh_path, 0.1) ||
      !exporter.export_metadata(meta_path, 7)) {
    return false;
  }

  gearpost::Engine reloaded;
  bool step_ok = reloaded.load_step(step_path) &&
                 relative_equal(reloaded.get_result_volume(), engine.get_result_volume());

  tinygltf::Model model;
  tinygltf::TinyGLTF loader;
  std::string err;
  std::string warn;
  bool glb_ok = loader.LoadBinaryFromFile(&model, &err, &warn, mesh_path) &&
                engine.get_triangle_count() > 0 &&
                model.meshes.size() == 1 &&
                model.accessors.size() == 3 &&
                model.accessors[2].count == 3 * engine.get_triangle_count() &&
                model.accessors[0].count == model.accessors[1].count &&
                model.accessors[0].maxValues.size() == 3 &&
                almost_equal(model.accessors[0].maxValues[2], 5.0, 1e-4) &&
                almost_equal(model.accessors[0].minValues[2], 0.0, 1e-4);

  std::ifstream meta(meta_path);
  std::stringstream text;
  text << meta.rdbuf();
  const std::string json = text.str();
  bool meta_ok = json.find("\"bore_d\": 3") != std::string::npos &&
                 json.find("{\"name\": \"bore\", \"applied\": true") != std::string::npos &&
                 json.find("{\"name\": \"spokes\", \"applied\": false") != std::string::npos &&
                 json.find("\"triangles\": " + std::to_string(engine.get_triangle_count())) != std::string::npos;

  fs::remove_all(dir);

  if (!glb_ok && !err.empty()) {
    std::cerr << "  glb: " << err << "\n";
  }
  return step_ok && glb_ok && meta_ok;
}

}  // namespace

int main() {
  const std::vector<TestCase> tests = {
      {"Params_Parse", "Text parses to absent/scalar/pair", test_param_value_parse},
      {"Binder_UntriggeredAbsent", "Untriggered step binds required params as absent", test_binder_untriggered_binds_absent},
      {"Binder_OverrideWins", "Pool value replaces default", test_binder_override_wins},
      {"Binder_ExplicitAbsent", "Absent trigger disables step", test_binder_explicit_absent_disables},
      {"Binder_MissingRequired", "Triggered step without required param fails", test_binder_missing_required},
      {"Binder_WrongShapes", "Pair for length, fractional or out-of-range count rejected", test_binder_rejects_wrong_shapes},
      {"Binder_FreshPerStep", "Shared names bind independently, pool unchanged", test_binder_is_fresh_per_step},
      {"Pool_Overlay", "Overrides replace stored parameters", test_pool_overlay},
      {"Steps_NoOp", "Every step returns input when untriggered", test_steps_noop_without_trigger},
      {"Pipeline_NoOp", "Pipeline without triggers returns input", test_pipeline_noop},
      {"Pipeline_Order", "Fixed step order", test_pipeline_order},
      {"Bore_ThroughHole", "Bore cuts through-hole of radius d/2", test_bore_through_hole},
      {"Bore_NonPositive", "Non-positive bore rejected", test_bore_rejects_non_positive},
      {"Recess_Annulus", "Recess around hub removes annulus", test_recess_annulus_volume},
      {"Recess_Clipped", "Oversized recess clips at body", test_recess_wider_than_body},
      {"Hub_MissingDiameter", "Hub length without diameter fails", test_hub_missing_diameter},
      {"Hub_HollowBoss", "Hub boss is hollow over the bore", test_hub_hollow_boss},
      {"Recess_ThenHub", "Hub grows from recessed face", test_recess_then_hub},
      {"Pipeline_ErrorStep", "Errors carry step name", test_error_names_step},
      {"Spokes_CountGuard", "Spoke count must exceed one", test_spokes_count_must_exceed_one},
      {"Spokes_WedgeSweep", "r1 < r2 and simple wedge across sweep", test_spoke_wedge_sweep},
      {"Spokes_WedgeProfile", "Wedge profile closed on r1/r2", test_spoke_wedge_profile},
      {"Spokes_Fillet", "Filleted windows with and without spokes_id", test_spokes_fillet},
      {"Spokes_FiveRegions", "Five spokes, five windows of predicted span", test_spokes_five_regions},
      {"Spokes_Symmetry", "Result symmetric under rotation by tau", test_spokes_rotational_symmetry},
      {"Chamfer_ScalarEqualsPair", "Scalar chamfer equals (w, w) pairs", test_chamfer_scalar_equals_pair},
      {"Chamfer_SeedsUnset", "chamfer seeds only unset sides", test_chamfer_seeds_unset_sides},
      {"Chamfer_PairOrder", "Pair is (axial, radial)", test_chamfer_pair_order},
      {"Chamfer_Volume", "Chamfers remove revolved triangles", test_chamfer_volume},
      {"Chamfer_NonPositive", "Non-positive extents rejected", test_chamfer_rejects_non_positive},
      {"Kernel_CutMiss", "Cut missing the body is a no-op", test_kernel_cut_missing_tool},
      {"Frame_FromShape", "Frame derived from blank bounds", test_frame_from_shape},
      {"Engine_Overlay", "Engine overlays overrides on stored params", test_engine_build_parameter_overlay},
      {"Engine_FrameFlags", "Partial frame flags override the derived frame", test_engine_resolve_frame},
      {"Engine_Exports", "STEP, glb and meta.json written and read back", test_engine_exports},
  };

  bool all_passed = true;
  for (const TestCase& test : tests) {
    bool passed = false;
    try {
      passed = test.run();
    } catch (const std::exception& e) {
      std::cerr << "  exception: " << e.what() << "\n";
    } catch (const Standard_Failure& e) {
      std::cerr << "  OpenCASCADE exception: " << e.GetMessageString() << "\n";
    }
    std::cout << (passed ? "[PASS] " : "[FAIL] ") << test.name << " - " << test.intent << "\n";
    all_passed = all_passed && passed;
  }

  if (!all_passed) {
    std::cerr << "gearpost tests failed\n";
    return 1;
  }

  std::cout << "gearpost tests passed (" << tests.size() << " cases)\n";
  return 0;
}
