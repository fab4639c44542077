/**
 * Gearpost Engine - parametric post-processing of gear blanks
 */

#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

// OpenCASCADE includes
#include <TopoDS_Face.hxx>
#include <TopoDS_Shape.hxx>
#include <gp_Dir.hxx>
#include <gp_Pnt.hxx>

// Gearpost includes
#include "gear_frame.h"
#include "parameters.h"
#include "pipeline.h"

namespace gearpost {

/**
 * Main post-processing engine
 *
 * Holds the blank handed over by the tooth generator (or loaded from
 * STEP), its frame and the stored build parameters, runs the
 * modification pipeline and exports the result.
 */
class Engine {
public:
    Engine();
    ~Engine();

    /**
     * Load blank from STEP file
     * @param filepath Path to STEP file
     * @return true if successful
     */
    bool load_step(const std::string& filepath);

    /**
     * Use a plain cylinder as the blank (radius = addendum radius)
     * Sets the frame to match.
     * @return true if successful
     */
    bool make_cylinder_blank(double radius, double height);

    /**
     * Hand over a blank produced in-process
     */
    void set_blank(const TopoDS_Shape& blank) { blank_ = blank; result_.Nullify(); }

    /**
     * Set the frame supplied by the tooth generator
     */
    void set_frame(const GearFrame& frame) { frame_ = frame; has_frame_ = true; }

    /**
     * Derive the frame from the blank's bounding box
     * @return true if successful
     */
    bool derive_frame();

    /**
     * Apply frame values given on the command line
     * Values not supplied come from the current frame, or from the blank
     * when there is none yet. Supplied values must be positive.
     * @return true if successful
     */
    bool resolve_frame(std::optional<double> addendum_radius, std::optional<double> width);

    /**
     * Stored parameters; every run overlays its overrides on these
     */
    void set_build_parameters(const ParameterPool& params) { build_params_ = params; }

    /**
     * Run the modification pipeline
     * @param overrides Per-run parameters, win over the stored ones
     * @throws PostProcessError on any parameter or geometry failure
     */
    void run_pipeline(const ParameterPool& overrides = ParameterPool());

    /**
     * Write the result (or the blank, before any run) to STEP
     * @return true if successful
     */
    bool export_step(const std::string& filepath) const;

    /**
     * Export result mesh as glTF binary
     * @param mesh_path Output glTF file path
     * @param quality Linear deflection in mm
     * @return true if successful
     */
    bool export_mesh(const std::string& mesh_path, double quality);

    const TopoDS_Shape& get_blank() const { return blank_; }
    const TopoDS_Shape& get_result() const { return result_.IsNull() ? blank_ : result_; }
    const GearFrame& get_frame() const { return frame_; }
    bool has_frame() const { return has_frame_; }

    /**
     * Parameters used by the last run (stored overlaid with overrides)
     */
    const ParameterPool& get_effective_parameters() const { return effective_params_; }

    /**
     * Step reports of the last run
     */
    const std::vector<StepReport>& get_reports() const { return reports_; }

    /**
     * Statistics
     */
    size_t get_face_count() const;
    size_t get_edge_count() const;
    size_t get_solid_count() const;
    size_t get_triangle_count() const { return triangle_count_; }
    double get_blank_volume() const;
    double get_result_volume() const;

private:
    /**
     * Flat-shaded triangle soup: one vertex set per face
     */
    struct MeshData {
        std::vector<float> positions;
        std::vector<float> normals;
        std::vector<uint32_t> indices;
        float min_corner[3] = {0.0f, 0.0f, 0.0f};
        float max_corner[3] = {0.0f, 0.0f, 0.0f};

        void push_vertex(const gp_Pnt& p, const gp_Dir& n);
    };

    static constexpr double ANGULAR_DEFLECTION = 0.5;

    static bool tessellate(const TopoDS_Shape& shape, double quality, MeshData& mesh);
    static gp_Dir face_normal(const TopoDS_Face& face);
    static bool write_glb(const MeshData& mesh, const std::string& path);

    TopoDS_Shape blank_;
    TopoDS_Shape result_;
    GearFrame frame_;
    bool has_frame_;

    ParameterPool build_params_;
    ParameterPool effective_params_;
    std::vector<StepReport> reports_;

    size_t triangle_count_;
};

} // namespace gearpost
