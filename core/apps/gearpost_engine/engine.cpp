/**
 * Gearpost Engine Implementation
 */

#include "engine.h"
#include "errors.h"
#include "kernel.h"
#include "version.h"

#include <algorithm>
#include <cstdint>
#include <iostream>

// OpenCASCADE includes
#include <BRepAdaptor_Surface.hxx>
#include <BRepLProp_SLProps.hxx>
#include <BRepMesh_IncrementalMesh.hxx>
#include <BRepPrimAPI_MakeCylinder.hxx>
#include <BRep_Tool.hxx>
#include <IFSelect_ReturnStatus.hxx>
#include <Poly_Triangulation.hxx>
#include <STEPControl_Reader.hxx>
#include <STEPControl_Writer.hxx>
#include <Standard_Failure.hxx>
#include <TopExp.hxx>
#include <TopExp_Explorer.hxx>
#include <TopLoc_Location.hxx>
#include <TopTools_IndexedMapOfShape.hxx>
#include <TopoDS.hxx>
#include <TopoDS_Face.hxx>

// glTF export
#define TINYGLTF_IMPLEMENTATION
#define STB_IMAGE_IMPLEMENTATION
#define STB_IMAGE_WRITE_IMPLEMENTATION
#include <tinygltf.h>

namespace gearpost {

Engine::Engine()
    : has_frame_(false), triangle_count_(0)
{
}

Engine::~Engine() {
}

bool Engine::load_step(const std::string& filepath) {
    STEPControl_Reader reader;
    IFSelect_ReturnStatus status = reader.ReadFile(filepath.c_str());

    if (status != IFSelect_RetDone) {
        std::cerr << "ERROR: Failed to read STEP file: " << filepath << "\n";
        return false;
    }

    // Transfer all roots
    reader.TransferRoots();

    TopoDS_Shape shape = reader.OneShape();

    if (shape.IsNull()) {
        std::cerr << "ERROR: Loaded shape is null\n";
        return false;
    }

    if (kernel::CountSolids(shape) == 0) {
        std::cerr << "ERROR: STEP file contains no solid: " << filepath << "\n";
        return false;
    }

    set_blank(shape);

    std::cout << "  ✓ STEP file loaded successfully\n";

    return true;
}

bool Engine::make_cylinder_blank(double radius, double height) {
    if (!(radius > 0.0) || !(height > 0.0)) {
        std::cerr << "ERROR: Cylinder blank needs positive radius and height\n";
        return false;
    }

    BRepPrimAPI_MakeCylinder cylinder(radius, height);
    cylinder.Build();

    if (!cylinder.IsDone()) {
        std::cerr << "ERROR: Failed to build cylinder blank\n";
        return false;
    }

    set_blank(cylinder.Shape());
    set_frame(GearFrame(radius, height));

    std::cout << "  ✓ Cylinder blank r=" << radius << "mm h=" << height << "mm\n";

    return true;
}

bool Engine::derive_frame() {
    if (blank_.IsNull()) {
        std::cerr << "ERROR: No blank loaded\n";
        return false;
    }

    try {
        set_frame(GearFrame::FromShape(blank_));
    }
    catch (const PostProcessError& e) {
        std::cerr << "ERROR: " << e.what() << "\n";
        return false;
    }

    std::cout << "  ✓ Frame derived from blank: addendum radius "
              << frame_.addendum_radius << "mm, width " << frame_.width << "mm\n";

    return true;
}

bool Engine::resolve_frame(std::optional<double> addendum_radius, std::optional<double> width) {
    if ((addendum_radius && !(*addendum_radius > 0.0)) || (width && !(*width > 0.0))) {
        std::cerr << "ERROR: Addendum radius and width must be positive\n";
        return false;
    }

    if (!(addendum_radius && width) && !has_frame_) {
        std::cerr << "    WARNING: frame not fully given, deriving the rest from blank\n";
        if (!derive_frame()) {
            return false;
        }
    }

    GearFrame frame = frame_;
    if (addendum_radius) frame.addendum_radius = *addendum_radius;
    if (width) frame.width = *width;
    set_frame(frame);

    return true;
}

void Engine::run_pipeline(const ParameterPool& overrides) {
    if (blank_.IsNull()) {
        throw_geometry("", "input", "no blank loaded");
    }
    if (!has_frame_) {
        throw_invalid("", "frame", "addendum radius and width are not set");
    }

    effective_params_ = build_params_.Overlay(overrides);
    reports_.clear();
    result_.Nullify();

    ModificationPipeline pipeline(frame_);
    result_ = pipeline.Apply(blank_, effective_params_);
    reports_ = pipeline.GetReports();

    size_t applied = static_cast<size_t>(
        std::count_if(reports_.begin(), reports_.end(),
                      [](const StepReport& r) { return r.applied; }));

    std::cout << "  ✓ Applied " << applied << " of " << reports_.size() << " steps\n";
}

bool Engine::export_step(const std::string& filepath) const {
    const TopoDS_Shape& shape = get_result();
    if (shape.IsNull()) {
        std::cerr << "ERROR: No shape to export\n";
        return false;
    }

    STEPControl_Writer writer;
    if (writer.Transfer(shape, STEPControl_AsIs) != IFSelect_RetDone) {
        std::cerr << "ERROR: Failed to transfer shape to STEP\n";
        return false;
    }

    if (writer.Write(filepath.c_str()) != IFSelect_RetDone) {
        std::cerr << "ERROR: Failed to write STEP file: " << filepath << "\n";
        return false;
    }

    std::cout << "  ✓ Exported STEP to " << filepath << "\n";

    return true;
}

bool Engine::export_mesh(const std::string& mesh_path, double quality) {
    const TopoDS_Shape& shape = get_result();
    if (shape.IsNull()) {
        std::cerr << "ERROR: No shape to mesh\n";
        return false;
    }

    MeshData mesh;
    if (!tessellate(shape, quality, mesh)) {
        return false;
    }
    triangle_count_ = mesh.indices.size() / 3;

    std::cout << "  ✓ Generated mesh: " << triangle_count_
              << " triangles, " << mesh.positions.size() / 3 << " vertices\n";

    if (!write_glb(mesh, mesh_path)) {
        return false;
    }

    std::cout << "  ✓ Exported mesh to " << mesh_path << "\n";

    return true;
}

bool Engine::tessellate(const TopoDS_Shape& shape, double quality, MeshData& mesh) {
    BRepMesh_IncrementalMesh mesher(shape, quality, Standard_False, ANGULAR_DEFLECTION, Standard_True);
    if (!mesher.IsDone()) {
        std::cerr << "ERROR: Mesh generation failed\n";
        return false;
    }

    mesh = MeshData();

    for (TopExp_Explorer exp(shape, TopAbs_FACE); exp.More(); exp.Next()) {
        const TopoDS_Face& face = TopoDS::Face(exp.Current());

        TopLoc_Location loc;
        Handle(Poly_Triangulation) tri = BRep_Tool::Triangulation(face, loc);
        if (tri.IsNull()) {
            continue;
        }

        bool reversed = (face.Orientation() == TopAbs_REVERSED);
        gp_Dir normal = face_normal(face);
        uint32_t base = static_cast<uint32_t>(mesh.positions.size() / 3);

        for (int i = 1; i <= tri->NbNodes(); i++) {
            gp_Pnt pnt = tri->Node(i).Transformed(loc);
            mesh.push_vertex(pnt, normal);
        }

        // Keep outward winding on reversed faces
        for (int i = 1; i <= tri->NbTriangles(); i++) {
            int n1, n2, n3;
            tri->Triangle(i).Get(n1, n2, n3);
            if (reversed) {
                std::swap(n2, n3);
            }
            for (int n : {n1, n2, n3}) {
                mesh.indices.push_back(base + static_cast<uint32_t>(n - 1));
            }
        }
    }

    if (mesh.indices.empty()) {
        std::cerr << "ERROR: Tessellation produced no triangles\n";
        return false;
    }
    return true;
}

gp_Dir Engine::face_normal(const TopoDS_Face& face) {
    // Flat normal per face, taken at the middle of its parameter range
    BRepAdaptor_Surface surface(face);
    double u_mid = (surface.FirstUParameter() + surface.LastUParameter()) / 2.0;
    double v_mid = (surface.FirstVParameter() + surface.LastVParameter()) / 2.0;

    gp_Dir normal(0, 0, 1);
    try {
        BRepLProp_SLProps props(surface, u_mid, v_mid, 1, 1e-6);
        if (props.IsNormalDefined()) {
            normal = props.Normal();
        }
    } catch (const Standard_Failure&) {
        // Singular point: keep the default normal
    }
    if (face.Orientation() == TopAbs_REVERSED) {
        normal.Reverse();
    }
    return normal;
}

void Engine::MeshData::push_vertex(const gp_Pnt& p, const gp_Dir& n) {
    const float xyz[3] = {static_cast<float>(p.X()), static_cast<float>(p.Y()), static_cast<float>(p.Z())};
    if (positions.empty()) {
        std::copy(xyz, xyz + 3, min_corner);
        std::copy(xyz, xyz + 3, max_corner);
    }
    for (int k = 0; k < 3; k++) {
        min_corner[k] = std::min(min_corner[k], xyz[k]);
        max_corner[k] = std::max(max_corner[k], xyz[k]);
        positions.push_back(xyz[k]);
    }
    normals.push_back(static_cast<float>(n.X()));
    normals.push_back(static_cast<float>(n.Y()));
    normals.push_back(static_cast<float>(n.Z()));
}

namespace {

// Append raw bytes to buffer 0 as a new view; returns the view index
int append_view(tinygltf::Model& model, const void* data, size_t bytes, int target) {
    tinygltf::Buffer& buffer = model.buffers[0];

    tinygltf::BufferView view;
    view.buffer = 0;
    view.byteOffset = buffer.data.size();
    view.byteLength = bytes;
    view.target = target;

    const unsigned char* raw = static_cast<const unsigned char*>(data);
    buffer.data.insert(buffer.data.end(), raw, raw + bytes);

    model.bufferViews.push_back(view);
    return static_cast<int>(model.bufferViews.size() - 1);
}

int append_accessor(tinygltf::Model& model, int view, int component_type, int type, size_t count) {
    tinygltf::Accessor accessor;
    accessor.bufferView = view;
    accessor.componentType = component_type;
    accessor.type = type;
    accessor.count = count;

    model.accessors.push_back(accessor);
    return static_cast<int>(model.accessors.size() - 1);
}

} // namespace

bool Engine::write_glb(const MeshData& mesh, const std::string& path) {
    tinygltf::Model model;
    model.buffers.resize(1);

    size_t vertex_count = mesh.positions.size() / 3;

    int positions = append_accessor(model,
        append_view(model, mesh.positions.data(), mesh.positions.size() * sizeof(float),
                    TINYGLTF_TARGET_ARRAY_BUFFER),
        TINYGLTF_COMPONENT_TYPE_FLOAT, TINYGLTF_TYPE_VEC3, vertex_count);

    // glTF requires bounds on POSITION
    tinygltf::Accessor& position_accessor = model.accessors[positions];
    position_accessor.minValues.assign(mesh.min_corner, mesh.min_corner + 3);
    position_accessor.maxValues.assign(mesh.max_corner, mesh.max_corner + 3);

    int normals = append_accessor(model,
        append_view(model, mesh.normals.data(), mesh.normals.size() * sizeof(float),
                    TINYGLTF_TARGET_ARRAY_BUFFER),
        TINYGLTF_COMPONENT_TYPE_FLOAT, TINYGLTF_TYPE_VEC3, vertex_count);

    int indices = append_accessor(model,
        append_view(model, mesh.indices.data(), mesh.indices.size() * sizeof(uint32_t),
                    TINYGLTF_TARGET_ELEMENT_ARRAY_BUFFER),
        TINYGLTF_COMPONENT_TYPE_UNSIGNED_INT, TINYGLTF_TYPE_SCALAR, mesh.indices.size());

    tinygltf::Primitive primitive;
    primitive.attributes["POSITION"] = positions;
    primitive.attributes["NORMAL"] = normals;
    primitive.indices = indices;
    primitive.mode = TINYGLTF_MODE_TRIANGLES;

    tinygltf::Mesh gltf_mesh;
    gltf_mesh.name = "gearpost_result";
    gltf_mesh.primitives.push_back(primitive);
    model.meshes.push_back(gltf_mesh);

    tinygltf::Node node;
    node.mesh = 0;
    model.nodes.push_back(node);

    tinygltf::Scene scene;
    scene.nodes.push_back(0);
    model.scenes.push_back(scene);
    model.defaultScene = 0;

    model.asset.version = "2.0";
    model.asset.generator = std::string("gearpost ") + GEARPOST_VERSION;

    tinygltf::TinyGLTF gltf;
    if (!gltf.WriteGltfSceneToFile(&model, path, false, true, true, true)) {
        std::cerr << "ERROR: Failed to write glTF file: " << path << "\n";
        return false;
    }
    return true;
}

size_t Engine::get_face_count() const {
    TopTools_IndexedMapOfShape faces;
    TopExp::MapShapes(get_result(), TopAbs_FACE, faces);
    return static_cast<size_t>(faces.Extent());
}

size_t Engine::get_edge_count() const {
    TopTools_IndexedMapOfShape edges;
    TopExp::MapShapes(get_result(), TopAbs_EDGE, edges);
    return static_cast<size_t>(edges.Extent());
}

size_t Engine::get_solid_count() const {
    return static_cast<size_t>(kernel::CountSolids(get_result()));
}

double Engine::get_blank_volume() const {
    return blank_.IsNull() ? 0.0 : kernel::Volume(blank_);
}

double Engine::get_result_volume() const {
    const TopoDS_Shape& shape = get_result();
    return shape.IsNull() ? 0.0 : kernel::Volume(shape);
}

} // namespace gearpost
