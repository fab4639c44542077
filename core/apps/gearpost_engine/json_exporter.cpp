/**
 * JSON Exporter Implementation
 */

#include "json_exporter.h"
#include "version.h"

#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>

// OpenCASCADE includes
#include <BRepBndLib.hxx>
#include <Bnd_Box.hxx>

namespace gearpost {

namespace {

// Simple JSON escaping
std::string escape_json(const std::string& str) {
    std::ostringstream oss;
    for (char c : str) {
        switch (c) {
            case '"':  oss << "\\\""; break;
            case '\\': oss << "\\\\"; break;
            case '\n': oss << "\\n"; break;
            case '\r': oss << "\\r"; break;
            case '\t': oss << "\\t"; break;
            default: oss << c; break;
        }
    }
    return oss.str();
}

std::string json_value(const ParamValue& value) {
    std::ostringstream oss;
    oss << std::setprecision(10);
    switch (value.kind()) {
        case ParamValue::Kind::ABSENT:
            oss << "null";
            break;
        case ParamValue::Kind::SCALAR:
            oss << value.scalar();
            break;
        case ParamValue::Kind::PAIR:
            oss << "[" << value.pair().first << ", " << value.pair().second << "]";
            break;
    }
    return oss.str();
}

} // namespace

JsonExporter::JsonExporter(const Engine& engine)
    : engine_(engine)
{
}

bool JsonExporter::export_metadata(const std::string& filepath, long processing_time_ms) {
    std::ofstream out(filepath);
    if (!out.is_open()) {
        std::cerr << "ERROR: Failed to open " << filepath << "\n";
        return false;
    }

    out << std::setprecision(10);

    const GearFrame& frame = engine_.get_frame();
    double blank_volume = engine_.get_blank_volume();
    double result_volume = engine_.get_result_volume();

    out << "{\n";
    out << "  \"version\": \"" << GEARPOST_VERSION << "\",\n";
    out << "  \"units\": \"mm\",\n";

    out << "  \"frame\": {\n";
    out << "    \"addendum_radius\": " << frame.addendum_radius << ",\n";
    out << "    \"width\": " << frame.width << "\n";
    out << "  },\n";

    // Parameters
    out << "  \"parameters\": {";
    const ParameterPool& params = engine_.get_effective_parameters();
    bool first = true;
    for (const auto& entry : params) {
        out << (first ? "\n" : ",\n");
        out << "    \"" << escape_json(entry.first) << "\": " << json_value(entry.second);
        first = false;
    }
    out << (params.empty() ? "},\n" : "\n  },\n");

    // Steps
    out << "  \"steps\": [";
    const std::vector<StepReport>& reports = engine_.get_reports();
    for (size_t i = 0; i < reports.size(); i++) {
        const StepReport& r = reports[i];
        out << (i == 0 ? "\n" : ",\n");
        out << "    {\"name\": \"" << escape_json(r.name) << "\", "
            << "\"applied\": " << (r.applied ? "true" : "false") << ", "
            << "\"elapsed_ms\": " << r.elapsed_ms << "}";
    }
    out << (reports.empty() ? "],\n" : "\n  ],\n");

    out << "  \"counts\": {\n";
    out << "    \"solids\": " << engine_.get_solid_count() << ",\n";
    out << "    \"faces\": " << engine_.get_face_count() << ",\n";
    out << "    \"edges\": " << engine_.get_edge_count() << ",\n";
    out << "    \"triangles\": " << engine_.get_triangle_count() << "\n";
    out << "  },\n";

    out << "  \"volume\": {\n";
    out << "    \"blank\": " << blank_volume << ",\n";
    out << "    \"result\": " << result_volume << ",\n";
    out << "    \"removed\": " << (blank_volume - result_volume) << "\n";
    out << "  },\n";

    // Bounding box of the result
    double xmin = 0, ymin = 0, zmin = 0, xmax = 0, ymax = 0, zmax = 0;
    if (!engine_.get_result().IsNull()) {
        Bnd_Box bbox;
        BRepBndLib::Add(engine_.get_result(), bbox);
        if (!bbox.IsVoid()) {
            bbox.Get(xmin, ymin, zmin, xmax, ymax, zmax);
        }
    }
    out << "  \"bbox\": {\n";
    out << "    \"min\": [" << xmin << ", " << ymin << ", " << zmin << "],\n";
    out << "    \"max\": [" << xmax << ", " << ymax << ", " << zmax << "]\n";
    out << "  },\n";

    out << "  \"timings\": {\n";
    out << "    \"total_ms\": " << processing_time_ms << "\n";
    out << "  }\n";
    out << "}\n";

    out.close();

    std::cout << "  ✓ Exported metadata to " << filepath << "\n";

    return true;
}

} // namespace gearpost
