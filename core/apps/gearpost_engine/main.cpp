/**
 * Gearpost Engine
 *
 * Headless post-processor for gear blanks: bore, recess, hub, spokes and
 * chamfer driven by named parameters.
 */

#include <iostream>
#include <optional>
#include <string>
#include <filesystem>
#include <chrono>

#include <Standard_Failure.hxx>

#include "engine.h"
#include "errors.h"
#include "json_exporter.h"
#include "version.h"

namespace fs = std::filesystem;

void print_usage(const char* prog_name) {
    std::cout << "Gearpost Engine v" << GEARPOST_VERSION << "\n"
              << "Usage: " << prog_name << " [options]\n\n"
              << "Options:\n"
              << "  --input <file>            Gear blank STEP file\n"
              << "  --blank-cylinder <r,h>    Use a cylinder blank instead of --input\n"
              << "  --outdir <dir>            Output directory (required)\n"
              << "  --addendum-radius <val>   Tooth tip radius in mm (default: from blank)\n"
              << "  --width <val>             Face width in mm (default: from blank)\n"
              << "  --param <name=value>      Step parameter; value is none, a number or a,b\n"
              << "                            (repeatable)\n"
              << "  --mesh-quality <val>      Mesh linear deflection in mm (default: 0.05)\n"
              << "  --list-steps              List pipeline steps and their parameters\n"
              << "  --version                 Print version and exit\n"
              << "  --help                    Show this help\n\n"
              << "Example:\n"
              << "  " << prog_name << " --input blank.step --outdir out/ \\\n"
              << "      --param bore_d=5 --param n_spokes=5 --param spokes_od=30 \\\n"
              << "      --param spoke_width=4 --param chamfer=0.5\n\n"
              << "Outputs:\n"
              << "  result.step           - Post-processed solid\n"
              << "  mesh.glb              - 3D mesh in glTF binary format\n"
              << "  meta.json             - Metadata (parameters, steps, counts, timings)\n";
}

void list_steps() {
    gearpost::ModificationPipeline pipeline{gearpost::GearFrame()};

    std::cout << "{\n  \"steps\": [";
    const auto& steps = pipeline.GetSteps();
    for (size_t i = 0; i < steps.size(); i++) {
        const gearpost::StepDescriptor& d = steps[i]->Descriptor();
        std::cout << (i == 0 ? "\n" : ",\n");
        std::cout << "    {\"name\": \"" << d.name << "\", \"triggers\": [";
        for (size_t t = 0; t < d.triggers.size(); t++) {
            std::cout << (t == 0 ? "" : ", ") << "\"" << d.triggers[t] << "\"";
        }
        std::cout << "], \"params\": [";
        for (size_t p = 0; p < d.params.size(); p++) {
            std::cout << (p == 0 ? "" : ", ") << "{\"name\": \"" << d.params[p].name
                      << "\", \"required\": " << (d.params[p].default_value ? "false" : "true") << "}";
        }
        std::cout << "]}";
    }
    std::cout << "\n  ]\n}" << std::endl;
}

bool parse_param(const std::string& text, gearpost::ParameterPool& pool) {
    size_t eq = text.find('=');
    if (eq == std::string::npos || eq == 0) {
        std::cerr << "ERROR: --param expects name=value, got: " << text << "\n";
        return false;
    }

    std::string name = text.substr(0, eq);
    pool.Set(name, gearpost::ParamValue::Parse(name, text.substr(eq + 1)));
    return true;
}

int main(int argc, char** argv) {
    // Parse command line arguments
    std::string input_file;
    std::string output_dir;
    std::string blank_cylinder;
    std::optional<double> addendum_radius;
    std::optional<double> width;
    double mesh_quality = 0.05;
    gearpost::ParameterPool params;

    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];

            if (arg == "--help" || arg == "-h") {
                print_usage(argv[0]);
                return 0;
            }
            else if (arg == "--version") {
                std::cout << "Gearpost v" << GEARPOST_VERSION << "\n"
                          << "OpenCASCADE geometry kernel\n"
                          << "Built on " << __DATE__ << "\n";
                return 0;
            }
            else if (arg == "--list-steps") {
                list_steps();
                return 0;
            }
            else if (arg == "--input" && i + 1 < argc) {
                input_file = argv[++i];
            }
            else if (arg == "--blank-cylinder" && i + 1 < argc) {
                blank_cylinder = argv[++i];
            }
            else if (arg == "--outdir" && i + 1 < argc) {
                output_dir = argv[++i];
            }
            else if (arg == "--addendum-radius" && i + 1 < argc) {
                addendum_radius = std::stod(argv[++i]);
            }
            else if (arg == "--width" && i + 1 < argc) {
                width = std::stod(argv[++i]);
            }
            else if (arg == "--param" && i + 1 < argc) {
                if (!parse_param(argv[++i], params)) {
                    return 1;
                }
            }
            else if (arg == "--mesh-quality" && i + 1 < argc) {
                mesh_quality = std::stod(argv[++i]);
            }
            else {
                std::cerr << "Unknown option: " << arg << "\n";
                print_usage(argv[0]);
                return 1;
            }
        }
    }
    catch (const std::exception& e) {
        std::cerr << "ERROR: Invalid argument: " << e.what() << "\n";
        return 1;
    }

    // Validate required arguments
    if (output_dir.empty() || (input_file.empty() == blank_cylinder.empty())) {
        std::cerr << "ERROR: --outdir and exactly one of --input / --blank-cylinder are required\n";
        print_usage(argv[0]);
        return 1;
    }

    if (!input_file.empty() && !fs::exists(input_file)) {
        std::cerr << "ERROR: Input file not found: " << input_file << "\n";
        return 1;
    }

    // Create output directory
    fs::create_directories(output_dir);

    std::cout << "Gearpost Engine v" << GEARPOST_VERSION << "\n";
    std::cout << "Input:  " << (input_file.empty() ? "cylinder " + blank_cylinder : input_file) << "\n";
    std::cout << "Output: " << output_dir << "\n";
    std::cout << "Parameters: " << params.size() << "\n\n";

    auto start_time = std::chrono::high_resolution_clock::now();

    try {
        gearpost::Engine engine;

        // Blank
        std::cout << "[1/4] Preparing gear blank...\n";
        if (!input_file.empty()) {
            if (!engine.load_step(input_file)) {
                std::cerr << "ERROR: Failed to load STEP file\n";
                return 1;
            }
        } else {
            gearpost::ParamValue dims = gearpost::ParamValue::Parse("blank-cylinder", blank_cylinder);
            if (!dims.is_pair() || !engine.make_cylinder_blank(dims.pair().first, dims.pair().second)) {
                std::cerr << "ERROR: --blank-cylinder expects <radius>,<height>\n";
                return 1;
            }
        }

        // Frame
        std::cout << "[2/4] Resolving gear frame...\n";
        if (!engine.resolve_frame(addendum_radius, width)) {
            std::cerr << "ERROR: Failed to resolve gear frame\n";
            return 1;
        }

        // Pipeline
        std::cout << "[3/4] Running modification pipeline...\n";
        engine.run_pipeline(params);

        // Export results
        std::cout << "[4/4] Exporting results...\n";
        if (!engine.export_step(output_dir + "/result.step")) {
            std::cerr << "ERROR: Failed to export result.step\n";
            return 1;
        }

        if (!engine.export_mesh(output_dir + "/mesh.glb", mesh_quality)) {
            std::cerr << "ERROR: Mesh export failed\n";
            return 1;
        }

        auto end_time = std::chrono::high_resolution_clock::now();
        auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(end_time - start_time);

        gearpost::JsonExporter exporter(engine);
        if (!exporter.export_metadata(output_dir + "/meta.json", duration.count())) {
            std::cerr << "ERROR: Failed to export meta.json\n";
            return 1;
        }

        std::cout << "\n✓ Processing complete in " << duration.count() << "ms\n";
        std::cout << "  Volume removed: " << (engine.get_blank_volume() - engine.get_result_volume()) << "mm³\n";
        std::cout << "  Triangles generated: " << engine.get_triangle_count() << "\n";
        std::cout << "  Output files:\n";
        std::cout << "    - result.step\n";
        std::cout << "    - mesh.glb\n";
        std::cout << "    - meta.json\n";

        return 0;
    }
    catch (const std::exception& e) {
        std::cerr << "ERROR: " << e.what() << "\n";
        return 1;
    }
    catch (const Standard_Failure& e) {
        std::cerr << "ERROR: OpenCASCADE: " << e.GetMessageString() << "\n";
        return 1;
    }
}
