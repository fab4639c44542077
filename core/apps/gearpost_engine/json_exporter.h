/**
 * JSON Exporter - Exports run metadata to JSON
 */

#pragma once

#include <string>
#include "engine.h"

namespace gearpost {

/**
 * Exports engine results to JSON files
 */
class JsonExporter {
public:
    explicit JsonExporter(const Engine& engine);

    /**
     * Export metadata to JSON
     * Schema: {version, units, frame, parameters, steps: [{name, applied, elapsed_ms}],
     *          counts, volume: {blank, result, removed}, bbox, timings}
     */
    bool export_metadata(const std::string& filepath, long processing_time_ms);

private:
    const Engine& engine_;
};

} // namespace gearpost
