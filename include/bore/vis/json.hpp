#pragma once

#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "bore/anno/annotation.hpp"
#include "bore/util/name_registry.hpp"

namespace bore {
namespace vis {

// {"class": "SinkDeclared", "target": "~Top|Expect>y", "name": "x"}
// "name" is present only for source and sink intents.
nlohmann::json annotationToJson(const anno::Annotation& a);

// Array of annotationToJson, in emission order.
nlohmann::json annotationsToJson(const std::vector<anno::Annotation>& annos);

// Intents grouped by boring ID:
// {"<id>": {"sources": [target...], "sinks": [target...],
//           "noDedup": [module target...]}}
// Dedup suppression carries no ID; it is listed under every ID whose source
// or sink lives in that module.
nlohmann::json wiringViewJson(const std::vector<anno::Annotation>& annos);

// {"size": n, "names": [sorted names]}
nlohmann::json namespaceToJson(const NameRegistry& ns);

// Convenience: write JSON to a file
inline void writeJsonFile(const std::string& path, const nlohmann::json& j) {
    std::ofstream ofs(path);
    if (!ofs)
        throw std::runtime_error("Cannot open file for writing: " + path);
    ofs << j.dump(2) << std::endl;
}

} // namespace vis
} // namespace bore
