#pragma once

#include <sinew/anatomy/anatomy_template.hpp>

#include <string>

namespace sinew::anatomy {

// AnatomyTemplateLoader - Reads anatomy templates from JSON
//
// File layout:
//   {
//     "name": "quadruped",
//     "variant": "quadruped",
//     "locomotion": "limbs",            // or "whole_body"; default "limbs"
//     "parts": [
//       { "kind": "head", "name": "head", "ratio": 0.5,
//         "vital": true, "limb": false, "grasp": false,
//         "protection": 0, "tags": ["head", "armor"] }
//     ]
//   }
class AnatomyTemplateLoader {
public:
    // Parse a template from JSON text
    // Throws std::runtime_error on malformed JSON, unknown kinds/variants,
    // or a template that fails validate_template()
    static AnatomyTemplate parse(const std::string& json_text);

    // Read and parse a template file
    // Throws std::runtime_error if the file cannot be opened or parsed
    static AnatomyTemplate load_file(const std::string& json_path);

    // Load a file and register the result, returning its variant
    static AnatomyVariant load_into(AnatomyTemplateLibrary& library, const std::string& json_path);

private:
    static AnatomyTemplate parse_document(const void* document_json, const std::string& source);
    static PartSpec parse_part(const void* part_json, const std::string& source);
};

} // namespace sinew::anatomy
