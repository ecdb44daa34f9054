#include <sinew/anatomy/anatomy_template_loader.hpp>
#include <sinew/core/log.hpp>
#include <nlohmann/json.hpp>

#include <fstream>
#include <optional>
#include <stdexcept>
#include <utility>

using json = nlohmann::json;

namespace sinew::anatomy {

// Helper: Fail on a key that is present with the wrong type
static void json_type_error(const json& j, const std::string& key, const char* expected) {
    throw std::runtime_error("Anatomy template field '" + key + "' must be " + expected +
                             ", got " + j[key].type_name());
}

// Helper: Extract string from JSON with default
static std::string json_get_string(const json& j, const std::string& key, const std::string& default_val = "") {
    if (!j.contains(key)) {
        return default_val;
    }
    if (!j[key].is_string()) {
        json_type_error(j, key, "a string");
    }
    return j[key].get<std::string>();
}

// Helper: Extract int from JSON with default
static int json_get_int(const json& j, const std::string& key, int default_val = 0) {
    if (!j.contains(key)) {
        return default_val;
    }
    if (!j[key].is_number_integer()) {
        json_type_error(j, key, "an integer");
    }
    return j[key].get<int>();
}

// Helper: Extract double from JSON with default
static double json_get_double(const json& j, const std::string& key, double default_val = 0.0) {
    if (!j.contains(key)) {
        return default_val;
    }
    if (!j[key].is_number()) {
        json_type_error(j, key, "a number");
    }
    return j[key].get<double>();
}

// Helper: Extract bool from JSON with default
static bool json_get_bool(const json& j, const std::string& key, bool default_val = false) {
    if (!j.contains(key)) {
        return default_val;
    }
    if (!j[key].is_boolean()) {
        json_type_error(j, key, "a boolean");
    }
    return j[key].get<bool>();
}

PartSpec AnatomyTemplateLoader::parse_part(const void* part_json_ptr, const std::string& source) {
    const json& part_json = *static_cast<const json*>(part_json_ptr);

    if (!part_json.is_object()) {
        throw std::runtime_error(source + ": every part must be a JSON object");
    }

    std::string kind_name = json_get_string(part_json, "kind");
    std::optional<BodyPartKind> kind = parse_body_part_kind(kind_name);
    if (!kind) {
        throw std::runtime_error(source + ": unknown body part kind '" + kind_name + "'");
    }

    if (!part_json.contains("ratio") || !part_json["ratio"].is_number()) {
        throw std::runtime_error(source + ": part '" + kind_name + "' needs a numeric ratio");
    }

    PartSpec spec;
    spec.kind = *kind;
    spec.display_name = json_get_string(part_json, "name", kind_name);
    spec.max_hp_ratio = json_get_double(part_json, "ratio");
    spec.is_vital = json_get_bool(part_json, "vital");
    spec.is_limb = json_get_bool(part_json, "limb");
    spec.can_grasp = json_get_bool(part_json, "grasp");
    spec.natural_protection = json_get_int(part_json, "protection");

    if (part_json.contains("tags")) {
        if (!part_json["tags"].is_array()) {
            throw std::runtime_error(source + ": tags of '" + kind_name + "' must be an array");
        }
        for (const auto& tag : part_json["tags"]) {
            if (!tag.is_string()) {
                throw std::runtime_error(source + ": tags of '" + kind_name + "' must be strings");
            }
            spec.tags.push_back(tag.get<std::string>());
        }
    }

    return spec;
}

AnatomyTemplate AnatomyTemplateLoader::parse_document(const void* document_json_ptr, const std::string& source) {
    const json& document = *static_cast<const json*>(document_json_ptr);

    if (!document.is_object()) {
        throw std::runtime_error(source + ": anatomy template must be a JSON object");
    }

    std::string variant_name = json_get_string(document, "variant");
    std::optional<AnatomyVariant> variant = parse_anatomy_variant(variant_name);
    if (!variant) {
        throw std::runtime_error(source + ": unknown anatomy variant '" + variant_name + "'");
    }

    AnatomyTemplate anatomy;
    anatomy.variant = *variant;
    anatomy.name = json_get_string(document, "name", variant_name);

    std::string locomotion = json_get_string(document, "locomotion", "limbs");
    if (locomotion == "limbs") {
        anatomy.locomotion = LocomotionModel::Limbs;
    } else if (locomotion == "whole_body") {
        anatomy.locomotion = LocomotionModel::WholeBody;
    } else {
        throw std::runtime_error(source + ": unknown locomotion '" + locomotion + "'");
    }

    if (!document.contains("parts") || !document["parts"].is_array()) {
        throw std::runtime_error(source + ": anatomy template needs a 'parts' array");
    }
    for (const auto& part_json : document["parts"]) {
        anatomy.parts.push_back(parse_part(&part_json, source));
    }

    validate_template(anatomy);
    return anatomy;
}

AnatomyTemplate AnatomyTemplateLoader::parse(const std::string& json_text) {
    json document;
    try {
        document = json::parse(json_text);
    } catch (const json::parse_error& e) {
        throw std::runtime_error("Failed to parse anatomy template JSON: " + std::string(e.what()));
    }
    return parse_document(&document, "<inline>");
}

AnatomyTemplate AnatomyTemplateLoader::load_file(const std::string& json_path) {
    LOG_SCOPE_TIMER_CAT("Anatomy template load", Performance);
    LOG_INFO(Assets, "Loading anatomy template: {}", json_path);

    std::ifstream file(json_path);
    if (!file.is_open()) {
        LOG_ERROR(Assets, "Failed to open anatomy template: {}", json_path);
        throw std::runtime_error("Failed to open anatomy template file: " + json_path);
    }

    json document;
    try {
        file >> document;
    } catch (const json::parse_error& e) {
        LOG_ERROR(Assets, "Failed to parse anatomy template: {} - {}", json_path, e.what());
        throw std::runtime_error("Failed to parse anatomy template JSON: " + std::string(e.what()));
    }

    AnatomyTemplate anatomy = parse_document(&document, json_path);
    LOG_INFO(Assets, "Loaded anatomy template '{}' ({} parts)", anatomy.name, anatomy.parts.size());
    return anatomy;
}

AnatomyVariant AnatomyTemplateLoader::load_into(AnatomyTemplateLibrary& library, const std::string& json_path) {
    AnatomyTemplate anatomy = load_file(json_path);
    AnatomyVariant variant = anatomy.variant;
    library.register_template(std::move(anatomy));
    return variant;
}

} // namespace sinew::anatomy
