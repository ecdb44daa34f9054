#pragma once

#include <sinew/anatomy/body_part.hpp>

#include <map>
#include <string>
#include <vector>

namespace sinew::anatomy {

/// How an anatomy gets around
enum class LocomotionModel : uint8_t {
    Limbs,      ///< Legs and feet carry the body; each lost one slows it down
    WholeBody   ///< The torso is the locomotion organ (slimes, golems)
};

/**
 * @brief Static description of one part in an anatomy layout
 *
 * Tags are kept as a plain list; build_parts() turns them into a fresh TagSet
 * for every part instance it creates.
 */
struct PartSpec {
    BodyPartKind kind = BodyPartKind::Torso;
    std::string display_name;
    double max_hp_ratio = 1.0;
    bool is_vital = false;
    bool is_limb = false;
    bool can_grasp = false;
    int natural_protection = 0;
    std::vector<std::string> tags;
};

/**
 * @brief Ordered list of part specifications for one anatomy variant
 *
 * build_parts() consumes any template, built-in or loaded from JSON.
 */
struct AnatomyTemplate {
    AnatomyVariant variant = AnatomyVariant::Simple;
    std::string name;
    LocomotionModel locomotion = LocomotionModel::Limbs;
    std::vector<PartSpec> parts;

    /**
     * @brief Humans, elves, orcs
     *
     * Head, neck, torso, and paired arms, hands, legs and feet. Paired parts
     * share their functional tags and differ by side tags ("left" plus
     * "left_hand", etc).
     */
    static AnatomyTemplate create_humanoid();

    /**
     * @brief Spiders, scorpions
     *
     * Vital thorax and abdomen, eight legs.
     */
    static AnatomyTemplate create_arachnid();

    /**
     * @brief Slimes, golems: one armored body part
     */
    static AnatomyTemplate create_simple();
};

using PartMap = std::map<BodyPartKind, BodyPart>;

/**
 * @brief Check template invariants
 *
 * Rejects empty templates, duplicate kinds, ratios outside (0, 1], negative
 * protection, a can_grasp flag that disagrees with a "grasp" tag, two parts
 * with identical tag sets, and whole-body locomotion without a torso.
 *
 * @throws std::runtime_error describing the first violation
 */
void validate_template(const AnatomyTemplate& anatomy);

/**
 * @brief Build the part mapping for one entity
 *
 * max_hp = floor(ratio * total_hp) per part, current_hp = max_hp. Every part
 * gets its own tag and status containers.
 *
 * @throws std::invalid_argument if total_hp <= 0
 */
PartMap build_parts(const AnatomyTemplate& anatomy, int total_hp);

/**
 * @brief Table of anatomy templates keyed by variant
 *
 * Starts with the built-in humanoid, arachnid and simple layouts. Other
 * variants (quadruped, insect, bird) are supplied at runtime, typically from
 * JSON files via AnatomyTemplateLoader.
 */
class AnatomyTemplateLibrary {
public:
    AnatomyTemplateLibrary();

    /// Process-wide library used when no library is passed explicitly
    static AnatomyTemplateLibrary& instance();

    /// Validate and add or replace the template for its variant
    void register_template(AnatomyTemplate anatomy);

    const AnatomyTemplate* find(AnatomyVariant variant) const;
    bool contains(AnatomyVariant variant) const;
    std::size_t size() const noexcept { return templates_.size(); }

    /// Restore the built-in set, dropping registered templates
    void reset();

private:
    std::map<AnatomyVariant, AnatomyTemplate> templates_;
};

/**
 * @brief Build parts for a variant from the process-wide library
 *
 * @throws std::invalid_argument if total_hp <= 0 or the variant has no template
 */
PartMap build_parts(AnatomyVariant variant, int total_hp);

} // namespace sinew::anatomy
