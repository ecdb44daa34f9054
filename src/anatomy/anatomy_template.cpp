#include <sinew/anatomy/anatomy_template.hpp>
#include <sinew/core/log.hpp>

#include <cmath>
#include <set>
#include <stdexcept>
#include <string>
#include <utility>

namespace sinew::anatomy {

namespace {

PartSpec make_part(BodyPartKind kind, std::string name, double ratio,
                   std::vector<std::string> tags) {
    PartSpec spec;
    spec.kind = kind;
    spec.display_name = std::move(name);
    spec.max_hp_ratio = ratio;
    spec.tags = std::move(tags);
    return spec;
}

PartSpec make_vital(BodyPartKind kind, std::string name, double ratio,
                    std::vector<std::string> tags) {
    PartSpec spec = make_part(kind, std::move(name), ratio, std::move(tags));
    spec.is_vital = true;
    return spec;
}

PartSpec make_limb(BodyPartKind kind, std::string name, double ratio,
                   std::vector<std::string> tags) {
    PartSpec spec = make_part(kind, std::move(name), ratio, std::move(tags));
    spec.is_limb = true;
    return spec;
}

PartSpec make_hand(BodyPartKind kind, std::string name, const std::string& side) {
    PartSpec spec = make_limb(kind, std::move(name), 0.167,
        {"hand", "grasp", "manipulate", "hold", "use", side, side + "_hand", "upper_limbs"});
    spec.can_grasp = true;
    return spec;
}

} // namespace

AnatomyTemplate AnatomyTemplate::create_humanoid() {
    AnatomyTemplate anatomy;
    anatomy.variant = AnatomyVariant::Humanoid;
    anatomy.name = "humanoid";
    anatomy.locomotion = LocomotionModel::Limbs;
    anatomy.parts = {
        make_vital(BodyPartKind::Head, "head", 0.5, {"head", "armor", "cranium"}),
        make_vital(BodyPartKind::Neck, "neck", 0.267, {"neck", "armor", "cranium"}),
        make_vital(BodyPartKind::Torso, "torso", 1.0, {"torso", "armor", "core"}),
        make_limb(BodyPartKind::LeftArm, "left arm", 0.4,
                  {"arm", "armor", "left", "left_arm", "upper_limbs"}),
        make_limb(BodyPartKind::RightArm, "right arm", 0.4,
                  {"arm", "armor", "right", "right_arm", "upper_limbs"}),
        make_hand(BodyPartKind::LeftHand, "left hand", "left"),
        make_hand(BodyPartKind::RightHand, "right hand", "right"),
        make_limb(BodyPartKind::LeftLeg, "left leg", 0.5,
                  {"leg", "locomotion", "left", "left_leg", "lower_limbs"}),
        make_limb(BodyPartKind::RightLeg, "right leg", 0.5,
                  {"leg", "locomotion", "right", "right_leg", "lower_limbs"}),
        make_limb(BodyPartKind::LeftFoot, "left foot", 0.2,
                  {"foot", "locomotion", "armor", "left", "left_foot", "lower_limbs"}),
        make_limb(BodyPartKind::RightFoot, "right foot", 0.2,
                  {"foot", "locomotion", "armor", "right", "right_foot", "lower_limbs"})
    };
    return anatomy;
}

AnatomyTemplate AnatomyTemplate::create_arachnid() {
    AnatomyTemplate anatomy;
    anatomy.variant = AnatomyVariant::Arachnid;
    anatomy.name = "arachnid";
    anatomy.locomotion = LocomotionModel::Limbs;
    anatomy.parts = {
        make_vital(BodyPartKind::Thorax, "thorax", 1.0, {"thorax", "armor"}),
        make_vital(BodyPartKind::Abdomen, "abdomen", 0.5, {"abdomen", "armor"})
    };

    struct LegSlot {
        BodyPartKind kind;
        const char* position;
        const char* side;
    };
    const LegSlot legs[] = {
        {BodyPartKind::FrontLeftLeg, "front", "left"},
        {BodyPartKind::FrontRightLeg, "front", "right"},
        {BodyPartKind::SecondLeftLeg, "second", "left"},
        {BodyPartKind::SecondRightLeg, "second", "right"},
        {BodyPartKind::ThirdLeftLeg, "third", "left"},
        {BodyPartKind::ThirdRightLeg, "third", "right"},
        {BodyPartKind::BackLeftLeg, "back", "left"},
        {BodyPartKind::BackRightLeg, "back", "right"}
    };
    for (const LegSlot& leg : legs) {
        std::string position = leg.position;
        std::string side = leg.side;
        anatomy.parts.push_back(make_limb(leg.kind, position + " " + side + " leg", 0.4,
            {"leg", "locomotion", side, position + "_" + side + "_leg"}));
    }
    return anatomy;
}

AnatomyTemplate AnatomyTemplate::create_simple() {
    PartSpec body = make_vital(BodyPartKind::Torso, "body", 1.0, {"torso", "armor"});
    body.natural_protection = 1;

    AnatomyTemplate anatomy;
    anatomy.variant = AnatomyVariant::Simple;
    anatomy.name = "simple";
    anatomy.locomotion = LocomotionModel::WholeBody;
    anatomy.parts = {body};
    return anatomy;
}

void validate_template(const AnatomyTemplate& anatomy) {
    const std::string label = anatomy.name.empty() ? to_string(anatomy.variant) : anatomy.name;

    if (anatomy.parts.empty()) {
        throw std::runtime_error("Anatomy template '" + label + "' has no parts");
    }

    std::set<BodyPartKind> kinds;
    std::set<TagSet> tag_sets;
    for (const PartSpec& spec : anatomy.parts) {
        if (!kinds.insert(spec.kind).second) {
            throw std::runtime_error("Anatomy template '" + label + "' lists " +
                                     to_string(spec.kind) + " more than once");
        }
        if (!(spec.max_hp_ratio > 0.0 && spec.max_hp_ratio <= 1.0)) {
            throw std::runtime_error("Anatomy template '" + label + "': HP ratio of " +
                                     to_string(spec.kind) + " must be in (0, 1]");
        }
        if (spec.natural_protection < 0) {
            throw std::runtime_error("Anatomy template '" + label + "': negative protection on " +
                                     std::string(to_string(spec.kind)));
        }
        // Parts of the same functional type must stay distinguishable
        TagSet tags(spec.tags.begin(), spec.tags.end());
        if (spec.can_grasp != tags.contains("grasp")) {
            throw std::runtime_error("Anatomy template '" + label + "': " + to_string(spec.kind) +
                                     " must set can_grasp exactly when tagged \"grasp\"");
        }
        if (!tag_sets.insert(std::move(tags)).second) {
            throw std::runtime_error("Anatomy template '" + label + "': tag set of " +
                                     to_string(spec.kind) + " duplicates another part");
        }
    }

    if (anatomy.locomotion == LocomotionModel::WholeBody && !kinds.contains(BodyPartKind::Torso)) {
        throw std::runtime_error("Anatomy template '" + label +
                                 "' uses whole-body locomotion but has no torso");
    }
}

PartMap build_parts(const AnatomyTemplate& anatomy, int total_hp) {
    if (total_hp <= 0) {
        LOG_ERROR(Anatomy, "Cannot build '{}' anatomy with total HP {}", anatomy.name, total_hp);
        throw std::invalid_argument("Total HP must be positive, got " + std::to_string(total_hp));
    }

    PartMap parts;
    for (const PartSpec& spec : anatomy.parts) {
        BodyPart part;
        part.kind = spec.kind;
        part.display_name = spec.display_name;
        part.max_hp_ratio = spec.max_hp_ratio;
        part.max_hp = static_cast<int>(std::floor(spec.max_hp_ratio * total_hp));
        part.current_hp = part.max_hp;
        part.is_vital = spec.is_vital;
        part.is_limb = spec.is_limb;
        part.can_grasp = spec.can_grasp;
        part.natural_protection = spec.natural_protection;
        part.capability_tags = TagSet(spec.tags.begin(), spec.tags.end());
        part.status_effects = TagSet{};

        parts.emplace(spec.kind, std::move(part));
    }
    return parts;
}

AnatomyTemplateLibrary::AnatomyTemplateLibrary() {
    reset();
}

AnatomyTemplateLibrary& AnatomyTemplateLibrary::instance() {
    static AnatomyTemplateLibrary library;
    return library;
}

void AnatomyTemplateLibrary::register_template(AnatomyTemplate anatomy) {
    validate_template(anatomy);

    const AnatomyVariant variant = anatomy.variant;
    if (contains(variant)) {
        LOG_WARNING(Anatomy, "Replacing anatomy template for variant {} with '{}'",
                    to_string(variant), anatomy.name);
    }
    LOG_INFO(Anatomy, "Registered anatomy template '{}' for variant {} ({} parts)",
             anatomy.name, to_string(variant), anatomy.parts.size());
    templates_.insert_or_assign(variant, std::move(anatomy));
}

const AnatomyTemplate* AnatomyTemplateLibrary::find(AnatomyVariant variant) const {
    auto it = templates_.find(variant);
    return (it != templates_.end()) ? &it->second : nullptr;
}

bool AnatomyTemplateLibrary::contains(AnatomyVariant variant) const {
    return templates_.contains(variant);
}

void AnatomyTemplateLibrary::reset() {
    templates_.clear();
    templates_.emplace(AnatomyVariant::Humanoid, AnatomyTemplate::create_humanoid());
    templates_.emplace(AnatomyVariant::Arachnid, AnatomyTemplate::create_arachnid());
    templates_.emplace(AnatomyVariant::Simple, AnatomyTemplate::create_simple());
}

PartMap build_parts(AnatomyVariant variant, int total_hp) {
    const AnatomyTemplate* anatomy = AnatomyTemplateLibrary::instance().find(variant);
    if (!anatomy) {
        LOG_ERROR(Anatomy, "No anatomy template registered for variant {}", to_string(variant));
        throw std::invalid_argument(std::string("No anatomy template for variant ") + to_string(variant));
    }
    return build_parts(*anatomy, total_hp);
}

} // namespace sinew::anatomy
