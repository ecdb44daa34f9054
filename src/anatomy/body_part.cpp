#include <sinew/anatomy/body_part.hpp>

#include <algorithm>
#include <array>
#include <stdexcept>
#include <string>
#include <utility>

namespace sinew::anatomy {

namespace {

constexpr std::array<std::pair<BodyPartKind, const char*>, 25> kind_names = {{
    {BodyPartKind::Head, "head"},
    {BodyPartKind::Neck, "neck"},
    {BodyPartKind::Torso, "torso"},
    {BodyPartKind::LeftArm, "left_arm"},
    {BodyPartKind::RightArm, "right_arm"},
    {BodyPartKind::LeftHand, "left_hand"},
    {BodyPartKind::RightHand, "right_hand"},
    {BodyPartKind::LeftLeg, "left_leg"},
    {BodyPartKind::RightLeg, "right_leg"},
    {BodyPartKind::LeftFoot, "left_foot"},
    {BodyPartKind::RightFoot, "right_foot"},
    {BodyPartKind::Tail, "tail"},
    {BodyPartKind::Wings, "wings"},
    {BodyPartKind::Antenna, "antenna"},
    {BodyPartKind::Mandibles, "mandibles"},
    {BodyPartKind::Thorax, "thorax"},
    {BodyPartKind::Abdomen, "abdomen"},
    {BodyPartKind::FrontLeftLeg, "front_left_leg"},
    {BodyPartKind::FrontRightLeg, "front_right_leg"},
    {BodyPartKind::SecondLeftLeg, "second_left_leg"},
    {BodyPartKind::SecondRightLeg, "second_right_leg"},
    {BodyPartKind::ThirdLeftLeg, "third_left_leg"},
    {BodyPartKind::ThirdRightLeg, "third_right_leg"},
    {BodyPartKind::BackLeftLeg, "back_left_leg"},
    {BodyPartKind::BackRightLeg, "back_right_leg"}
}};

constexpr std::array<std::pair<AnatomyVariant, const char*>, 6> variant_names = {{
    {AnatomyVariant::Humanoid, "humanoid"},
    {AnatomyVariant::Quadruped, "quadruped"},
    {AnatomyVariant::Insect, "insect"},
    {AnatomyVariant::Arachnid, "arachnid"},
    {AnatomyVariant::Bird, "bird"},
    {AnatomyVariant::Simple, "simple"}
}};

} // namespace

const char* to_string(BodyPartKind kind) noexcept {
    for (const auto& [k, name] : kind_names) {
        if (k == kind) return name;
    }
    return "unknown";
}

const char* to_string(AnatomyVariant variant) noexcept {
    for (const auto& [v, name] : variant_names) {
        if (v == variant) return name;
    }
    return "unknown";
}

const char* to_string(DamageTier tier) noexcept {
    switch (tier) {
        case DamageTier::Healthy:         return "healthy";
        case DamageTier::Damaged:         return "damaged";
        case DamageTier::Wounded:         return "wounded";
        case DamageTier::BadlyWounded:    return "badly wounded";
        case DamageTier::SeverelyWounded: return "severely wounded";
        case DamageTier::Destroyed:       return "destroyed";
        default:                          return "unknown";
    }
}

std::optional<BodyPartKind> parse_body_part_kind(std::string_view name) noexcept {
    for (const auto& [kind, kind_name] : kind_names) {
        if (name == kind_name) return kind;
    }
    return std::nullopt;
}

std::optional<AnatomyVariant> parse_anatomy_variant(std::string_view name) noexcept {
    for (const auto& [variant, variant_name] : variant_names) {
        if (name == variant_name) return variant;
    }
    return std::nullopt;
}

DamageTier BodyPart::damage_tier() const {
    if (is_destroyed()) {
        return DamageTier::Destroyed;
    }
    if (!is_damaged()) {
        return DamageTier::Healthy;
    }

    // Bands are on remaining HP, checked from the healthy end down
    float remaining = health_ratio();
    if (remaining > 0.75f) {
        return DamageTier::Damaged;
    } else if (remaining > 0.5f) {
        return DamageTier::Wounded;
    } else if (remaining > 0.25f) {
        return DamageTier::BadlyWounded;
    }
    return DamageTier::SeverelyWounded;
}

bool BodyPart::has_all_tags(const TagSet& required_tags) const {
    return std::includes(capability_tags.begin(), capability_tags.end(),
                         required_tags.begin(), required_tags.end(),
                         capability_tags.value_comp());
}

int BodyPart::take_damage(int amount) {
    if (amount < 0) {
        throw std::invalid_argument("Damage amount must be non-negative, got " + std::to_string(amount));
    }

    int actual_damage = std::min(amount, current_hp);
    current_hp -= actual_damage;
    return actual_damage;
}

int BodyPart::heal(int amount) {
    if (amount < 0) {
        throw std::invalid_argument("Heal amount must be non-negative, got " + std::to_string(amount));
    }

    int actual_healing = std::min(amount, max_hp - current_hp);
    current_hp += actual_healing;
    return actual_healing;
}

} // namespace sinew::anatomy
