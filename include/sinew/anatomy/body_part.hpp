#pragma once

#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <string_view>

namespace sinew::anatomy {

/// Capability tags and status effects are unordered unique string sets
using TagSet = std::set<std::string, std::less<>>;

/// Anatomical slots. Enumeration order is the iteration order of every registry.
enum class BodyPartKind : uint8_t {
    Head,
    Neck,
    Torso,
    LeftArm,
    RightArm,
    LeftHand,
    RightHand,
    LeftLeg,
    RightLeg,
    LeftFoot,
    RightFoot,
    Tail,
    Wings,
    Antenna,
    Mandibles,
    Thorax,
    Abdomen,
    FrontLeftLeg,
    FrontRightLeg,
    SecondLeftLeg,
    SecondRightLeg,
    ThirdLeftLeg,
    ThirdRightLeg,
    BackLeftLeg,
    BackRightLeg
};

/// Named creature layouts
enum class AnatomyVariant : uint8_t {
    Humanoid,
    Quadruped,
    Insect,
    Arachnid,
    Bird,
    Simple
};

/// Banding of remaining HP, most to least healthy
enum class DamageTier : uint8_t {
    Healthy,            ///< Full HP
    Damaged,            ///< More than 75% HP left
    Wounded,            ///< More than 50% HP left
    BadlyWounded,       ///< More than 25% HP left
    SeverelyWounded,    ///< Some HP left
    Destroyed           ///< No HP left
};

const char* to_string(BodyPartKind kind) noexcept;
const char* to_string(AnatomyVariant variant) noexcept;
const char* to_string(DamageTier tier) noexcept;

std::optional<BodyPartKind> parse_body_part_kind(std::string_view name) noexcept;
std::optional<AnatomyVariant> parse_anatomy_variant(std::string_view name) noexcept;

/**
 * @brief One anatomical part of one entity
 *
 * Holds the template data the part was built from plus its mutable HP and
 * status effects. HP stays within [0, max_hp]: take_damage() and heal() clamp.
 * Every part owns its own tag and status containers.
 */
struct BodyPart {
    BodyPartKind kind = BodyPartKind::Torso;
    std::string display_name;
    double max_hp_ratio = 1.0;      ///< Fraction of the entity's total HP, (0, 1]
    int max_hp = 0;
    int current_hp = 0;
    bool is_vital = false;          ///< Entity dies when this part is destroyed
    bool is_limb = false;           ///< Can be lost without killing the entity
    bool can_grasp = false;         ///< Can hold weapons and tools
    int natural_protection = 0;
    TagSet capability_tags;
    TagSet status_effects;

    bool is_destroyed() const {
        return current_hp == 0;
    }

    bool is_damaged() const {
        return current_hp < max_hp;
    }

    /// 0.0 = untouched, 1.0 = destroyed. A part with no HP pool counts as destroyed.
    float damage_fraction() const {
        if (max_hp <= 0) {
            return 1.0f;
        }
        return 1.0f - static_cast<float>(current_hp) / static_cast<float>(max_hp);
    }

    /// current_hp / max_hp, 0.0 when the part has no HP pool
    float health_ratio() const {
        if (max_hp <= 0) {
            return 0.0f;
        }
        return static_cast<float>(current_hp) / static_cast<float>(max_hp);
    }

    DamageTier damage_tier() const;

    bool has_tag(std::string_view tag) const {
        return capability_tags.find(tag) != capability_tags.end();
    }

    /// True if every required tag is carried by this part
    bool has_all_tags(const TagSet& required_tags) const;

    /**
     * @brief Reduce HP, never below zero
     * @return Damage actually dealt
     */
    int take_damage(int amount);

    /**
     * @brief Restore HP, never above max_hp
     * @return Healing actually done
     */
    int heal(int amount);
};

} // namespace sinew::anatomy
