#pragma once

#include <sinew/anatomy/body_part.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace sinew::anatomy {

class BodyPartRegistry;

enum class EquipmentType : uint8_t {
    Weapon,
    Armor,
    Offhand,
    Backpack,
    Shield,
    Helmet,
    Boots,
    Gauntlets,
    Leggings
};

const char* to_string(EquipmentType type) noexcept;

/**
 * @brief What an item needs from a body to be worn or wielded
 *
 * Owned by the item definitions; the anatomy only reads required_tags.
 */
struct EquippableDefinition {
    std::string name;
    EquipmentType type = EquipmentType::Weapon;
    int power_bonus = 0;
    int defense_bonus = 0;
    TagSet required_tags;

    static EquippableDefinition create_dagger();
    static EquippableDefinition create_sword();
    static EquippableDefinition create_torch();
    static EquippableDefinition create_shield();
    static EquippableDefinition create_leather_armor();
    static EquippableDefinition create_chain_mail();
    static EquippableDefinition create_helmet();
    static EquippableDefinition create_boots();
    static EquippableDefinition create_gauntlets();
    static EquippableDefinition create_leggings();
    static EquippableDefinition create_backpack();
};

/// How to pick one part when several can host an item
enum class TargetPolicy : uint8_t {
    FirstByKind,    ///< Lowest BodyPartKind
    LeastDamaged    ///< Highest health ratio, ties broken by kind
};

/**
 * @brief Tag-matching gate in front of equip actions
 *
 * An item fits a part when its required tags are a subset of the part's
 * capability tags and the part is intact. Holds a reference to the registry,
 * which must outlive it.
 */
class EquipmentEligibility {
public:
    explicit EquipmentEligibility(const BodyPartRegistry& registry);

    bool can_equip(const TagSet& required_tags) const;
    bool can_equip(const EquippableDefinition& item) const;

    std::vector<const BodyPart*> candidate_parts(const TagSet& required_tags) const;
    std::vector<const BodyPart*> candidate_parts(const EquippableDefinition& item) const;

    /**
     * @brief Deterministically pick the part an item goes on
     * @return nullptr if no intact part matches
     */
    const BodyPart* select_target(const EquippableDefinition& item,
                                  TargetPolicy policy = TargetPolicy::FirstByKind) const;

private:
    const BodyPartRegistry& registry_;
};

} // namespace sinew::anatomy
