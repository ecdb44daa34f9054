#include <sinew/anatomy/equipment_eligibility.hpp>
#include <sinew/anatomy/body_part_registry.hpp>
#include <sinew/core/log.hpp>

namespace sinew::anatomy {

const char* to_string(EquipmentType type) noexcept {
    switch (type) {
        case EquipmentType::Weapon:    return "weapon";
        case EquipmentType::Armor:     return "armor";
        case EquipmentType::Offhand:   return "offhand";
        case EquipmentType::Backpack:  return "backpack";
        case EquipmentType::Shield:    return "shield";
        case EquipmentType::Helmet:    return "helmet";
        case EquipmentType::Boots:     return "boots";
        case EquipmentType::Gauntlets: return "gauntlets";
        case EquipmentType::Leggings:  return "leggings";
        default:                       return "unknown";
    }
}

EquippableDefinition EquippableDefinition::create_dagger() {
    EquippableDefinition item;
    item.name = "dagger";
    item.type = EquipmentType::Weapon;
    item.power_bonus = 2;
    item.required_tags = {"hand", "grasp"};
    return item;
}

EquippableDefinition EquippableDefinition::create_sword() {
    EquippableDefinition item;
    item.name = "sword";
    item.type = EquipmentType::Weapon;
    item.power_bonus = 4;
    item.required_tags = {"hand", "grasp"};
    return item;
}

EquippableDefinition EquippableDefinition::create_torch() {
    EquippableDefinition item;
    item.name = "torch";
    item.type = EquipmentType::Weapon;
    item.required_tags = {"grasp", "hold"};
    return item;
}

EquippableDefinition EquippableDefinition::create_shield() {
    EquippableDefinition item;
    item.name = "shield";
    item.type = EquipmentType::Shield;
    item.defense_bonus = 2;
    item.required_tags = {"hand", "grasp"};
    return item;
}

EquippableDefinition EquippableDefinition::create_leather_armor() {
    EquippableDefinition item;
    item.name = "leather armor";
    item.type = EquipmentType::Armor;
    item.defense_bonus = 1;
    item.required_tags = {"torso", "armor"};
    return item;
}

EquippableDefinition EquippableDefinition::create_chain_mail() {
    EquippableDefinition item;
    item.name = "chain mail";
    item.type = EquipmentType::Armor;
    item.defense_bonus = 3;
    item.required_tags = {"torso", "armor"};
    return item;
}

EquippableDefinition EquippableDefinition::create_helmet() {
    EquippableDefinition item;
    item.name = "helmet";
    item.type = EquipmentType::Helmet;
    item.defense_bonus = 1;
    item.required_tags = {"head", "armor"};
    return item;
}

EquippableDefinition EquippableDefinition::create_boots() {
    EquippableDefinition item;
    item.name = "boots";
    item.type = EquipmentType::Boots;
    item.defense_bonus = 1;
    item.required_tags = {"foot"};
    return item;
}

EquippableDefinition EquippableDefinition::create_gauntlets() {
    EquippableDefinition item;
    item.name = "gauntlets";
    item.type = EquipmentType::Gauntlets;
    item.defense_bonus = 1;
    item.required_tags = {"hand"};
    return item;
}

EquippableDefinition EquippableDefinition::create_leggings() {
    EquippableDefinition item;
    item.name = "leggings";
    item.type = EquipmentType::Leggings;
    item.defense_bonus = 1;
    item.required_tags = {"leg"};
    return item;
}

EquippableDefinition EquippableDefinition::create_backpack() {
    EquippableDefinition item;
    item.name = "backpack";
    item.type = EquipmentType::Backpack;
    item.required_tags = {"torso"};
    return item;
}

EquipmentEligibility::EquipmentEligibility(const BodyPartRegistry& registry)
    : registry_(registry)
{
}

bool EquipmentEligibility::can_equip(const TagSet& required_tags) const {
    return registry_.can_equip(required_tags);
}

bool EquipmentEligibility::can_equip(const EquippableDefinition& item) const {
    bool allowed = registry_.can_equip(item.required_tags);
    if (!allowed) {
        LOG_DEBUG(Equipment, "No intact part can take {} ({})", item.name, to_string(item.type));
    }
    return allowed;
}

std::vector<const BodyPart*> EquipmentEligibility::candidate_parts(const TagSet& required_tags) const {
    return registry_.parts_matching(required_tags);
}

std::vector<const BodyPart*> EquipmentEligibility::candidate_parts(const EquippableDefinition& item) const {
    return registry_.parts_matching(item.required_tags);
}

const BodyPart* EquipmentEligibility::select_target(const EquippableDefinition& item,
                                                    TargetPolicy policy) const {
    std::vector<const BodyPart*> candidates = registry_.parts_matching(item.required_tags);
    if (candidates.empty()) {
        return nullptr;
    }

    const BodyPart* chosen = candidates.front();
    if (policy == TargetPolicy::LeastDamaged) {
        // Candidates arrive in kind order; strict > keeps the first on ties
        for (const BodyPart* part : candidates) {
            if (part->health_ratio() > chosen->health_ratio()) {
                chosen = part;
            }
        }
    }

    LOG_TRACE(Equipment, "{} goes on {}", item.name, chosen->display_name);
    return chosen;
}

} // namespace sinew::anatomy
