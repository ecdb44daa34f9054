#include <sinew/anatomy/body_part_registry.hpp>
#include <sinew/anatomy/equipment_eligibility.hpp>

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <string>
#include <vector>

using namespace sinew::anatomy;
using namespace testing;

namespace {

std::vector<std::string> names_of(const std::vector<const BodyPart*>& parts) {
    std::vector<std::string> names;
    for (const BodyPart* part : parts) {
        names.push_back(part->display_name);
    }
    return names;
}

} // namespace

class EquipmentEligibilityTest : public ::testing::Test {
protected:
    BodyPartRegistry body{AnatomyVariant::Humanoid, 100, {}, 5};
    EquipmentEligibility equipment{body};
};

TEST_F(EquipmentEligibilityTest, HandWeaponsGoToEitherHand) {
    auto sword = EquippableDefinition::create_sword();

    EXPECT_TRUE(equipment.can_equip(sword));
    EXPECT_THAT(names_of(equipment.candidate_parts(sword)), ElementsAre("left hand", "right hand"));
}

TEST_F(EquipmentEligibilityTest, ArmorSlotsMatchTags) {
    EXPECT_THAT(names_of(equipment.candidate_parts(EquippableDefinition::create_helmet())),
                ElementsAre("head"));
    EXPECT_THAT(names_of(equipment.candidate_parts(EquippableDefinition::create_chain_mail())),
                ElementsAre("torso"));
    EXPECT_THAT(names_of(equipment.candidate_parts(EquippableDefinition::create_boots())),
                ElementsAre("left foot", "right foot"));
    EXPECT_THAT(names_of(equipment.candidate_parts(EquippableDefinition::create_leggings())),
                ElementsAre("left leg", "right leg"));
    EXPECT_THAT(names_of(equipment.candidate_parts(EquippableDefinition::create_backpack())),
                ElementsAre("torso"));
}

TEST_F(EquipmentEligibilityTest, SideTagsNarrowCandidates) {
    EXPECT_THAT(names_of(equipment.candidate_parts(TagSet{"hand", "left"})), ElementsAre("left hand"));
    EXPECT_TRUE(equipment.can_equip(TagSet{"right_foot"}));
    EXPECT_FALSE(equipment.can_equip(TagSet{"tail"}));
}

TEST_F(EquipmentEligibilityTest, EmptyRequirementMatchesEveryIntactPart) {
    EXPECT_EQ(equipment.candidate_parts(TagSet{}).size(), body.part_count());

    body.apply_damage(BodyPartKind::LeftFoot, 100);
    EXPECT_EQ(equipment.candidate_parts(TagSet{}).size(), body.part_count() - 1);
}

TEST_F(EquipmentEligibilityTest, DestroyedPartsCannotHostItems) {
    auto helmet = EquippableDefinition::create_helmet();
    body.apply_damage(BodyPartKind::Head, 1000);

    EXPECT_FALSE(equipment.can_equip(helmet));
    EXPECT_TRUE(equipment.candidate_parts(helmet).empty());
    EXPECT_EQ(equipment.select_target(helmet), nullptr);
}

TEST_F(EquipmentEligibilityTest, LosingBothHandsBlocksWeapons) {
    auto dagger = EquippableDefinition::create_dagger();
    auto torch = EquippableDefinition::create_torch();

    body.apply_damage(BodyPartKind::LeftHand, 1000);
    EXPECT_TRUE(equipment.can_equip(dagger));
    EXPECT_THAT(names_of(equipment.candidate_parts(torch)), ElementsAre("right hand"));

    body.apply_damage(BodyPartKind::RightHand, 1000);
    EXPECT_FALSE(equipment.can_equip(dagger));
    EXPECT_FALSE(equipment.can_equip(torch));
    EXPECT_FALSE(equipment.can_equip(EquippableDefinition::create_gauntlets()));
}

TEST_F(EquipmentEligibilityTest, SelectTargetPolicies) {
    auto shield = EquippableDefinition::create_shield();

    const BodyPart* first = equipment.select_target(shield);
    ASSERT_NE(first, nullptr);
    EXPECT_EQ(first->kind, BodyPartKind::LeftHand);

    // Ties on health go to the lowest kind
    const BodyPart* tied = equipment.select_target(shield, TargetPolicy::LeastDamaged);
    ASSERT_NE(tied, nullptr);
    EXPECT_EQ(tied->kind, BodyPartKind::LeftHand);

    body.apply_damage(BodyPartKind::LeftHand, 4);
    const BodyPart* healthiest = equipment.select_target(shield, TargetPolicy::LeastDamaged);
    ASSERT_NE(healthiest, nullptr);
    EXPECT_EQ(healthiest->kind, BodyPartKind::RightHand);
    EXPECT_EQ(equipment.select_target(shield, TargetPolicy::FirstByKind)->kind, BodyPartKind::LeftHand);
}

TEST_F(EquipmentEligibilityTest, WholeBodyCreatureOnlyWearsArmor) {
    BodyPartRegistry ooze(AnatomyVariant::Simple, 30, {}, 5);
    EquipmentEligibility ooze_equipment(ooze);

    EXPECT_TRUE(ooze_equipment.can_equip(EquippableDefinition::create_leather_armor()));
    EXPECT_FALSE(ooze_equipment.can_equip(EquippableDefinition::create_sword()));
    EXPECT_FALSE(ooze_equipment.can_equip(EquippableDefinition::create_helmet()));
}

TEST_F(EquipmentEligibilityTest, PresetBonuses) {
    auto sword = EquippableDefinition::create_sword();
    EXPECT_EQ(sword.type, EquipmentType::Weapon);
    EXPECT_EQ(sword.power_bonus, 4);

    auto mail = EquippableDefinition::create_chain_mail();
    EXPECT_EQ(mail.type, EquipmentType::Armor);
    EXPECT_EQ(mail.defense_bonus, 3);
    EXPECT_EQ(mail.required_tags, (TagSet{"torso", "armor"}));

    EXPECT_STREQ(to_string(EquipmentType::Gauntlets), "gauntlets");
}
