#include <sinew/anatomy/anatomy_template_loader.hpp>
#include <sinew/anatomy/body_part_registry.hpp>
#include <sinew/anatomy/equipment_eligibility.hpp>
#include <sinew/core/log.hpp>

#include <iomanip>
#include <iostream>
#include <random>
#include <string>

using namespace sinew::anatomy;

namespace {

void print_status(const std::string& label, const BodyPartRegistry& body) {
    std::cout << label << " - alive: " << std::boolalpha << body.is_alive()
              << ", can move: " << body.can_move()
              << ", can manipulate: " << body.can_manipulate()
              << std::fixed << std::setprecision(2)
              << ", movement penalty: " << body.movement_penalty()
              << ", manipulation penalty: " << body.manipulation_penalty() << "\n";

    for (const std::string& line : body.status_report()) {
        std::cout << "    " << line << "\n";
    }
}

void demonstrate_targeted_damage() {
    std::cout << "\n=== Targeted Damage ===\n";

    BodyPartRegistry body(AnatomyVariant::Humanoid, 100, {}, 7);
    print_status("Fresh humanoid", body);

    int dealt = body.apply_damage(BodyPartKind::LeftLeg, 60);
    std::cout << "Hit left leg for 60, dealt " << dealt << "\n";
    body.apply_damage(BodyPartKind::RightHand, 10);
    std::cout << "Right hand grip: " << to_string(body.grip_state(BodyPartKind::RightHand)) << "\n";

    print_status("After injuries", body);

    int healed = body.heal_all(5);
    std::cout << "Bandages restored " << healed << " HP\n";
    print_status("After bandages", body);
}

void demonstrate_random_hits() {
    std::cout << "\n=== Random Hits ===\n";

    BodyPartRegistry body(AnatomyVariant::Humanoid, 40);
    std::mt19937 rng(2024);

    for (int round = 1; round <= 10 && body.is_alive(); ++round) {
        const BodyPart* hit = body.apply_damage_random(9, rng);
        if (hit) {
            std::cout << "Round " << round << ": " << hit->display_name
                      << " is " << to_string(hit->damage_tier()) << "\n";
        } else {
            std::cout << "Round " << round << ": no damage landed\n";
        }
    }
    print_status("After the brawl", body);
}

void demonstrate_equipment() {
    std::cout << "\n=== Equipment Eligibility ===\n";

    BodyPartRegistry body(AnatomyVariant::Humanoid, 30);
    EquipmentEligibility equipment(body);

    const EquippableDefinition items[] = {
        EquippableDefinition::create_sword(),
        EquippableDefinition::create_helmet(),
        EquippableDefinition::create_torch(),
        EquippableDefinition::create_boots(),
        EquippableDefinition::create_gauntlets(),
        EquippableDefinition::create_leather_armor(),
        EquippableDefinition::create_shield()
    };

    for (const EquippableDefinition& item : items) {
        std::cout << std::left << std::setw(16) << item.name << " -> ";
        for (const BodyPart* part : equipment.candidate_parts(item)) {
            std::cout << part->display_name << "; ";
        }
        std::cout << "\n";
    }

    body.apply_damage(BodyPartKind::RightHand, 100);
    const BodyPart* target = equipment.select_target(EquippableDefinition::create_sword(),
                                                     TargetPolicy::LeastDamaged);
    std::cout << "With the right hand gone the sword goes to: "
              << (target ? target->display_name : std::string("nothing")) << "\n";
}

void demonstrate_templates(const std::string& template_path) {
    std::cout << "\n=== Data-Driven Templates ===\n";

    AnatomyTemplateLibrary& library = AnatomyTemplateLibrary::instance();
    AnatomyVariant variant = AnatomyTemplateLoader::load_into(library, template_path);

    BodyPartRegistry beast(variant, 80);
    std::cout << "Loaded " << to_string(variant) << " with " << beast.part_count() << " parts\n";

    beast.apply_damage(BodyPartKind::FrontLeftLeg, 100);
    print_status("Lame beast", beast);
}

} // namespace

int main(int argc, char** argv) {
    sinew::core::Logger::instance().initialize("logs/anatomy_example.log");

    std::cout << "Sinew - Body Part Anatomy Demo\n";
    std::cout << "==============================\n";

    try {
        demonstrate_targeted_damage();
        demonstrate_random_hits();
        demonstrate_equipment();
        if (argc > 1) {
            demonstrate_templates(argv[1]);
        }

        std::cout << "\n=== All Demonstrations Completed Successfully ===\n";

    } catch (const std::exception& e) {
        std::cerr << "Error during demonstration: " << e.what() << std::endl;
        sinew::core::Logger::instance().shutdown();
        return 1;
    }

    sinew::core::Logger::instance().shutdown();
    return 0;
}
