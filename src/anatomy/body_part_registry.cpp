#include <sinew/anatomy/body_part_registry.hpp>
#include <sinew/core/log.hpp>

#include <algorithm>
#include <array>
#include <cmath>
#include <stdexcept>
#include <string>
#include <vector>

namespace sinew::anatomy {

namespace {

// Parts that carry a limb-locomotion body
constexpr std::array<BodyPartKind, 12> locomotion_slots = {
    BodyPartKind::LeftLeg, BodyPartKind::RightLeg,
    BodyPartKind::LeftFoot, BodyPartKind::RightFoot,
    BodyPartKind::FrontLeftLeg, BodyPartKind::FrontRightLeg,
    BodyPartKind::SecondLeftLeg, BodyPartKind::SecondRightLeg,
    BodyPartKind::ThirdLeftLeg, BodyPartKind::ThirdRightLeg,
    BodyPartKind::BackLeftLeg, BodyPartKind::BackRightLeg
};

constexpr std::array<BodyPartKind, 4> manipulation_slots = {
    BodyPartKind::LeftHand, BodyPartKind::RightHand,
    BodyPartKind::LeftArm, BodyPartKind::RightArm
};

const AnatomyTemplate& require_template(AnatomyVariant variant) {
    const AnatomyTemplate* anatomy = AnatomyTemplateLibrary::instance().find(variant);
    if (!anatomy) {
        LOG_ERROR(Anatomy, "No anatomy template registered for variant {}", to_string(variant));
        throw std::invalid_argument(std::string("No anatomy template for variant ") + to_string(variant));
    }
    return *anatomy;
}

void require_non_negative(int amount, const char* what) {
    if (amount < 0) {
        LOG_ERROR(Combat, "Rejected negative {} amount {}", what, amount);
        throw std::invalid_argument(std::string(what) + " amount must be non-negative, got " +
                                    std::to_string(amount));
    }
}

std::vector<const BodyPart*> collect(const PartMap& parts, bool (*keep)(const BodyPart&)) {
    std::vector<const BodyPart*> result;
    for (const auto& [kind, part] : parts) {
        if (keep(part)) {
            result.push_back(&part);
        }
    }
    return result;
}

} // namespace

void validate_hit_config(const HitLocationConfig& config) {
    const int weights[] = {
        config.torso_weight, config.head_weight, config.limb_weight, config.default_weight
    };

    bool any_positive = false;
    for (int weight : weights) {
        if (weight < 0) {
            LOG_ERROR(Combat, "Rejected negative hit weight {}", weight);
            throw std::invalid_argument("Hit location weights must be non-negative, got " +
                                        std::to_string(weight));
        }
        any_positive = any_positive || weight > 0;
    }

    if (!any_positive) {
        LOG_ERROR(Combat, "Rejected hit location config with all weights zero");
        throw std::invalid_argument("Hit location config needs at least one positive weight");
    }
}

const char* to_string(GripState state) noexcept {
    switch (state) {
        case GripState::NotApplicable: return "not applicable";
        case GripState::Secure:        return "secure";
        case GripState::AtRisk:        return "at risk";
        case GripState::Lost:          return "lost";
        default:                       return "unknown";
    }
}

BodyPartRegistry::BodyPartRegistry(AnatomyVariant variant, int total_hp,
                                   const HitLocationConfig& config, std::uint32_t seed)
    : BodyPartRegistry(require_template(variant), total_hp, config, seed)
{
}

BodyPartRegistry::BodyPartRegistry(const AnatomyTemplate& anatomy, int total_hp,
                                   const HitLocationConfig& config, std::uint32_t seed)
    : variant_(anatomy.variant)
    , locomotion_(anatomy.locomotion)
    , total_hp_(total_hp)
    , config_(config)
    , rng_(seed)
{
    validate_hit_config(config);
    validate_template(anatomy);
    parts_ = build_parts(anatomy, total_hp);

    LOG_DEBUG(Anatomy, "Created {} body ({} parts, total HP {})",
              anatomy.name, parts_.size(), total_hp);
}

// === Queries ===

const BodyPart* BodyPartRegistry::get(BodyPartKind kind) const {
    auto it = parts_.find(kind);
    return (it != parts_.end()) ? &it->second : nullptr;
}

BodyPart* BodyPartRegistry::find_mutable(BodyPartKind kind) {
    auto it = parts_.find(kind);
    return (it != parts_.end()) ? &it->second : nullptr;
}

std::vector<const BodyPart*> BodyPartRegistry::vital_parts() const {
    return collect(parts_, [](const BodyPart& part) { return part.is_vital; });
}

std::vector<const BodyPart*> BodyPartRegistry::limbs() const {
    return collect(parts_, [](const BodyPart& part) { return part.is_limb; });
}

std::vector<const BodyPart*> BodyPartRegistry::damaged_parts() const {
    return collect(parts_, [](const BodyPart& part) { return part.is_damaged(); });
}

std::vector<const BodyPart*> BodyPartRegistry::destroyed_parts() const {
    return collect(parts_, [](const BodyPart& part) { return part.is_destroyed(); });
}

std::vector<const BodyPart*> BodyPartRegistry::grasping_parts() const {
    return collect(parts_, [](const BodyPart& part) { return part.can_grasp && !part.is_destroyed(); });
}

std::vector<const BodyPart*> BodyPartRegistry::parts_matching(const TagSet& required_tags) const {
    std::vector<const BodyPart*> matching;
    for (const auto& [kind, part] : parts_) {
        if (!part.is_destroyed() && part.has_all_tags(required_tags)) {
            matching.push_back(&part);
        }
    }
    return matching;
}

bool BodyPartRegistry::can_equip(const TagSet& required_tags) const {
    return std::any_of(parts_.begin(), parts_.end(), [&](const auto& entry) {
        return !entry.second.is_destroyed() && entry.second.has_all_tags(required_tags);
    });
}

std::optional<float> BodyPartRegistry::health_ratio(BodyPartKind kind) const {
    const BodyPart* part = get(kind);
    if (!part) {
        return std::nullopt;
    }
    return part->health_ratio();
}

bool BodyPartRegistry::has_status_effect(BodyPartKind kind, std::string_view effect) const {
    const BodyPart* part = get(kind);
    return part && part->status_effects.find(effect) != part->status_effects.end();
}

// === Derived status ===

bool BodyPartRegistry::is_alive() const {
    return std::none_of(parts_.begin(), parts_.end(), [](const auto& entry) {
        return entry.second.is_vital && entry.second.is_destroyed();
    });
}

bool BodyPartRegistry::can_move() const {
    if (locomotion_ == LocomotionModel::WholeBody) {
        const BodyPart* torso = get(BodyPartKind::Torso);
        return torso && !torso->is_destroyed();
    }

    return std::any_of(locomotion_slots.begin(), locomotion_slots.end(), [this](BodyPartKind kind) {
        const BodyPart* part = get(kind);
        return part && !part->is_destroyed();
    });
}

bool BodyPartRegistry::can_manipulate() const {
    return std::any_of(parts_.begin(), parts_.end(), [](const auto& entry) {
        return !entry.second.is_destroyed() && entry.second.has_tag("grasp");
    });
}

float BodyPartRegistry::lost_fraction(const BodyPartKind* kinds, std::size_t count) const {
    int total = 0;
    int functional = 0;

    for (std::size_t i = 0; i < count; ++i) {
        const BodyPart* part = get(kinds[i]);
        if (part) {
            ++total;
            if (!part->is_destroyed()) {
                ++functional;
            }
        }
    }

    if (total == 0) {
        return 0.0f;
    }
    return 1.0f - static_cast<float>(functional) / static_cast<float>(total);
}

float BodyPartRegistry::movement_penalty() const {
    if (locomotion_ == LocomotionModel::WholeBody) {
        const BodyPart* torso = get(BodyPartKind::Torso);
        return torso ? torso->damage_fraction() : 0.0f;
    }
    return lost_fraction(locomotion_slots.data(), locomotion_slots.size());
}

float BodyPartRegistry::manipulation_penalty() const {
    if (locomotion_ == LocomotionModel::WholeBody) {
        return 0.0f; // Whole-body movers have no manipulators
    }
    return lost_fraction(manipulation_slots.data(), manipulation_slots.size());
}

GripState BodyPartRegistry::grip_state(BodyPartKind kind) const {
    const BodyPart* part = get(kind);
    if (!part || !part->can_grasp) {
        return GripState::NotApplicable;
    }

    const std::int64_t current = part->current_hp;
    if (part->is_destroyed() || current * 4 <= part->max_hp) {
        return GripState::Lost;
    }
    if (current * 2 <= part->max_hp) {
        return GripState::AtRisk;
    }
    return GripState::Secure;
}

std::vector<std::string> BodyPartRegistry::status_report() const {
    std::vector<std::string> lines;

    for (const auto& [kind, part] : parts_) {
        if (part.is_destroyed()) {
            lines.push_back(part.display_name + ": destroyed");
        } else if (part.is_damaged()) {
            lines.push_back(part.display_name + ": " + to_string(part.damage_tier()));
        }
    }

    if (lines.empty()) {
        lines.emplace_back("All body parts are healthy.");
    }
    return lines;
}

int BodyPartRegistry::hit_weight(const BodyPart& part) const {
    if (part.kind == BodyPartKind::Torso) {
        return config_.torso_weight;
    }
    if (part.kind == BodyPartKind::Head) {
        return config_.head_weight;
    }
    if (part.is_limb) {
        return config_.limb_weight;
    }
    return config_.default_weight;
}

void BodyPartRegistry::set_config(const HitLocationConfig& config) {
    validate_hit_config(config);
    config_ = config;
}

// === Mutators ===

void BodyPartRegistry::log_destruction(const BodyPart& part) const {
    if (part.is_vital) {
        LOG_WARNING(Combat, "Vital part destroyed: {}", part.display_name);
    } else {
        LOG_INFO(Combat, "Part destroyed: {}", part.display_name);
    }
}

int BodyPartRegistry::apply_damage(BodyPartKind kind, int amount) {
    require_non_negative(amount, "Damage");

    BodyPart* part = find_mutable(kind);
    if (!part || part->is_destroyed()) {
        return 0;
    }

    int dealt = part->take_damage(amount);
    if (dealt > 0 && part->is_destroyed()) {
        log_destruction(*part);
    }
    return dealt;
}

const BodyPart* BodyPartRegistry::apply_damage_random(int amount) {
    return apply_damage_random(amount, rng_);
}

const BodyPart* BodyPartRegistry::apply_damage_random(int amount, std::mt19937& rng) {
    require_non_negative(amount, "Damage");

    // Cumulative weights over intact parts, in kind order
    std::vector<BodyPart*> candidates;
    std::vector<std::uint64_t> cumulative;
    std::uint64_t total_weight = 0;

    for (auto& [kind, part] : parts_) {
        if (part.is_destroyed()) {
            continue;
        }
        int weight = hit_weight(part);
        if (weight <= 0) {
            continue;
        }
        total_weight += static_cast<std::uint64_t>(weight);
        candidates.push_back(&part);
        cumulative.push_back(total_weight);
    }

    // Zero-weight parts are skipped, so an intact body can still have no candidates
    if (candidates.empty()) {
        LOG_DEBUG(Combat, "Random hit found no intact part to strike");
        return nullptr;
    }

    // engine() % total keeps seeded sequences identical across standard libraries
    std::uint64_t roll = static_cast<std::uint64_t>(rng()) % total_weight;
    auto it = std::upper_bound(cumulative.begin(), cumulative.end(), roll);
    BodyPart* struck = candidates[static_cast<std::size_t>(it - cumulative.begin())];

    int dealt = struck->take_damage(amount);
    if (dealt == 0) {
        return nullptr;
    }

    LOG_TRACE(Combat, "Random hit on {} for {} ({} HP left)",
              struck->display_name, dealt, struck->current_hp);
    if (struck->is_destroyed()) {
        log_destruction(*struck);
    }
    return struck;
}

int BodyPartRegistry::heal(BodyPartKind kind, int amount) {
    require_non_negative(amount, "Heal");

    BodyPart* part = find_mutable(kind);
    if (!part) {
        return 0;
    }
    return part->heal(amount);
}

int BodyPartRegistry::heal_all(int amount_per_part) {
    require_non_negative(amount_per_part, "Heal");

    int total_healing = 0;
    for (auto& [kind, part] : parts_) {
        total_healing += part.heal(amount_per_part);
    }
    return total_healing;
}

int BodyPartRegistry::recover_fraction(float fraction) {
    if (!(fraction >= 0.0f && fraction <= 1.0f)) {
        LOG_ERROR(Combat, "Rejected recovery fraction {}", fraction);
        throw std::invalid_argument("Recovery fraction must be in [0, 1], got " + std::to_string(fraction));
    }

    int total_healing = 0;
    for (auto& [kind, part] : parts_) {
        int missing = part.max_hp - part.current_hp;
        int amount = static_cast<int>(std::floor(missing * static_cast<double>(fraction)));
        if (amount > 0) {
            total_healing += part.heal(amount);
        }
    }
    return total_healing;
}

void BodyPartRegistry::set_max_health(int new_total_hp) {
    if (new_total_hp <= 0) {
        LOG_ERROR(Anatomy, "Rejected max health {}", new_total_hp);
        throw std::invalid_argument("Total HP must be positive, got " + std::to_string(new_total_hp));
    }

    for (auto& [kind, part] : parts_) {
        const int old_max = part.max_hp;
        part.max_hp = static_cast<int>(std::floor(part.max_hp_ratio * new_total_hp));

        // current * new_max / old_max in integers, so an unchanged total keeps HP exactly
        if (old_max > 0) {
            std::int64_t scaled = static_cast<std::int64_t>(part.current_hp) * part.max_hp / old_max;
            part.current_hp = static_cast<int>(std::min<std::int64_t>(scaled, part.max_hp));
        } else {
            part.current_hp = part.max_hp;
        }
    }

    LOG_DEBUG(Anatomy, "Rescaled body from {} to {} total HP", total_hp_, new_total_hp);
    total_hp_ = new_total_hp;
}

bool BodyPartRegistry::add_status_effect(BodyPartKind kind, const std::string& effect) {
    BodyPart* part = find_mutable(kind);
    if (!part) {
        return false;
    }
    return part->status_effects.insert(effect).second;
}

bool BodyPartRegistry::remove_status_effect(BodyPartKind kind, std::string_view effect) {
    BodyPart* part = find_mutable(kind);
    if (!part) {
        return false;
    }

    auto it = part->status_effects.find(effect);
    if (it == part->status_effects.end()) {
        return false;
    }
    part->status_effects.erase(it);
    return true;
}

} // namespace sinew::anatomy
