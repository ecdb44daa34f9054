#pragma once

#include <sinew/anatomy/anatomy_template.hpp>
#include <sinew/anatomy/body_part.hpp>

#include <cstdint>
#include <optional>
#include <random>
#include <string>
#include <string_view>
#include <vector>

namespace sinew::anatomy {

/**
 * @brief Relative chance of each part being struck by an untargeted hit
 */
struct HitLocationConfig {
    int torso_weight = 30;      ///< Large target
    int head_weight = 10;       ///< Small, well guarded
    int limb_weight = 15;       ///< Arms, hands, legs, feet
    int default_weight = 20;    ///< Everything else (neck, thorax, ...)
};

/**
 * @brief Reject configs that cannot produce a draw
 *
 * @throws std::invalid_argument if any weight is negative or all are zero
 */
void validate_hit_config(const HitLocationConfig& config);

/// Whether a grasping part can keep hold of what it carries
enum class GripState : uint8_t {
    NotApplicable,  ///< Unknown part or a part that cannot grasp
    Secure,         ///< More than half HP left
    AtRisk,         ///< Half HP or less; the caller rolls for a drop
    Lost            ///< A quarter HP or less, or destroyed
};

const char* to_string(GripState state) noexcept;

/**
 * @brief Per-entity body parts with localized damage and derived status
 *
 * Owns one BodyPart per kind prescribed by the entity's anatomy template. The
 * set of parts never changes after construction; a severed limb is a
 * destroyed part, not a missing one.
 *
 * Life, mobility and manipulation are always computed from part state, never
 * cached:
 * - alive while no vital part is destroyed
 * - mobile while one locomotion part survives (the torso for whole-body movers)
 * - able to manipulate while one grasp-tagged part survives
 *
 * Not thread-safe; each registry belongs to exactly one entity.
 *
 * @code
 * BodyPartRegistry body(AnatomyVariant::Humanoid, 100);
 * body.apply_damage(BodyPartKind::LeftLeg, 60);
 * float slow = body.movement_penalty();       // 0.25
 * if (const BodyPart* hit = body.apply_damage_random(12)) {
 *     show(hit->display_name, hit->damage_tier());
 * }
 * @endcode
 */
class BodyPartRegistry {
public:
    /**
     * @brief Build from a variant registered in the template library
     *
     * @throws std::invalid_argument if total_hp <= 0, the variant is unknown
     *         or the config fails validate_hit_config()
     */
    BodyPartRegistry(AnatomyVariant variant, int total_hp,
                     const HitLocationConfig& config = {},
                     std::uint32_t seed = std::random_device{}());

    /**
     * @brief Build from an explicit template
     *
     * @throws std::invalid_argument if total_hp <= 0 or the config is invalid
     * @throws std::runtime_error if the template is invalid
     */
    BodyPartRegistry(const AnatomyTemplate& anatomy, int total_hp,
                     const HitLocationConfig& config = {},
                     std::uint32_t seed = std::random_device{}());

    // === Queries ===

    const BodyPart* get(BodyPartKind kind) const;
    bool has_part(BodyPartKind kind) const { return get(kind) != nullptr; }

    /// Copy of every part; changing it does not touch the registry
    PartMap all() const { return parts_; }

    std::size_t part_count() const noexcept { return parts_.size(); }

    std::vector<const BodyPart*> vital_parts() const;
    std::vector<const BodyPart*> limbs() const;
    std::vector<const BodyPart*> damaged_parts() const;
    std::vector<const BodyPart*> destroyed_parts() const;

    /// Intact parts flagged can_grasp
    std::vector<const BodyPart*> grasping_parts() const;

    /**
     * @brief Intact parts carrying every required tag, in kind order
     */
    std::vector<const BodyPart*> parts_matching(const TagSet& required_tags) const;

    bool can_equip(const TagSet& required_tags) const;

    std::optional<float> health_ratio(BodyPartKind kind) const;

    bool has_status_effect(BodyPartKind kind, std::string_view effect) const;

    // === Derived status ===

    bool is_alive() const;
    bool can_move() const;
    bool can_manipulate() const;

    /// 0.0 = full speed, 1.0 = immobile
    float movement_penalty() const;

    /// 0.0 = full dexterity, 1.0 = no working arms or hands
    float manipulation_penalty() const;

    GripState grip_state(BodyPartKind kind) const;

    /**
     * @brief One line per damaged part, e.g. "left hand: badly wounded"
     *
     * Returns a single "All body parts are healthy." line when nothing is hurt.
     */
    std::vector<std::string> status_report() const;

    // === Mutators ===

    /**
     * @brief Damage one part
     *
     * @return Damage actually dealt; 0 for an unknown or already destroyed part
     * @throws std::invalid_argument if amount < 0
     */
    int apply_damage(BodyPartKind kind, int amount);

    /**
     * @brief Damage a part picked by weighted draw among intact parts
     *
     * Uses the registry's own engine.
     *
     * @return The struck part, or nullptr if nothing was hit or no damage landed
     * @throws std::invalid_argument if amount < 0
     */
    const BodyPart* apply_damage_random(int amount);

    /// Same as above, drawing from a caller-owned engine
    const BodyPart* apply_damage_random(int amount, std::mt19937& rng);

    /**
     * @brief Heal one part
     * @return Healing actually done; 0 for an unknown part
     * @throws std::invalid_argument if amount < 0
     */
    int heal(BodyPartKind kind, int amount);

    /// Heal every part by amount_per_part, returning the total healed
    int heal_all(int amount_per_part);

    /**
     * @brief Heal each part by floor(missing HP * fraction)
     *
     * @param fraction Share of missing HP to restore, in [0, 1]
     * @return Total healed
     * @throws std::invalid_argument if fraction is outside [0, 1]
     */
    int recover_fraction(float fraction);

    /**
     * @brief Resize every part to a new total HP
     *
     * Keeps each part's health fraction (rounded down), so a destroyed part
     * stays destroyed and an unchanged total keeps HP exactly. A part that had
     * no HP pool starts full.
     *
     * @throws std::invalid_argument if new_total_hp <= 0
     */
    void set_max_health(int new_total_hp);

    /// @return false if the part is unknown or already had the effect
    bool add_status_effect(BodyPartKind kind, const std::string& effect);

    /// @return false if the part is unknown or did not have the effect
    bool remove_status_effect(BodyPartKind kind, std::string_view effect);

    // === Configuration ===

    AnatomyVariant get_variant() const noexcept { return variant_; }
    LocomotionModel get_locomotion() const noexcept { return locomotion_; }
    int get_total_hp() const noexcept { return total_hp_; }

    const HitLocationConfig& get_config() const { return config_; }

    /// @throws std::invalid_argument if the config fails validate_hit_config()
    void set_config(const HitLocationConfig& config);

    void reseed(std::uint32_t seed) { rng_.seed(seed); }

    /// Draw weight of a part under the current config
    int hit_weight(const BodyPart& part) const;

private:
    BodyPart* find_mutable(BodyPartKind kind);

    /// Fraction of the listed slots that are present but destroyed
    float lost_fraction(const BodyPartKind* kinds, std::size_t count) const;

    void log_destruction(const BodyPart& part) const;

    AnatomyVariant variant_;
    LocomotionModel locomotion_;
    int total_hp_;
    HitLocationConfig config_;
    PartMap parts_;
    std::mt19937 rng_;
};

} // namespace sinew::anatomy
