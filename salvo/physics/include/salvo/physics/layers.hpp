#pragma once

#include <cstdint>
#include <initializer_list>

namespace salvo::physics {

// Predefined collision layers
namespace layers {
    constexpr uint16_t STATIC = 0;
    constexpr uint16_t DYNAMIC = 1;
    constexpr uint16_t PLAYER = 2;
    constexpr uint16_t ENEMY = 3;
    constexpr uint16_t TRIGGER = 4;
    constexpr uint16_t DEBRIS = 5;
    constexpr uint16_t PROJECTILE = 6;
    // User-defined layers start at 8
    constexpr uint16_t USER_START = 8;
    constexpr uint16_t MAX_LAYERS = 16;
}

// Layer masks select which layers a query sees. Bit N set means layer N is hit.
using LayerMask = uint16_t;

constexpr LayerMask ALL_LAYERS = 0xFFFF;
constexpr LayerMask NO_LAYERS = 0x0000;

constexpr LayerMask layer_bit(uint16_t layer) {
    return layer < layers::MAX_LAYERS ? static_cast<LayerMask>(1u << layer) : NO_LAYERS;
}

constexpr LayerMask make_mask(std::initializer_list<uint16_t> layer_list) {
    LayerMask mask = NO_LAYERS;
    for (uint16_t layer : layer_list) {
        mask = static_cast<LayerMask>(mask | layer_bit(layer));
    }
    return mask;
}

constexpr bool mask_includes(LayerMask mask, uint16_t layer) {
    return (mask & layer_bit(layer)) != 0;
}

// Default for projectiles: world geometry and anything that can take damage.
// Other projectiles, triggers and debris are ignored.
constexpr LayerMask DEFAULT_PROJECTILE_MASK =
    make_mask({layers::STATIC, layers::DYNAMIC, layers::PLAYER, layers::ENEMY});

} // namespace salvo::physics
