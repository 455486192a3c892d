#pragma once

#include <array>
#include <fixcap/core/core.hpp>
#include <raylib.h>

namespace fixcap_rt::stimulus {

struct OrientationBinding {
    fixcap::core::Orientation orientation;
    int key;
};

// Indexed by the Orientation value
inline constexpr std::array<OrientationBinding, fixcap::core::kOrientationCount>
    kOrientationBindings{{
        {fixcap::core::Orientation::UP, KEY_UP},
        {fixcap::core::Orientation::DOWN, KEY_DOWN},
        {fixcap::core::Orientation::LEFT, KEY_LEFT},
        {fixcap::core::Orientation::RIGHT, KEY_RIGHT},
    }};

constexpr int ConfirmationKey(fixcap::core::Orientation orientation) {
    return kOrientationBindings[static_cast<size_t>(orientation)].key;
}

constexpr fixcap::core::Orientation OrientationFromIndex(int index) {
    return kOrientationBindings[static_cast<size_t>(index)].orientation;
}

} // namespace fixcap_rt::stimulus
