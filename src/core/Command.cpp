#include "pixelair/core/Command.hpp"

#include <algorithm>
#include <sstream>
#include <type_traits>

namespace pixelair {

namespace {
constexpr std::uint16_t MAX_HUE = 359;
constexpr std::uint8_t MAX_SATURATION = 100;

template <class... Ts>
struct Overloaded : Ts... { using Ts::operator()...; };
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;
} // namespace

LightState applyCommand(const LightState& current, const Command& command) {
    LightState next = current;
    std::visit(Overloaded{
        [&](const SetPower& c) { next.on = c.on; },
        [&](const SetBrightness& c) { next.brightness = c.brightness; },
        [&](const SetColor& c) {
            next.hue = std::min(c.hue, MAX_HUE);
            next.saturation = std::min(c.saturation, MAX_SATURATION);
        },
        [&](const SetEffect& c) {
            if (c.effectId.empty()) {
                next.effect.reset();
            } else {
                next.effect = c.effectId;
            }
        },
        [&](const SetMode& c) { next.mode = c.mode; }
    }, command);
    return next;
}

std::string describe(const Command& command) {
    std::ostringstream os;
    std::visit(Overloaded{
        [&](const SetPower& c) { os << "power " << (c.on ? "on" : "off"); },
        [&](const SetBrightness& c) { os << "brightness " << static_cast<int>(c.brightness); },
        [&](const SetColor& c) {
            os << "color hue=" << c.hue << " saturation=" << static_cast<int>(c.saturation);
        },
        [&](const SetEffect& c) { os << "effect " << (c.effectId.empty() ? "-" : c.effectId); },
        [&](const SetMode& c) { os << "mode " << toString(c.mode); }
    }, command);
    return os.str();
}

} // namespace pixelair
