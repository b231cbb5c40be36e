#include "graph/mode.hpp"
#include "common/errors.hpp"

namespace holes {

Mode parseMode(const std::string& text) {
    if (text == "both") return Mode::Both;
    if (text == "out") return Mode::Out;
    if (text == "in") return Mode::In;
    throw InvalidModeError("mode must be both, out, or in, got " + text);
}

std::string modeName(Mode mode) {
    switch (mode) {
        case Mode::Both: return "both";
        case Mode::Out:  return "out";
        case Mode::In:   return "in";
    }
    throw InvalidModeError("mode must be both, out, or in, got " +
                           std::to_string(static_cast<int>(mode)));
}

} // namespace holes
