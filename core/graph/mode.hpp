#pragma once

#include <string>

namespace holes {

/// Which ties of a node a metric looks at.
///   Both: symmetrized, union of in- and out-neighbors, both directions summed
///   Out:  outgoing ties only
///   In:   incoming ties only
/// On an undirected graph the three coincide.
enum class Mode {
    Both,
    Out,
    In
};

/// Parse "both" / "out" / "in". Throws InvalidModeError otherwise.
Mode parseMode(const std::string& text);

std::string modeName(Mode mode);

} // namespace holes
