#pragma once

#include <functional>
#include <string>

namespace rag_core {

// Percent in [0, 1] and a human-readable status line.
using ProgressUpdater = std::function<void(float, const std::string&)>;

}  // namespace rag_core
