#pragma once

#include <string>
#include <string_view>

namespace orchestrator::util {

// Random RFC4122 v4 id in canonical text form, e.g.
// "3f2a0c9e-5b1d-4e7a-9c20-6d8e1f4b7a53". Used for backend ids.
std::string NewId();

// True for the canonical 36-character form, lowercase or uppercase hex.
bool IsCanonicalId(std::string_view id);

} // namespace orchestrator::util
