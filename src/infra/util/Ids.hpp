#pragma once

#include <string>

namespace flowgraph::util {

// Random (v4) UUID in canonical textual form.
std::string NewId();

}  // namespace flowgraph::util
