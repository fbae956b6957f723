#pragma once
#include <string>

namespace pw {
// Reduces a user supplied target to scheme://host[:port]path. A missing scheme
// defaults to https and an empty path to "/"; query and fragment are dropped.
bool normalize_target(const std::string& raw, std::string& out, std::string& err);
}  // namespace pw
