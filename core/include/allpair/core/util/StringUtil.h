#pragma once

#include <string>

namespace allpair::core::util {

// Whole-string base-10 parse. Rejects trailing characters and values outside
// the range of int; `value` is untouched on failure.
bool ParseInt(const std::string& text, int& value);

}  // namespace allpair::core::util
