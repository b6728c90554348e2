#pragma once

#include <string>

namespace chart_model {

// Process-unique id such as "glyph_12". Ids come from a single counter, so a
// given sequence of creations always yields the same ids.
std::string unique_id(const std::string& prefix);

} // namespace chart_model
