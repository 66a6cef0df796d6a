#pragma once

#include "configuration.hpp"

#include <string>
#include <vector>

namespace whispertrigger {

// File names tried for a model size, most specific first.
std::vector<std::string> model_file_candidates(ModelSize size,
                                               const std::string &language);

// Path of the first candidate present in models_dir, or "" when the
// requested size is not installed.
std::string resolve_model_path(const std::string &models_dir, ModelSize size,
                               const std::string &language);

} // namespace whispertrigger
