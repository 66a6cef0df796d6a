#include "model_assets.hpp"

#include <glib.h>

namespace whispertrigger {

std::vector<std::string> model_file_candidates(ModelSize size,
                                               const std::string &language) {
    std::vector<std::string> names;
    if (size == ModelSize::Large) {
        for (const char *variant : {"large-v3", "large-v2", "large"}) {
            names.push_back(std::string("ggml-") + variant + ".bin");
        }
        return names;
    }

    const std::string base = std::string("ggml-") + model_size_name(size);
    // English-only checkpoints are smaller and more accurate for "en"
    if (language == "en") names.push_back(base + ".en.bin");
    names.push_back(base + ".bin");
    names.push_back(base + "-q5_1.bin");
    return names;
}

std::string resolve_model_path(const std::string &models_dir, ModelSize size,
                               const std::string &language) {
    for (const auto &name : model_file_candidates(size, language)) {
        gchar *path = g_build_filename(models_dir.c_str(), name.c_str(),
                                       nullptr);
        bool found = g_file_test(path, G_FILE_TEST_IS_REGULAR);
        std::string result(path);
        g_free(path);
        if (found) return result;
    }
    return "";
}

} // namespace whispertrigger
