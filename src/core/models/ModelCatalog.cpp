#include "ModelCatalog.hpp"

#include <algorithm>

namespace WhisperGui {

namespace {
const QString kHubBaseUrl = QStringLiteral("https://huggingface.co/ggerganov/whisper.cpp/resolve/main/");

ModelDescriptor hubModel(const QString& id, const QString& displayName, qint64 sizeMb,
                         const QString& description) {
    return ModelDescriptor{id, displayName, sizeMb, description,
                           QUrl(kHubBaseUrl + "ggml-" + id + ".bin")};
}
}

ModelCatalog::ModelCatalog(std::vector<ModelDescriptor> models)
    : models_(std::move(models)) {}

ModelCatalog ModelCatalog::defaults() {
    return ModelCatalog({
        hubModel("tiny", "Tiny", 75, "Fastest, lowest accuracy"),
        hubModel("base", "Base", 148, "Fast, good for simple audio"),
        hubModel("small", "Small", 488, "Balanced speed and accuracy"),
        hubModel("medium", "Medium", 1500, "High accuracy, slower"),
        hubModel("large-v3", "Large v3", 3000, "Best accuracy, slowest"),
        hubModel("large-v3-turbo", "Large v3 Turbo", 1600, "Fast and accurate")
    });
}

std::optional<ModelDescriptor> ModelCatalog::find(const QString& id) const {
    auto it = std::find_if(models_.begin(), models_.end(),
                           [&id](const ModelDescriptor& model) { return model.id == id; });
    if (it == models_.end()) {
        return std::nullopt;
    }
    return *it;
}

bool ModelCatalog::contains(const QString& id) const {
    return find(id).has_value();
}

} // namespace WhisperGui
