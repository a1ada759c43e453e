#pragma once

#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>

namespace lswitch {

/// One configured backend. Immutable once loaded.
struct ModelDefinition {
    std::string key;
    std::string command_template;
    std::vector<std::string> capabilities;
    nlohmann::json metadata;  // the whole entry as written in the models file
};

/// "completion" and "chat" always; "multimodal" when the template passes a
/// multimodal projector (mmproj) to the backend.
std::vector<std::string> deriveCapabilities(const std::string& command_template);

/// Immutable model-key -> definition mapping, in file order.
class ModelCatalog {
public:
    ModelCatalog() = default;
    explicit ModelCatalog(std::vector<ModelDefinition> models);

    const ModelDefinition* find(const std::string& key) const;
    const std::vector<ModelDefinition>& models() const { return models_; }
    size_t size() const { return models_.size(); }
    bool empty() const { return models_.empty(); }

private:
    std::vector<ModelDefinition> models_;
};

/// Parse the models file contents (YAML; JSON is accepted as a YAML subset).
/// Throws SwitchError(kConfigParseError) on malformed input.
ModelCatalog parseModelCatalog(const std::string& text);

/// Owns the model mapping loaded from disk. The mapping is swapped wholesale
/// on reload; readers always get a complete snapshot.
class ModelConfigStore {
public:
    using ChangeCallback = std::function<void()>;

    explicit ModelConfigStore(std::filesystem::path config_path);
    ~ModelConfigStore();

    ModelConfigStore(const ModelConfigStore&) = delete;
    ModelConfigStore& operator=(const ModelConfigStore&) = delete;

    // Re-read the file. A missing or unparsable file leaves an empty mapping
    // and returns false; the failure is logged, never thrown.
    bool reload();

    std::shared_ptr<const ModelCatalog> getModels() const;

    void setOnChange(ChangeCallback cb);

    // One watch step: reload and fire the change callback if the file's
    // modification time differs from the last one seen.
    bool checkForChanges();

    void startWatching(std::chrono::milliseconds interval = std::chrono::seconds(2));
    void stopWatching();
    bool watching() const;

    const std::filesystem::path& path() const { return path_; }

private:
    void watchLoop(std::chrono::milliseconds interval);

    std::filesystem::path path_;

    mutable std::mutex mutex_;
    std::shared_ptr<const ModelCatalog> catalog_;
    std::optional<std::filesystem::file_time_type> last_mtime_;
    ChangeCallback on_change_;

    mutable std::mutex watch_mutex_;
    std::condition_variable watch_cv_;
    bool watch_stop_{false};
    std::thread watcher_;
};

}  // namespace lswitch
