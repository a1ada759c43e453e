#include "models/model_config.h"

#include <algorithm>
#include <fstream>
#include <sstream>
#include <utility>

#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

#include "core/switch_error.h"

namespace fs = std::filesystem;

namespace lswitch {

namespace {

nlohmann::json yamlToJson(const YAML::Node& node) {
    switch (node.Type()) {
        case YAML::NodeType::Map: {
            nlohmann::json obj = nlohmann::json::object();
            for (const auto& kv : node) {
                obj[kv.first.as<std::string>()] = yamlToJson(kv.second);
            }
            return obj;
        }
        case YAML::NodeType::Sequence: {
            nlohmann::json arr = nlohmann::json::array();
            for (const auto& item : node) {
                arr.push_back(yamlToJson(item));
            }
            return arr;
        }
        case YAML::NodeType::Scalar: {
            // Quoted scalars carry the "!" tag and stay strings.
            if (node.Tag() != "!") {
                bool b = false;
                long long i = 0;
                double d = 0.0;
                if (YAML::convert<long long>::decode(node, i)) return i;
                if (YAML::convert<double>::decode(node, d)) return d;
                if (YAML::convert<bool>::decode(node, b)) return b;
            }
            return node.Scalar();
        }
        case YAML::NodeType::Null:
        case YAML::NodeType::Undefined:
        default:
            return nullptr;
    }
}

std::optional<std::string> readFile(const fs::path& path) {
    std::ifstream ifs(path, std::ios::binary);
    if (!ifs.is_open()) {
        return std::nullopt;
    }
    std::ostringstream oss;
    oss << ifs.rdbuf();
    return oss.str();
}

}  // namespace

std::vector<std::string> deriveCapabilities(const std::string& command_template) {
    std::vector<std::string> caps = {"completion", "chat"};
    if (command_template.find("mmproj") != std::string::npos) {
        caps.push_back("multimodal");
    }
    return caps;
}

ModelCatalog::ModelCatalog(std::vector<ModelDefinition> models) : models_(std::move(models)) {}

const ModelDefinition* ModelCatalog::find(const std::string& key) const {
    auto it = std::find_if(models_.begin(), models_.end(),
                           [&key](const ModelDefinition& m) { return m.key == key; });
    return it == models_.end() ? nullptr : &*it;
}

ModelCatalog parseModelCatalog(const std::string& text) {
    YAML::Node root;
    try {
        root = YAML::Load(text);
    } catch (const YAML::Exception& e) {
        throw SwitchError(SwitchErrorCode::kConfigParseError, e.what());
    }

    if (!root || root.IsNull()) {
        return ModelCatalog{};
    }
    if (!root.IsMap()) {
        throw SwitchError(SwitchErrorCode::kConfigParseError, "top level must be a mapping");
    }

    const YAML::Node models = root["models"];
    if (!models || models.IsNull()) {
        return ModelCatalog{};
    }
    if (!models.IsMap()) {
        throw SwitchError(SwitchErrorCode::kConfigParseError, "'models' must be a mapping");
    }

    std::vector<ModelDefinition> defs;
    try {
        for (const auto& kv : models) {
            const std::string key = kv.first.as<std::string>();
            const YAML::Node& entry = kv.second;
            if (!entry.IsMap()) {
                spdlog::warn("[Config] Skipping model '{}': entry is not a mapping", key);
                continue;
            }
            const YAML::Node cmd = entry["cmd"];
            if (!cmd || !cmd.IsScalar()) {
                spdlog::warn("[Config] Skipping model '{}': missing 'cmd'", key);
                continue;
            }
            ModelDefinition def;
            def.key = key;
            def.command_template = cmd.as<std::string>();
            def.capabilities = deriveCapabilities(def.command_template);
            def.metadata = yamlToJson(entry);
            defs.push_back(std::move(def));
        }
    } catch (const YAML::Exception& e) {
        throw SwitchError(SwitchErrorCode::kConfigParseError, e.what());
    }
    return ModelCatalog(std::move(defs));
}

ModelConfigStore::ModelConfigStore(fs::path config_path)
    : path_(std::move(config_path)), catalog_(std::make_shared<const ModelCatalog>()) {}

ModelConfigStore::~ModelConfigStore() {
    stopWatching();
}

bool ModelConfigStore::reload() {
    std::error_code ec;
    if (!fs::exists(path_, ec)) {
        spdlog::error("[Config] {} not found ({})", path_.string(),
                      to_string(SwitchErrorCode::kConfigNotFound));
        std::lock_guard<std::mutex> lock(mutex_);
        catalog_ = std::make_shared<const ModelCatalog>();
        return false;
    }

    const auto mtime = fs::last_write_time(path_, ec);
    auto text = readFile(path_);
    if (!text) {
        spdlog::error("[Config] Failed to open {}", path_.string());
        std::lock_guard<std::mutex> lock(mutex_);
        catalog_ = std::make_shared<const ModelCatalog>();
        return false;
    }

    std::shared_ptr<const ModelCatalog> next;
    bool ok = true;
    try {
        next = std::make_shared<const ModelCatalog>(parseModelCatalog(*text));
    } catch (const SwitchError& e) {
        spdlog::error("[Config] Failed to load {}: {}", path_.string(), e.what());
        next = std::make_shared<const ModelCatalog>();
        ok = false;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        catalog_ = next;
        if (!ec) {
            last_mtime_ = mtime;
        }
    }
    if (ok) {
        spdlog::info("[Config] Loaded {} models from {}", next->size(), path_.string());
    }
    return ok;
}

std::shared_ptr<const ModelCatalog> ModelConfigStore::getModels() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return catalog_;
}

void ModelConfigStore::setOnChange(ChangeCallback cb) {
    std::lock_guard<std::mutex> lock(mutex_);
    on_change_ = std::move(cb);
}

bool ModelConfigStore::checkForChanges() {
    std::error_code ec;
    if (!fs::exists(path_, ec)) {
        return false;
    }
    const auto mtime = fs::last_write_time(path_, ec);
    if (ec) {
        spdlog::warn("[Config] Cannot stat {}: {}", path_.string(), ec.message());
        return false;
    }

    ChangeCallback cb;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (last_mtime_ && *last_mtime_ == mtime) {
            return false;
        }
        cb = on_change_;
    }

    spdlog::info("[Config] Change detected in {}, reloading", path_.string());
    reload();
    if (cb) {
        cb();
    }
    return true;
}

void ModelConfigStore::startWatching(std::chrono::milliseconds interval) {
    std::lock_guard<std::mutex> lock(watch_mutex_);
    if (watcher_.joinable()) return;
    watch_stop_ = false;
    watcher_ = std::thread(&ModelConfigStore::watchLoop, this, interval);
    spdlog::info("[Config] Watching {} for changes", path_.string());
}

void ModelConfigStore::stopWatching() {
    std::thread worker;
    {
        std::lock_guard<std::mutex> lock(watch_mutex_);
        if (!watcher_.joinable()) return;
        watch_stop_ = true;
        worker = std::move(watcher_);
    }
    watch_cv_.notify_all();
    worker.join();
}

bool ModelConfigStore::watching() const {
    std::lock_guard<std::mutex> lock(watch_mutex_);
    return watcher_.joinable();
}

void ModelConfigStore::watchLoop(std::chrono::milliseconds interval) {
    std::unique_lock<std::mutex> lock(watch_mutex_);
    while (!watch_cv_.wait_for(lock, interval, [this]() { return watch_stop_; })) {
        lock.unlock();
        try {
            checkForChanges();
        } catch (const std::exception& e) {
            spdlog::error("[Config] Watch error: {}", e.what());
        }
        lock.lock();
    }
}

}  // namespace lswitch
