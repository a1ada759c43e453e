#include "core/process_supervisor.h"

#include <algorithm>
#include <exception>
#include <iterator>
#include <unistd.h>

#include <spdlog/spdlog.h>

#include "core/log_monitor.h"
#include "core/switch_error.h"
#include "models/command_template.h"
#include "models/model_config.h"
#include "system/port.h"
#include "system/process.h"

namespace lswitch {

ProcessSupervisor::ProcessSupervisor(ServiceState& state, SupervisorOptions options)
    : state_(state), options_(options) {}

ProcessSupervisor::~ProcessSupervisor() {
    stop();
    std::vector<std::unique_ptr<LogMonitor>> monitors;
    {
        std::lock_guard<std::mutex> lock(monitors_mutex_);
        monitors.swap(monitors_);
    }
    for (auto& m : monitors) {
        m->join();
    }
}

StartResult ProcessSupervisor::start(const std::string& model_key, std::optional<int> ctx) {
    auto catalog = state_.config().getModels();
    const ModelDefinition* def = catalog->find(model_key);
    if (!def) {
        throw SwitchError(SwitchErrorCode::kModelNotFound,
                          "Model '" + model_key + "' not found in config");
    }

    const int port = findFreePort();

    TemplateValues values;
    values.port = port;
    {
        auto guard = state_.lock();
        values.ctx = ctx.value_or(guard->default_ctx);
        values.host = guard->host;
    }

    CommandSubstitution sub = substituteCommand(def->command_template, values);
    if (!sub.has_port) {
        spdlog::warn("[Service] Command for '{}' has no ${{PORT}} placeholder; the backend "
                     "may not listen on port {}",
                     model_key, port);
    }
    for (const auto& name : sub.unresolved) {
        spdlog::warn("[Service] Command for '{}' leaves ${{{}}} unresolved", model_key, name);
    }

    std::unique_ptr<LogMonitor> monitor;
    {
        auto guard = state_.lock();
        stopLocked(guard);

        spdlog::info("[Service] Starting '{}' on {}:{} with command: {}", model_key, values.host,
                     port, sub.command);
        SpawnedProcess child;
        try {
            child = options_.spawn(sub.command);
        } catch (const SwitchError& e) {
            spdlog::error("[Service] Failed to start '{}': {}", model_key, e.what());
            throw;
        }

        guard->generation++;
        BackendProcess backend;
        backend.model_key = model_key;
        backend.ctx = values.ctx;
        backend.port = port;
        backend.process = ProcessHandle(child.pid);
        backend.status = BackendStatus::Starting;
        backend.generation = guard->generation;
        guard->backend = std::move(backend);
        guard->ready = false;
        guard->stats = StatsSnapshot{};
        guard->current_ctx = values.ctx;

        try {
            monitor = std::make_unique<LogMonitor>(state_, child.output_fd, guard->generation);
        } catch (const std::exception& e) {
            ::close(child.output_fd);
            stopLocked(guard);
            throw SwitchError(SwitchErrorCode::kSpawnFailure,
                              std::string("cannot monitor backend output: ") + e.what());
        }
        try {
            monitor->start();
        } catch (const std::exception& e) {
            stopLocked(guard);
            throw SwitchError(SwitchErrorCode::kSpawnFailure,
                              std::string("cannot monitor backend output: ") + e.what());
        }
        spdlog::info("[Service] Started '{}' (pid {})", model_key, child.pid);
    }

    {
        std::lock_guard<std::mutex> lock(monitors_mutex_);
        monitors_.push_back(std::move(monitor));
    }
    reapMonitors();

    return StartResult{port, sub.command};
}

void ProcessSupervisor::stop() {
    {
        auto guard = state_.lock();
        stopLocked(guard);
    }
    reapMonitors();
}

void ProcessSupervisor::stopLocked(ServiceState::Guard& guard) {
    if (!guard->backend) {
        return;
    }
    BackendProcess& backend = *guard->backend;
    spdlog::info("[Service] Stopping '{}' (pid {})", backend.model_key, backend.process.pid());
    backend.status = BackendStatus::Stopping;

    const bool graceful = backend.process.terminateGroup(options_.stop_grace);

    guard->backend.reset();
    guard->ready = false;
    guard->stats = StatsSnapshot{};
    spdlog::info("[Service] Process stopped{}", graceful ? "" : " (killed)");
}

StatusReport ProcessSupervisor::status() {
    auto guard = state_.lock();
    StatusReport report;
    report.running = guard->backend && guard->backend->process.isRunning();
    report.ready = guard->ready;
    report.ctx = guard->current_ctx;
    report.host = guard->host;
    report.stats = guard->stats;
    report.status = guard->status();
    if (guard->backend) {
        report.model = guard->backend->model_key;
    }
    if (report.running) {
        report.port = guard->backend->port;
        report.pid = guard->backend->process.pid();
    }
    return report;
}

void ProcessSupervisor::reapMonitors() {
    std::vector<std::unique_ptr<LogMonitor>> done;
    {
        std::lock_guard<std::mutex> lock(monitors_mutex_);
        auto it = std::stable_partition(monitors_.begin(), monitors_.end(),
                                        [](const std::unique_ptr<LogMonitor>& m) {
                                            return !m->finished();
                                        });
        std::move(it, monitors_.end(), std::back_inserter(done));
        monitors_.erase(it, monitors_.end());
    }
    // Destroying a finished monitor joins a thread that has already returned.
}

}  // namespace lswitch
