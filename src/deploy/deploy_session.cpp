#include "deploy_session.hpp"
#include "inventory_builder.hpp"
#include "diff_engine.hpp"
#include <core/constants.hpp>
#include <core/utils.hpp>
#include <core/log.hpp>
#include <fmt/format.h>

DeploySession::DeploySession(const SessionPaths& paths, std::unique_ptr<Transport> transport,
                             ProgressSink& progress)
    : configured_output_(paths.output_dir),
      transport_(std::move(transport)),
      progress_(progress),
      lock_(paths.config_dir / SESSION_LOCK_FILENAME) {
    state_.paths = paths;
    state_.transport = transport_->kind();
    state_.revision = generate_revision_id();
    set_output(transport_->addresses_from_root());
}

DeploySession::~DeploySession() {
    lock_.release();
}

void DeploySession::set_output(bool use_empty) {
    state_.paths.output_dir = use_empty ? "" : configured_output_;
}

void DeploySession::request_cancel() {
    cancel_requested_.store(true);
}

void DeploySession::report(int progress) {
    state_.progress = progress;
    progress_.report(ProgressUpdate{progress, std::nullopt});
}

std::optional<std::string> DeploySession::fetch_remote_manifest() {
    auto fetched = transport_->fetch_manifest(state_.remote_manifest_path());
    if (fetched.is_err()) {
        deploy_log("Session: cannot fetch remote manifest: " + fetched.error);
        return std::nullopt;
    }
    return fetched.value;
}

Result<Schedule> DeploySession::prepare(StatusCallback callback) {
    deploy_log(fmt::format("Session: start revision={} protocol={} input={} output='{}'",
                           state_.revision, transport_kind_name(state_.transport),
                           state_.paths.input_dir.string(), state_.paths.output_dir));

    auto locked = lock_.acquire();
    if (locked.is_err()) {
        return Result<Schedule>::Err(locked.error);
    }

    report(PROGRESS_START);

    if (callback) callback("Connecting...");
    auto connected = transport_->init_connection(callback);
    if (connected.is_err()) {
        return Result<Schedule>::Err("init_connection: " + connected.error);
    }

    if (callback) callback("Listing local files...");
    InventoryBuilder builder(state_.paths.input_dir, state_.transport);
    auto local = builder.build_and_save();
    if (local.is_err()) {
        return Result<Schedule>::Err(local.error);
    }
    report(PROGRESS_INVENTORY_DONE);

    if (callback) callback("Checking remote snapshot...");
    SnapshotResolver resolver(state_.paths.config_dir);
    snapshot_ = resolver.resolve(fetch_remote_manifest());

    Inventory remote = DiffEngine::load_remote(resolver.remote_inventory_path(), snapshot_.usable());
    DiffResult diff = DiffEngine(state_.transport).diff(local.value, remote);

    OperationScheduler scheduler(OperationScheduler::filesystem_classifier(state_.paths.input_dir));
    Schedule schedule = scheduler.schedule(diff);

    auto logged = OperationScheduler::write_audit_logs(schedule, state_.paths.app_dir);
    if (logged.is_err()) {
        deploy_log("Session: audit logs not written: " + logged.error);
    }

    if (callback) {
        callback(fmt::format("{} to remove, {} to upload",
                             schedule.removals.size(), schedule.uploads.size()));
    }
    return Result<Schedule>::Ok(std::move(schedule));
}

Result<Schedule> DeploySession::plan(StatusCallback callback) {
    auto schedule = prepare(callback);
    transport_->close();
    lock_.release();
    return schedule;
}

Result<void> DeploySession::replace_sync_info_files() {
    SnapshotResolver resolver(state_.paths.config_dir);

    auto inventory = read_file(state_.inventory_path());
    if (inventory.is_err()) {
        return Result<void>::Err(inventory.error);
    }

    std::error_code ec;
    fs::create_directories(state_.paths.config_dir, ec);
    if (ec) {
        return Result<void>::Err(fmt::format("Cannot create {}: {}",
                                             state_.paths.config_dir.string(), ec.message()));
    }

    auto r = write_file_atomic(resolver.remote_inventory_path(), inventory.value);
    if (r.is_err()) return r;

    std::string descriptor = make_revision_descriptor(state_.revision);
    r = write_file_atomic(state_.inventory_path(), descriptor);
    if (r.is_err()) return r;
    return write_file_atomic(resolver.revision_path(), descriptor);
}

Result<void> DeploySession::run(StatusCallback callback) {
    auto schedule = prepare(callback);
    if (schedule.is_err()) {
        transport_->close();
        lock_.release();
        return Result<void>::Err(schedule.error);
    }

    state_.removals = std::move(schedule.value.removals);
    state_.uploads = std::move(schedule.value.uploads);

    pump_ = std::make_unique<TransferPump>(
        state_, *transport_, progress_,
        [this](std::function<void()> task) { loop_.post(std::move(task)); });
    pump_->set_publish_hook([this]() { return replace_sync_info_files(); });
    pump_->set_cancel_token(&cancel_requested_);

    if (callback) callback("Transferring...");
    loop_.post([this]() {
        pump_->start([this](const SessionState&) { loop_.stop(); });
    });
    loop_.run();

    transport_->close();
    lock_.release();

    if (state_.state != PumpState::Done) {
        deploy_log("Session: failed: " + state_.error);
        return Result<void>::Err(state_.error);
    }

    deploy_log(fmt::format("Session: finished, {} operations", state_.operation_count));
    return Result<void>::Ok();
}
