#include "syncer.hpp"

#include <utility>

#include "deployer.hpp"
#include "errors.hpp"
#include "git_utils.hpp"
#include "logger.hpp"
#include "repo_state.hpp"
#include "time_utils.hpp"

namespace deploy {

const char* sync_state_name(SyncState state) {
    switch (state) {
    case SyncState::Bootstrapping:
        return "Bootstrapping";
    case SyncState::Polling:
        return "Polling";
    case SyncState::Deploying:
        return "Deploying";
    case SyncState::Stopped:
        return "Stopped";
    }
    return "Unknown";
}

const char* sync_event_name(SyncEvent event) {
    switch (event) {
    case SyncEvent::RepositoryReady:
        return "RepositoryReady";
    case SyncEvent::RepositoryCloned:
        return "RepositoryCloned";
    case SyncEvent::ChangesDetected:
        return "ChangesDetected";
    case SyncEvent::NoChanges:
        return "NoChanges";
    case SyncEvent::DetectionFailed:
        return "DetectionFailed";
    case SyncEvent::DeployFinished:
        return "DeployFinished";
    case SyncEvent::StopRequested:
        return "StopRequested";
    }
    return "Unknown";
}

SyncState next_state(SyncState state, SyncEvent event) noexcept {
    if (state == SyncState::Stopped || event == SyncEvent::StopRequested)
        return SyncState::Stopped;
    switch (state) {
    case SyncState::Bootstrapping:
        if (event == SyncEvent::RepositoryCloned)
            return SyncState::Deploying;
        if (event == SyncEvent::RepositoryReady)
            return SyncState::Polling;
        break;
    case SyncState::Polling:
        if (event == SyncEvent::ChangesDetected || event == SyncEvent::RepositoryCloned)
            return SyncState::Deploying;
        break;
    case SyncState::Deploying:
        if (event == SyncEvent::DeployFinished)
            return SyncState::Polling;
        break;
    case SyncState::Stopped:
        break;
    }
    return state;
}

Syncer::Syncer(DeploymentTarget target, procutil::CommandRunner run)
    : target_(std::move(target)), run_(std::move(run)) {}

void Syncer::transition(SyncEvent event) {
    SyncState next = next_state(state_, event);
    if (next != state_)
        log_debug("State change", {{"from", sync_state_name(state_)},
                                   {"to", sync_state_name(next)},
                                   {"event", sync_event_name(event)}});
    state_ = next;
}

void Syncer::deploy_now() {
    ++stats_.deployments;
    if (!deploy(run_, target_))
        ++stats_.failed_deployments;
    transition(SyncEvent::DeployFinished);
}

// Warn about checkouts that polling cannot work with; never fatal.
void Syncer::check_checkout() const {
    if (!git::is_git_repo(target_.repo_path)) {
        log_warning("Local path is not a git work tree, fetch will fail",
                    {{"path", target_.repo_path.string()}});
        return;
    }
    std::string err;
    auto branch = git::get_current_branch(target_.repo_path, &err);
    if (branch && *branch != target_.branch)
        log_warning("Checked out branch differs from configured branch",
                    {{"checked_out", *branch}, {"configured", target_.branch}});
}

void Syncer::bootstrap() {
    state_ = SyncState::Bootstrapping;
    if (!is_absent_or_empty(target_.repo_path)) {
        check_checkout();
        transition(SyncEvent::RepositoryReady);
        return;
    }
    clone_repository(run_, target_);
    ++stats_.clones;
    transition(SyncEvent::RepositoryCloned);
    deploy_now();
}

SyncEvent Syncer::poll_once() {
    SyncEvent event = SyncEvent::DetectionFailed;
    try {
        switch (detect_changes(run_, target_)) {
        case ChangeDecision::RepositoryMissing:
            clone_repository(run_, target_);
            ++stats_.clones;
            event = SyncEvent::RepositoryCloned;
            break;
        case ChangeDecision::ChangesDetected:
            event = SyncEvent::ChangesDetected;
            break;
        case ChangeDecision::NoChanges:
            event = SyncEvent::NoChanges;
            break;
        }
    } catch (const AutodeployError& e) {
        log_error(e.what(), {{"kind", error_kind_name(e.kind())}});
        event = SyncEvent::DetectionFailed;
    } catch (const std::exception& e) {
        log_error(e.what());
        event = SyncEvent::DetectionFailed;
    }
    if (event == SyncEvent::DetectionFailed)
        ++stats_.detection_failures;
    transition(event);
    if (state_ == SyncState::Deploying)
        deploy_now();
    return event;
}

void Syncer::run(size_t max_cycles) {
    try {
        bootstrap();
    } catch (const CommandFailed& e) {
        // SIGINT reaches the clone too; a requested stop is not a failure.
        if (!timer_.cancelled())
            throw;
        log_warning("Initial clone interrupted by shutdown", {{"error", e.what()}});
        transition(SyncEvent::StopRequested);
        return;
    }
    while (state_ != SyncState::Stopped) {
        if (timer_.cancelled()) {
            transition(SyncEvent::StopRequested);
            break;
        }
        poll_once();
        ++stats_.cycles;
        if (max_cycles > 0 && stats_.cycles >= max_cycles) {
            transition(SyncEvent::StopRequested);
            break;
        }
        log_info("Waiting for next check...", {{"in", format_millis(target_.interval)}});
        if (!timer_.wait(target_.interval))
            transition(SyncEvent::StopRequested);
    }
    log_info("Sync loop stopped", {{"cycles", std::to_string(stats_.cycles)},
                                   {"deployments", std::to_string(stats_.deployments)},
                                   {"failed", std::to_string(stats_.failed_deployments)}});
}

} // namespace deploy
