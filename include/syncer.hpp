#ifndef SYNCER_HPP
#define SYNCER_HPP

#include <cstddef>

#include "command_runner.hpp"
#include "deployment_target.hpp"
#include "interval_timer.hpp"

namespace deploy {

enum class SyncState { Bootstrapping, Polling, Deploying, Stopped };

/** Inputs of the state machine, produced by the individual steps. */
enum class SyncEvent {
    RepositoryReady,  ///< Bootstrap found an existing checkout.
    RepositoryCloned, ///< A fresh clone was made (bootstrap or after removal).
    ChangesDetected,
    NoChanges,
    DetectionFailed, ///< Fetch, diff or a steady-state clone failed.
    DeployFinished,  ///< Deployer returned, successfully or not.
    StopRequested
};

const char* sync_state_name(SyncState state);
const char* sync_event_name(SyncEvent event);

/**
 * @brief Pure transition function of the sync state machine.
 *
 * `StopRequested` leads to `Stopped` from anywhere and `Stopped` is
 * terminal. Events that do not apply to a state leave it unchanged.
 */
SyncState next_state(SyncState state, SyncEvent event) noexcept;

struct SyncStats {
    size_t cycles = 0;
    size_t clones = 0;
    size_t deployments = 0;
    size_t failed_deployments = 0;
    size_t detection_failures = 0;
};

/**
 * @brief Polling orchestrator for one deployment target.
 *
 * `run()` bootstraps the checkout and then polls forever: detect, deploy on
 * change, wait the fixed interval, repeat. A failing cycle is logged and the
 * loop continues; only a failed bootstrap clone escapes `run()`.
 */
class Syncer {
  public:
    Syncer(DeploymentTarget target, procutil::CommandRunner run);

    Syncer(const Syncer&) = delete;
    Syncer& operator=(const Syncer&) = delete;

    /**
     * @brief Bootstrap, then poll until stopped.
     *
     * @param max_cycles Stop after this many poll cycles; `0` polls until
     *                   @ref request_stop is called.
     * @throws CommandFailed if the bootstrap clone fails, unless a stop was
     *         requested while it ran.
     */
    void run(size_t max_cycles = 0);

    /**
     * @brief Clone when the local path is absent or empty, then deploy once.
     *
     * @throws CommandFailed if the clone fails.
     */
    void bootstrap();

    /**
     * @brief Detection half of a poll cycle, including the deploy it triggers.
     *
     * Never throws; failures are logged and reported as `DetectionFailed`.
     *
     * @return The event produced by the detection step.
     */
    SyncEvent poll_once();

    /** Wake the interval wait and stop after the current step. Async-signal-safe. */
    void request_stop() noexcept { timer_.cancel(); }

    bool stop_requested() const noexcept { return timer_.cancelled(); }
    SyncState state() const noexcept { return state_; }
    const SyncStats& stats() const noexcept { return stats_; }
    const DeploymentTarget& target() const noexcept { return target_; }

  private:
    void transition(SyncEvent event);
    void deploy_now();
    void check_checkout() const;

    const DeploymentTarget target_;
    procutil::CommandRunner run_;
    IntervalTimer timer_;
    SyncState state_ = SyncState::Bootstrapping;
    SyncStats stats_;
};

} // namespace deploy

#endif // SYNCER_HPP
