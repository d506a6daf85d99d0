#pragma once

#include "footfall/capture/frame_source.hpp"
#include "footfall/core/module.hpp"
#include "footfall/core/run_state.hpp"
#include "footfall/detection/detector.hpp"
#include "footfall/detection/embedder.hpp"
#include "footfall/pipeline/publisher.hpp"
#include "footfall/pipeline/scene.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <thread>

namespace footfall {

/**
 * @brief Collaborators consumed by one run
 */
struct RunnerComponents {
    std::unique_ptr<IFrameSource> source;
    std::unique_ptr<IPersonDetector> detector;
    std::unique_ptr<IEmbedder> embedder;

    bool complete() const { return source && detector && embedder; }
};

/**
 * @brief Runner statistics for the current run
 */
struct RunnerStats {
    uint64_t frames_processed = 0;
    uint64_t detections = 0;
    uint64_t entries = 0;
    uint64_t exits = 0;
    size_t active_sessions = 0;
    size_t total_sessions = 0;
};

/**
 * @brief Owns the frame-loop worker thread
 *
 * Each run gets a fresh JourneyPipeline, so identities, tracks and sessions
 * never leak between runs. Results leave the worker only through the
 * SnapshotPublisher; the final snapshot of a run has final == true.
 */
class PipelineRunner : public IModule {
public:
    PipelineRunner(SceneRegistry& scene, SnapshotPublisher& publisher);
    ~PipelineRunner() override;

    PipelineRunner(const PipelineRunner&) = delete;
    PipelineRunner& operator=(const PipelineRunner&) = delete;

    // IModule interface
    bool initialize(const Config& config) override;
    void start() override;
    void stop() override;
    bool is_running() const override;
    std::string name() const override { return "PipelineRunner"; }

    /**
     * @brief Start a run with the given components
     *
     * Stops the active run first (if any), waits for its worker to report
     * stopped, clears the publisher, then launches exactly one new worker.
     *
     * @return false if components are incomplete
     */
    bool start(RunnerComponents components);

    RunState state() const { return state_.state(); }
    RunStateMachine& state_machine() { return state_; }

    RunnerStats get_stats() const;

    /**
     * @brief Number of runs launched so far
     */
    uint64_t run_count() const { return run_count_.load(std::memory_order_acquire); }

    void set_stats_interval(std::chrono::milliseconds interval) { stats_interval_ = interval; }

private:
    void stop_worker();
    void worker_loop(RunnerComponents components);

    SceneRegistry& scene_;
    SnapshotPublisher& publisher_;
    RunStateMachine state_;

    // Components prepared by initialize() for start()
    RunnerComponents pending_;

    // Serializes start/stop
    std::mutex control_mutex_;
    std::thread worker_;
    std::atomic<bool> stop_requested_{false};
    std::atomic<bool> worker_stopped_{true};
    std::atomic<uint64_t> run_count_{0};

    std::chrono::milliseconds stats_interval_{std::chrono::seconds(10)};

    mutable std::mutex stats_mutex_;
    RunnerStats stats_;
};

}  // namespace footfall
