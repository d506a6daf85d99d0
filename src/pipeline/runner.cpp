#include "footfall/pipeline/runner.hpp"
#include "footfall/capture/frame_convert.hpp"
#include "footfall/core/config.hpp"
#include "footfall/core/logger.hpp"
#include "footfall/pipeline/pipeline.hpp"

namespace footfall {

namespace {

constexpr auto kStopPollInterval = std::chrono::milliseconds(5);

}  // namespace

PipelineRunner::PipelineRunner(SceneRegistry& scene, SnapshotPublisher& publisher)
    : scene_(scene)
    , publisher_(publisher)
{
}

PipelineRunner::~PipelineRunner() {
    stop();
}

bool PipelineRunner::initialize(const Config& config) {
    RunnerComponents components;

    components.source = create_frame_source(config);
    if (!components.source) {
        FOOTFALL_LOG_ERROR("runner", "Failed to create frame source");
        return false;
    }

    components.detector = create_detector(config);
    if (!components.detector) {
        FOOTFALL_LOG_ERROR("runner", "Failed to create person detector");
        return false;
    }

    components.embedder = create_embedder(config);
    if (!components.embedder) {
        FOOTFALL_LOG_ERROR("runner", "Failed to create embedder");
        return false;
    }

    std::chrono::milliseconds interval(config.get_int("runner.stats_interval_ms", 10000));
    if (interval.count() > 0) {
        stats_interval_ = interval;
    }

    FOOTFALL_LOG_INFO("runner", "Initialized: source={}, detector={}, embedder={} (dim {})",
                      components.source->name(), to_string(components.detector->backend()),
                      to_string(components.embedder->backend()), components.embedder->dimension());

    pending_ = std::move(components);
    return true;
}

void PipelineRunner::start() {
    if (!pending_.complete()) {
        FOOTFALL_LOG_ERROR("runner", "start() without initialized components");
        return;
    }
    start(std::move(pending_));
}

bool PipelineRunner::start(RunnerComponents components) {
    if (!components.complete()) {
        FOOTFALL_LOG_ERROR("runner", "Incomplete components, run not started");
        return false;
    }

    std::lock_guard<std::mutex> lock(control_mutex_);

    stop_worker();
    publisher_.reset();

    {
        std::lock_guard<std::mutex> stats_lock(stats_mutex_);
        stats_ = RunnerStats{};
    }

    stop_requested_.store(false, std::memory_order_release);
    worker_stopped_.store(false, std::memory_order_release);
    state_.set_state(RunState::STARTING);
    uint64_t run = run_count_.fetch_add(1, std::memory_order_acq_rel) + 1;

    worker_ = std::thread(&PipelineRunner::worker_loop, this, std::move(components));

    FOOTFALL_LOG_INFO("runner", "Run {} started", run);
    return true;
}

void PipelineRunner::stop() {
    std::lock_guard<std::mutex> lock(control_mutex_);
    stop_worker();
}

void PipelineRunner::stop_worker() {
    if (!worker_.joinable()) {
        return;
    }

    state_.transition(RunState::RUNNING, RunState::STOPPING);
    stop_requested_.store(true, std::memory_order_release);

    while (!worker_stopped_.load(std::memory_order_acquire)) {
        std::this_thread::sleep_for(kStopPollInterval);
    }
    worker_.join();

    FOOTFALL_LOG_INFO("runner", "Run {} stopped ({})", run_count(), state_.state_string());
}

bool PipelineRunner::is_running() const {
    return state_.is_active();
}

RunnerStats PipelineRunner::get_stats() const {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    return stats_;
}

void PipelineRunner::worker_loop(RunnerComponents components) {
    FOOTFALL_LOG_DEBUG("runner", "Worker thread started");

    IFrameSource& source = *components.source;
    IPersonDetector& detector = *components.detector;
    IEmbedder& embedder = *components.embedder;

    JourneyPipeline pipeline;
    bool failed = false;

    source.start();
    if (!source.is_running()) {
        FOOTFALL_LOG_ERROR("runner", "Frame source {} failed to start", source.name());
        failed = true;
    } else {
        state_.transition(RunState::STARTING, RunState::RUNNING);
    }

    uint64_t window_frames = 0;
    auto last_stats_time = Clock::now();

    try {
        while (!failed && !stop_requested_.load(std::memory_order_acquire)) {
            FramePtr frame = source.read();
            if (!frame || !frame->valid()) {
                FOOTFALL_LOG_INFO("runner", "Frame source exhausted");
                break;
            }

            SceneSnapshot scene = scene_.snapshot();
            cv::Mat image = frame_to_mat(*frame);

            std::vector<Detection> detections =
                detector.detect(image, scene.params.detection_confidence);

            std::vector<Embedding> embeddings;
            embeddings.reserve(detections.size());
            for (const auto& detection : detections) {
                embeddings.push_back(embedder.embed(crop_box(image, detection.bbox)));
            }

            Timestamp now = WallClock::now();
            FrameResult result = pipeline.process(detections, embeddings, frame->size(), scene, now);

            {
                std::lock_guard<std::mutex> lock(stats_mutex_);
                stats_.frames_processed++;
                stats_.detections += detections.size();
                stats_.entries += result.entries;
                stats_.exits += result.exits;
                stats_.active_sessions = result.active_sessions;
                stats_.total_sessions = result.sessions.size();
            }

            FrameSnapshot snapshot;
            snapshot.frame_id = frame->metadata.frame_id;
            snapshot.frame_size = frame->size();
            snapshot.tracks = std::move(result.tracks);
            snapshot.sessions = std::move(result.sessions);
            snapshot.active_sessions = result.active_sessions;
            publisher_.publish(std::move(snapshot));

            window_frames++;

            // Statistics
            auto elapsed = Clock::now() - last_stats_time;
            if (elapsed > stats_interval_) {
                float fps = window_frames / std::chrono::duration<float>(elapsed).count();
                RunnerStats stats = get_stats();
                FOOTFALL_LOG_INFO("runner", "Processing: fps={:.1f}, tracks={}, sessions={} ({} active), entries={}, exits={}",
                                  fps, pipeline.tracker().live_count(), stats.total_sessions,
                                  stats.active_sessions, stats.entries, stats.exits);
                FOOTFALL_LOG_DEBUG("runner", "Detection: avg_time={:.1f}ms, identities={}",
                                   std::chrono::duration<float, std::milli>(
                                       detector.get_stats().average_inference_time()).count(),
                                   pipeline.identities().identity_count());
                window_frames = 0;
                last_stats_time = Clock::now();
            }
        }
    } catch (const std::exception& e) {
        FOOTFALL_LOG_ERROR("runner", "Frame loop failed: {}", e.what());
        failed = true;
    }

    // Final session list
    FrameSnapshot last;
    last.frame_size = source.frame_size();
    last.sessions = pipeline.sessions().all_sessions();
    for (const auto& session : last.sessions) {
        if (session.state() == SessionState::ACTIVE) {
            last.active_sessions++;
        }
    }
    last.final = true;
    publisher_.publish(std::move(last));

    source.stop();

    state_.set_state(failed ? RunState::ERROR : RunState::STOPPED);
    worker_stopped_.store(true, std::memory_order_release);

    FOOTFALL_LOG_DEBUG("runner", "Worker thread exiting after {} frames",
                       pipeline.frames_processed());
}

}  // namespace footfall
