#pragma once

#include "footfall/core/types.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace footfall {

// Session log markers
constexpr const char* kEventEntry = "ENTRY";
constexpr const char* kEventExit = "EXIT";
constexpr const char* kEventAutoExit = "AUTO_EXIT";

/**
 * @brief One stay inside a zone
 */
struct ZoneVisit {
    std::string zone_name;
    Timestamp entry_time;
    std::optional<Timestamp> exit_time;

    bool is_open() const { return !exit_time.has_value(); }
};

/**
 * @brief Session lifecycle
 */
enum class SessionState : uint8_t {
    NONE = 0,   // Record exists but no entry recorded
    ACTIVE,     // Entered, not yet exited
    CLOSED      // Exited (terminal)
};

inline const char* to_string(SessionState state) {
    switch (state) {
        case SessionState::NONE: return "NONE";
        case SessionState::ACTIVE: return "ACTIVE";
        case SessionState::CLOSED: return "CLOSED";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Presence record of one person
 */
struct Session {
    std::string session_id;
    int person_id = 0;
    std::optional<Timestamp> entry_time;
    std::optional<Timestamp> exit_time;
    std::vector<std::string> events;
    std::optional<Timestamp> last_seen_time;
    std::vector<ZoneVisit> zone_visits;

    SessionState state() const {
        if (exit_time) return SessionState::CLOSED;
        if (entry_time) return SessionState::ACTIVE;
        return SessionState::NONE;
    }
};

/**
 * @brief Session store configuration
 */
struct SessionStoreConfig {
    std::chrono::milliseconds inactivity_timeout{5000};
    std::string id_prefix = "CUST_";
};

/**
 * @brief Per-person session records
 *
 * Sessions are created lazily on the first ENTRY of a person and never
 * deleted. A closed session is never reopened: a later ENTRY of the same
 * person only appends another "ENTRY" marker to it.
 *
 * Calls for persons without a session are no-ops. All times are passed in
 * by the caller so that one frame sees one instant.
 *
 * Not thread-safe; owned by the frame loop.
 */
class SessionStore {
public:
    explicit SessionStore(const SessionStoreConfig& config = SessionStoreConfig{});

    /**
     * @brief Record that a person was seen in the current frame
     */
    void observe(int person_id, Timestamp now);

    /**
     * @brief Person crossed a line in the entry direction
     */
    void on_entry(int person_id, Timestamp now);

    /**
     * @brief Person crossed a line in the exit direction
     *
     * The first exit closes the session and every zone visit still open.
     */
    void on_exit(int person_id, Timestamp now);

    /**
     * @brief Person's reference point moved into a zone
     *
     * Idempotent while a visit to the same zone is open.
     */
    void on_zone_entry(int person_id, const std::string& zone_name, Timestamp now);

    /**
     * @brief Person's reference point left a zone
     *
     * Closes the most recently opened visit to that zone.
     */
    void on_zone_exit(int person_id, const std::string& zone_name, Timestamp now);

    /**
     * @brief Auto-close sessions whose person has not been seen for longer
     *        than the inactivity timeout
     *
     * The exit time is set to the last time the person was seen. Zone
     * visits still open are closed at the same time.
     *
     * @return Number of sessions closed
     */
    size_t mark_inactive_if_not_seen(Timestamp now);

    /**
     * @brief Sessions currently present
     *
     * Runs the inactivity sweep first.
     */
    std::vector<Session> active_sessions(Timestamp now);

    /**
     * @brief Every session ever created, in creation order
     */
    const std::vector<Session>& all_sessions() const { return sessions_; }

    std::optional<std::string> session_id(int person_id) const;
    const Session* find(int person_id) const;
    size_t size() const { return sessions_.size(); }

    void set_inactivity_timeout(std::chrono::milliseconds timeout) {
        config_.inactivity_timeout = timeout;
    }
    const SessionStoreConfig& config() const { return config_; }

private:
    Session* find_mutable(int person_id);
    void close_zone_visits(Session& session, Timestamp when);
    std::string next_session_id();
    std::optional<Timestamp> last_seen(const Session& session) const;

    SessionStoreConfig config_;
    int next_session_number_ = 1;
    std::vector<Session> sessions_;
    std::unordered_map<int, size_t> index_;             // person id -> sessions_ index
    std::unordered_map<int, Timestamp> person_last_seen_;
};

}  // namespace footfall
