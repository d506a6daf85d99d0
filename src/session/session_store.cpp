#include "footfall/session/session_store.hpp"
#include "footfall/core/logger.hpp"

#include <cstdio>

namespace footfall {

SessionStore::SessionStore(const SessionStoreConfig& config)
    : config_(config)
{
}

void SessionStore::observe(int person_id, Timestamp now) {
    person_last_seen_[person_id] = now;

    if (Session* session = find_mutable(person_id)) {
        session->last_seen_time = now;
    }
}

void SessionStore::on_entry(int person_id, Timestamp now) {
    Session* session = find_mutable(person_id);
    if (session == nullptr) {
        Session created;
        created.session_id = next_session_id();
        created.person_id = person_id;
        index_[person_id] = sessions_.size();
        sessions_.push_back(std::move(created));
        session = &sessions_.back();

        FOOTFALL_LOG_INFO("sessions", "Session {} opened for person {}",
                          session->session_id, person_id);
    }

    if (!session->entry_time) {
        session->entry_time = now;
    }
    session->last_seen_time = now;
    person_last_seen_[person_id] = now;
    session->events.emplace_back(kEventEntry);
}

void SessionStore::on_exit(int person_id, Timestamp now) {
    Session* session = find_mutable(person_id);
    if (session == nullptr) {
        return;
    }

    if (!session->exit_time) {
        session->exit_time = now;
        close_zone_visits(*session, now);
        FOOTFALL_LOG_INFO("sessions", "Session {} closed by exit", session->session_id);
    }
    session->events.emplace_back(kEventExit);
}

void SessionStore::on_zone_entry(int person_id, const std::string& zone_name, Timestamp now) {
    Session* session = find_mutable(person_id);
    if (session == nullptr) {
        return;
    }

    for (const auto& visit : session->zone_visits) {
        if (visit.zone_name == zone_name && visit.is_open()) {
            return;
        }
    }

    session->zone_visits.push_back(ZoneVisit{zone_name, now, std::nullopt});
    FOOTFALL_LOG_DEBUG("sessions", "Session {} entered zone '{}'", session->session_id, zone_name);
}

void SessionStore::on_zone_exit(int person_id, const std::string& zone_name, Timestamp now) {
    Session* session = find_mutable(person_id);
    if (session == nullptr) {
        return;
    }

    for (auto it = session->zone_visits.rbegin(); it != session->zone_visits.rend(); ++it) {
        if (it->zone_name == zone_name && it->is_open()) {
            it->exit_time = now;
            FOOTFALL_LOG_DEBUG("sessions", "Session {} left zone '{}'",
                               session->session_id, zone_name);
            return;
        }
    }
}

size_t SessionStore::mark_inactive_if_not_seen(Timestamp now) {
    size_t closed = 0;

    for (auto& session : sessions_) {
        if (session.exit_time) {
            continue;
        }

        auto seen = last_seen(session);
        if (!seen) {
            continue;
        }

        if (now - *seen > config_.inactivity_timeout) {
            session.exit_time = *seen;
            session.events.emplace_back(kEventAutoExit);
            close_zone_visits(session, *seen);
            ++closed;

            FOOTFALL_LOG_INFO("sessions", "Session {} auto-closed after {:.1f}s unseen",
                              session.session_id,
                              std::chrono::duration_cast<Seconds>(now - *seen).count());
        }
    }

    return closed;
}

std::vector<Session> SessionStore::active_sessions(Timestamp now) {
    mark_inactive_if_not_seen(now);

    std::vector<Session> out;
    for (const auto& session : sessions_) {
        if (!session.entry_time || session.exit_time) {
            continue;
        }

        auto seen = last_seen(session);
        if (!seen || now - *seen <= config_.inactivity_timeout) {
            out.push_back(session);
        }
    }
    return out;
}

std::optional<std::string> SessionStore::session_id(int person_id) const {
    const Session* session = find(person_id);
    if (session == nullptr) {
        return std::nullopt;
    }
    return session->session_id;
}

const Session* SessionStore::find(int person_id) const {
    auto it = index_.find(person_id);
    return it == index_.end() ? nullptr : &sessions_[it->second];
}

Session* SessionStore::find_mutable(int person_id) {
    auto it = index_.find(person_id);
    return it == index_.end() ? nullptr : &sessions_[it->second];
}

void SessionStore::close_zone_visits(Session& session, Timestamp when) {
    for (auto& visit : session.zone_visits) {
        if (visit.is_open()) {
            visit.exit_time = when;
        }
    }
}

std::string SessionStore::next_session_id() {
    char number[16];
    std::snprintf(number, sizeof(number), "%03d", next_session_number_++);
    return config_.id_prefix + number;
}

std::optional<Timestamp> SessionStore::last_seen(const Session& session) const {
    auto it = person_last_seen_.find(session.person_id);
    if (it != person_last_seen_.end()) {
        return it->second;
    }
    if (session.entry_time) {
        return session.entry_time;
    }
    return session.last_seen_time;
}

}  // namespace footfall
