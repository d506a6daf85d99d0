#include "footfall/session/session_report.hpp"
#include "footfall/core/logger.hpp"

#include <yaml-cpp/yaml.h>

#include <fstream>

namespace footfall {

namespace {

void emit_time(YAML::Emitter& out, const std::optional<Timestamp>& time) {
    if (time) {
        out << to_epoch_seconds(*time);
    } else {
        out << YAML::Null;
    }
}

}  // namespace

std::string to_yaml(const std::vector<Session>& sessions) {
    YAML::Emitter out;
    out.SetDoublePrecision(15);

    out << YAML::BeginMap;
    out << YAML::Key << "sessions" << YAML::Value << YAML::BeginSeq;

    for (const auto& session : sessions) {
        out << YAML::BeginMap;
        out << YAML::Key << "session_id" << YAML::Value << session.session_id;
        out << YAML::Key << "person_id" << YAML::Value << session.person_id;
        out << YAML::Key << "state" << YAML::Value << to_string(session.state());
        out << YAML::Key << "entry_time" << YAML::Value;
        emit_time(out, session.entry_time);
        out << YAML::Key << "exit_time" << YAML::Value;
        emit_time(out, session.exit_time);

        out << YAML::Key << "events" << YAML::Value << YAML::Flow << YAML::BeginSeq;
        for (const auto& event : session.events) {
            out << event;
        }
        out << YAML::EndSeq;

        out << YAML::Key << "zone_visits" << YAML::Value << YAML::BeginSeq;
        for (const auto& visit : session.zone_visits) {
            out << YAML::BeginMap;
            out << YAML::Key << "zone_name" << YAML::Value << visit.zone_name;
            out << YAML::Key << "entry_time" << YAML::Value << to_epoch_seconds(visit.entry_time);
            out << YAML::Key << "exit_time" << YAML::Value;
            emit_time(out, visit.exit_time);
            out << YAML::EndMap;
        }
        out << YAML::EndSeq;

        out << YAML::EndMap;
    }

    out << YAML::EndSeq;
    out << YAML::EndMap;

    return out.c_str();
}

bool write_report(const std::string& path, const std::vector<Session>& sessions) {
    std::ofstream file(path);
    if (!file.is_open()) {
        FOOTFALL_LOG_ERROR("sessions", "Failed to open report file: {}", path);
        return false;
    }

    file << to_yaml(sessions) << '\n';
    if (!file.good()) {
        FOOTFALL_LOG_ERROR("sessions", "Failed to write report file: {}", path);
        return false;
    }

    FOOTFALL_LOG_INFO("sessions", "Wrote {} sessions to {}", sessions.size(), path);
    return true;
}

}  // namespace footfall
