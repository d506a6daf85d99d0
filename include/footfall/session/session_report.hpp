#pragma once

#include "footfall/session/session_store.hpp"

#include <string>
#include <vector>

namespace footfall {

/**
 * @brief Render sessions as a YAML document
 *
 * Times are epoch seconds, unset times are rendered as null ("~").
 */
std::string to_yaml(const std::vector<Session>& sessions);

/**
 * @brief Write the YAML session report to a file
 *
 * @return true if the file was written
 */
bool write_report(const std::string& path, const std::vector<Session>& sessions);

}  // namespace footfall
