#pragma once

#include <nlohmann/json.hpp>

#include "job.h"

namespace texq {

void to_json(nlohmann::json& j, const ParsedLogEntry& entry);
// Throws nlohmann::json::exception on missing or mistyped fields
void from_json(const nlohmann::json& j, ParsedLogEntry& entry);

// metadata.json layout of an ephemeral job
nlohmann::json record_to_json(const JobRecord& record);
// Throws ValidationError when the document is not a valid record of a
// known schema version.
JobRecord record_from_json(const nlohmann::json& j);

} // namespace texq
