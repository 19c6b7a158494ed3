#pragma once

#include <string>

namespace texq {

// Hex SHA-256 of a string
std::string compute_hash(const std::string& data);

// Hex SHA-256 of a file's bytes. Empty string when unreadable.
std::string compute_file_hash(const std::string& file_path);

// Random RFC 4122 version 4 identifier, used for job and worker instance ids
std::string generate_uuid();

} // namespace texq
