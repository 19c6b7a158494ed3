#include "status_publisher.h"
#include "errors.h"
#include "json_codec.h"

#include <iostream>

using json = nlohmann::json;

namespace texq::worker {

StatusPublisher::StatusPublisher(RedisClient& redis, std::string channel)
    : redis_(redis), channel_(std::move(channel)) {}

std::string StatusPublisher::to_message(const StatusEvent& event) {
    json j;
    j["jobId"] = event.job_id;
    j["projectId"] = event.project_id;
    j["status"] = to_string(event.status);

    if (is_terminal(event.status)) {
        j["logs"] = event.logs;
        j["durationMs"] = event.duration_ms ? json(*event.duration_ms) : json(nullptr);
        j["errors"] = event.errors;
        j["pdfUrl"] = event.pdf_url ? json(*event.pdf_url) : json(nullptr);
        if (!event.artifact_hash.empty()) {
            j["artifactHash"] = event.artifact_hash;
        }
    }
    // TeX logs are not guaranteed to be UTF-8
    return j.dump(-1, ' ', false, json::error_handler_t::replace);
}

bool StatusPublisher::publish(const StatusEvent& event) {
    try {
        redis_.publish(channel_, to_message(event));
        return true;
    } catch (const BrokerError& e) {
        std::cerr << "[Publisher] Failed to publish " << to_string(event.status)
                  << " for " << event.job_id << ": " << e.what() << std::endl;
        return false;
    }
}

} // namespace texq::worker
