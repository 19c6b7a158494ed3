#pragma once

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "config.h"

namespace texq {

// Owned copy of a hiredis reply
struct RedisReply {
    enum class Type { Nil, String, Integer, Array, Status, Error };

    Type type = Type::Nil;
    std::string str;
    long long integer = 0;
    std::vector<RedisReply> elements;

    bool is_nil() const { return type == Type::Nil; }
};

// Synchronous Redis connection. One instance is shared by the threads of a
// component and serialized internally; blocking pops need their own instance.
class RedisClient {
public:
    RedisClient(const std::string& host, int port);
    explicit RedisClient(const RedisConfig& config);
    ~RedisClient();

    RedisClient(const RedisClient&) = delete;
    RedisClient& operator=(const RedisClient&) = delete;

    bool is_available() const;

    // PING round trip; reconnects first when the connection was lost.
    bool ping();

    // Run one command. Throws BrokerError on transport failures and error replies.
    RedisReply command(const std::vector<std::string>& args);

    void set(const std::string& key, const std::string& value, int ttl_seconds = 0);
    std::optional<std::string> get(const std::string& key);
    bool exists(const std::string& key);
    long long del(const std::string& key);
    long long publish(const std::string& channel, const std::string& message);
    long long llen(const std::string& key);
    long long zcard(const std::string& key);
    void hset(const std::string& key, const std::map<std::string, std::string>& fields);
    std::map<std::string, std::string> hgetall(const std::string& key);
    void expire(const std::string& key, int ttl_seconds);

    RedisReply eval(const std::string& script,
                    const std::vector<std::string>& keys,
                    const std::vector<std::string>& args);

    // Atomically pops the tail of source onto destination, waiting up to
    // timeout_seconds. nullopt when nothing arrived.
    std::optional<std::string> brpoplpush(const std::string& source,
                                          const std::string& destination,
                                          int timeout_seconds);

    const RedisConfig& config() const { return config_; }

private:
    bool connect();
    void disconnect();
    RedisReply command_locked(const std::vector<std::string>& args);

    RedisConfig config_;
    void* redis_;  // redisContext* - using void* to avoid exposing hiredis in header
    mutable std::mutex mutex_;
};

} // namespace texq
