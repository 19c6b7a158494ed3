#include "redis_client.h"
#include "errors.h"
#include <hiredis/hiredis.h>
#include <iostream>
#include <sys/time.h>

namespace texq {

namespace {

RedisReply convert_reply(const redisReply* reply) {
    RedisReply result;
    switch (reply->type) {
        case REDIS_REPLY_STRING:
            result.type = RedisReply::Type::String;
            result.str.assign(reply->str, reply->len);
            break;
        case REDIS_REPLY_STATUS:
            result.type = RedisReply::Type::Status;
            result.str.assign(reply->str, reply->len);
            break;
        case REDIS_REPLY_ERROR:
            result.type = RedisReply::Type::Error;
            result.str.assign(reply->str, reply->len);
            break;
        case REDIS_REPLY_INTEGER:
            result.type = RedisReply::Type::Integer;
            result.integer = reply->integer;
            break;
        case REDIS_REPLY_ARRAY:
            result.type = RedisReply::Type::Array;
            for (size_t i = 0; i < reply->elements; i++) {
                result.elements.push_back(convert_reply(reply->element[i]));
            }
            break;
        default:
            result.type = RedisReply::Type::Nil;
            break;
    }
    return result;
}

} // namespace

RedisClient::RedisClient(const std::string& host, int port)
    : RedisClient(RedisConfig{host, port, "", 0}) {}

RedisClient::RedisClient(const RedisConfig& config)
    : config_(config), redis_(nullptr) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (connect()) {
        std::cout << "Connected to Redis at " << config_.host << ":" << config_.port << std::endl;
    }
}

RedisClient::~RedisClient() {
    std::lock_guard<std::mutex> lock(mutex_);
    disconnect();
}

bool RedisClient::connect() {
    disconnect();

    struct timeval timeout = {5, 0};
    redisContext* ctx = redisConnectWithTimeout(config_.host.c_str(), config_.port, timeout);
    if (ctx == nullptr || ctx->err) {
        std::cerr << "Failed to connect to Redis: "
                  << (ctx ? ctx->errstr : "connection error") << std::endl;
        if (ctx) redisFree(ctx);
        return false;
    }
    redisSetTimeout(ctx, timeout);
    redis_ = ctx;

    try {
        if (!config_.password.empty()) {
            command_locked({"AUTH", config_.password});
        }
        if (config_.db != 0) {
            command_locked({"SELECT", std::to_string(config_.db)});
        }
    } catch (const BrokerError& e) {
        std::cerr << "Redis handshake failed: " << e.what() << std::endl;
        disconnect();
        return false;
    }
    return true;
}

void RedisClient::disconnect() {
    if (redis_) {
        redisFree(static_cast<redisContext*>(redis_));
        redis_ = nullptr;
    }
}

bool RedisClient::is_available() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return redis_ != nullptr && static_cast<redisContext*>(redis_)->err == 0;
}

bool RedisClient::ping() {
    try {
        RedisReply reply = command({"PING"});
        return reply.str == "PONG";
    } catch (const BrokerError& e) {
        std::cerr << "Redis ping failed: " << e.what() << std::endl;
        return false;
    }
}

RedisReply RedisClient::command(const std::vector<std::string>& args) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (redis_ == nullptr || static_cast<redisContext*>(redis_)->err) {
        if (!connect()) {
            throw BrokerError("Redis unavailable at " + config_.host + ":" +
                              std::to_string(config_.port));
        }
    }
    return command_locked(args);
}

RedisReply RedisClient::command_locked(const std::vector<std::string>& args) {
    std::vector<const char*> argv;
    std::vector<size_t> argvlen;
    argv.reserve(args.size());
    argvlen.reserve(args.size());
    for (const auto& arg : args) {
        argv.push_back(arg.data());
        argvlen.push_back(arg.size());
    }

    redisContext* ctx = static_cast<redisContext*>(redis_);
    redisReply* reply = static_cast<redisReply*>(
        redisCommandArgv(ctx, static_cast<int>(argv.size()), argv.data(), argvlen.data()));
    if (reply == nullptr) {
        std::string error = ctx->errstr;
        disconnect();
        throw BrokerError("Redis command " + args.front() + " failed: " + error);
    }

    RedisReply result = convert_reply(reply);
    freeReplyObject(reply);
    if (result.type == RedisReply::Type::Error) {
        throw BrokerError("Redis " + args.front() + " error: " + result.str);
    }
    return result;
}

void RedisClient::set(const std::string& key, const std::string& value, int ttl_seconds) {
    if (ttl_seconds > 0) {
        command({"SET", key, value, "EX", std::to_string(ttl_seconds)});
    } else {
        command({"SET", key, value});
    }
}

std::optional<std::string> RedisClient::get(const std::string& key) {
    RedisReply reply = command({"GET", key});
    if (reply.is_nil()) return std::nullopt;
    return reply.str;
}

bool RedisClient::exists(const std::string& key) {
    return command({"EXISTS", key}).integer == 1;
}

long long RedisClient::del(const std::string& key) {
    return command({"DEL", key}).integer;
}

long long RedisClient::publish(const std::string& channel, const std::string& message) {
    return command({"PUBLISH", channel, message}).integer;
}

long long RedisClient::llen(const std::string& key) {
    return command({"LLEN", key}).integer;
}

long long RedisClient::zcard(const std::string& key) {
    return command({"ZCARD", key}).integer;
}

void RedisClient::hset(const std::string& key, const std::map<std::string, std::string>& fields) {
    if (fields.empty()) return;
    std::vector<std::string> args = {"HSET", key};
    for (const auto& [field, value] : fields) {
        args.push_back(field);
        args.push_back(value);
    }
    command(args);
}

std::map<std::string, std::string> RedisClient::hgetall(const std::string& key) {
    RedisReply reply = command({"HGETALL", key});
    std::map<std::string, std::string> fields;
    for (size_t i = 0; i + 1 < reply.elements.size(); i += 2) {
        fields[reply.elements[i].str] = reply.elements[i + 1].str;
    }
    return fields;
}

void RedisClient::expire(const std::string& key, int ttl_seconds) {
    command({"EXPIRE", key, std::to_string(ttl_seconds)});
}

RedisReply RedisClient::eval(const std::string& script,
                             const std::vector<std::string>& keys,
                             const std::vector<std::string>& args) {
    std::vector<std::string> argv = {"EVAL", script, std::to_string(keys.size())};
    argv.insert(argv.end(), keys.begin(), keys.end());
    argv.insert(argv.end(), args.begin(), args.end());
    return command(argv);
}

std::optional<std::string> RedisClient::brpoplpush(const std::string& source,
                                                   const std::string& destination,
                                                   int timeout_seconds) {
    RedisReply reply = command({"BRPOPLPUSH", source, destination, std::to_string(timeout_seconds)});
    if (reply.is_nil()) return std::nullopt;
    return reply.str;
}

} // namespace texq
