#include <drogon/drogon.h>
#include <json/json.h>
#include <nlohmann/json.hpp>

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <functional>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "config.hpp"
#include "engine.hpp"
#include "rule_loader.hpp"
#include "session_manager.hpp"

using json = nlohmann::json;

static json fromJsoncpp(const Json::Value &v) {
    switch (v.type()) {
    case Json::nullValue: return nullptr;
    case Json::intValue: return (int64_t)v.asInt64();
    case Json::uintValue: return (uint64_t)v.asUInt64();
    case Json::realValue: return v.asDouble();
    case Json::stringValue: return v.asString();
    case Json::booleanValue: return v.asBool();
    case Json::arrayValue: {
        json out = json::array();
        for (const auto &item : v) out.push_back(fromJsoncpp(item));
        return out;
    }
    case Json::objectValue: {
        json out = json::object();
        for (auto it = v.begin(); it != v.end(); ++it) {
            out[it.name()] = fromJsoncpp(*it);
        }
        return out;
    }
    default:
        return nullptr;
    }
}

// Replies only carry strings, flags, counters, timestamps and nested lists/objects.
static Json::Value toJsoncpp(const json &v) {
    switch (v.type()) {
    case json::value_t::boolean: return Json::Value(v.get<bool>());
    case json::value_t::number_integer: return Json::Value((Json::Int64)v.get<int64_t>());
    case json::value_t::number_unsigned: return Json::Value((Json::UInt64)v.get<uint64_t>());
    case json::value_t::string: return Json::Value(v.get<std::string>());
    case json::value_t::array: {
        Json::Value arr(Json::arrayValue);
        for (const auto &item : v) arr.append(toJsoncpp(item));
        return arr;
    }
    case json::value_t::object: {
        Json::Value obj(Json::objectValue);
        for (const auto &item : v.items()) obj[item.key()] = toJsoncpp(item.value());
        return obj;
    }
    default:
        return Json::Value();
    }
}

static std::string stringField(const json &body, const char *key) {
    if (!body.is_object() || !body.contains(key) || !body[key].is_string()) return "";
    return body[key].get<std::string>();
}

using Callback = std::function<void(const drogon::HttpResponsePtr &)>;

class GatewayServer {
public:
    GatewayServer(std::shared_ptr<const eliza::RuleSet> rules, const eliza::Config &config)
        : rules_(std::move(rules)), config_(config),
          sessions_(engineFactory(), config.sessionIdleMs, config.maxSessions) {
        startedAt_ = std::chrono::steady_clock::now();
        setupRoutes();
    }

    void listen() {
        drogon::app().getLoop()->runEvery(60.0, [this]() {
            int dropped = sessions_.expireIdle(eliza::SessionManager::nowMs());
            if (dropped > 0) std::cout << "[Gateway] expired " << dropped << " idle session(s)" << std::endl;
        });
        drogon::app().setThreadNum((size_t)config_.threads);
        // Utterances are cut to maxInputChars anyway; refuse bodies far beyond that.
        drogon::app().setClientMaxBodySize((size_t)config_.maxInputChars * 4 + 1024);
        drogon::app().addListener(config_.host, (uint16_t)config_.port);
        std::cout << "[Gateway] Listening on http://" << config_.host << ":" << config_.port << std::endl;
        std::cout << "[Gateway] keywords: " << rules_->keywords.size() << ", links: " << rules_->links.size() << std::endl;
        drogon::app().run();
    }

private:
    std::shared_ptr<const eliza::RuleSet> rules_;
    eliza::Config config_;
    eliza::SessionManager sessions_;
    std::chrono::steady_clock::time_point startedAt_;
    std::mutex seedMu_;
    std::uint32_t nextSeed_{0};

    eliza::SessionManager::EngineFactory engineFactory() {
        return [this]() {
            eliza::EngineOptions options;
            {
                std::lock_guard<std::mutex> lock(seedMu_);
                // A fixed --seed keeps every session reproducible but distinct.
                if (config_.seed) options.seed = config_.seed + nextSeed_++;
            }
            options.memoryCapacity = (std::size_t)config_.memorySize;
            options.maxInputChars = (std::size_t)config_.maxInputChars;
            if (config_.debug) {
                options.onDebug = [](const std::string &msg) {
                    std::cerr << "[Engine] " << msg << std::endl;
                };
            }
            return eliza::Engine(rules_, std::move(options));
        };
    }

    json parseRequestBody(const drogon::HttpRequestPtr &req, bool &ok) const {
        ok = true;
        auto payload = req->getJsonObject();
        if (payload) return fromJsoncpp(*payload);
        auto body = req->getBody();
        if (body.empty()) return json::object();
        auto parsed = json::parse(std::string(body), nullptr, false);
        if (parsed.is_discarded() || !parsed.is_object()) {
            ok = false;
            return json();
        }
        return parsed;
    }

    void setupRoutes() {
        drogon::app().registerHandler("/api/chat", [this](const drogon::HttpRequestPtr &req, Callback &&cb) {
            try {
                bool ok = true;
                json body = parseRequestBody(req, ok);
                if (!ok) return badRequest(cb, "invalid json");
                std::string text = stringField(body, "text");
                if (text.empty()) text = stringField(body, "message");
                auto session = sessions_.ensure(stringField(body, "sessionId"));
                json result{{"sessionId", session->id}};
                {
                    std::lock_guard<std::mutex> lock(session->mu);
                    if (session->engine.isQuitWord(text)) {
                        result["reply"] = "Goodbye. It was nice talking to you.";
                        result["quit"] = true;
                    } else {
                        result["reply"] = session->engine.respond(text);
                        const auto &trace = session->engine.lastTrace();
                        result["stage"] = eliza::stageName(trace.stage);
                        result["keyword"] = trace.keyword;
                        result["memory"] = session->engine.memory().size();
                        result["quit"] = false;
                    }
                }
                if (result.value("quit", false)) sessions_.remove(session->id);
                respondJson(cb, json{{"ok", true}, {"result", result}});
            } catch (const std::exception &e) {
                respondJson(cb, json{{"ok", false}, {"error", e.what()}}, drogon::k500InternalServerError);
            }
        }, {drogon::Post});

        drogon::app().registerHandler("/api/chat/start", [this](const drogon::HttpRequestPtr &req, Callback &&cb) {
            try {
                bool ok = true;
                json body = parseRequestBody(req, ok);
                if (!ok) return badRequest(cb, "invalid json");
                auto session = sessions_.ensure(stringField(body, "sessionId"));
                std::string greeting;
                {
                    std::lock_guard<std::mutex> lock(session->mu);
                    greeting = session->engine.initialPrompt();
                }
                respondJson(cb, json{{"ok", true}, {"result", json{{"sessionId", session->id}, {"greeting", greeting}}}});
            } catch (const std::exception &e) {
                respondJson(cb, json{{"ok", false}, {"error", e.what()}}, drogon::k500InternalServerError);
            }
        }, {drogon::Post});

        drogon::app().registerHandler("/api/session/reset", [this](const drogon::HttpRequestPtr &req, Callback &&cb) {
            try {
                bool ok = true;
                json body = parseRequestBody(req, ok);
                if (!ok) return badRequest(cb, "invalid json");
                std::string sid = stringField(body, "sessionId");
                if (sid.empty()) return badRequest(cb, "sessionId required");
                if (!sessions_.reset(sid)) {
                    respondJson(cb, json{{"ok", false}, {"error", "session not found"}}, drogon::k404NotFound);
                    return;
                }
                respondJson(cb, json{{"ok", true}, {"result", json{{"sessionId", sid}}}});
            } catch (const std::exception &e) {
                respondJson(cb, json{{"ok", false}, {"error", e.what()}}, drogon::k500InternalServerError);
            }
        }, {drogon::Post});

        drogon::app().registerHandler("/api/sessions", [this](const drogon::HttpRequestPtr &, Callback &&cb) {
            respondJson(cb, json{{"ok", true}, {"result", sessions_.exportSessions()}});
        }, {drogon::Get});

        drogon::app().registerHandler("/api/system/status", [this](const drogon::HttpRequestPtr &, Callback &&cb) {
            auto uptime = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - startedAt_).count();
            json status{
                {"keywords", rules_->keywords.size()},
                {"links", rules_->links.size()},
                {"memoryCapacity", config_.memorySize > 0 ? (std::size_t)config_.memorySize : rules_->memory.capacity},
                {"sessions", sessions_.size()},
                {"uptimeMs", (int64_t)uptime}
            };
            respondJson(cb, json{{"ok", true}, {"result", status}});
        }, {drogon::Get});
    }

    void respondJson(const Callback &cb, const json &j, drogon::HttpStatusCode code = drogon::k200OK) {
        auto resp = drogon::HttpResponse::newHttpJsonResponse(toJsoncpp(j));
        resp->setStatusCode(code);
        cb(resp);
    }

    void badRequest(const Callback &cb, const std::string &msg) {
        respondJson(cb, json{{"ok", false}, {"error", msg}}, drogon::k400BadRequest);
    }
};

int main(int argc, char **argv) {
    const auto config = eliza::loadConfig(argc, argv);

    auto rules = eliza::loadRuleSetOrBuiltin(config.scriptPath);
    GatewayServer gateway(rules, config);
    gateway.listen();
    return 0;
}
