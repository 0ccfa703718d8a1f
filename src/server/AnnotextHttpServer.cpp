#include "AnnotextHttpServer.hpp"

#include <cctype>
#include <cstddef>
#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>

using json = nlohmann::json;

AnnotextHttpServer::AnnotextHttpServer(std::string host, int port, annotext::AnalyzerRegistry registry)
    : host_(std::move(host)), port_(port), registry_(std::move(registry)) {
    setupRoutes();
}

void AnnotextHttpServer::run() {
    std::cout << "annotext HTTP server listening on "
              << host_ << ":" << port_ << std::endl;
    if (!server_.listen(host_.c_str(), port_)) {
        throw std::runtime_error("failed to listen on " + host_ + ":" + std::to_string(port_));
    }
}

int AnnotextHttpServer::bindToAnyPort() {
    port_ = server_.bind_to_any_port(host_.c_str());
    if (port_ > 0) {
        std::cout << "annotext HTTP server bound to "
                  << host_ << ":" << port_ << std::endl;
    }
    return port_;
}

bool AnnotextHttpServer::listenAfterBind() {
    return server_.listen_after_bind();
}

void AnnotextHttpServer::stop() {
    server_.stop();
}

bool AnnotextHttpServer::isRunning() const {
    return server_.is_running();
}

std::optional<int> AnnotextHttpServer::parsePort(const std::string& value) {
    if (value.empty() || !std::isdigit(static_cast<unsigned char>(value[0]))) return std::nullopt;
    try {
        std::size_t pos = 0;
        long port = std::stol(value, &pos);
        if (pos != value.size() || port < 1 || port > 65535) return std::nullopt;
        return static_cast<int>(port);
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

void AnnotextHttpServer::setupRoutes() {

    // JSON helpers
    auto ok = [](const json& data) {
        return json{
            {"status", "ok"},
            {"data", data}
        };
    };

    auto err = [](int code, const std::string& message) {
        return json{
            {"status", "error"},
            {"error", {
                {"code", code},
                {"message", message}
            }}
        };
    };

    auto isJsonContent = [](const httplib::Request& req) {
        auto ct = req.get_header_value("Content-Type");
        return ct.find("application/json") != std::string::npos;
    };

    // CORS helper to add to ALL responses
    auto addCors = [](httplib::Response& res) {
        res.set_header("Access-Control-Allow-Origin", "*");
        res.set_header("Access-Control-Allow-Methods", "GET, POST, OPTIONS");
        res.set_header("Access-Control-Allow-Headers", "Content-Type");
    };

    server_.Options(R"(.*)", [addCors](const httplib::Request&, httplib::Response& res) {
        addCors(res);
        res.status = 200;
        res.set_content("", "text/plain");
    });

    // --- HEALTH ---
    server_.Get("/v1/health", [this, ok, addCors](const httplib::Request&, httplib::Response& res) {
        json data = { {"analyzers", registry_.size()} };
        res.set_content(ok(data).dump(), "application/json");
        addCors(res);
    });

    // --- LIST ANALYZERS ---
    server_.Get("/v1/analyzers", [this, ok, addCors](const httplib::Request&, httplib::Response& res) {
        json list = json::array();
        for (const auto& name : registry_.names()) {
            const auto& analyzer = registry_.get(name);
            list.push_back({
                {"name", name},
                {"keep_whole", analyzer.keepAnnotationsWhole()},
                {"settings", analyzer.config().toJson()}
            });
        }
        res.set_content(ok(list).dump(), "application/json");
        addCors(res);
    });

    // --- ANALYZE ---
    server_.Post("/v1/_analyze", [this, ok, err, isJsonContent, addCors](const httplib::Request& req, httplib::Response& res) {
        if (!isJsonContent(req)) {
            res.status = 415;
            res.set_content(err(415, "Content-Type must be application/json").dump(), "application/json");
            addCors(res);
            return;
        }

        auto body = json::parse(req.body, nullptr, false);
        if (body.is_discarded() || !body.is_object()) {
            res.status = 400;
            res.set_content(err(400, "Invalid JSON body").dump(), "application/json");
            addCors(res);
            return;
        }
        if (!body.contains("text") || !body["text"].is_string()) {
            res.status = 400;
            res.set_content(err(400, "Missing string field 'text'").dump(), "application/json");
            addCors(res);
            return;
        }

        std::string name = annotext::AnalyzerRegistry::kDefaultAnalyzer;
        if (body.contains("analyzer")) {
            if (!body["analyzer"].is_string()) {
                res.status = 400;
                res.set_content(err(400, "Field 'analyzer' must be a string").dump(), "application/json");
                addCors(res);
                return;
            }
            name = body["analyzer"].get<std::string>();
        }
        if (!registry_.contains(name)) {
            res.status = 404;
            res.set_content(err(404, "Analyzer not found: " + name).dump(), "application/json");
            addCors(res);
            return;
        }

        auto tokens = registry_.get(name).analyze(body["text"].get<std::string>());
        json data = {
            {"analyzer", name},
            {"tokens", annotext::tokensToJson(tokens)}
        };
        res.set_content(ok(data).dump(), "application/json");
        addCors(res);
    });
}
