#pragma once

#include <optional>
#include <string>
#include "httplib.h"
#include "annotext/Analyzer.hpp"
#include <nlohmann/json.hpp>

class AnnotextHttpServer {
public:
    AnnotextHttpServer(std::string host, int port, annotext::AnalyzerRegistry registry);

    // Blocks serving host:port; throws if the address cannot be bound.
    void run();

    // Binds host to an ephemeral port and returns it (-1 on failure);
    // serve with listenAfterBind().
    int bindToAnyPort();
    bool listenAfterBind();
    void stop();
    bool isRunning() const;

    // Whole-string decimal port in 1..65535, otherwise std::nullopt.
    static std::optional<int> parsePort(const std::string& value);

private:
    void setupRoutes();

    std::string host_;
    int port_;
    httplib::Server server_;
    const annotext::AnalyzerRegistry registry_;
};
