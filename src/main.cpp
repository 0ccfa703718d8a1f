#include "AnnotextHttpServer.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>

using json = nlohmann::json;

namespace {

json loadSettings(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("cannot open settings file " + path);
    }
    return json::parse(in);
}

} // namespace

int main() {
    std::string host = "0.0.0.0";
    int port = 8080;
    if (const char* envHost = std::getenv("ANNOTEXT_HOST")) {
        host = envHost;
    }
    if (const char* envPort = std::getenv("ANNOTEXT_PORT")) {
        if (auto parsed = AnnotextHttpServer::parsePort(envPort)) {
            port = *parsed;
        } else {
            std::cerr << "annotext: ignoring invalid ANNOTEXT_PORT=" << envPort << ", using " << port << "\n";
        }
    }

    try {
        json settings;
        if (const char* envSettings = std::getenv("ANNOTEXT_SETTINGS")) {
            std::cerr << "annotext: loading settings from " << envSettings << "\n";
            settings = loadSettings(envSettings);
        }
        auto registry = annotext::AnalyzerRegistry::fromSettings(settings);
        std::cerr << "annotext: analyzers=" << registry.size() << "\n";

        AnnotextHttpServer app(host, port, std::move(registry));
        app.run();
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
