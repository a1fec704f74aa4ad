#include "infrastructure/OllamaClient.hpp"
#include <httplib.h>
#include <iostream>
#include <nlohmann/json.hpp>

namespace wikiembed::infrastructure {

using json = nlohmann::json;

OllamaClient::OllamaClient(const std::string& host, int port)
    : m_host(host), m_port(port) {}

std::vector<float> OllamaClient::getEmbedding(const std::string& model, const std::string& text) {
    httplib::Client cli(m_host, m_port);
    cli.set_read_timeout(180);

    json requestData = {
        {"model", model},
        {"prompt", text}
    };

    auto res = cli.Post("/api/embeddings", requestData.dump(), "application/json");
    if (res && res->status == 200) {
        try {
            auto body = json::parse(res->body);
            if (body.contains("embedding") && body["embedding"].is_array()) {
                return body["embedding"].get<std::vector<float>>();
            }
            std::cerr << "[OllamaClient] Response has no embedding array for model " << model << std::endl;
        } catch (const std::exception& e) {
            std::cerr << "[OllamaClient] Embedding JSON Parse Error: " << e.what() << std::endl;
        }
    } else if (res) {
        std::cerr << "[OllamaClient] HTTP Error " << res->status << ": " << res->body << std::endl;
    } else {
        std::cerr << "[OllamaClient] Connection failed: " << static_cast<int>(res.error()) << std::endl;
    }
    return {};
}

} // namespace wikiembed::infrastructure
