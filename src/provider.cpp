#include "provider.hpp"
#include "errors.hpp"
#include "utils.hpp"
#include <httplib.h>
#include <chrono>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <thread>

namespace arena {

// ── Error classification ───────────────────────────────────────────────

ProviderErrorKind classify_provider_error(const std::string& error_text) {
    if (error_text.empty()) return ProviderErrorKind::unknown;

    std::string lower = to_lower(error_text);

    if (text_contains_any(lower, {"rate limit", "rate_limit", "too many requests", "429",
                                   "quota exceeded", "resource_exhausted", "usage limit"}))
        return ProviderErrorKind::rate_limit;

    if (text_contains_any(lower, {"overloaded", "overloaded_error", "503"}))
        return ProviderErrorKind::overloaded;

    if (text_contains_any(lower, {"context overflow", "context window", "prompt too large",
                                   "too long", "token limit", "maximum context"}))
        return ProviderErrorKind::context_overflow;

    if (text_contains_any(lower, {"timeout", "timed out", "deadline exceeded", "connection error"}))
        return ProviderErrorKind::timeout;

    if (text_contains_any(lower, {"401", "403", "unauthorized", "forbidden",
                                   "invalid api key", "invalid_api_key", "authentication"}))
        return ProviderErrorKind::auth;

    if (text_contains_any(lower, {"402", "payment required", "insufficient credits",
                                   "billing", "insufficient balance"}))
        return ProviderErrorKind::billing;

    return ProviderErrorKind::unknown;
}

bool is_retryable_error(ProviderErrorKind kind) {
    return kind == ProviderErrorKind::rate_limit ||
           kind == ProviderErrorKind::timeout ||
           kind == ProviderErrorKind::overloaded;
}

// ── URL handling ───────────────────────────────────────────────────────

static void parse_url(const std::string& url, std::string& scheme, std::string& host, int& port, std::string& path_prefix) {
    scheme = "http";
    host = "127.0.0.1";
    port = 80;
    path_prefix = "";

    size_t pos = 0;
    if (url.substr(0, 8) == "https://") {
        scheme = "https"; pos = 8; port = 443;
    } else if (url.substr(0, 7) == "http://") {
        scheme = "http"; pos = 7; port = 80;
    }

    size_t slash = url.find('/', pos);
    std::string host_port = (slash != std::string::npos) ? url.substr(pos, slash - pos) : url.substr(pos);
    if (slash != std::string::npos) {
        path_prefix = url.substr(slash);
        while (!path_prefix.empty() && path_prefix.back() == '/') path_prefix.pop_back();
    }

    size_t colon = host_port.find(':');
    if (colon != std::string::npos) {
        host = host_port.substr(0, colon);
        try {
            port = std::stoi(host_port.substr(colon + 1));
        } catch (const std::exception&) {
            throw ConfigError("invalid port in api_base: " + url);
        }
    } else {
        host = host_port;
    }
}

ProviderGenerator::ProviderGenerator(const ProviderConfig& cfg) : config_(cfg) {
    parse_url(config_.api_base, scheme_, host_, port_, path_prefix_);
    base_url_ = scheme_ + "://" + host_ + ":" + std::to_string(port_);
}

// ── Request building ───────────────────────────────────────────────────

nlohmann::json ProviderGenerator::build_request(const std::string& prompt,
                                                const std::vector<Message>& context,
                                                const SamplingParams& params) {
    nlohmann::json body;
    body["model"] = params.model;
    body["max_tokens"] = params.max_tokens;
    body["temperature"] = params.temperature;

    auto& msgs = body["messages"];
    msgs = nlohmann::json::array();
    for (auto& m : context) {
        switch (m.role) {
            case Role::user:
                msgs.push_back({{"role", "user"}, {"content", m.content}});
                break;
            case Role::agent:
                msgs.push_back({{"role", "assistant"}, {"content", m.content}});
                break;
            case Role::tool:
                // No tool_call ids on this path, observations go back as user turns
                msgs.push_back({{"role", "user"}, {"content", "Observation: " + m.content}});
                break;
        }
    }
    msgs.push_back({{"role", "user"}, {"content", prompt}});
    return body;
}

static std::unique_ptr<httplib::Client> make_client(const std::string& base_url) {
    std::unique_ptr<httplib::Client> cli;
    try {
        cli = std::make_unique<httplib::Client>(base_url);
    } catch (const std::invalid_argument& e) {
        throw ConfigError("unsupported api_base " + base_url + ": " + e.what());
    }
    if (!cli->is_valid()) throw ConfigError("unsupported api_base " + base_url);
    return cli;
}

bool ProviderGenerator::client_supported() const {
    try {
        make_client(base_url_);
        return true;
    } catch (const ConfigError& e) {
        std::cerr << "[provider] " << e.what() << "\n";
        return false;
    }
}

std::string ProviderGenerator::post_once(const std::string& payload) {
    auto client = make_client(base_url_);
    httplib::Client& cli = *client;
    cli.set_connection_timeout(30);
    cli.set_read_timeout(120);

    httplib::Headers headers = {
        {"Content-Type", "application/json"}
    };
    if (!config_.api_key.empty()) {
        headers.emplace("Authorization", "Bearer " + config_.api_key);
    }

    std::string path = path_prefix_ + "/chat/completions";
    auto res = cli.Post(path, headers, payload, "application/json");
    if (!res) {
        throw GenerationError("Provider request failed: connection error");
    }
    if (res->status != 200) {
        throw GenerationError("Provider returned status " + std::to_string(res->status) + ": " + res->body);
    }

    try {
        auto j = nlohmann::json::parse(res->body);
        if (j.contains("choices") && !j["choices"].empty()) {
            auto& msg = j["choices"][0]["message"];
            if (msg.contains("content") && msg["content"].is_string()) {
                return msg["content"].get<std::string>();
            }
        }
    } catch (const nlohmann::json::exception& e) {
        throw GenerationError(std::string("Failed to parse provider response: ") + e.what());
    }
    throw GenerationError("Provider response has no message content");
}

// ── Generation with retry ──────────────────────────────────────────────

std::string ProviderGenerator::generate(const std::string& prompt,
                                        const std::vector<Message>& context,
                                        const SamplingParams& params) {
    std::string payload = build_request(prompt, context, params).dump();
    std::string last_error;

    for (int retry = 0; retry <= config_.max_retries; retry++) {
        try {
            return post_once(payload);
        } catch (const GenerationError& e) {
            last_error = e.what();
            auto kind = classify_provider_error(last_error);
            if (!is_retryable_error(kind) || retry >= config_.max_retries) break;

            std::cerr << "[provider] retry " << (retry + 1) << ": " << last_error << "\n";
            // Exponential backoff: 1s, 2s, 4s
            int delay_ms = 1000 * (1 << retry);
            std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms));
        }
    }
    throw GenerationError(last_error);
}

} // namespace arena
