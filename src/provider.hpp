#pragma once
#include "config.hpp"
#include "generator.hpp"
#include <string>
#include <vector>

namespace arena {

// ── Error classification for provider retry ─────────────────────────
enum class ProviderErrorKind {
    unknown,
    rate_limit,
    timeout,
    overloaded,
    context_overflow,
    auth,
    billing
};

ProviderErrorKind classify_provider_error(const std::string& error_text);
bool is_retryable_error(ProviderErrorKind kind);

// OpenAI-compatible chat completions endpoint reached over cpp-httplib.
class ProviderGenerator : public Generator {
public:
    explicit ProviderGenerator(const ProviderConfig& cfg);

    std::string generate(const std::string& prompt,
                         const std::vector<Message>& context,
                         const SamplingParams& params) override;

    const ProviderConfig& config() const { return config_; }
    const std::string& base_url() const { return base_url_; }

    // True when the HTTP client can be built for base_url(); an https
    // endpoint needs a TLS-enabled httplib.
    bool client_supported() const;

    // Request body for one call; exposed for inspection.
    static nlohmann::json build_request(const std::string& prompt,
                                        const std::vector<Message>& context,
                                        const SamplingParams& params);

private:
    ProviderConfig config_;
    // Cached URL components (parsed once in constructor)
    std::string scheme_;
    std::string host_;
    int port_;
    std::string path_prefix_;
    std::string base_url_;  // scheme://host:port

    std::string post_once(const std::string& payload);
};

} // namespace arena
