#pragma once

#include <memory>
#include <optional>
#include <string>

#include <httplib.h>

#include "run_config.hpp"

/**
 * @brief Result of one HTTP attempt. status is 0 when no response arrived.
 */
struct RequestOutcome {
    int status = 0;
    double latency_ms = 0.0;
    bool success = false;
    std::optional<std::string> error;
    std::size_t body_bytes = 0;
};

/**
 * @brief A response counts as successful when its status is in [200, 400).
 */
bool is_success_status(int status);

struct TargetUrl {
    std::string scheme_host_port;   // e.g. "http://example.com:8080"
    std::string path;               // path and query, never empty
};

/**
 * @brief Splits an absolute http(s) URL. Throws ConfigError on anything else.
 */
TargetUrl parse_target_url(const std::string& url);

/**
 * @brief Issues one request and reports how it went.
 *
 * Each virtual user gets its own clone, so an implementation may keep
 * per-connection state without locks. execute() must not throw for
 * transport failures; those are returned as unsuccessful outcomes.
 */
class IRequestExecutor {
public:
    virtual ~IRequestExecutor() = default;

    virtual RequestOutcome execute() = 0;

    virtual std::unique_ptr<IRequestExecutor> clone() const = 0;
};

/**
 * @brief IRequestExecutor over a persistent httplib::Client.
 */
class HttpRequestExecutor : public IRequestExecutor {
public:
    explicit HttpRequestExecutor(const RunConfig& cfg);

    RequestOutcome execute() override;

    std::unique_ptr<IRequestExecutor> clone() const override;

private:
    void configure_client();

    RunConfig cfg_;
    TargetUrl target_;
    httplib::Headers headers_;
    std::unique_ptr<httplib::Client> client_;
};
