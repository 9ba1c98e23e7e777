#include "request_executor.hpp"

#include <chrono>
#include <cmath>

namespace {

// httplib takes timeouts as (seconds, microseconds).
void split_seconds(double seconds, time_t& sec, time_t& usec) {
    double whole = std::floor(seconds);
    sec = static_cast<time_t>(whole);
    usec = static_cast<time_t>((seconds - whole) * 1000000.0);
}

double elapsed_ms(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
}

} // namespace

bool is_success_status(int status) {
    return status >= 200 && status < 400;
}

TargetUrl parse_target_url(const std::string& url) {
    std::string::size_type scheme_end = url.find("://");
    if (scheme_end == std::string::npos) {
        throw ConfigError("URL '" + url + "' has no scheme");
    }
    std::string scheme = url.substr(0, scheme_end);
    if (scheme != "http" && scheme != "https") {
        throw ConfigError("unsupported URL scheme '" + scheme + "'");
    }

    std::string::size_type authority_start = scheme_end + 3;
    std::string::size_type path_start = url.find_first_of("/?#", authority_start);
    std::string authority = url.substr(authority_start, path_start - authority_start);
    if (authority.empty()) {
        throw ConfigError("URL '" + url + "' has no host");
    }

    TargetUrl target;
    target.scheme_host_port = scheme + "://" + authority;
    if (path_start == std::string::npos) {
        target.path = "/";
    } else {
        target.path = url.substr(path_start);
        std::string::size_type fragment = target.path.find('#');
        if (fragment != std::string::npos) {
            target.path.erase(fragment);
        }
        if (target.path.empty() || target.path[0] != '/') {
            target.path.insert(0, "/");
        }
    }
    return target;
}

HttpRequestExecutor::HttpRequestExecutor(const RunConfig& cfg)
    : cfg_(cfg), target_(parse_target_url(cfg.url)) {
    for (const auto& kv : cfg_.headers) {
        headers_.emplace(kv.first, kv.second);
    }
    configure_client();
}

void HttpRequestExecutor::configure_client() {
    client_ = std::make_unique<httplib::Client>(target_.scheme_host_port);
    if (!client_->is_valid()) {
        // https without CPPHTTPLIB_OPENSSL_SUPPORT leaves the client empty.
        throw ConfigError("cannot create an HTTP client for '" + target_.scheme_host_port + "'");
    }
    client_->set_keep_alive(cfg_.keep_alive);
    client_->set_tcp_nodelay(true);

    time_t sec = 0;
    time_t usec = 0;
    split_seconds(cfg_.connect_timeout_sec, sec, usec);
    client_->set_connection_timeout(sec, usec);
    split_seconds(cfg_.request_timeout_sec, sec, usec);
    client_->set_read_timeout(sec, usec);
    client_->set_write_timeout(sec, usec);
}

RequestOutcome HttpRequestExecutor::execute() {
    httplib::Request req;
    req.method = cfg_.method;
    req.path = target_.path;
    req.headers = headers_;
    if (cfg_.body) {
        req.body = *cfg_.body;
    }

    RequestOutcome outcome;
    auto start_time = std::chrono::steady_clock::now();
    try {
        httplib::Result res = client_->send(req);
        outcome.latency_ms = elapsed_ms(start_time);

        if (res) {
            outcome.status = res->status;
            outcome.body_bytes = res->body.size();
            outcome.success = is_success_status(res->status);
        } else {
            outcome.error = httplib::to_string(res.error());
        }
    } catch (const std::exception& e) {
        outcome.latency_ms = elapsed_ms(start_time);
        outcome.status = 0;
        outcome.success = false;
        outcome.error = e.what();
    }
    return outcome;
}

std::unique_ptr<IRequestExecutor> HttpRequestExecutor::clone() const {
    return std::make_unique<HttpRequestExecutor>(cfg_);
}
