#include "utils.h"

#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

#include <nlohmann/json.hpp>

namespace {

nlohmann::json to_json(const StepSummary& s) {
    return nlohmann::json{
        {"users", s.users},
        {"total_requests", s.total_requests},
        {"successful_requests", s.successful_requests},
        {"failed_requests", s.failed_requests},
        {"avg_latency_ms", s.avg_latency_ms},
        {"success_rate", s.success_rate},
        {"elapsed_sec", s.elapsed_sec},
        {"throughput", s.throughput},
    };
}

} // namespace

void append_step_summary_to_file(const StepSummary& s, const std::string& path) {
    nlohmann::json results = nlohmann::json::array();

    // Read existing file (if any)
    std::ifstream in(path);
    if (in.good()) {
        auto existing = nlohmann::json::parse(in, nullptr, false);
        if (!existing.is_discarded() && existing.is_array()) {
            results = std::move(existing);
        }
    }
    in.close();

    results.push_back(to_json(s));

    std::ofstream out(path, std::ios::trunc);
    if (!out) {
        throw std::runtime_error("cannot write results file '" + path + "'");
    }
    out << results.dump(2) << "\n";
}

std::string file_timestamp() {
    auto now = std::chrono::system_clock::now();
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
    std::time_t t = std::chrono::system_clock::to_time_t(now);
    std::tm utc{};
    gmtime_r(&t, &utc);

    std::ostringstream ss;
    ss << std::put_time(&utc, "%Y-%m-%d_%H-%M-%S") << "-" << std::setw(3) << std::setfill('0') << millis;
    return ss.str();
}
