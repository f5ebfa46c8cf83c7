#include "engine/run_report.hpp"

#include <glaze/glaze.hpp>

#include <stdexcept>
#include <utility>

namespace scrambler {

RunReport RunReport::success(std::string input, std::string output,
                             const RunStats& stats, int64_t elapsed_ms) {
    RunReport report;
    report.status = "ok";
    report.input = std::move(input);
    report.output = std::move(output);
    report.records_read = stats.records_read;
    report.records_scrambled = stats.records_scrambled;
    report.records_passthrough = stats.records_passthrough;
    report.elapsed_ms = elapsed_ms;
    return report;
}

RunReport RunReport::failure(std::string input, const ScrambleError& err) {
    RunReport report;
    report.status = "error";
    report.input = std::move(input);
    report.error_kind = std::string(error_kind_to_string(err.kind));
    report.error = err.message;
    report.record_index = err.record_index;
    return report;
}

std::string to_json(const RunReport& report) {
    std::string buffer;
    const auto ec = glz::write_json(report, buffer);
    if (ec) {
        throw std::runtime_error("Failed to serialise run report");
    }
    return buffer;
}

} // namespace scrambler
