#include "harvest_bot/telemetry_log.hpp"

namespace harvest_bot {

void TelemetryLog::append(const TelemetryRecord& record) {
    list_records_.push_back(record);
}

void TelemetryLog::clear() noexcept {
    list_records_.clear();
}

const std::vector<TelemetryRecord>& TelemetryLog::records() const noexcept {
    return list_records_;
}

std::size_t TelemetryLog::size() const noexcept {
    return list_records_.size();
}

bool TelemetryLog::empty() const noexcept {
    return list_records_.empty();
}

std::optional<TelemetryRecord> TelemetryLog::latest() const {
    if (list_records_.empty()) {
        return std::nullopt;
    }
    return list_records_.back();
}

}  // namespace harvest_bot
