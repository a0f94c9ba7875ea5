#ifndef DAMASCUS_SERIALIZATION_JSON_SERIALIZATION_HPP
#define DAMASCUS_SERIALIZATION_JSON_SERIALIZATION_HPP

#include <nlohmann/json.hpp>
#include <common/error.hpp>
#include <billet/operation_record.hpp>
#include <fstream>
#include <sstream>
#include <string>
#include <chrono>
#include <iomanip>

namespace damascus::json {

// Version of the operation log format
constexpr const char* LOG_FORMAT_VERSION = "1.0.0";

// ISO 8601 UTC with milliseconds
inline std::string format_timestamp(const Timestamp& time_point) {
    auto time = std::chrono::system_clock::to_time_t(time_point);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        time_point.time_since_epoch()).count() % 1000;
    if (millis < 0) millis += 1000;
    std::ostringstream oss;
    oss << std::put_time(std::gmtime(&time), "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setw(3) << std::setfill('0') << millis << 'Z';
    return oss.str();
}

// Get current timestamp in ISO 8601 format
inline std::string get_timestamp() {
    return format_timestamp(std::chrono::system_clock::now());
}

// Write JSON to file
inline void write_json_file(const std::string& path, const nlohmann::json& j) {
    std::ofstream file(path);
    if (!file) {
        throw Error(ErrorCode::IoFailure, "cannot write to file: " + path);
    }
    file << j.dump(2);  // Pretty print with 2-space indent
    if (!file) {
        throw Error(ErrorCode::IoFailure, "failed writing file: " + path);
    }
}

// Read JSON from file
inline nlohmann::json read_json_file(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw Error(ErrorCode::IoFailure, "cannot open file: " + path);
    }
    try {
        nlohmann::json j;
        file >> j;
        return j;
    } catch (const nlohmann::json::parse_error& e) {
        throw Error(ErrorCode::InvalidParameter, path + ": " + e.what());
    }
}

}  // namespace damascus::json

#endif // DAMASCUS_SERIALIZATION_JSON_SERIALIZATION_HPP
