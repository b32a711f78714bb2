#include "pan_series/core/types.hpp"
#include "pan_series/core/errors.hpp"
#include "pan_series/core/utils.hpp"

#include <cctype>
#include <cmath>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace pan_series {

Resampling string_to_resampling(const std::string& s) {
    std::string norm = core::to_upper(core::trim(s));
    if (norm == "NEAREST") return Resampling::NEAREST;
    if (norm == "BILINEAR") return Resampling::BILINEAR;
    if (norm == "BICUBIC") return Resampling::BICUBIC;
    throw ValidationError("unknown resampling method '" + s + "'");
}

bool operator==(const Grid& a, const Grid& b) {
    if (a.rows != b.rows || a.cols != b.cols || a.crs != b.crs) {
        return false;
    }
    for (size_t i = 0; i < a.transform.size(); ++i) {
        if (std::fabs(a.transform[i] - b.transform[i]) > 1e-12) {
            return false;
        }
    }
    return true;
}

std::string format_date(const Timestamp& ts) {
    auto t = std::chrono::system_clock::to_time_t(ts);
    std::tm tm_buf;
    gmtime_r(&t, &tm_buf);

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%d");
    return oss.str();
}

std::string format_iso8601(const Timestamp& ts) {
    auto t = std::chrono::system_clock::to_time_t(ts);
    std::tm tm_buf;
    gmtime_r(&t, &tm_buf);

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

Timestamp parse_timestamp(const std::string& s) {
    std::string text = core::trim(s);
    std::tm tm_buf{};
    std::istringstream iss(text);

    if (text.size() == 10) {
        iss >> std::get_time(&tm_buf, "%Y-%m-%d");
    } else {
        iss >> std::get_time(&tm_buf, "%Y-%m-%dT%H:%M:%S");
    }
    if (iss.fail()) {
        throw ValidationError("cannot parse timestamp '" + s + "'");
    }

    // Optional fractional seconds, then the UTC designator
    std::string rest;
    std::getline(iss, rest);
    if (!rest.empty() && rest.front() == '.') {
        size_t i = 1;
        while (i < rest.size() && std::isdigit(static_cast<unsigned char>(rest[i]))) ++i;
        rest = rest.substr(i);
    }
    if (!rest.empty() && rest != "Z" && rest != "+00:00") {
        throw ValidationError("timestamp '" + s + "' must be UTC");
    }

    return std::chrono::system_clock::from_time_t(timegm(&tm_buf));
}

Timestamp make_date(int year, int month, int day) {
    std::tm tm_buf{};
    tm_buf.tm_year = year - 1900;
    tm_buf.tm_mon = month - 1;
    tm_buf.tm_mday = day;
    return std::chrono::system_clock::from_time_t(timegm(&tm_buf));
}

std::string describe_bbox(const BBox& bbox) {
    std::ostringstream oss;
    oss << "(" << bbox.min_lon << "," << bbox.min_lat << ")-("
        << bbox.max_lon << "," << bbox.max_lat << ")";
    return oss.str();
}

} // namespace pan_series
