#include "TemperatureRecord.hpp"
#include <algorithm>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <map>
#include <sstream>
#include <stdexcept>

namespace VFLUX {

namespace {

std::string trim(const std::string& str) {
    size_t first = str.find_first_not_of(" \t\r\n\"");
    if (first == std::string::npos) return "";
    size_t last = str.find_last_not_of(" \t\r\n\"");
    return str.substr(first, last - first + 1);
}

// Keeps empty fields, unlike the config splitter
std::vector<std::string> splitFields(const std::string& line) {
    std::vector<std::string> fields;
    std::stringstream ss(line);
    std::string item;
    while (std::getline(ss, item, ',')) {
        fields.push_back(trim(item));
    }
    if (!line.empty() && line.back() == ',') fields.push_back("");
    return fields;
}

// Days since 1970-01-01 in the proleptic Gregorian calendar
long long daysFromCivil(long long y, unsigned m, unsigned d) {
    y -= m <= 2;
    const long long era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<long long>(doe) - 719468;
}

void civilFromDays(long long z, long long& y, unsigned& m, unsigned& d) {
    z += 719468;
    const long long era = (z >= 0 ? z : z - 146096) / 146097;
    const unsigned doe = static_cast<unsigned>(z - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    d = doy - (153 * mp + 2) / 5 + 1;
    m = mp < 10 ? mp + 3 : mp - 9;
    y = static_cast<long long>(yoe) + era * 400 + (m <= 2);
}

bool parseNumber(const std::string& text, double& value) {
    if (text.empty()) return false;
    const char* begin = text.c_str();
    char* end = nullptr;
    value = std::strtod(begin, &end);
    return end != begin && *end == '\0' && std::isfinite(value);
}

std::string location(const std::string& path, int line) {
    return path + ":" + std::to_string(line);
}

} // namespace

// =============================================================================
// TemperatureRecord
// =============================================================================

size_t TemperatureRecord::sensorIndex(const std::string& name) const {
    auto it = std::find(names.begin(), names.end(), name);
    if (it == names.end()) {
        throw std::out_of_range("No sensor named " + name);
    }
    return static_cast<size_t>(std::distance(names.begin(), it));
}

std::vector<double> TemperatureRecord::timeIn(double unit_seconds) const {
    std::vector<double> result(time.size());
    for (size_t i = 0; i < time.size(); ++i) {
        result[i] = time[i] / unit_seconds;
    }
    return result;
}

// =============================================================================
// Timestamps
// =============================================================================

bool parseTimestamp(const std::string& text, double& seconds) {
    int year, month, day, hour, minute;
    char sep;
    int consumed = 0;

    if (std::sscanf(text.c_str(), "%4d-%2d-%2d%c%2d:%2d%n",
                    &year, &month, &day, &sep, &hour, &minute, &consumed) != 6) {
        return false;
    }
    if (sep != ' ' && sep != 'T') return false;

    double sec = 0.0;
    std::string rest = text.substr(consumed);
    if (!rest.empty()) {
        if (rest[0] != ':' || !parseNumber(rest.substr(1), sec)) return false;
    }

    if (month < 1 || month > 12 || day < 1 || day > 31 ||
        hour < 0 || hour > 23 || minute < 0 || minute > 59 || sec < 0.0 || sec >= 61.0) {
        return false;
    }

    long long days = daysFromCivil(year, static_cast<unsigned>(month), static_cast<unsigned>(day));
    seconds = static_cast<double>(days) * 86400.0 + hour * 3600.0 + minute * 60.0 + sec;
    return true;
}

std::string formatTimestamp(double seconds) {
    long long total = static_cast<long long>(std::llround(seconds));
    long long days = total / 86400;
    long long rem = total % 86400;
    if (rem < 0) {
        rem += 86400;
        days -= 1;
    }

    long long y;
    unsigned m, d;
    civilFromDays(days, y, m, d);

    std::ostringstream ss;
    ss << std::setfill('0') << std::setw(4) << y << "-" << std::setw(2) << m << "-"
       << std::setw(2) << d << " " << std::setw(2) << rem / 3600 << ":"
       << std::setw(2) << (rem % 3600) / 60 << ":" << std::setw(2) << rem % 60;
    return ss.str();
}

// =============================================================================
// CSV input
// =============================================================================

std::vector<SensorSeries> loadCSV(const std::string& path,
                                  const std::vector<std::string>& time_columns,
                                  const std::vector<std::string>& temperature_columns) {
    if (temperature_columns.empty()) {
        throw std::runtime_error("No temperature columns requested from " + path);
    }
    if (time_columns.size() != 1 && time_columns.size() != temperature_columns.size()) {
        throw std::runtime_error("Expected one shared time column or one per temperature column");
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open temperature file: " + path);
    }

    std::string line;
    if (!std::getline(file, line)) {
        throw std::runtime_error("Temperature file is empty: " + path);
    }

    std::map<std::string, size_t> header;
    auto header_fields = splitFields(line);
    for (size_t i = 0; i < header_fields.size(); ++i) {
        header[header_fields[i]] = i;
    }

    auto columnIndex = [&](const std::string& name) {
        auto it = header.find(name);
        if (it == header.end()) {
            throw std::runtime_error(path + ": missing column '" + name + "'");
        }
        return it->second;
    };

    const size_t n_sensors = temperature_columns.size();
    std::vector<size_t> time_idx(n_sensors), temp_idx(n_sensors);
    std::vector<SensorSeries> series(n_sensors);
    for (size_t s = 0; s < n_sensors; ++s) {
        time_idx[s] = columnIndex(time_columns.size() == 1 ? time_columns[0] : time_columns[s]);
        temp_idx[s] = columnIndex(temperature_columns[s]);
        series[s].name = temperature_columns[s];
    }

    int line_num = 1;
    while (std::getline(file, line)) {
        line_num++;
        if (trim(line).empty()) continue;

        auto fields = splitFields(line);
        for (size_t s = 0; s < n_sensors; ++s) {
            if (time_idx[s] >= fields.size() || temp_idx[s] >= fields.size()) continue;
            const std::string& t_text = fields[time_idx[s]];
            const std::string& y_text = fields[temp_idx[s]];
            if (t_text.empty() || y_text.empty()) continue;

            double t;
            if (parseNumber(t_text, t)) {
                t *= 3600.0;
            } else if (!parseTimestamp(t_text, t)) {
                throw std::runtime_error(location(path, line_num) + ": cannot parse time '" +
                                         t_text + "'");
            }

            double y;
            if (!parseNumber(y_text, y)) {
                throw std::runtime_error(location(path, line_num) + ": cannot parse temperature '" +
                                         y_text + "'");
            }

            if (!series[s].time.empty() && !(t > series[s].time.back())) {
                throw std::runtime_error(location(path, line_num) + ": time of " + series[s].name +
                                         " is not increasing");
            }

            series[s].time.push_back(t);
            series[s].temperature.push_back(y);
        }
    }

    return series;
}

// =============================================================================
// Resampling
// =============================================================================

TemperatureRecord alignAndResample(const std::vector<SensorSeries>& series, double interval) {
    if (!(interval > 0.0)) {
        throw std::runtime_error("Resample interval must be positive");
    }
    if (series.empty()) {
        throw std::runtime_error("No series to resample");
    }

    double start = -HUGE_VAL;
    double end = HUGE_VAL;
    for (const auto& s : series) {
        if (s.time.size() < 2) {
            throw std::runtime_error("Series " + s.name + " has fewer than two samples");
        }
        start = std::max(start, s.time.front());
        end = std::min(end, s.time.back());
    }
    if (!(end > start)) {
        throw std::runtime_error("Sensor series do not overlap in time");
    }

    TemperatureRecord record;
    record.start_epoch = start;
    const size_t n = static_cast<size_t>(std::floor((end - start) / interval + 1e-9)) + 1;
    record.time.resize(n);
    for (size_t k = 0; k < n; ++k) {
        record.time[k] = k * interval;
    }

    for (const auto& s : series) {
        record.names.push_back(s.name);
        std::vector<double> values(n);

        size_t j = 0;
        for (size_t k = 0; k < n; ++k) {
            double t = start + record.time[k];
            while (j + 2 < s.time.size() && s.time[j + 1] < t) j++;

            double t0 = s.time[j], t1 = s.time[j + 1];
            double w = (t - t0) / (t1 - t0);
            w = std::min(1.0, std::max(0.0, w));
            values[k] = (1.0 - w) * s.temperature[j] + w * s.temperature[j + 1];
        }

        record.temperatures.push_back(values);
    }

    return record;
}

// =============================================================================
// CSV output
// =============================================================================

void writeTemperatureCSV(const std::string& path, const TemperatureRecord& record,
                         const std::vector<std::string>& time_columns) {
    if (time_columns.size() != record.sensorCount()) {
        throw std::runtime_error("One time column name per sensor is required");
    }

    std::ofstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot write temperature file: " + path);
    }

    for (size_t s = 0; s < record.sensorCount(); ++s) {
        if (s > 0) file << ",";
        file << time_columns[s] << "," << record.names[s];
    }
    file << "\n";

    file << std::setprecision(10);
    for (size_t k = 0; k < record.size(); ++k) {
        std::string stamp = formatTimestamp(record.start_epoch + record.time[k]);
        for (size_t s = 0; s < record.sensorCount(); ++s) {
            if (s > 0) file << ",";
            file << stamp << "," << record.temperatures[s][k];
        }
        file << "\n";
    }
}

} // namespace VFLUX
