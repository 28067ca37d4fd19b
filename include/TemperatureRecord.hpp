#ifndef TEMPERATURE_RECORD_HPP
#define TEMPERATURE_RECORD_HPP

#include <string>
#include <vector>

namespace VFLUX {

/**
 * @brief One sensor's raw samples as read from file
 *
 * Times are absolute seconds: seconds since 1970-01-01 UTC for calendar
 * timestamps, or hours * 3600 for plain numeric time columns.
 */
struct SensorSeries {
    std::string name;
    std::vector<double> time;
    std::vector<double> temperature;
};

/**
 * @brief Temperatures of all sensors on one uniform time grid
 */
struct TemperatureRecord {
    std::vector<double> time;                          // [s] since start_epoch
    std::vector<std::string> names;
    std::vector<std::vector<double>> temperatures;     // [sensor][sample], degC
    double start_epoch;                                // Absolute time of time[0] [s]

    TemperatureRecord() : start_epoch(0.0) {}

    size_t size() const { return time.size(); }
    size_t sensorCount() const { return temperatures.size(); }

    /// Index of the named sensor; throws std::out_of_range if absent
    size_t sensorIndex(const std::string& name) const;

    /// Time vector expressed in a unit of the given length [s]
    std::vector<double> timeIn(double unit_seconds) const;
};

/**
 * @brief Parse "YYYY-MM-DD[ T]HH:MM[:SS]" (UTC) to seconds since the epoch
 * @return false if the text is not such a timestamp
 */
bool parseTimestamp(const std::string& text, double& seconds);

/// Format seconds since the epoch as "YYYY-MM-DD HH:MM:SS" (UTC)
std::string formatTimestamp(double seconds);

/**
 * @brief Read per-sensor series from a CSV file with a header row
 * @param time_columns One shared time column, or one per temperature column
 * @param temperature_columns Temperature column per sensor; also the sensor names
 *
 * Cells may be calendar timestamps or plain numbers in hours. Rows where a
 * sensor's time or temperature cell is empty are skipped for that sensor.
 *
 * @throws std::runtime_error on a missing file or column, an unparsable cell
 *         or non-increasing times (messages carry file and line)
 */
std::vector<SensorSeries> loadCSV(const std::string& path,
                                  const std::vector<std::string>& time_columns,
                                  const std::vector<std::string>& temperature_columns);

/**
 * @brief Interpolate all series onto a common uniform grid
 *
 * The grid spans the interval covered by every series, starting at the
 * latest first sample, with the given spacing [s]. Values are linearly
 * interpolated.
 *
 * @throws std::runtime_error if the series do not overlap or a series has
 *         fewer than two samples
 */
TemperatureRecord alignAndResample(const std::vector<SensorSeries>& series, double interval);

/**
 * @brief Write a record in the per-sensor layout (time1, temp1, time2, ...)
 *
 * Times are written as calendar timestamps. The file reads back through
 * loadCSV with the same column names.
 */
void writeTemperatureCSV(const std::string& path, const TemperatureRecord& record,
                         const std::vector<std::string>& time_columns);

} // namespace VFLUX

#endif // TEMPERATURE_RECORD_HPP
