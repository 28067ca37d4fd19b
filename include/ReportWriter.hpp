#ifndef REPORT_WRITER_HPP
#define REPORT_WRITER_HPP

#include "FluxAggregator.hpp"
#include <ostream>
#include <string>
#include <vector>

namespace VFLUX {

/**
 * @brief One analysed sensor pair, as written to the results file
 */
struct PairResult {
    std::string label;            // e.g. "temp1-temp2"
    double depth_shallow;         // [m]
    double depth_deep;            // [m]
    FluxReport report;
};

/**
 * @brief Console and CSV formatting of flux results
 *
 * Undefined velocities are written as "undefined" in tables and left empty
 * in CSV files. Velocities are shown in m/s and in the display unit.
 */
class ReportWriter {
public:
    explicit ReportWriter(const std::string& flux_unit = "mm/day");

    void printReport(std::ostream& os, const std::string& pair_label,
                     const FluxReport& report) const;

    void printSignals(std::ostream& os, const std::vector<std::string>& names,
                      const std::vector<HarmonicSignal>& signals) const;

    /// One row per (pair, method)
    void writeCSV(const std::string& path, const std::vector<PairResult>& rows) const;

    const std::string& fluxUnit() const { return flux_unit_; }

private:
    std::string flux_unit_;

    std::string formatVelocity(double value, int precision) const;
};

} // namespace VFLUX

#endif // REPORT_WRITER_HPP
