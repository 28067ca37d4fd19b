#include "ReportWriter.hpp"
#include "FluxMethods.hpp"
#include "SensorPair.hpp"
#include "UnitSystem.hpp"
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace VFLUX {

ReportWriter::ReportWriter(const std::string& flux_unit) : flux_unit_(flux_unit) {
    if (!UnitSystemManager::getInstance().areCompatible(flux_unit_, "m/s")) {
        throw std::runtime_error("Flux unit '" + flux_unit_ + "' is not a velocity unit");
    }
}

std::string ReportWriter::formatVelocity(double value, int precision) const {
    if (!std::isfinite(value)) return "undefined";
    std::ostringstream ss;
    ss << std::scientific << std::setprecision(precision) << value;
    return ss.str();
}

void ReportWriter::printReport(std::ostream& os, const std::string& pair_label,
                               const FluxReport& report) const {
    const SensorPairObservation& obs = report.observation;

    os << "\nSensor pair " << pair_label << "\n";
    os << std::string(78, '-') << "\n";
    os << "  dz = " << std::fixed << std::setprecision(3) << report.depth_difference << " m"
       << "   alpha = " << std::scientific << std::setprecision(3) << report.thermal_diffusivity
       << " m2/s   w = " << report.angular_frequency << " rad/s\n";
    os << "  ln(Ar) = " << std::fixed << std::setprecision(5) << obs.amplitude_log_ratio
       << "   dphi = " << obs.phase_difference << " rad\n";
    if (obs.frequency_mismatch) {
        os << "  Warning: fitted frequencies of the pair differ by more than "
           << std::setprecision(0) << FREQUENCY_MISMATCH_TOLERANCE * 100.0 << "%\n"
           << std::setprecision(5);
    }
    os << "\n";

    os << std::left << std::setw(18) << "  Method"
       << std::right << std::setw(14) << "v [m/s]"
       << std::setw(14) << ("v [" + flux_unit_ + "]")
       << "  " << std::left << std::setw(10) << "Status" << "Note\n";

    for (FluxMethod method : allFluxMethods()) {
        auto it = report.estimates.find(method);
        if (it == report.estimates.end()) continue;
        const FluxEstimate& est = it->second;

        std::string display = "undefined";
        if (est.isDefined()) {
            std::ostringstream ss;
            ss << std::fixed << std::setprecision(4) << fromSI(est.velocity, flux_unit_);
            display = ss.str();
        }

        std::string note = undefinedReasonName(est.reason);
        if (est.fallback_used) note += note.empty() ? "Hatch-Amplitude fallback" : ", Hatch-Amplitude fallback";
        if (est.provisional) note += note.empty() ? "provisional" : ", provisional";

        os << "  " << std::left << std::setw(16) << fluxMethodName(method)
           << std::right << std::setw(14) << formatVelocity(est.velocity, 4)
           << std::setw(14) << display
           << "  " << std::left << std::setw(10) << fluxStatusName(est.status)
           << note << "\n";
    }
    os << std::right << std::defaultfloat;
}

void ReportWriter::printSignals(std::ostream& os, const std::vector<std::string>& names,
                                const std::vector<HarmonicSignal>& signals) const {
    os << "\nHarmonic fit\n";
    os << std::string(78, '-') << "\n";
    os << std::left << std::setw(12) << "  Sensor" << std::right
       << std::setw(10) << "Mean" << std::setw(11) << "Amplitude"
       << std::setw(12) << "Period [h]" << std::setw(11) << "Phase"
       << std::setw(8) << "Iter" << std::setw(12) << "RMS" << "\n";

    for (size_t i = 0; i < signals.size() && i < names.size(); ++i) {
        const HarmonicSignal& s = signals[i];
        os << "  " << std::left << std::setw(10) << names[i] << std::right << std::fixed
           << std::setprecision(3)
           << std::setw(10) << s.mean
           << std::setw(11) << s.amplitude
           << std::setw(12) << s.period() / SECONDS_PER_HOUR
           << std::setw(11) << s.phase
           << std::setw(8) << s.iterations
           << std::setw(12) << std::scientific << std::setprecision(2) << s.rms_residual
           << "\n";
    }
    os << std::defaultfloat;
}

void ReportWriter::writeCSV(const std::string& path, const std::vector<PairResult>& rows) const {
    std::ofstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot write results file: " + path);
    }

    file << "pair,depth_shallow_m,depth_deep_m,method,velocity_m_s,velocity_"
         << flux_unit_ << ",status,reason,fallback_used,provisional\n";
    file << std::setprecision(10);

    for (const auto& row : rows) {
        for (FluxMethod method : allFluxMethods()) {
            auto it = row.report.estimates.find(method);
            if (it == row.report.estimates.end()) continue;
            const FluxEstimate& est = it->second;

            file << row.label << "," << row.depth_shallow << "," << row.depth_deep << ","
                 << fluxMethodName(method) << ",";
            if (est.isDefined()) {
                file << est.velocity << "," << fromSI(est.velocity, flux_unit_);
            } else {
                file << ",";
            }
            file << "," << fluxStatusName(est.status)
                 << "," << undefinedReasonName(est.reason)
                 << "," << (est.fallback_used ? 1 : 0)
                 << "," << (est.provisional ? 1 : 0) << "\n";
        }
    }
}

} // namespace VFLUX
