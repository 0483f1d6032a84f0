#include "indicator_writer.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "utils.hpp" // formatFixed
#include <spdlog/fmt/fmt.h>
#include <fstream>
#include <stdexcept>

namespace data {

    namespace {

        template<typename T>
        void checkLengths(const std::vector<core::Timestamp>& timestamps, const core::AlignedSeries<T>& series) {
            if (timestamps.size() != series.size()) {
                throw std::invalid_argument(fmt::format(
                    "Timestamp count ({}) does not match series length ({})", timestamps.size(), series.size()));
            }
        }

        std::ofstream openForWrite(const std::string& path) {
            std::ofstream ofs(path, std::ios::out | std::ios::trunc);
            if (!ofs.is_open()) {
                throw core::IndicatorEngineException(fmt::format("Failed to open output file: {}", path));
            }
            return ofs;
        }

        void finish(std::ofstream& ofs, const std::string& path) {
            ofs.flush();
            if (!ofs) {
                throw core::IndicatorEngineException(fmt::format("Failed while writing output file: {}", path));
            }
        }

    } // namespace

    void writeScalarSeries(std::ostream& out,
                           const std::vector<core::Timestamp>& timestamps,
                           const core::AlignedSeries<double>& series,
                           int precision) {
        checkLengths(timestamps, series);
        out << "open_time,expected\n";
        for (std::size_t i = 0; i < series.size(); ++i) {
            if (!series[i]) continue;
            out << timestamps[i] << ',' << core::utils::formatFixed(*series[i], precision) << '\n';
        }
    }

    void writeBandSeries(std::ostream& out,
                         const std::vector<core::Timestamp>& timestamps,
                         const core::AlignedSeries<core::BandValue>& series,
                         int precision) {
        checkLengths(timestamps, series);
        out << "open_time,upper,middle,lower\n";
        for (std::size_t i = 0; i < series.size(); ++i) {
            if (!series[i]) continue;
            const auto& band = *series[i];
            out << timestamps[i] << ','
                << core::utils::formatFixed(band.upper, precision) << ','
                << core::utils::formatFixed(band.middle, precision) << ','
                << core::utils::formatFixed(band.lower, precision) << '\n';
        }
    }

    void writeScalarSeries(const std::string& path,
                           const std::vector<core::Timestamp>& timestamps,
                           const core::AlignedSeries<double>& series,
                           int precision) {
        auto ofs = openForWrite(path);
        writeScalarSeries(ofs, timestamps, series, precision);
        finish(ofs, path);
        core::logging::getLogger()->debug("Wrote scalar series ({} rows) to {}", series.size(), path);
    }

    void writeBandSeries(const std::string& path,
                         const std::vector<core::Timestamp>& timestamps,
                         const core::AlignedSeries<core::BandValue>& series,
                         int precision) {
        auto ofs = openForWrite(path);
        writeBandSeries(ofs, timestamps, series, precision);
        finish(ofs, path);
        core::logging::getLogger()->debug("Wrote band series ({} rows) to {}", series.size(), path);
    }

} // namespace data
