#include "indicator_factory.hpp"
#include "sma_indicator.hpp"
#include "ema_indicator.hpp"
#include "bollinger_bands.hpp"
#include "rsi_indicator.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <cctype>
#include <regex>       // For parsing indicator names
#include <stdexcept>

namespace indicators {

    namespace {

        IndicatorType typeFromName(const std::string& name, const std::string& spec_str) {
            std::string upper = name;
            std::transform(upper.begin(), upper.end(), upper.begin(),
                [](unsigned char c){ return std::toupper(c); });
            if (upper == "SMA") return IndicatorType::Sma;
            if (upper == "EMA") return IndicatorType::Ema;
            if (upper == "BB" || upper == "BBANDS" || upper == "BOLLINGER") return IndicatorType::Bollinger;
            if (upper == "RSI") return IndicatorType::Rsi;
            throw core::ConfigException(fmt::format("Unknown indicator '{}' in '{}'.", name, spec_str));
        }

        const char* typeLabel(IndicatorType type) {
            switch (type) {
                case IndicatorType::Sma: return "SMA";
                case IndicatorType::Ema: return "EMA";
                case IndicatorType::Bollinger: return "BB";
                case IndicatorType::Rsi: return "RSI";
            }
            return "?";
        }

    } // namespace

    std::string IndicatorSpec::toString() const {
        if (type == IndicatorType::Bollinger) {
            return fmt::format("{}({},{:g})", typeLabel(type), period, multiplier);
        }
        return fmt::format("{}({})", typeLabel(type), period);
    }

    std::string IndicatorSpec::fileStem() const {
        std::string stem = (type == IndicatorType::Bollinger)
            ? fmt::format("{}-{}-{:g}", typeLabel(type), period, multiplier)
            : fmt::format("{}-{}", typeLabel(type), period);
        std::transform(stem.begin(), stem.end(), stem.begin(),
            [](unsigned char c){ return std::tolower(c); });
        return stem;
    }

    IndicatorSpec parseIndicatorSpec(const std::string& spec_str) {
        // NAME(period) or NAME(period, multiplier)
        static const std::regex spec_regex(
            R"(^\s*([A-Za-z]+)\s*\(\s*([-+]?\d+)\s*(?:,\s*([-+]?(?:\d+\.?\d*|\.\d+)(?:[eE][-+]?\d+)?)\s*)?\)\s*$)");
        std::smatch match;
        if (!std::regex_match(spec_str, match, spec_regex)) {
            throw core::ConfigException(fmt::format(
                "Malformed indicator spec '{}'. Expected e.g. SMA(20), BB(20,2), RSI(14).", spec_str));
        }

        IndicatorSpec spec;
        spec.type = typeFromName(match[1].str(), spec_str);

        try {
            spec.period = std::stoi(match[2].str());
        } catch (const std::out_of_range&) {
            throw core::ConfigException(fmt::format("Period out of range in indicator spec '{}'.", spec_str));
        }
        validatePeriod(spec.period, typeLabel(spec.type));

        if (match[3].matched) {
            if (spec.type != IndicatorType::Bollinger) {
                throw core::ConfigException(fmt::format(
                    "Only Bollinger Bands take a multiplier, got '{}'.", spec_str));
            }
            try {
                spec.multiplier = std::stod(match[3].str());
            } catch (const std::out_of_range&) {
                throw core::InvalidMultiplierException(fmt::format("Multiplier out of range in '{}'.", spec_str));
            }
            validateMultiplier(spec.multiplier);
        }

        core::logging::getLogger()->trace("Parsed indicator spec '{}' -> {}", spec_str, spec.toString());
        return spec;
    }

    IndicatorResult computeIndicator(const IndicatorSpec& spec,
                                     const core::TimeSeries<core::Observation>& input) {
        auto logger = core::logging::getLogger();
        logger->debug("Computing {} over {} observations", spec.toString(), input.size());

        IndicatorResult result;
        result.spec = spec;

        switch (spec.type) {
            case IndicatorType::Sma: {
                SmaIndicator sma(spec.period);
                sma.calculate(input);
                result.name = sma.getName();
                result.lookback = sma.getLookback();
                result.values = sma.getResult();
                break;
            }
            case IndicatorType::Ema: {
                EmaIndicator ema(spec.period);
                ema.calculate(input);
                result.name = ema.getName();
                result.lookback = ema.getLookback();
                result.values = ema.getResult();
                break;
            }
            case IndicatorType::Bollinger: {
                BollingerBands bb(spec.period, spec.multiplier);
                bb.calculate(input);
                result.name = bb.getName();
                result.lookback = bb.getLookback();
                result.values = bb.getResult();
                break;
            }
            case IndicatorType::Rsi: {
                RsiIndicator rsi(spec.period);
                rsi.calculate(input);
                result.name = rsi.getName();
                result.lookback = rsi.getLookback();
                result.values = rsi.getResult();
                break;
            }
        }
        return result;
    }

} // namespace indicators
