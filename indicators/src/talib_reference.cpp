#include "talib_reference.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "ta_libc.h"  // TA-Lib C API header
#include <spdlog/fmt/fmt.h>
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace indicators {
namespace talib {

    namespace {

        void checkLookback(int lookback, const char* function_name) {
            if (lookback < 0) {
                throw core::IndicatorCalculationException(
                    fmt::format("{}_Lookback returned an unexpected value: {}", function_name, lookback));
            }
        }

        void checkRetCode(TA_RetCode ret_code, const char* function_name) {
            if (ret_code != TA_SUCCESS) {
                core::logging::getLogger()->error("TA-Lib {} calculation failed with error code: {}",
                                                  function_name, static_cast<int>(ret_code));
                throw core::IndicatorCalculationException(
                    fmt::format("TA-Lib {} failed with code {}", function_name, static_cast<int>(ret_code)));
            }
        }

        // TA-Lib writes outNbElement values starting at input index outBegIdx
        core::AlignedSeries<double> align(const std::vector<double>& compact, int out_begin_idx,
                                          int out_nb_element, std::size_t input_size,
                                          int lookback, const char* function_name) {
            if (out_begin_idx != lookback) {
                core::logging::getLogger()->warn("{} out_begin_idx ({}) does not match calculated lookback ({}).",
                                                 function_name, out_begin_idx, lookback);
            }
            core::AlignedSeries<double> series(input_size);
            for (int i = 0; i < out_nb_element; ++i) {
                series[static_cast<std::size_t>(out_begin_idx + i)] = compact[static_cast<std::size_t>(i)];
            }
            return series;
        }

        bool hasOutput(std::size_t input_size, int lookback) {
            return input_size > static_cast<std::size_t>(lookback);
        }

        int endIdx(const std::vector<double>& closes) {
            return static_cast<int>(closes.size()) - 1;
        }

    } // namespace

    Session::Session() {
        TA_RetCode ret_code = TA_Initialize();
        if (ret_code != TA_SUCCESS) {
            throw core::IndicatorCalculationException(
                fmt::format("TA_Initialize failed with code {}", static_cast<int>(ret_code)));
        }
        core::logging::getLogger()->debug("TA-Lib session initialized.");
    }

    Session::~Session() {
        TA_RetCode ret_code = TA_Shutdown();
        if (ret_code != TA_SUCCESS) {
            core::logging::getLogger()->warn("TA_Shutdown returned code {}", static_cast<int>(ret_code));
        }
    }

    core::AlignedSeries<double> sma(const std::vector<double>& closes, int period) {
        int lookback = TA_MA_Lookback(period, TA_MAType_SMA);
        checkLookback(lookback, "TA_MA");
        if (!hasOutput(closes.size(), lookback)) {
            return core::AlignedSeries<double>(closes.size());
        }

        std::vector<double> out(closes.size());
        int out_begin_idx = 0;
        int out_nb_element = 0;
        TA_RetCode ret_code = TA_MA(0, endIdx(closes), closes.data(), period, TA_MAType_SMA,
                                    &out_begin_idx, &out_nb_element, out.data());
        checkRetCode(ret_code, "TA_MA");
        return align(out, out_begin_idx, out_nb_element, closes.size(), lookback, "TA_MA");
    }

    core::AlignedSeries<double> ema(const std::vector<double>& closes, int period) {
        int lookback = TA_EMA_Lookback(period);
        checkLookback(lookback, "TA_EMA");
        if (!hasOutput(closes.size(), lookback)) {
            return core::AlignedSeries<double>(closes.size());
        }

        std::vector<double> out(closes.size());
        int out_begin_idx = 0;
        int out_nb_element = 0;
        TA_RetCode ret_code = TA_EMA(0, endIdx(closes), closes.data(), period,
                                     &out_begin_idx, &out_nb_element, out.data());
        checkRetCode(ret_code, "TA_EMA");
        return align(out, out_begin_idx, out_nb_element, closes.size(), lookback, "TA_EMA");
    }

    core::AlignedSeries<core::BandValue> bollinger(const std::vector<double>& closes, int period, double multiplier) {
        int lookback = TA_BBANDS_Lookback(period, multiplier, multiplier, TA_MAType_SMA);
        checkLookback(lookback, "TA_BBANDS");
        if (!hasOutput(closes.size(), lookback)) {
            return core::AlignedSeries<core::BandValue>(closes.size());
        }

        std::vector<double> upper(closes.size());
        std::vector<double> middle(closes.size());
        std::vector<double> lower(closes.size());
        int out_begin_idx = 0;
        int out_nb_element = 0;
        TA_RetCode ret_code = TA_BBANDS(0, endIdx(closes), closes.data(), period,
                                        multiplier, multiplier, TA_MAType_SMA,
                                        &out_begin_idx, &out_nb_element,
                                        upper.data(), middle.data(), lower.data());
        checkRetCode(ret_code, "TA_BBANDS");

        const auto upper_aligned = align(upper, out_begin_idx, out_nb_element, closes.size(), lookback, "TA_BBANDS");
        const auto middle_aligned = align(middle, out_begin_idx, out_nb_element, closes.size(), lookback, "TA_BBANDS");
        const auto lower_aligned = align(lower, out_begin_idx, out_nb_element, closes.size(), lookback, "TA_BBANDS");

        core::AlignedSeries<core::BandValue> series(closes.size());
        for (std::size_t i = 0; i < closes.size(); ++i) {
            if (middle_aligned[i]) {
                series[i] = core::BandValue{*upper_aligned[i], *middle_aligned[i], *lower_aligned[i]};
            }
        }
        return series;
    }

    core::AlignedSeries<double> rsi(const std::vector<double>& closes, int period) {
        int lookback = TA_RSI_Lookback(period);
        checkLookback(lookback, "TA_RSI");
        if (!hasOutput(closes.size(), lookback)) {
            return core::AlignedSeries<double>(closes.size());
        }

        std::vector<double> out(closes.size());
        int out_begin_idx = 0;
        int out_nb_element = 0;
        TA_RetCode ret_code = TA_RSI(0, endIdx(closes), closes.data(), period,
                                     &out_begin_idx, &out_nb_element, out.data());
        checkRetCode(ret_code, "TA_RSI");
        return align(out, out_begin_idx, out_nb_element, closes.size(), lookback, "TA_RSI");
    }

    double maxAbsDifference(const core::AlignedSeries<double>& lhs, const core::AlignedSeries<double>& rhs) {
        if (lhs.size() != rhs.size()) {
            throw std::invalid_argument(fmt::format("Series lengths differ: {} vs {}", lhs.size(), rhs.size()));
        }
        double max_diff = 0.0;
        for (std::size_t i = 0; i < lhs.size(); ++i) {
            if (lhs[i].has_value() != rhs[i].has_value()) {
                throw std::invalid_argument(fmt::format("Series definedness differs at index {}", i));
            }
            if (lhs[i]) {
                max_diff = std::max(max_diff, std::fabs(*lhs[i] - *rhs[i]));
            }
        }
        return max_diff;
    }

    double maxAbsDifference(const core::AlignedSeries<core::BandValue>& lhs,
                            const core::AlignedSeries<core::BandValue>& rhs) {
        if (lhs.size() != rhs.size()) {
            throw std::invalid_argument(fmt::format("Series lengths differ: {} vs {}", lhs.size(), rhs.size()));
        }
        double max_diff = 0.0;
        for (std::size_t i = 0; i < lhs.size(); ++i) {
            if (lhs[i].has_value() != rhs[i].has_value()) {
                throw std::invalid_argument(fmt::format("Series definedness differs at index {}", i));
            }
            if (lhs[i]) {
                max_diff = std::max({max_diff,
                                     std::fabs(lhs[i]->upper - rhs[i]->upper),
                                     std::fabs(lhs[i]->middle - rhs[i]->middle),
                                     std::fabs(lhs[i]->lower - rhs[i]->lower)});
            }
        }
        return max_diff;
    }

} // namespace talib
} // namespace indicators
