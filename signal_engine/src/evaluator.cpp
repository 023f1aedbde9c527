#include "evaluator.hpp"
#include <fmt/format.h>
#include <spdlog/spdlog.h>

SignalEvaluator::SignalEvaluator(const Config& config)
    : config_(config),
      factor_calculator_(config_),
      confidence_scorer_(config_),
      safety_lock_(config_),
      forecast_generator_(config_),
      report_assembler_(config_) {}

SignalReport SignalEvaluator::evaluate(
    const MarketSnapshot& snapshot,
    const std::optional<LockState>& latched
) const {
    if (snapshot.fast.empty()) {
        return unavailable(snapshot.instrument, snapshot.as_of, "no fast timeframe bars");
    }

    try {
        FactorSet factors = factor_calculator_.calculate_factors(snapshot);
        SessionRisk session = safety_lock_.classify_session(snapshot.as_of);
        ScoreResult score = confidence_scorer_.score(factors, session.multiplier);

        LockState lock = safety_lock_.evaluate(snapshot, factors);
        if (!lock.engaged && latched && latched->engaged) {
            lock = *latched;
        }

        Signal signal = lock.engaged ? Signal::Wait : confidence_scorer_.determine_signal(score);
        ForecastLabel forecast = forecast_generator_.generate(factors, score, lock);

        SignalReport report = report_assembler_.assemble(
            snapshot, factors, score, signal, lock, session, forecast);
        report.reasons = summarize(report);

        spdlog::debug("{} evaluated: {} {:.1f}% lock={} forecast='{}'",
                      report.instrument, to_string(report.signal), report.confidence,
                      to_string(report.lock.reason), to_string(report.forecast));
        return report;

    } catch (const std::exception& e) {
        spdlog::error("Evaluation failed for {}: {}", snapshot.instrument, e.what());
        return unavailable(snapshot.instrument, snapshot.as_of, fmt::format("evaluation error: {}", e.what()));
    }
}

SignalReport SignalEvaluator::unavailable(
    const std::string& instrument,
    const TimePoint& as_of,
    const std::string& detail
) const {
    SignalReport report;
    report.instrument = instrument;
    report.signal = Signal::Wait;
    report.confidence = 0.0;
    report.actionable = false;
    report.lock = SafetyLock::data_unavailable(detail);
    report.session = safety_lock_.classify_session(as_of);
    report.forecast = ForecastLabel::StayOut;
    report.evaluated_at = as_of;
    report.reasons = {fmt::format("data unavailable: {}", detail)};
    return report;
}

std::vector<std::string> SignalEvaluator::summarize(const SignalReport& report) const {
    std::vector<std::string> reasons;

    if (report.lock.engaged) {
        reasons.push_back(fmt::format("LOCKED ({}): {}", to_string(report.lock.reason), report.lock.detail));
    } else if (report.bias == Bias::Neutral) {
        reasons.push_back("no directional bias");
    } else if (report.confidence < config_.wait_floor) {
        reasons.push_back(fmt::format("confidence {:.1f}% below {:.0f}%: insufficient edge",
                                      report.confidence, config_.wait_floor));
    } else if (report.confidence < config_.actionable_threshold) {
        reasons.push_back(fmt::format("confidence {:.1f}% in dead zone below {:.0f}%",
                                      report.confidence, config_.actionable_threshold));
    }

    if (report.session.soft_lock) {
        reasons.push_back(fmt::format("{} session: confidence scaled x{:.2f}, reduce position size",
                                      report.session.name, report.session.multiplier));
    }

    reasons.insert(reasons.end(), report.factors.reasons.begin(), report.factors.reasons.end());
    return reasons;
}
