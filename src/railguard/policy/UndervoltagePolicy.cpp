#include "railguard/policy/UndervoltagePolicy.hpp"

namespace railguard {
namespace policy {

UndervoltagePolicy::UndervoltagePolicy(unsigned undervoltageLimit) : limit_(undervoltageLimit) {}

PolicyDecision UndervoltagePolicy::evaluate(double correctedVoltage, double thresholdVoltage) {
    if (correctedVoltage < thresholdVoltage) {
        ++count_;
    } else {
        count_ = 0;
    }

    PolicyDecision decision{count_, count_ > limit_};
    if (decision.tripped) {
        count_ = 0;
    }
    return decision;
}

} // namespace policy
} // namespace railguard
