// errors.cpp

#include <keydiff/errors.h>
#include <keydiff/log.h>

#include <string>
#include <utility>

namespace keydiff {

namespace {

std::string make_strategy_message(const std::string& strategy, const std::string& value_type)
{
    if (value_type.empty()) {
        return "Unknown diff strategy: '" + strategy + "'";
    }
    return "Diff strategy '" + strategy + "' is not supported for " + value_type;
}

} // anonymous namespace

UnsupportedStrategy::UnsupportedStrategy(std::string strategy, std::string value_type)
    : std::runtime_error(make_strategy_message(strategy, value_type))
    , strategy_(std::move(strategy))
    , value_type_(std::move(value_type))
{
}

namespace detail {

void unreachable_classification(std::string_view func, std::source_location loc)
{
    constexpr std::string_view message =
        "key found in neither source nor target (key equality is not reflexive)";

    log_invariant_violation(func, message, loc);
    throw InvariantViolation(std::string(func) + ": " + std::string(message));
}

} // namespace detail

} // namespace keydiff
