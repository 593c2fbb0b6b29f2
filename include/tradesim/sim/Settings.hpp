#pragma once

#include <string>

#include "tradesim/feed/BackoffPolicy.hpp"
#include "tradesim/model/CostModelEngine.hpp"
#include "tradesim/util/Config.hpp"

namespace tradesim::sim {

// Config -> runtime values. Unrecognized fee tier or order type labels fall
// back (VIP 0, market) with a warning.
model::SimulationParameters parametersFromConfig(const util::Config& cfg);
model::ModelConstants       constantsFromConfig(const util::Config& cfg);
feed::BackoffPolicy         backoffFromConfig(const util::Config& cfg);

// Applies one live "key=value" to p. Only simulation parameter keys are
// accepted (exchange, asset, orderType, quantity, volatility, feeTier).
// Numbers are parsed but not range-checked; validateParameters() does that.
bool applyParameter(model::SimulationParameters& p,
                    const std::string& key,
                    const std::string& value,
                    std::string* whyNot = nullptr);

} // namespace tradesim::sim
