#pragma once

#include <exception>

#include "internal/util/outcome.hpp"

namespace stockroom::service {

util::OutcomeCode ToOutcomeCode(const std::exception& e);

} // namespace stockroom::service
