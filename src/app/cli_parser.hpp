#pragma once
#include "core/errors/plan_errors.hpp"
#include "protocol/plan_request.hpp"

namespace callplan::app::cli {
    callplan::core::errors::Result<callplan::protocol::PlanRequest> parse_and_validate(int argc, char* argv[]);
}
