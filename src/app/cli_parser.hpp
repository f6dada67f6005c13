#pragma once
#include "protocol/cli_request.hpp"
#include "core/errors/cuid_errors.hpp"

namespace cuid::app::cli {
    constexpr uint32_t kMaxCount = 1000000;

    cuid::core::errors::Result<cuid::protocol::CliRequest> parse_and_validate(int argc, char* argv[]);
    const char* usage();
}
