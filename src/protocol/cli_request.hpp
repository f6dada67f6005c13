#pragma once
#include <cstdint>
#include <optional>
#include <string>

namespace cuid::protocol {

    enum class Command {
        Generate,
        Inspect,
        Help
    };

    enum class OutputFormat {
        Text,
        Json
    };

    // Validated command-line input
    struct CliRequest {
        Command command = Command::Generate;
        uint32_t count = 1;
        OutputFormat format = OutputFormat::Text;
        std::optional<std::string> cuid; // inspect only
        bool verbose = false;
    };

} // namespace cuid::protocol
