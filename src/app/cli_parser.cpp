#include "cli_parser.hpp"
#include <charconv>
#include <optional>
#include <system_error>
#include <vector>

namespace cuid::app::cli {

    using namespace cuid::core::errors;
    using cuid::protocol::CliRequest;
    using cuid::protocol::Command;
    using cuid::protocol::OutputFormat;

    struct RawCliOptions {
        std::optional<std::string> count;
        std::optional<std::string> format;
        std::vector<std::string> positionals;
        bool verbose = false;
    };

    const char* usage() {
        return "Usage:\n"
               "  cuid generate [--count N] [--format text|json] [--verbose]\n"
               "  cuid inspect <cuid> [--verbose]\n"
               "  cuid --help\n";
    }

    Result<CliRequest> parse_and_validate(int argc, char* argv[]) {
        if (argc < 2) {
            return CuidError{ErrorCategory::Input, "No command provided.", "missing_command", "Usage: cuid generate --count 10"};
        }

        CliRequest req;
        std::string command = argv[1];
        if (command == "--help" || command == "-h" || command == "help") {
            req.command = Command::Help;
            return req;
        }
        if (command == "generate") {
            req.command = Command::Generate;
        } else if (command == "inspect") {
            req.command = Command::Inspect;
        } else {
            return CuidError{ErrorCategory::Input, "Unknown command: " + command, "unknown_command", "Supported commands: generate, inspect."};
        }

        RawCliOptions raw;
        std::vector<std::string> args;
        for (int i = 2; i < argc; ++i) {
            args.push_back(argv[i]);
        }

        // Parser phase: read the raw strings
        for (size_t i = 0; i < args.size(); ++i) {
            if (args[i] == "--count") {
                if (i + 1 < args.size()) raw.count = args[++i];
                else return CuidError{ErrorCategory::Input, "Missing value for --count", "missing_value"};
            } else if (args[i] == "--format") {
                if (i + 1 < args.size()) raw.format = args[++i];
                else return CuidError{ErrorCategory::Input, "Missing value for --format", "missing_value"};
            } else if (args[i] == "--verbose") {
                raw.verbose = true;
            } else if (!args[i].empty() && args[i][0] == '-') {
                return CuidError{ErrorCategory::Input, "Unknown argument: " + args[i], "unknown_argument"};
            } else {
                raw.positionals.push_back(args[i]);
            }
        }

        // Validator phase
        req.verbose = raw.verbose;

        if (req.command == Command::Inspect) {
            if (raw.count || raw.format) {
                return CuidError{ErrorCategory::Input, "inspect does not accept --count or --format", "conflicting_flags"};
            }
            if (raw.positionals.size() != 1) {
                return CuidError{ErrorCategory::Input, "inspect expects exactly one identifier", "missing_required_argument", "Usage: cuid inspect <cuid>"};
            }
            req.cuid = raw.positionals.front();
            req.format = OutputFormat::Json;
            return req;
        }

        if (!raw.positionals.empty()) {
            return CuidError{ErrorCategory::Input, "Unexpected argument: " + raw.positionals.front(), "unknown_argument"};
        }

        if (raw.format) {
            if (*raw.format == "text") {
                req.format = OutputFormat::Text;
            } else if (*raw.format == "json") {
                req.format = OutputFormat::Json;
            } else {
                return CuidError{ErrorCategory::Input, "Unknown output format: " + *raw.format, "invalid_format", "Use 'text' or 'json'."};
            }
        }

        // Exception-free integer parsing
        if (raw.count) {
            uint32_t count = 0;
            const char* begin = raw.count->data();
            const char* end = raw.count->data() + raw.count->size();
            auto [ptr, ec] = std::from_chars(begin, end, count);
            if (ec != std::errc() || ptr != end) {
                return CuidError{ErrorCategory::Input, "Invalid number for --count", "invalid_integer", "Provide a positive integer."};
            }
            if (count == 0 || count > kMaxCount) {
                return CuidError{ErrorCategory::Input, "--count out of bounds", "bounds_error", "Must be between 1 and 1000000."};
            }
            req.count = count;
        }

        return req;
    }

} // namespace cuid::app::cli
