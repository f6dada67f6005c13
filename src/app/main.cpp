#include <iostream>
#include <string>
#include <vector>
#include "app/cli_parser.hpp"
#include "app/json_output.hpp"
#include "core/errors/cuid_errors.hpp"
#include "core/logging/logger.hpp"
#include "generator/cuid_generator.hpp"
#include "generator/cuid_parts.hpp"

namespace {

void report(const std::string& context, const cuid::core::errors::CuidError& err) {
    LOG_ERROR(context + " [" + cuid::core::errors::to_string(err.category) + "/" +
              err.code + "]: " + err.message);
    if (!err.hint.empty()) {
        LOG_INFO("Hint: " + err.hint);
    }
}

int run_inspect(const std::string& id) {
    auto parts = cuid::generator::decompose(id);
    if (cuid::core::errors::is_error(parts)) {
        report("Cannot decompose identifier", cuid::core::errors::get_error(parts));
        return 5;
    }
    std::cout << cuid::app::parts_to_json(id, cuid::core::errors::get_value(parts)).dump(2)
              << std::endl;
    return 0;
}

int run_generate(const cuid::protocol::CliRequest& req) {
    auto created = cuid::generator::create_generator();
    if (cuid::core::errors::is_error(created)) {
        report("Failed to create generator", cuid::core::errors::get_error(created));
        return 3;
    }
    const auto handle = cuid::core::errors::get_value(created);
    cuid::core::logging::Logger::get().set_tag(handle->fingerprint());
    LOG_DEBUG("Generating " + std::to_string(req.count) + " identifier(s)");

    std::vector<std::string> ids;
    ids.reserve(req.count);
    for (uint32_t i = 0; i < req.count; ++i) {
        auto id = cuid::generator::generate(handle);
        if (cuid::core::errors::is_error(id)) {
            report("Generation failed", cuid::core::errors::get_error(id));
            return 4;
        }
        if (req.format == cuid::protocol::OutputFormat::Text) {
            std::cout << cuid::core::errors::get_value(id) << '\n';
        } else {
            ids.push_back(cuid::core::errors::get_value(id));
        }
    }

    if (req.format == cuid::protocol::OutputFormat::Json) {
        std::cout << cuid::app::batch_to_json(handle->fingerprint(), ids).dump(2) << '\n';
    }
    std::cout.flush();
    return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
    auto parsed = cuid::app::cli::parse_and_validate(argc, argv);
    if (cuid::core::errors::is_error(parsed)) {
        report("Input error", cuid::core::errors::get_error(parsed));
        std::cerr << cuid::app::cli::usage();
        return 2;
    }

    const auto& req = cuid::core::errors::get_value(parsed);
    if (req.verbose) {
        cuid::core::logging::Logger::get().set_min_level(cuid::core::logging::LogLevel::DEBUG);
    }

    switch (req.command) {
        case cuid::protocol::Command::Help:
            std::cout << cuid::app::cli::usage();
            return 0;
        case cuid::protocol::Command::Inspect:
            return run_inspect(req.cuid.value_or(""));
        case cuid::protocol::Command::Generate:
            return run_generate(req);
    }
    return 2;
}
