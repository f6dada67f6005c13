#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "generator/cuid_parts.hpp"

namespace cuid::app {

nlohmann::json batch_to_json(const std::string& fingerprint,
                             const std::vector<std::string>& ids);

nlohmann::json parts_to_json(const std::string& id,
                             const generator::CuidParts& parts);

}  // namespace cuid::app
