#include "app/json_output.hpp"

namespace cuid::app {

using nlohmann::json;

json batch_to_json(const std::string& fingerprint,
                   const std::vector<std::string>& ids) {
    json payload;
    payload["fingerprint"] = fingerprint;
    payload["count"] = ids.size();
    payload["ids"] = ids;
    return payload;
}

json parts_to_json(const std::string& id, const generator::CuidParts& parts) {
    json payload;
    payload["cuid"] = id;
    payload["timestamp"] = {{"text", parts.timestamp_text},
                            {"value", parts.timestamp}};
    payload["counter"] = {{"text", parts.counter_text}, {"value", parts.counter}};
    payload["fingerprint"] = parts.fingerprint;

    json blocks = json::array();
    for (std::size_t i = 0; i < parts.random_texts.size(); ++i) {
        blocks.push_back({{"text", parts.random_texts[i]},
                          {"value", parts.random_values[i]}});
    }
    payload["random_blocks"] = blocks;
    return payload;
}

}  // namespace cuid::app
