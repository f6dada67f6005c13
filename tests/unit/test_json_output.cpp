#include <string>
#include <vector>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "app/json_output.hpp"
#include "generator/cuid_parts.hpp"

namespace {

using cuid::core::errors::get_value;
using cuid::core::errors::is_error;

TEST(JsonOutputTest, BatchListsIdsInOrder) {
    const std::vector<std::string> ids = {"ck2p0000ab12002s005k", "ck2p0001ab12002s005k"};
    const auto payload = cuid::app::batch_to_json("ab12", ids);

    EXPECT_EQ(payload["fingerprint"], "ab12");
    EXPECT_EQ(payload["count"], 2);
    ASSERT_TRUE(payload["ids"].is_array());
    EXPECT_EQ(payload["ids"].size(), 2u);
    EXPECT_EQ(payload["ids"][0], "ck2p0000ab12002s005k");
    EXPECT_EQ(payload["ids"][1], "ck2p0001ab12002s005k");
}

TEST(JsonOutputTest, PartsCarryTextAndValues) {
    const std::string id = "ck2p0001ab12002s005k";
    auto parts = cuid::generator::decompose(id);
    ASSERT_FALSE(is_error(parts));

    const auto payload = cuid::app::parts_to_json(id, get_value(parts));
    EXPECT_EQ(payload["cuid"], id);
    EXPECT_EQ(payload["timestamp"]["text"], "k2p");
    EXPECT_EQ(payload["counter"]["text"], "0001");
    EXPECT_EQ(payload["counter"]["value"], 1);
    EXPECT_EQ(payload["fingerprint"], "ab12");
    ASSERT_EQ(payload["random_blocks"].size(), 2u);
    EXPECT_EQ(payload["random_blocks"][0]["text"], "002s");
    EXPECT_EQ(payload["random_blocks"][0]["value"], 100);
    EXPECT_EQ(payload["random_blocks"][1]["value"], 200);
}

TEST(JsonOutputTest, DumpsParseableDocument) {
    const auto payload = cuid::app::batch_to_json("ab12", {"ck2p0000ab12002s005k"});
    const auto reparsed = nlohmann::json::parse(payload.dump());
    EXPECT_EQ(reparsed, payload);
}

}  // namespace
