#include <doctest/doctest.h>
#include <cardkit/card.hpp>

using namespace cardkit;
using json = nlohmann::json;

namespace {

json v2_with_entry(json entry) {
    return json{
        {"spec", "chara_card_v2"},
        {"spec_version", "2.0"},
        {"data", {{"name", "Alice"}, {"character_book", {{"entries", json::array({entry})}}}}},
    };
}

} // namespace

TEST_CASE("normalize_card fixes non-standard spec tags") {
    auto v3 = normalize_card(json{{"spec", "ccv3"}, {"data", {{"name", "A"}}}}, CardSpec::V3);
    CHECK(v3.card["spec"] == "chara_card_v3");
    CHECK(v3.card["spec_version"] == "3.0");
    CHECK_FALSE(v3.warnings.empty());

    auto v3_kept = normalize_card(json{{"spec", "ccv3"}, {"spec_version", "3.1"}, {"data", {{"name", "A"}}}},
                                  CardSpec::V3);
    CHECK(v3_kept.card["spec_version"] == "3.1");

    auto v2 = normalize_card(json{{"spec", "v2"}, {"data", {{"name", "A"}}}}, CardSpec::V2);
    CHECK(v2.card["spec"] == "chara_card_v2");
    CHECK(v2.card["spec_version"] == "2.0");
}

TEST_CASE("normalize_card leaves canonical cards untouched") {
    json card = {{"spec", "chara_card_v3"}, {"spec_version", "3.0"}, {"data", {{"name", "A"}}}};
    auto result = normalize_card(card, CardSpec::V3);
    CHECK(result.card == card);
    CHECK(result.warnings.empty());
}

TEST_CASE("normalize_card wraps legacy v2 cards") {
    json legacy = {{"name", "Alice"}, {"description", "desc"}};
    auto result = normalize_card(legacy, CardSpec::V2);
    CHECK(result.card["spec"] == "chara_card_v2");
    CHECK(result.card["spec_version"] == "2.0");
    CHECK(result.card["data"]["name"] == "Alice");
    CHECK(result.card["data"]["description"] == "desc");
}

TEST_CASE("normalize_card drops a null character_book") {
    json card = {{"spec", "chara_card_v2"}, {"data", {{"name", "A"}, {"character_book", nullptr}}}};
    auto result = normalize_card(card, CardSpec::V2);
    CHECK_FALSE(result.card["data"].contains("character_book"));
}

TEST_CASE("normalize_card fills lorebook entry defaults") {
    auto result = normalize_card(v2_with_entry(json::object()), CardSpec::V2);
    const auto& entry = result.card["data"]["character_book"]["entries"][0];
    CHECK(entry["keys"] == json::array());
    CHECK(entry["content"] == "");
    CHECK(entry["enabled"] == true);
    CHECK(entry["insertion_order"] == 100);
    CHECK(entry["extensions"] == json::object());
}

TEST_CASE("normalize_card maps lorebook positions") {
    auto position_of = [](json value) {
        auto result = normalize_card(v2_with_entry(json{{"position", value}}), CardSpec::V2);
        return result.card["data"]["character_book"]["entries"][0];
    };

    CHECK(position_of(0)["position"] == "before_char");
    CHECK(position_of(4)["position"] == "after_char");
    CHECK(position_of("before_char")["position"] == "before_char");
    CHECK(position_of("Before")["position"] == "before_char");
    CHECK(position_of("after_char")["position"] == "after_char");
    CHECK(position_of("somewhere")["position"] == "after_char");
    CHECK_FALSE(position_of(nullptr).contains("position"));
}

TEST_CASE("normalize_card moves v3-only entry fields into extensions for v2") {
    json entry = {{"keys", {"a"}}, {"content", "c"}, {"depth", 4}, {"selectiveLogic", 1},
                  {"extensions", {{"existing", true}}}};
    auto result = normalize_card(v2_with_entry(entry), CardSpec::V2);
    const auto& out = result.card["data"]["character_book"]["entries"][0];
    CHECK_FALSE(out.contains("depth"));
    CHECK_FALSE(out.contains("selectiveLogic"));
    CHECK(out["extensions"]["depth"] == 4);
    CHECK(out["extensions"]["selectiveLogic"] == 1);
    CHECK(out["extensions"]["existing"] == true);
}

TEST_CASE("normalize_card keeps v3-only entry fields for v3") {
    json card = {{"spec", "chara_card_v3"},
                 {"spec_version", "3.0"},
                 {"data", {{"name", "A"},
                           {"character_book", {{"entries", json::array({{{"depth", 4}}})}}}}}};
    auto result = normalize_card(card, CardSpec::V3);
    CHECK(result.card["data"]["character_book"]["entries"][0]["depth"] == 4);
}

TEST_CASE("normalize_card does not modify its input") {
    json legacy = {{"name", "Alice"}, {"description", "desc"}};
    json copy = legacy;
    normalize_card(legacy, CardSpec::V2);
    CHECK(legacy == copy);
}
