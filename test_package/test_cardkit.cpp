/**
 * Consumer check - verify cardkit headers and library link correctly
 */

#include <cardkit/cardkit.hpp>
#include <iostream>

int main() {
    std::cout << "cardkit version: " << CARDKIT_VERSION << "\n";

    // Minimal PNG: signature, IHDR, IEND
    std::vector<uint8_t> png = {0x89, 'P', 'N', 'G', '\r', '\n', 0x1A, '\n'};
    auto append_chunk = [&png](const std::string& type, const std::vector<uint8_t>& data) {
        uint32_t len = static_cast<uint32_t>(data.size());
        for (int shift = 24; shift >= 0; shift -= 8) png.push_back(static_cast<uint8_t>(len >> shift));
        std::vector<uint8_t> body(type.begin(), type.end());
        body.insert(body.end(), data.begin(), data.end());
        png.insert(png.end(), body.begin(), body.end());
        uint32_t crc = cardkit::crc32(body);
        for (int shift = 24; shift >= 0; shift -= 8) png.push_back(static_cast<uint8_t>(crc >> shift));
    };
    append_chunk("IHDR", {0, 0, 0, 1, 0, 0, 0, 1, 8, 0, 0, 0, 0});
    append_chunk("IEND", {});

    nlohmann::json card = {
        {"spec", "chara_card_v3"},
        {"spec_version", "3.0"},
        {"data", {{"name", "Consumer"}}},
    };

    auto embedded = cardkit::embed_card(png, card, cardkit::CardSpec::V3);
    if (!embedded.ok) {
        std::cerr << "Embedding failed: " << embedded.message << "\n";
        return 1;
    }

    auto extracted = cardkit::extract_card(embedded.png);
    if (!extracted.ok || !extracted.card) {
        std::cerr << "Extraction failed!\n";
        return 1;
    }

    std::cout << "Extracted card: " << cardkit::card_name(extracted.card->data) << "\n";
    std::cout << "cardkit test_package: OK\n";

    return 0;
}
