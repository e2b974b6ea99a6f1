#pragma once

#include "cardkit/card.hpp"
#include "cardkit/png.hpp"

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace cardkit {

// ============================================================================
// Extraction chain
// ============================================================================

// tEXt keywords checked for card data, highest priority first. v3-era keys
// come before v2-era keys, then the keys other tools have used.
const std::vector<std::string>& card_text_keys();

// One way of turning chunk text into JSON. Returns std::nullopt when the text
// does not decode.
struct PayloadDecoder {
    std::string name;
    std::function<std::optional<CardDocument>(const std::string&)> decode;
};

// Raw JSON first, then base64-wrapped JSON
const std::vector<PayloadDecoder>& default_payload_decoders();

struct ExtractedCard {
    CardDocument data;
    CardSpec spec = CardSpec::V2;
    std::string key;        // tEXt keyword the card came from
    std::string decoder;    // PayloadDecoder::name that produced it
};

// Try every key in order and, for each present key, every decoder in order.
// The first decoded value that detect_spec() classifies wins.
std::optional<ExtractedCard> extract_from_text_chunks(const TextChunkMap& text,
                                                      const std::vector<std::string>& keys,
                                                      const std::vector<PayloadDecoder>& decoders);

// ============================================================================
// PNG card import / export
// ============================================================================

struct ExtractResult {
    bool ok = false;                        // false only for container corruption
    ContainerError error = ContainerError::None;
    std::string message;
    std::optional<ExtractedCard> card;      // empty when the PNG carries no card
};

ExtractResult extract_card(const std::vector<uint8_t>& png);

// tEXt keyword a card of the given spec is written under ("ccv3" / "chara")
const char* card_keyword(CardSpec spec);

// Embed minified card JSON. Existing card chunks (any card_text_keys()
// keyword) are removed first so the result carries exactly one card.
EmbedResult embed_card(const std::vector<uint8_t>& png, const CardDocument& card, CardSpec spec);

} // namespace cardkit
