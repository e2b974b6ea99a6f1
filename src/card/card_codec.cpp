#include "cardkit/card_codec.hpp"
#include "cardkit/encoding.hpp"

#include <spdlog/spdlog.h>

namespace cardkit {

namespace {

std::optional<CardDocument> parse_json(const std::string& text) {
    auto doc = nlohmann::json::parse(text, nullptr, /*allow_exceptions=*/false);
    if (doc.is_discarded()) {
        return std::nullopt;
    }
    return doc;
}

std::optional<CardDocument> decode_raw_json(const std::string& text) {
    return parse_json(text);
}

std::optional<CardDocument> decode_base64_json(const std::string& text) {
    auto bytes = base64_decode(text);
    if (!bytes || bytes->empty()) {
        return std::nullopt;
    }
    return parse_json(utf8_decode_lossy(std::string(bytes->begin(), bytes->end())));
}

} // namespace

const std::vector<std::string>& card_text_keys() {
    static const std::vector<std::string> keys = {
        "ccv3", "chara_card_v3",
        "chara", "ccv2", "character",
        "charactercard", "card", "CharacterCard", "Chara",
    };
    return keys;
}

const std::vector<PayloadDecoder>& default_payload_decoders() {
    static const std::vector<PayloadDecoder> decoders = {
        {"json", decode_raw_json},
        {"base64+json", decode_base64_json},
    };
    return decoders;
}

std::optional<ExtractedCard> extract_from_text_chunks(const TextChunkMap& text,
                                                      const std::vector<std::string>& keys,
                                                      const std::vector<PayloadDecoder>& decoders) {
    for (const auto& key : keys) {
        auto it = text.find(key);
        if (it == text.end()) continue;

        for (const auto& decoder : decoders) {
            auto doc = decoder.decode(it->second);
            if (!doc) continue;

            auto spec = detect_spec(*doc);
            if (!spec) {
                spdlog::debug("tEXt '{}' decoded as {} but is not a recognizable card", key, decoder.name);
                continue;
            }

            ExtractedCard card;
            card.data = std::move(*doc);
            card.spec = *spec;
            card.key = key;
            card.decoder = decoder.name;
            return card;
        }

        spdlog::warn("tEXt '{}' present but no decoder produced a card", key);
    }
    return std::nullopt;
}

ExtractResult extract_card(const std::vector<uint8_t>& png) {
    ExtractResult result;

    auto text = read_text_chunks(png);
    if (!text.ok) {
        result.error = text.error;
        result.message = text.message;
        spdlog::error("card extraction failed: {}", text.message);
        return result;
    }

    result.card = extract_from_text_chunks(text.text, card_text_keys(), default_payload_decoders());
    if (result.card) {
        spdlog::debug("extracted {} card from tEXt '{}' ({})",
                      card_spec_name(result.card->spec), result.card->key, result.card->decoder);
    } else {
        spdlog::debug("no card data among {} tEXt chunk(s)", text.text.size());
    }

    result.ok = true;
    return result;
}

const char* card_keyword(CardSpec spec) {
    return spec == CardSpec::V3 ? "ccv3" : "chara";
}

EmbedResult embed_card(const std::vector<uint8_t>& png, const CardDocument& card, CardSpec spec) {
    // Minified; invalid UTF-8 sequences become U+FFFD
    auto text = card.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    return replace_text_chunks(png, card_text_keys(), card_keyword(spec), text);
}

} // namespace cardkit
