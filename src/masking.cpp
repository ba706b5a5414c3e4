#include "masking.hpp"
#include <stdexcept>

namespace masking {

    std::string make_tag(Classification c) {
        return "[" + std::string(types::to_string(c)) + "]";
    }

    std::string apply_masks(const std::string& text, const EntityList& entities) {
        std::string masked = text;

        for (auto it = entities.rbegin(); it != entities.rend(); ++it) {
            if (it->start >= it->end || it->end > text.size()) {
                throw std::out_of_range("entity [" + std::to_string(it->start) + ", "
                    + std::to_string(it->end) + ") is outside of the text");
            }
            masked.replace(it->start, it->length(), make_tag(it->classification));
        }
        return masked;
    }

    MaskResult PiiMasker::mask(const std::string& text) const {
        auto candidates = collector_.collect(text);
        EntityList entities = analyze::resolve_overlaps(candidates);

        MaskResult result;
        result.masked_text = apply_masks(text, entities);
        result.entities = std::move(entities);
        return result;
    }
}
