#pragma once
#include "analyze.hpp"
#include <string>

namespace masking {

    using types::Classification;
    using types::EntityList;

    struct MaskResult {
        std::string masked_text;
        EntityList entities;   // по возрастанию start, с исходными смещениями
    };

    // "[" + метка + "]"
    std::string make_tag(Classification c);

    // Замена фрагментов справа налево: смещения считаются по исходному тексту,
    // поэтому левые фрагменты остаются корректными. entities отсортирован по start.
    std::string apply_masks(const std::string& text, const EntityList& entities);

    /**
     * @brief Конвейер Collect -> Resolve -> Substitute.
     *
     * Не хранит состояния между вызовами; mask() можно вызывать из нескольких потоков.
     * Любое исключение прерывает вызов целиком, частично замаскированный текст не возвращается.
     */
    class PiiMasker {
    public:
        explicit PiiMasker(analyze::SpanCollector collector)
            : collector_(std::move(collector)) {
        }

        MaskResult mask(const std::string& text) const;

        const analyze::SpanCollector& collector() const { return collector_; }

    private:
        analyze::SpanCollector collector_;
    };
}
