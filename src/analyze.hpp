#pragma once
#include "types.hpp"
#include "rules.hpp"
#include "recognizer.hpp"
#include <memory>

namespace analyze {

    using types::Span;
    using types::EntityList;

    // Сбор всех кандидатов: сначала распознаватель, затем правила в порядке таблицы.
    // Кандидаты могут пересекаться; порядок выдачи - порядок вычисления.
    class SpanCollector {
    public:
        SpanCollector(std::shared_ptr<const ner::EntityRecognizer> recognizer,
                      std::shared_ptr<const rules::PatternRegistry> registry);

        std::vector<Span> collect(const std::string& text) const;

        const rules::PatternRegistry& registry() const { return *registry_; }

    private:
        std::shared_ptr<const ner::EntityRecognizer> recognizer_;
        std::shared_ptr<const rules::PatternRegistry> registry_;
    };

    // Касание тоже считается конфликтом: [0,5) и [5,9) конфликтуют
    inline bool spans_conflict(const Span& candidate, const Span& accepted) {
        return candidate.start <= accepted.end && candidate.end >= accepted.start;
    }

    // Первый занявший побеждает; отброшенные кандидаты не пересматриваются.
    // Результат отсортирован по start.
    EntityList resolve_overlaps(const std::vector<Span>& candidates);
}
