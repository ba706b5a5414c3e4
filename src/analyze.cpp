#include "analyze.hpp"
#include "errors.hpp"
#include <algorithm>
#include <stdexcept>
#include <string>

namespace analyze {

    using types::Classification;
    using types::SpanSource;

    SpanCollector::SpanCollector(std::shared_ptr<const ner::EntityRecognizer> recognizer,
                                 std::shared_ptr<const rules::PatternRegistry> registry)
        : recognizer_(std::move(recognizer)), registry_(std::move(registry)) {
        if (!registry_) {
            throw std::invalid_argument("SpanCollector requires a pattern registry");
        }
    }

    std::vector<Span> SpanCollector::collect(const std::string& text) const {
        if (!recognizer_) {
            throw errors::RecognizerUnavailable("no recognizer configured");
        }

        std::vector<Span> candidates;

        // 1. Распознаватель: берём только PERSON
        for (const auto& found : recognizer_->recognize(text)) {
            if (found.label != ner::kPersonLabel) continue;
            if (found.start >= found.end || found.end > text.size()) {
                throw errors::RecognizerUnavailable("recognizer returned span ["
                    + std::to_string(found.start) + ", " + std::to_string(found.end)
                    + ") outside of text of size " + std::to_string(text.size()));
            }
            candidates.push_back(Span::from_text(text, found.start, found.end,
                Classification::FULL_NAME, SpanSource::recognizer()));
        }

        // 2. Правила строго в объявленном порядке
        for (const auto& rule : registry_->rules()) {
            for (const auto& m : rule.find_all(text)) {
                candidates.push_back(Span::from_text(text, m.start, m.end,
                    rule.label, SpanSource::rule(rule.name)));
            }
        }

        return candidates;
    }

    EntityList resolve_overlaps(const std::vector<Span>& candidates) {
        EntityList accepted;

        for (const auto& candidate : candidates) {
            bool is_overlap = std::any_of(accepted.begin(), accepted.end(), [&](const Span& existing) {
                return spans_conflict(candidate, existing);
            });
            if (!is_overlap) {
                accepted.push_back(candidate);
            }
        }

        std::stable_sort(accepted.begin(), accepted.end(), [](const Span& a, const Span& b) {
            return a.start < b.start;
        });
        return accepted;
    }
}
