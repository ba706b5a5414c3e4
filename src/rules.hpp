#pragma once
#include "types.hpp"
#include <regex>
#include <string>
#include <vector>

namespace rules {

    using types::Classification;

    // Меняется при любом изменении состава или порядка правил
    inline constexpr const char* kRuleTableVersion = "2024.1";

    enum class RuleFlags : unsigned {
        NONE = 0,
        CASE_SENSITIVE = 1u << 0,
        // Совпадение отбрасывается, если рядом (через один разделитель ' '/'-') есть цифра
        ISOLATED_DIGIT_RUN = 1u << 1
    };

    inline constexpr RuleFlags operator|(RuleFlags a, RuleFlags b) {
        return static_cast<RuleFlags>(static_cast<unsigned>(a) | static_cast<unsigned>(b));
    }

    inline constexpr bool has_flag(RuleFlags set, RuleFlags flag) {
        return (static_cast<unsigned>(set) & static_cast<unsigned>(flag)) != 0;
    }

    struct RawMatch {
        size_t start;
        size_t end;
    };

    struct PatternRule {
        std::string name;
        std::string pattern;   // исходный текст выражения, для диагностики
        std::regex rx;
        Classification label;
        RuleFlags flags = RuleFlags::NONE;

        // Все совпадения слева направо без перекрытий (семантика find all)
        std::vector<RawMatch> find_all(const std::string& text) const;
    };

    class PatternRegistry {
    public:
        // Компилирует правило сразу; ошибка компиляции -> errors::InvalidRulePattern
        void add(const std::string& name, const std::string& pattern, Classification label,
                 RuleFlags flags = RuleFlags::NONE);

        const std::vector<PatternRule>& rules() const { return rules_; }
        size_t size() const { return rules_.size(); }

        // Таблица правил предметной области в фиксированном порядке
        static PatternRegistry build_default();

    private:
        std::vector<PatternRule> rules_;
    };
}
