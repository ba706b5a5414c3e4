#include "rules.hpp"
#include "errors.hpp"
#include "utils.hpp"

namespace rules {

    namespace {

        bool is_group_separator(char c) {
            return c == ' ' || c == '-';
        }

        // Цифра вплотную или через один разделитель слева/справа: совпадение лишь часть
        // более длинной группы цифр
        bool touches_digit_run(const std::string& text, size_t start, size_t end) {
            if (start >= 1 && utils::is_ascii_digit(text[start - 1])) return true;
            if (start >= 2 && is_group_separator(text[start - 1]) && utils::is_ascii_digit(text[start - 2])) return true;
            if (end < text.size() && utils::is_ascii_digit(text[end])) return true;
            if (end + 1 < text.size() && is_group_separator(text[end]) && utils::is_ascii_digit(text[end + 1])) return true;
            return false;
        }

        // \b на границе поиска должен видеть реальный предыдущий символ
        std::regex_constants::match_flag_type search_flags(const std::string& text,
                                                           std::string::const_iterator from) {
            return from == text.cbegin()
                ? std::regex_constants::match_default
                : std::regex_constants::match_prev_avail;
        }
    }

    std::vector<RawMatch> PatternRule::find_all(const std::string& text) const {
        std::vector<RawMatch> found;
        std::smatch m;
        std::string::const_iterator searchStart(text.cbegin());

        while (std::regex_search(searchStart, text.cend(), m, rx, search_flags(text, searchStart))) {
            size_t abs_pos = (size_t)(m.position(0) + (searchStart - text.cbegin()));
            size_t length = (size_t)m.length(0);

            if (length == 0) {
                // Пустое совпадение: сдвигаемся на символ, иначе зациклимся
                if (m[0].second == text.cend()) break;
                searchStart = m[0].second + 1;
                continue;
            }

            bool rejected = has_flag(flags, RuleFlags::ISOLATED_DIGIT_RUN)
                && touches_digit_run(text, abs_pos, abs_pos + length);
            if (!rejected) {
                found.push_back({ abs_pos, abs_pos + length });
            }

            searchStart = m.suffix().first;
        }
        return found;
    }

    void PatternRegistry::add(const std::string& name, const std::string& pattern, Classification label,
                              RuleFlags flags) {
        auto syntax = std::regex::ECMAScript | std::regex::optimize;
        if (!has_flag(flags, RuleFlags::CASE_SENSITIVE)) {
            syntax |= std::regex::icase;
        }

        try {
            rules_.push_back({ name, pattern, std::regex(pattern, syntax), label, flags });
        }
        catch (const std::regex_error& e) {
            throw errors::InvalidRulePattern(name, e.what());
        }
    }

    PatternRegistry PatternRegistry::build_default() {
        PatternRegistry registry;

        // Порядок правил - часть контракта приоритетов: кто раньше, тот и забирает фрагмент
        registry.add("full_name",
            R"(\b(?:Mr|Mrs|Ms|Dr|Prof)\. [A-Z][a-z]+(?: [A-Z][a-z]+)?\b)",
            Classification::FULL_NAME);
        registry.add("email",
            R"(\b[A-Za-z0-9._%+-]+@[A-Za-z0-9.-]+\.[A-Z|a-z]{2,}\b)",
            Classification::EMAIL);
        registry.add("phone_number",
            R"((?:\+\d{1,3}[- ]?)?\(?\d{3}\)?[- ]?\d{3}[- ]?\d{4}\b)",
            Classification::PHONE_NUMBER);
        registry.add("dob",
            R"(\b\d{1,2}[/-]\d{1,2}[/-]\d{2,4}\b)",
            Classification::DOB);
        registry.add("aadhar_num",
            R"(\b\d{4}[ -]?\d{4}[ -]?\d{4}\b)",
            Classification::AADHAR_NUM, RuleFlags::ISOLATED_DIGIT_RUN);
        // Разделитель только между группами: хвостовой пробел не попадает в фрагмент.
        // Карта - самая длинная группировка, поэтому соседние цифры её не отменяют
        registry.add("credit_debit_no",
            R"(\b\d{4}(?:[ -]?\d{4}){3}\b)",
            Classification::CREDIT_DEBIT_NO);
        registry.add("cvv_no",
            R"(\bCVV:? \d{3,4}\b|\bCVV \d{3,4}\b|\b\d{3,4} CVV\b)",
            Classification::CVV_NO);
        registry.add("expiry_no",
            R"(\b(?:0[1-9]|1[0-2])[/-]\d{2,4}\b|\bExp:? \d{2}[/-]\d{2,4}\b)",
            Classification::EXPIRY_NO);

        // Международные форматы телефонов идут последними и чувствительны к регистру
        registry.add("phone_number_international",
            R"(\+\d{1,3}[-\s]?\d{1,3}[-\s]?\d{3,4}[-\s]?\d{3,4}\b)",
            Classification::PHONE_NUMBER, RuleFlags::CASE_SENSITIVE);
        registry.add("phone_number_asian",
            R"(\+\d{1,3}[-\s]?\d{2}[-\s]?\d{4}[-\s]?\d{4}\b)",
            Classification::PHONE_NUMBER, RuleFlags::CASE_SENSITIVE);
        registry.add("phone_number_european",
            R"(\+\d{1,3}[-\s]?\d{2}[-\s]?\d{3,4}[-\s]?\d{4}\b)",
            Classification::PHONE_NUMBER, RuleFlags::CASE_SENSITIVE);

        return registry;
    }
}
