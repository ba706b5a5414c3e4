#pragma once
#include <string>
#include <string_view>
#include <vector>
#include <optional>
#include <array>
#include <cstddef>
#include <nlohmann/json.hpp>

namespace types {

    // Закрытый набор меток, которые выдаёт маскировщик
    enum class Classification {
        FULL_NAME,
        EMAIL,
        PHONE_NUMBER,
        DOB,
        AADHAR_NUM,
        CREDIT_DEBIT_NO,
        CVV_NO,
        EXPIRY_NO
    };

    inline constexpr std::array<Classification, 8> kAllClassifications = {
        Classification::FULL_NAME,
        Classification::EMAIL,
        Classification::PHONE_NUMBER,
        Classification::DOB,
        Classification::AADHAR_NUM,
        Classification::CREDIT_DEBIT_NO,
        Classification::CVV_NO,
        Classification::EXPIRY_NO
    };

    inline std::string_view to_string(Classification c) {
        switch (c) {
        case Classification::FULL_NAME:       return "full_name";
        case Classification::EMAIL:           return "email";
        case Classification::PHONE_NUMBER:    return "phone_number";
        case Classification::DOB:             return "dob";
        case Classification::AADHAR_NUM:      return "aadhar_num";
        case Classification::CREDIT_DEBIT_NO: return "credit_debit_no";
        case Classification::CVV_NO:          return "cvv_no";
        case Classification::EXPIRY_NO:       return "expiry_no";
        }
        return "unknown";
    }

    inline std::optional<Classification> classification_from_string(std::string_view label) {
        for (auto c : kAllClassifications) {
            if (to_string(c) == label) {
                return c;
            }
        }
        return std::nullopt;
    }

    // Кто нашёл фрагмент: распознаватель имён или одно из правил.
    // Используется только для приоритета, наружу не отдаётся.
    struct SpanSource {
        enum class Kind { RECOGNIZER, RULE };

        Kind kind = Kind::RULE;
        std::string rule_name;  // пусто для распознавателя

        static SpanSource recognizer() { return { Kind::RECOGNIZER, {} }; }
        static SpanSource rule(std::string name) { return { Kind::RULE, std::move(name) }; }

        std::string describe() const {
            return kind == Kind::RECOGNIZER ? std::string("recognizer") : "rule:" + rule_name;
        }
    };

    // Полуоткрытый интервал [start, end) в байтах исходного текста
    struct Span {
        std::size_t start = 0;
        std::size_t end = 0;
        Classification classification = Classification::FULL_NAME;
        std::string literal;   // text.substr(start, end - start), без нормализации
        SpanSource source;

        std::size_t length() const { return end - start; }

        static Span from_text(const std::string& text, std::size_t start, std::size_t end,
                              Classification c, SpanSource source) {
            return Span{ start, end, c, text.substr(start, end - start), std::move(source) };
        }
    };

    // Отсортирован по start, пересечений нет
    using EntityList = std::vector<Span>;

    // nlohmann serialization
    inline void to_json(nlohmann::json& j, Classification c) {
        j = std::string(to_string(c));
    }

    // Формат элемента list_of_masked_entities; источник не сериализуется
    inline void to_json(nlohmann::json& j, const Span& s) {
        j = nlohmann::json{
            {"position", { s.start, s.end }},
            {"classification", std::string(to_string(s.classification))},
            {"entity", s.literal}
        };
    }
} // namespace types
