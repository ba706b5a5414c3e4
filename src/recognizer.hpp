#pragma once
#include <string>
#include <vector>
#include <unordered_set>
#include <memory>

namespace ner {

    // Единственная метка, которую использует маскировщик
    inline constexpr const char* kPersonLabel = "PERSON";

    struct RecognizedSpan {
        size_t start;
        size_t end;
        std::string label;
    };

    // Внешний распознаватель именованных сущностей.
    // Если распознать невозможно, реализация бросает errors::RecognizerUnavailable.
    class EntityRecognizer {
    public:
        virtual ~EntityRecognizer() = default;

        virtual std::vector<RecognizedSpan> recognize(const std::string& text) const = 0;

        // Для журнала запуска
        virtual std::string name() const = 0;
    };

    /**
     * @brief Словарный распознаватель имён людей.
     *
     * Имя начинается со слова с заглавной буквы, которое есть в словаре, и продолжается
     * следующими словами с заглавной буквы (через один пробел), всего не более kMaxNameTokens.
     * Стоящее вплотную перед именем обращение (Mr. / Dr. ...) включается в фрагмент.
     */
    class GazetteerRecognizer : public EntityRecognizer {
    public:
        static constexpr size_t kMaxNameTokens = 3;

        explicit GazetteerRecognizer(std::unordered_set<std::string> given_names);

        // Бросает errors::RecognizerUnavailable, если файл не читается или пуст
        static std::shared_ptr<GazetteerRecognizer> load_from_file(const std::string& path);

        std::vector<RecognizedSpan> recognize(const std::string& text) const override;
        std::string name() const override { return "gazetteer"; }

        size_t size() const { return given_names_.size(); }

    private:
        std::unordered_set<std::string> given_names_;  // в нижнем регистре
    };

    // Явный режим --regex-only: распознаватель ничего не находит
    class NullRecognizer : public EntityRecognizer {
    public:
        std::vector<RecognizedSpan> recognize(const std::string&) const override { return {}; }
        std::string name() const override { return "disabled"; }
    };
}
