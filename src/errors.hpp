#pragma once
#include <stdexcept>
#include <string>

namespace errors {

    // Распознаватель имён недоступен: вызов mask прерывается целиком
    class RecognizerUnavailable : public std::runtime_error {
    public:
        explicit RecognizerUnavailable(const std::string& what)
            : std::runtime_error("Recognizer unavailable: " + what) {
        }
    };

    // Правило не скомпилировалось: фатально при старте
    class InvalidRulePattern : public std::runtime_error {
    public:
        InvalidRulePattern(const std::string& rule_name, const std::string& what)
            : std::runtime_error("Invalid pattern for rule '" + rule_name + "': " + what),
              rule_name_(rule_name) {
        }

        const std::string& rule_name() const { return rule_name_; }

    private:
        std::string rule_name_;
    };

    // Некорректное тело запроса; бросается только сервисным слоем
    class MalformedInput : public std::runtime_error {
    public:
        explicit MalformedInput(const std::string& what)
            : std::runtime_error(what) {
        }
    };

    class ModelLoadError : public std::runtime_error {
    public:
        explicit ModelLoadError(const std::string& what)
            : std::runtime_error("Model load error: " + what) {
        }
    };
}
