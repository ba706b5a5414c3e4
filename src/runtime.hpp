#pragma once
#include <memory>
#include "config.hpp"
#include "masking.hpp"
#include "classifier.hpp"

namespace runtime {

    /**
     * @brief Явный жизненный цикл процесса: правила, распознаватель, классификатор.
     *
     * start() собирает всё в фиксированном порядке и бросает исключение до того,
     * как будет обслужен первый запрос. После старта объекты неизменяемы и
     * разделяются между потоками без блокировок.
     */
    class Runtime {
    public:
        // Порядок: таблица правил -> распознаватель -> классификатор -> маскировщик
        static std::unique_ptr<Runtime> start(const config::Options& options);

        // Сборка из готовых компонентов (тесты, встраивание)
        Runtime(std::shared_ptr<const rules::PatternRegistry> registry,
                std::shared_ptr<const ner::EntityRecognizer> recognizer,
                std::shared_ptr<const classify::Classifier> classifier);

        const masking::PiiMasker& masker() const;
        const classify::Classifier& classifier() const;
        const rules::PatternRegistry& registry() const;
        const ner::EntityRecognizer& recognizer() const;

        bool running() const { return running_; }
        void shutdown();

    private:
        void ensure_running() const;

        std::shared_ptr<const rules::PatternRegistry> registry_;
        std::shared_ptr<const ner::EntityRecognizer> recognizer_;
        std::shared_ptr<const classify::Classifier> classifier_;
        std::unique_ptr<const masking::PiiMasker> masker_;
        bool running_ = false;
    };
}
