#include "runtime.hpp"
#include <iostream>
#include <stdexcept>

namespace runtime {

    std::unique_ptr<Runtime> Runtime::start(const config::Options& options) {
        // 1. Таблица правил: ошибка компиляции любого правила фатальна
        std::shared_ptr<const rules::PatternRegistry> registry =
            std::make_shared<rules::PatternRegistry>(rules::PatternRegistry::build_default());
        std::cout << "Loaded " << registry->size() << " pattern rules (table version "
            << rules::kRuleTableVersion << ")" << std::endl;

        // 2. Распознаватель имён
        std::shared_ptr<const ner::EntityRecognizer> recognizer;
        if (options.regex_only) {
            std::cerr << "Warning: --regex-only is set, person recognizer disabled; "
                "names are masked by pattern rules only" << std::endl;
            recognizer = std::make_shared<ner::NullRecognizer>();
        }
        else {
            auto gazetteer = ner::GazetteerRecognizer::load_from_file(options.names_path);
            std::cout << "Person recognizer: " << gazetteer->size() << " given names from "
                << options.names_path << std::endl;
            recognizer = gazetteer;
        }

        // 3. Классификатор
        auto classifier = classify::NaiveBayesClassifier::load_from_file(options.model_path);
        std::cout << "Classifier loaded from " << options.model_path << " with "
            << classifier->labels().size() << " categories" << std::endl;

        return std::make_unique<Runtime>(registry, recognizer, classifier);
    }

    Runtime::Runtime(std::shared_ptr<const rules::PatternRegistry> registry,
                     std::shared_ptr<const ner::EntityRecognizer> recognizer,
                     std::shared_ptr<const classify::Classifier> classifier)
        : registry_(std::move(registry)),
          recognizer_(std::move(recognizer)),
          classifier_(std::move(classifier)) {
        if (!registry_ || !recognizer_ || !classifier_) {
            throw std::invalid_argument("Runtime requires a registry, a recognizer and a classifier");
        }
        masker_ = std::make_unique<const masking::PiiMasker>(analyze::SpanCollector(recognizer_, registry_));
        running_ = true;
    }

    void Runtime::ensure_running() const {
        if (!running_) {
            throw std::logic_error("Runtime is shut down");
        }
    }

    const masking::PiiMasker& Runtime::masker() const {
        ensure_running();
        return *masker_;
    }

    const classify::Classifier& Runtime::classifier() const {
        ensure_running();
        return *classifier_;
    }

    const rules::PatternRegistry& Runtime::registry() const {
        ensure_running();
        return *registry_;
    }

    const ner::EntityRecognizer& Runtime::recognizer() const {
        ensure_running();
        return *recognizer_;
    }

    void Runtime::shutdown() {
        if (!running_) return;
        running_ = false;
        masker_.reset();
        classifier_.reset();
        recognizer_.reset();
        registry_.reset();
    }
}
