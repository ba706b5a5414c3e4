#pragma once
#include <string>
#include <vector>
#include <unordered_map>
#include <memory>
#include <nlohmann/json.hpp>

namespace classify {

    // Внешний классификатор категории письма. Получает уже замаскированный текст.
    class Classifier {
    public:
        virtual ~Classifier() = default;

        virtual std::string classify(const std::string& text) const = 0;

        virtual std::vector<std::string> labels() const = 0;
    };

    /**
     * @brief Мультиномиальный наивный Байес поверх TF-IDF признаков.
     *
     * Модель обучается вне сервиса и передаётся JSON-файлом:
     *   labels, vocabulary {термин: индекс}, idf, class_log_prior,
     *   feature_log_prob [метка][термин], ngram_range [min, max].
     */
    class NaiveBayesClassifier : public Classifier {
    public:
        // Бросает errors::ModelLoadError при несогласованных размерностях
        static std::shared_ptr<NaiveBayesClassifier> from_json(const nlohmann::json& model);

        // Бросает errors::ModelLoadError, если файл не читается или не разбирается
        static std::shared_ptr<NaiveBayesClassifier> load_from_file(const std::string& path);

        std::string classify(const std::string& text) const override;
        std::vector<std::string> labels() const override { return labels_; }

        // L2-нормированный TF-IDF вектор (разреженный: индекс термина -> вес)
        std::unordered_map<size_t, double> vectorize(const std::string& text) const;

    private:
        std::vector<std::string> labels_;
        std::unordered_map<std::string, size_t> vocabulary_;
        std::vector<double> idf_;
        std::vector<double> class_log_prior_;
        std::vector<std::vector<double>> feature_log_prob_;
        size_t ngram_min_ = 1;
        size_t ngram_max_ = 2;
    };
}
