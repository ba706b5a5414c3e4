#include "classifier.hpp"
#include "errors.hpp"
#include "utils.hpp"
#include <fstream>
#include <cmath>

namespace classify {

    using json = nlohmann::json;

    std::shared_ptr<NaiveBayesClassifier> NaiveBayesClassifier::from_json(const json& model) {
        auto clf = std::make_shared<NaiveBayesClassifier>();

        try {
            clf->labels_ = model.at("labels").get<std::vector<std::string>>();
            clf->vocabulary_ = model.at("vocabulary").get<std::unordered_map<std::string, size_t>>();
            clf->idf_ = model.at("idf").get<std::vector<double>>();
            clf->class_log_prior_ = model.at("class_log_prior").get<std::vector<double>>();
            clf->feature_log_prob_ = model.at("feature_log_prob").get<std::vector<std::vector<double>>>();
            if (model.contains("ngram_range")) {
                auto range = model.at("ngram_range").get<std::vector<size_t>>();
                if (range.size() != 2) {
                    throw errors::ModelLoadError("ngram_range must have two elements");
                }
                clf->ngram_min_ = range[0];
                clf->ngram_max_ = range[1];
            }
        }
        catch (const json::exception& e) {
            throw errors::ModelLoadError(std::string("malformed model: ") + e.what());
        }

        // Проверка согласованности размерностей
        if (clf->labels_.empty()) {
            throw errors::ModelLoadError("model has no labels");
        }
        if (clf->ngram_min_ == 0 || clf->ngram_min_ > clf->ngram_max_) {
            throw errors::ModelLoadError("invalid ngram_range");
        }
        size_t n_terms = clf->idf_.size();
        for (const auto& [term, idx] : clf->vocabulary_) {
            if (idx >= n_terms) {
                throw errors::ModelLoadError("vocabulary index out of range for term '" + term + "'");
            }
        }
        if (clf->class_log_prior_.size() != clf->labels_.size()
            || clf->feature_log_prob_.size() != clf->labels_.size()) {
            throw errors::ModelLoadError("class dimensions do not match label count");
        }
        for (const auto& row : clf->feature_log_prob_) {
            if (row.size() != n_terms) {
                throw errors::ModelLoadError("feature_log_prob row size does not match idf size");
            }
        }

        return clf;
    }

    std::shared_ptr<NaiveBayesClassifier> NaiveBayesClassifier::load_from_file(const std::string& path) {
        std::ifstream file(path);
        if (!file.is_open()) {
            throw errors::ModelLoadError("cannot open " + path);
        }

        json model;
        try {
            model = json::parse(file);
        }
        catch (const json::parse_error& e) {
            throw errors::ModelLoadError(path + ": " + e.what());
        }
        return from_json(model);
    }

    std::unordered_map<size_t, double> NaiveBayesClassifier::vectorize(const std::string& text) const {
        auto words = utils::split_words(utils::normalize_text_for_classifier(text));

        std::unordered_map<size_t, double> features;
        for (size_t n = ngram_min_; n <= ngram_max_; ++n) {
            if (words.size() < n) break;
            for (size_t i = 0; i + n <= words.size(); ++i) {
                std::string term = words[i];
                for (size_t k = 1; k < n; ++k) {
                    term += ' ';
                    term += words[i + k];
                }
                auto it = vocabulary_.find(term);
                if (it != vocabulary_.end()) {
                    features[it->second] += 1.0;
                }
            }
        }

        double norm = 0.0;
        for (auto& [idx, value] : features) {
            value *= idf_[idx];
            norm += value * value;
        }
        if (norm > 0.0) {
            norm = std::sqrt(norm);
            for (auto& [idx, value] : features) {
                value /= norm;
            }
        }
        return features;
    }

    std::string NaiveBayesClassifier::classify(const std::string& text) const {
        auto features = vectorize(text);

        size_t best = 0;
        double best_score = -INFINITY;
        for (size_t c = 0; c < labels_.size(); ++c) {
            double score = class_log_prior_[c];
            for (const auto& [idx, value] : features) {
                score += value * feature_log_prob_[c][idx];
            }
            if (score > best_score) {
                best_score = score;
                best = c;
            }
        }
        return labels_[best];
    }
}
