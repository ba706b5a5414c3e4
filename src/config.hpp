#pragma once
#include <string>
#include "CLI/CLI.hpp"

namespace config {

    struct Options {
        std::string host = "0.0.0.0";
        int port = 7860;
        std::string names_path = "data/names.txt";
        std::string model_path = "data/email_classifier.json";
        // Явный, задокументированный отказ от распознавателя имён: только правила
        bool regex_only = false;
        unsigned threads = 0;   // 0 - по числу ядер
        bool verbose = false;
    };

    // Регистрирует опции командной строки; PORT из окружения переопределяет порт по умолчанию
    void configure(CLI::App& app, Options& options);
}
