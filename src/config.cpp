#include "config.hpp"

namespace config {

    void configure(CLI::App& app, Options& options) {
        app.add_option("--host", options.host, "Host to listen on (default: 0.0.0.0)")
            ->type_name("HOST");
        app.add_option("--port", options.port, "Port to listen on (default: 7860)")
            ->type_name("PORT")
            ->envname("PORT")
            ->check(CLI::Range(1, 65535));
        app.add_option("--names", options.names_path, "Given-name list for the person recognizer")
            ->type_name("PATH");
        app.add_option("--model", options.model_path, "Trained email classifier (JSON)")
            ->type_name("PATH");
        app.add_flag("--regex-only", options.regex_only,
            "Disable the person recognizer and mask with pattern rules only");
        app.add_option("--threads", options.threads, "HTTP worker threads (default: hardware concurrency)")
            ->type_name("N");
        app.add_flag("-v,--verbose", options.verbose, "Log a per-request entity summary");
    }
}
