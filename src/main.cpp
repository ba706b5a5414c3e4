#include <iostream>
#include <string>
#include <thread>
#include <algorithm>
#include <memory>

#include "crow.h"
#include <nlohmann/json.hpp>
#include "CLI/CLI.hpp"

#include "config.hpp"
#include "runtime.hpp"
#include "service.hpp"

namespace {

    crow::response to_crow(const service::Reply& reply) {
        crow::response res(reply.status, reply.body.dump());
        res.set_header("Content-Type", "application/json; charset=utf-8");
        return res;
    }
}

int main(int argc, char* argv[]) {
    // --- CLI11 Setup ---
    CLI::App app{ "PII masking and email classification HTTP service" };

    config::Options options;
    config::configure(app, options);

    try {
        app.parse(argc, argv);
    }
    catch (const CLI::ParseError& e) {
        return app.exit(e);
    }

    // Модели и таблица правил загружаются до приёма первого запроса
    std::unique_ptr<runtime::Runtime> rt;
    try {
        rt = runtime::Runtime::start(options);
    }
    catch (const std::exception& e) {
        std::cerr << "Startup failed: " << e.what() << std::endl;
        return 1;
    }

    try {
        // --- Crow Setup ---
        crow::SimpleApp crow_app;

        CROW_ROUTE(crow_app, "/health")
            ([&]() {
            return to_crow(service::handle_health(rt->registry()));
                });

        CROW_ROUTE(crow_app, "/classify_email")
            .methods("POST"_method)
            ([&](const crow::request& req) {
            auto reply = service::handle_classify_email(req.get_header_value("Content-Type"), req.body,
                rt->masker(), rt->classifier());

            if (options.verbose && reply.status == 200) {
                std::cout << "classify_email: category=" << reply.body["category_of_the_email"].get<std::string>()
                    << " entities: " << service::summarize_entities(reply.body["list_of_masked_entities"]) << std::endl;
            }
            return to_crow(reply);
                });

        unsigned threads = options.threads != 0 ? options.threads : std::max(1u, std::thread::hardware_concurrency());

        std::cout << "Starting PII masking service on " << options.host << ":" << options.port
            << " (" << threads << " threads, recognizer: " << rt->recognizer().name() << ")" << std::endl;
        std::cout << "API /classify_email expects POST requests with field 'email_body'." << std::endl;

        crow_app.bindaddr(options.host).port(static_cast<uint16_t>(options.port)).concurrency(threads).run();
    }
    catch (const std::exception& e) {
        std::cerr << "Server error: " << e.what() << std::endl;
        rt->shutdown();
        return 1;
    }

    rt->shutdown();
    std::cout << "Service stopped." << std::endl;
    return 0;
}
