#include "service.hpp"
#include "errors.hpp"
#include <iostream>
#include <map>
#include <sstream>

namespace service {

    using json = nlohmann::json;

    namespace {
        const char* const kMissingBody = "Missing email_body in request";

        Reply error_reply(int status, const std::string& message) {
            return Reply{ status, json{ {"error", message} } };
        }
    }

    std::string parse_email_body(const std::string& request_body) {
        json req_json;
        try {
            req_json = json::parse(request_body);
        }
        catch (const json::parse_error&) {
            throw errors::MalformedInput(kMissingBody);
        }

        if (!req_json.is_object() || !req_json.contains("email_body") || !req_json["email_body"].is_string()) {
            throw errors::MalformedInput(kMissingBody);
        }
        return req_json["email_body"].get<std::string>();
    }

    Reply handle_classify_email(const std::string& content_type,
                                const std::string& request_body,
                                const masking::PiiMasker& masker,
                                const classify::Classifier& classifier) {
        if (content_type.find("application/json") == std::string::npos) {
            return error_reply(400, kMissingBody);
        }

        std::string email_body;
        try {
            email_body = parse_email_body(request_body);
        }
        catch (const errors::MalformedInput& e) {
            return error_reply(400, e.what());
        }

        try {
            auto result = masker.mask(email_body);
            std::string category = classifier.classify(result.masked_text);

            json response = {
                {"input_email_body", email_body},
                {"list_of_masked_entities", result.entities},
                {"masked_email", result.masked_text},
                {"category_of_the_email", category}
            };
            return Reply{ 200, response };
        }
        catch (const std::exception& e) {
            std::cerr << "Request failed: " << e.what() << std::endl;
            return error_reply(500, e.what());
        }
    }

    Reply handle_health(const rules::PatternRegistry& registry) {
        return Reply{ 200, json{
            {"status", "ok"},
            {"rules", registry.size()},
            {"rule_table_version", rules::kRuleTableVersion}
        } };
    }

    std::string summarize_entities(const json& entities) {
        std::map<std::string, size_t> counts;
        for (const auto& e : entities) {
            counts[e.value("classification", std::string("unknown"))]++;
        }

        std::ostringstream ss;
        bool first = true;
        for (const auto& [label, count] : counts) {
            if (!first) ss << ' ';
            ss << label << '=' << count;
            first = false;
        }
        return ss.str();
    }
}
