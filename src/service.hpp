#pragma once
#include <string>
#include <nlohmann/json.hpp>
#include "masking.hpp"
#include "classifier.hpp"

namespace service {

    struct Reply {
        int status = 200;
        nlohmann::json body;
    };

    // Извлекает email_body; бросает errors::MalformedInput
    std::string parse_email_body(const std::string& request_body);

    /**
     * @brief POST /classify_email
     *
     * 200: input_email_body, list_of_masked_entities, masked_email, category_of_the_email.
     * 400: Content-Type не JSON, тело не JSON, не объект или нет строкового email_body.
     * 500: любая ошибка маскирования или классификации (включая RecognizerUnavailable).
     * Классификатор всегда получает замаскированный текст.
     */
    Reply handle_classify_email(const std::string& content_type,
                                const std::string& request_body,
                                const masking::PiiMasker& masker,
                                const classify::Classifier& classifier);

    Reply handle_health(const rules::PatternRegistry& registry);

    // "email=1 phone_number=2" по list_of_masked_entities: только количества, без самих значений
    std::string summarize_entities(const nlohmann::json& entities);
}
