#pragma once

#include "domain/errors/DependencyErrors.hpp"
#include <IHttpClient.hpp>
#include <SimpleRequest.hpp>
#include <SimpleResponse.hpp>
#include <string>

namespace matchmaking::adapters::secondary {

/**
 * @brief Один HTTP запрос к зависимости с классификацией сбоев
 *
 * - транспорт не смог отправить / исключение клиента -> TransientDependencyError
 * - 5xx, 408, 429                                   -> TransientDependencyError
 * - прочие 4xx                                      -> PermanentDependencyError
 *
 * Ретраить или нет решает RetryPolicy по типу исключения.
 */
inline SimpleResponse sendToDependency(IHttpClient& httpClient,
                                       const std::string& dependency,
                                       const SimpleRequest& request)
{
    SimpleResponse response;
    bool sent = false;
    try {
        sent = httpClient.send(request, response);
    } catch (const std::exception& e) {
        throw domain::TransientDependencyError(dependency, std::string("transport error: ") + e.what());
    }

    if (!sent) {
        throw domain::TransientDependencyError(dependency, "request was not delivered");
    }

    int status = response.getStatus();
    if (status >= 500 || status == 408 || status == 429) {
        throw domain::TransientDependencyError(dependency, "HTTP " + std::to_string(status));
    }
    if (status >= 400) {
        throw domain::PermanentDependencyError(dependency, "HTTP " + std::to_string(status));
    }
    return response;
}

} // namespace matchmaking::adapters::secondary
