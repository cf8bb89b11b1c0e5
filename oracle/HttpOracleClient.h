#pragma once

#include "OptimizationOracle.h"
#include "../config/SchedulerConfig.h"
#include <boost/beast/http.hpp>
#include <string>

namespace RailPlan::Oracle {

/*
 * JSON over HTTP/1.1 POST using Boost.Beast. The whole exchange, name
 * resolution included, is bounded by the caller's timeout.
 */
class HttpOracleClient : public OptimizationOracle {
public:
    explicit HttpOracleClient(const Config::OracleConfig& config);

    OracleResult requestAdjustments(
        const OracleRequest& request,
        int timeoutMs,
        const Resolution::CancellationToken* cancel
    ) override;

    QString name() const override { return "http"; }
    bool isConfigured() const;

private:
    struct Endpoint {
        std::string host;
        std::string port;
        std::string target;
    };

    bool parseEndpoint(Endpoint& endpoint, QString& error) const;
    boost::beast::http::request<boost::beast::http::string_body> buildPostRequest(
        const Endpoint& endpoint,
        const QByteArray& body
    ) const;

    Config::OracleConfig m_config;

    static constexpr int POLL_INTERVAL_MS = 50;
    static constexpr const char* API_KEY_PREFIX = "rw-";
};

} // namespace RailPlan::Oracle
