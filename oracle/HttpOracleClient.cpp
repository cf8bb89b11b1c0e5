#include "HttpOracleClient.h"
#include "../core/ErrorCodes.h"
#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/version.hpp>
#include <QUrl>
#include <QElapsedTimer>
#include <QDebug>
#include <chrono>

namespace RailPlan::Oracle {

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace http = boost::beast::http;
using tcp = boost::asio::ip::tcp;

HttpOracleClient::HttpOracleClient(const Config::OracleConfig& config)
    : m_config(config)
{
}

bool HttpOracleClient::isConfigured() const {
    Endpoint endpoint;
    QString error;
    return parseEndpoint(endpoint, error);
}

bool HttpOracleClient::parseEndpoint(Endpoint& endpoint, QString& error) const {
    QUrl url(m_config.endpoint);
    if (!url.isValid() || url.host().isEmpty()) {
        error = QString("Invalid oracle endpoint: %1").arg(m_config.endpoint);
        return false;
    }
    if (url.scheme() != "http") {
        error = QString("Unsupported oracle scheme: %1").arg(url.scheme());
        return false;
    }

    endpoint.host = url.host().toStdString();
    endpoint.port = std::to_string(url.port(80));

    QString target = url.path(QUrl::FullyEncoded);
    if (target.isEmpty()) {
        target = "/";
    }
    if (url.hasQuery()) {
        target += "?" + url.query(QUrl::FullyEncoded);
    }
    endpoint.target = target.toStdString();
    return true;
}

http::request<http::string_body> HttpOracleClient::buildPostRequest(const Endpoint& endpoint, const QByteArray& body) const {
    http::request<http::string_body> request(http::verb::post, endpoint.target, 11);
    request.set(http::field::host, endpoint.host);
    request.set(http::field::user_agent, BOOST_BEAST_VERSION_STRING);
    request.set(http::field::content_type, "application/json");
    request.set(http::field::accept, "application/json");

    if (!m_config.apiKey.isEmpty()) {
        std::string key = m_config.apiKey.toStdString();
        if (key.rfind(API_KEY_PREFIX, 0) != 0) {
            key = API_KEY_PREFIX + key;
        }
        request.set("X-API-Key", key);
    }
    if (!m_config.bearerToken.isEmpty()) {
        request.set(http::field::authorization, "Bearer " + m_config.bearerToken.toStdString());
    }

    request.body() = body.toStdString();
    request.prepare_payload();
    return request;
}

OracleResult HttpOracleClient::requestAdjustments(
    const OracleRequest& request,
    int timeoutMs,
    const Resolution::CancellationToken* cancel
) {
    QElapsedTimer timer;
    timer.start();

    OracleResult result;
    result.errorCode = ErrorCode::ORACLE_UNAVAILABLE;

    Endpoint endpoint;
    QString endpointError;
    if (!parseEndpoint(endpoint, endpointError)) {
        result.error = endpointError;
        qWarning() << "[HttpOracleClient > requestAdjustments]" << result.error;
        return result;
    }

    try {
        asio::io_context ioc;
        tcp::resolver resolver(ioc);
        beast::tcp_stream stream(ioc);
        beast::flat_buffer buffer;
        http::request<http::string_body> httpRequest = buildPostRequest(endpoint, request.toJsonBytes());
        http::response<http::string_body> httpResponse;

        beast::error_code failure;
        bool finished = false;
        bool abortedByCaller = false;
        bool timedOut = false;

        const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeoutMs);

        resolver.async_resolve(endpoint.host, endpoint.port,
            [&](beast::error_code ec, tcp::resolver::results_type results) {
                if (ec) {
                    failure = ec;
                    finished = true;
                    return;
                }
                stream.expires_at(deadline);
                stream.async_connect(results, [&](beast::error_code ec, tcp::endpoint) {
                    if (ec) {
                        failure = ec;
                        finished = true;
                        return;
                    }
                    stream.expires_at(deadline);
                    http::async_write(stream, httpRequest, [&](beast::error_code ec, std::size_t) {
                        if (ec) {
                            failure = ec;
                            finished = true;
                            return;
                        }
                        stream.expires_at(deadline);
                        http::async_read(stream, buffer, httpResponse, [&](beast::error_code ec, std::size_t) {
                            failure = ec;
                            finished = true;
                        });
                    });
                });
            });

        // Poll so the caller's cancellation and the resolver are bounded too
        while (!finished && !ioc.stopped()) {
            ioc.run_for(std::chrono::milliseconds(POLL_INTERVAL_MS));

            if (finished) {
                break;
            }
            if (cancel && cancel->isCancelled() && !abortedByCaller) {
                abortedByCaller = true;
                resolver.cancel();
                stream.cancel();
            }
            if (std::chrono::steady_clock::now() >= deadline && !timedOut) {
                timedOut = true;
                resolver.cancel();
                stream.cancel();
            }
        }

        beast::error_code shutdownError;
        stream.socket().shutdown(tcp::socket::shutdown_both, shutdownError);

        result.roundTripMs = timer.elapsed();

        if (abortedByCaller) {
            result.errorCode = ErrorCode::CANCELLED;
            result.error = "Oracle request cancelled";
            return result;
        }
        if (timedOut || failure == beast::error::timeout) {
            result.error = QString("Oracle request timed out after %1 ms").arg(timeoutMs);
            qWarning() << "[HttpOracleClient > requestAdjustments]" << result.error;
            return result;
        }
        if (failure) {
            result.error = QString("Oracle transport error: %1").arg(QString::fromStdString(failure.message()));
            qWarning() << "[HttpOracleClient > requestAdjustments]" << result.error;
            return result;
        }
        if (!finished) {
            result.error = "Oracle exchange ended without a response";
            qWarning() << "[HttpOracleClient > requestAdjustments]" << result.error;
            return result;
        }

        const int status = httpResponse.result_int();
        if (status != 200) {
            result.error = QString("Oracle returned HTTP %1: %2")
                               .arg(status)
                               .arg(QString::fromStdString(httpResponse.body()).left(200));
            qWarning() << "[HttpOracleClient > requestAdjustments]" << result.error;
            return result;
        }

        QString decodeError;
        auto decoded = OracleResponse::fromJson(QByteArray::fromStdString(httpResponse.body()), &decodeError);
        if (!decoded) {
            result.error = decodeError;
            qWarning() << "[HttpOracleClient > requestAdjustments]" << result.error;
            return result;
        }
        if (!decoded->success) {
            result.error = "Oracle reported an unsuccessful optimization";
            qWarning() << "[HttpOracleClient > requestAdjustments]" << result.error;
            return result;
        }

        result.success = true;
        result.errorCode.clear();
        result.response = *decoded;

        qDebug() << "[HttpOracleClient > requestAdjustments] Received" << decoded->resolutions.size()
                 << "resolutions in" << result.roundTripMs << "ms";
        return result;

    } catch (const std::exception& e) {
        result.roundTripMs = timer.elapsed();
        result.error = QString("Oracle request failed: %1").arg(e.what());
        qCritical() << "[HttpOracleClient > requestAdjustments]" << result.error;
        return result;
    }
}

} // namespace RailPlan::Oracle
