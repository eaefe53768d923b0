#pragma once

#include "infrastructure/discovery/DiscoveryService.hpp"
#include "infrastructure/network/AsioContext.hpp"
#include "infrastructure/polling/PollCycleRunner.hpp"
#include "infrastructure/probes/ProbeSet.hpp"

#include <asio.hpp>
#include <atomic>
#include <functional>
#include <map>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace fleetwatch::infra {

/**
 * @brief HTTP method enumeration.
 */
enum class HttpMethod { GET, POST, PUT, DELETE, OPTIONS, UNKNOWN };

/**
 * @brief Represents an incoming API request.
 */
struct ApiRequest {
    HttpMethod method{HttpMethod::UNKNOWN};         ///< HTTP method of the request.
    std::string path;                               ///< Request path.
    std::string body;                               ///< Request body content.
    std::map<std::string, std::string> headers;     ///< Lower-case header names.
    std::map<std::string, std::string> queryParams; ///< Query string parameters.
    std::map<std::string, std::string> pathParams;  ///< Path parameters from route matching.
};

/**
 * @brief Represents an API response to send.
 */
struct ApiResponse {
    int statusCode{200};
    std::string statusText{"OK"};
    std::string body;
    std::map<std::string, std::string> headers;

    void setJson(const nlohmann::json& json, int code = 200);

    /**
     * @brief Sets {"detail": message} with the given status.
     */
    void setError(int code, const std::string& message);

    /**
     * @brief Serializes status line, headers and body.
     */
    std::string toString() const;

    nlohmann::json json() const { return nlohmann::json::parse(body); }
};

std::string statusTextFor(int code);

using RouteHandler = std::function<void(const ApiRequest&, ApiResponse&)>;

/**
 * @brief Route definition. Patterns may contain `:name` segments.
 */
struct Route {
    HttpMethod method;
    std::string pattern;
    RouteHandler handler;
    bool requiresAuth{true};
};

/**
 * @brief Services the control API drives.
 */
struct ApiServices {
    std::shared_ptr<DiscoveryService> discovery;
    std::shared_ptr<PollCycleRunner> poller;
    std::shared_ptr<ProbeSet> probes;
};

/**
 * @brief JSON control API for discovery scans, poll cycles and device actions.
 *
 * When an internal token is set, every route except /health requires a
 * matching X-Internal-Token header. Handlers run on the server's I/O pool
 * and may block, so that pool must not be shared with the scanner.
 *
 * @note This class is non-copyable.
 */
class RestApiServer : public std::enable_shared_from_this<RestApiServer> {
public:
    RestApiServer(AsioContext& asioContext, ApiServices services, uint16_t port = 8090);

    ~RestApiServer();

    RestApiServer(const RestApiServer&) = delete;
    RestApiServer& operator=(const RestApiServer&) = delete;

    /**
     * @brief Binds the port and starts accepting connections.
     * @throws asio::system_error if the port cannot be bound.
     */
    void start();

    void stop();

    bool isRunning() const { return running_.load(); }

    void setInternalToken(const std::string& token) { internalToken_ = token; }

    uint16_t port() const { return port_; }

    /**
     * @brief Routes one parsed request, including the token check.
     */
    ApiResponse dispatch(ApiRequest request);

    static ApiRequest parseRequest(const std::string& rawRequest);
    static bool matchRoute(const std::string& pattern, const std::string& path,
                           std::map<std::string, std::string>& pathParams);

private:
    void startAccept();
    void readRequest(std::shared_ptr<asio::ip::tcp::socket> socket);
    void processRequest(std::shared_ptr<asio::ip::tcp::socket> socket, const std::string& rawRequest);
    void sendResponse(std::shared_ptr<asio::ip::tcp::socket> socket, const ApiResponse& response);

    static HttpMethod parseMethod(const std::string& method);
    static std::map<std::string, std::string> parseQueryString(const std::string& queryString);
    bool validateToken(const ApiRequest& request) const;

    void registerRoutes();

    void handleHealth(const ApiRequest& req, ApiResponse& res);

    // Discovery
    void handleStartScan(const ApiRequest& req, ApiResponse& res);
    void handleScanStatus(const ApiRequest& req, ApiResponse& res);
    void handleScanResults(const ApiRequest& req, ApiResponse& res);

    // Polling
    void handlePollCycle(const ApiRequest& req, ApiResponse& res);
    void handlePortTable(const ApiRequest& req, ApiResponse& res);
    void handlePortConfig(const ApiRequest& req, ApiResponse& res);
    void handleAccessPoints(const ApiRequest& req, ApiResponse& res);

    // Media players
    void handleMediaPlayerStatus(const ApiRequest& req, ApiResponse& res);
    void handleMediaPlayerCommand(const ApiRequest& req, ApiResponse& res);

    AsioContext& asioContext_;
    ApiServices services_;
    uint16_t port_;
    std::string internalToken_;
    std::atomic<bool> running_{false};

    std::unique_ptr<asio::ip::tcp::acceptor> acceptor_;
    std::vector<Route> routes_;
};

} // namespace fleetwatch::infra
