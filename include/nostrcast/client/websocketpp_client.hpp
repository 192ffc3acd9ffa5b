#pragma once

#include <chrono>
#include <mutex>
#include <thread>
#include <unordered_map>

#include <websocketpp/client.hpp>
#include <websocketpp/config/asio_client.hpp>

#include "nostrcast/client/web_socket_client.hpp"

namespace nostrcast
{
namespace client
{
/**
 * @brief An implementation of the `IWebSocketClient` interface that uses the WebSocket++ library.
 * @remark Connections use TLS, so relay URIs are expected to use the `wss://` scheme.
 */
class WebsocketppClient : public IWebSocketClient
{
public:
    explicit WebsocketppClient(std::chrono::milliseconds openTimeout = std::chrono::seconds(10));

    ~WebsocketppClient() override;

    void start() override;

    void stop() override;

    void openConnection(std::string uri) override;

    bool isConnected(std::string uri) override;

    std::tuple<std::string, bool> send(std::string message, std::string uri) override;

    std::tuple<std::string, bool> send(
        std::string message,
        std::string uri,
        std::function<void(const std::string&)> messageHandler) override;

    void receive(std::string uri, std::function<void(const std::string&)> messageHandler) override;

    void onConnectionLost(std::function<void(const std::string&)> handler) override;

    void closeConnection(std::string uri) override;

private:
    typedef websocketpp::client<websocketpp::config::asio_tls_client> websocketpp_client;

    websocketpp_client _client;
    std::thread _ioThread;
    std::chrono::milliseconds _openTimeout;

    ///< Handles of connections that have completed their opening handshake.
    std::unordered_map<std::string, websocketpp::connection_hdl> _connectionHandles;
    ///< Handles of connections that are still opening.
    std::unordered_map<std::string, websocketpp::connection_hdl> _pendingHandles;
    std::unordered_map<std::string, std::function<void(const std::string&)>> _messageHandlers;
    std::function<void(const std::string&)> _connectionLostHandler;
    std::mutex _propertyMutex;

    void _onConnectionLost(const std::string& uri);
};
} // namespace client
} // namespace nostrcast
