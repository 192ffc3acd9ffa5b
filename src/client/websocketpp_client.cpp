#include <future>
#include <memory>
#include <system_error>

#include <plog/Log.h>

#include "nostrcast/client/websocketpp_client.hpp"

using namespace nostrcast::client;
using namespace std;

WebsocketppClient::WebsocketppClient(chrono::milliseconds openTimeout)
: _openTimeout(openTimeout)
{
};

WebsocketppClient::~WebsocketppClient()
{
    if (this->_ioThread.joinable())
    {
        this->stop();
    }
};

void WebsocketppClient::start()
{
    this->_client.clear_access_channels(websocketpp::log::alevel::all);
    this->_client.clear_error_channels(websocketpp::log::elevel::all);

    this->_client.init_asio();
    this->_client.start_perpetual();

    this->_client.set_tls_init_handler([](websocketpp::connection_hdl)
    {
        auto context = websocketpp::lib::make_shared<websocketpp::lib::asio::ssl::context>(
            websocketpp::lib::asio::ssl::context::tlsv12_client);
        context->set_default_verify_paths();
        context->set_verify_mode(websocketpp::lib::asio::ssl::verify_peer);
        return context;
    });

    this->_ioThread = thread([this]() { this->_client.run(); });
};

void WebsocketppClient::stop()
{
    unique_lock<mutex> lock(this->_propertyMutex);
    auto handles = this->_connectionHandles;
    this->_connectionHandles.clear();
    this->_pendingHandles.clear();
    this->_messageHandlers.clear();
    lock.unlock();

    for (auto& [uri, handle] : handles)
    {
        error_code error;
        this->_client.close(handle, websocketpp::close::status::going_away, "Client stopped.", error);
    }

    this->_client.stop_perpetual();
    this->_client.stop();

    if (this->_ioThread.joinable())
    {
        this->_ioThread.join();
    }
};

void WebsocketppClient::openConnection(string uri)
{
    error_code error;
    websocketpp_client::connection_ptr connection = this->_client.get_connection(uri, error);

    if (error)
    {
        PLOG_ERROR << "Error connecting to relay " << uri << ": " << error.message();
        return;
    }

    auto opened = make_shared<promise<bool>>();
    auto settled = make_shared<once_flag>();

    connection->set_open_handler([this, uri, opened, settled](websocketpp::connection_hdl handle)
    {
        {
            lock_guard<mutex> lock(this->_propertyMutex);
            this->_pendingHandles.erase(uri);
            this->_connectionHandles[uri] = handle;
        }
        call_once(*settled, [opened]() { opened->set_value(true); });
    });

    connection->set_fail_handler([this, uri, opened, settled](websocketpp::connection_hdl)
    {
        PLOG_ERROR << "Error connecting to relay " << uri << ": Handshake failed.";
        {
            lock_guard<mutex> lock(this->_propertyMutex);
            this->_pendingHandles.erase(uri);
            this->_connectionHandles.erase(uri);
        }
        call_once(*settled, [opened]() { opened->set_value(false); });
    });

    connection->set_close_handler([this, uri](websocketpp::connection_hdl handle)
    {
        bool wasOpen = false;
        {
            lock_guard<mutex> lock(this->_propertyMutex);
            auto it = this->_connectionHandles.find(uri);
            wasOpen = it != this->_connectionHandles.end()
                && !it->second.owner_before(handle)
                && !handle.owner_before(it->second);
            if (wasOpen)
            {
                this->_connectionHandles.erase(it);
            }
        }

        if (wasOpen)
        {
            PLOG_WARNING << "Connection to relay " << uri << " closed unexpectedly.";
            this->_onConnectionLost(uri);
        }
    });

    connection->set_message_handler([this, uri](
        websocketpp::connection_hdl,
        websocketpp_client::message_ptr message)
    {
        function<void(const string&)> handler;
        {
            lock_guard<mutex> lock(this->_propertyMutex);
            auto it = this->_messageHandlers.find(uri);
            if (it == this->_messageHandlers.end())
            {
                return;
            }
            handler = it->second;
        }
        handler(message->get_payload());
    });

    auto openFuture = opened->get_future();

    {
        lock_guard<mutex> lock(this->_propertyMutex);
        this->_pendingHandles[uri] = connection->get_handle();
    }
    this->_client.connect(connection);

    if (openFuture.wait_for(this->_openTimeout) == future_status::timeout)
    {
        PLOG_WARNING << "Timed out waiting for relay " << uri << " to accept the connection.";
    }
};

bool WebsocketppClient::isConnected(string uri)
{
    lock_guard<mutex> lock(this->_propertyMutex);
    return this->_connectionHandles.find(uri) != this->_connectionHandles.end();
};

tuple<string, bool> WebsocketppClient::send(string message, string uri)
{
    error_code error;

    // Make sure the connection isn't closed from under us.
    lock_guard<mutex> lock(this->_propertyMutex);
    auto it = this->_connectionHandles.find(uri);
    if (it == this->_connectionHandles.end())
    {
        return make_tuple(uri, false);
    }

    this->_client.send(
        it->second,
        message,
        websocketpp::frame::opcode::text,
        error);

    if (error)
    {
        PLOG_WARNING << "Failed to send message to relay " << uri << ": " << error.message();
        return make_tuple(uri, false);
    }

    return make_tuple(uri, true);
};

tuple<string, bool> WebsocketppClient::send(
    string message,
    string uri,
    function<void(const string&)> messageHandler)
{
    this->receive(uri, messageHandler);
    return this->send(message, uri);
};

void WebsocketppClient::receive(string uri, function<void(const string&)> messageHandler)
{
    lock_guard<mutex> lock(this->_propertyMutex);
    this->_messageHandlers[uri] = messageHandler;
};

void WebsocketppClient::onConnectionLost(function<void(const string&)> handler)
{
    lock_guard<mutex> lock(this->_propertyMutex);
    this->_connectionLostHandler = handler;
};

void WebsocketppClient::closeConnection(string uri)
{
    unique_lock<mutex> lock(this->_propertyMutex);
    auto it = this->_connectionHandles.find(uri);
    if (it == this->_connectionHandles.end())
    {
        return;
    }

    websocketpp::connection_hdl handle = it->second;
    this->_connectionHandles.erase(it);
    this->_messageHandlers.erase(uri);
    lock.unlock();

    error_code error;
    this->_client.close(
        handle,
        websocketpp::close::status::going_away,
        "Client requested close.",
        error);

    if (error)
    {
        PLOG_WARNING << "Error closing connection to relay " << uri << ": " << error.message();
    }
};

void WebsocketppClient::_onConnectionLost(const string& uri)
{
    function<void(const string&)> handler;
    {
        lock_guard<mutex> lock(this->_propertyMutex);
        handler = this->_connectionLostHandler;
    }

    if (handler)
    {
        handler(uri);
    }
};
