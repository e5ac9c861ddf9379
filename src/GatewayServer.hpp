#ifndef GATEWAY_SERVER_HPP
#define GATEWAY_SERVER_HPP

#include "ProtocolCodec.hpp"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

struct SessionContext;

struct Endpoint
{
    enum Kind
    {
        Tcp,
        Unix
    };

    Kind kind = Tcp;
    std::string host;
    int port = 0;
    std::string path;

    // Accepts tcp://host:port, tcp://[v6addr]:port and unix:///path.
    static bool parse(const std::string &uri, Endpoint &out);
};

/**
 * Accepts protocol connections and runs one Session per client thread.
 *
 * A protocol or transport error ends only the offending connection.
 * stop() wakes every client blocked on its socket and waits for all of
 * them to finish; a client in the middle of a backend call finishes that
 * call first.
 */
class GatewayServer {
public:
    GatewayServer(const std::string &uri, int maxConnections, const CodecLimits &limits,
                  const SessionContext &ctx);
    ~GatewayServer();

    // Binds and starts the accept thread. Throws TransportError.
    void start();
    void stop();

    // Bound TCP port, 0 for unix sockets.
    int port() const { return port_; }
    size_t activeConnections() const;

private:
    int open_listener();
    void server_loop();
    void handle_client(int fd, const std::string &peer);
    void release_client(int fd, uint64_t id);
    void reap_clients();

    Endpoint endpoint_;
    int max_connections_;
    CodecLimits limits_;
    const SessionContext &ctx_;

    std::thread th_;
    std::atomic<bool> running_{false};
    int listen_fd_ = -1;
    int port_ = 0;

    mutable std::mutex clients_mutex_;
    std::condition_variable clients_done_;
    std::set<int> clients_;
    // Client threads by id; finished ones are joined by the accept thread or stop()
    std::map<uint64_t, std::thread> client_threads_;
    std::vector<uint64_t> finished_clients_;
    uint64_t next_client_id_ = 0;
};

#endif // GATEWAY_SERVER_HPP
