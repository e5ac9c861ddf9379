#include "GatewayServer.hpp"

#include "Errors.hpp"
#include "Logger.hpp"
#include "Session.hpp"
#include "Transport.hpp"

#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/un.h>
#include <unistd.h>

#define MODULE "SERVER"

#define LISTEN_BACKLOG 16

static int set_cloexec(int fd) { return fcntl(fd, F_SETFD, fcntl(fd, F_GETFD) | FD_CLOEXEC); }

static std::string peer_name(const sockaddr_storage &ss, socklen_t len)
{
    if (ss.ss_family == AF_UNIX)
        return "unix";

    char host[NI_MAXHOST];
    char serv[NI_MAXSERV];
    if (getnameinfo((const sockaddr *)&ss, len, host, sizeof(host), serv, sizeof(serv),
                    NI_NUMERICHOST | NI_NUMERICSERV) != 0)
        return "?";
    return std::string(host) + ":" + serv;
}

bool Endpoint::parse(const std::string &uri, Endpoint &out)
{
    if (uri.rfind("unix://", 0) == 0)
    {
        out.kind = Unix;
        out.path = uri.substr(7);
        return !out.path.empty() && out.path.size() < sizeof(sockaddr_un::sun_path);
    }
    if (uri.rfind("tcp://", 0) != 0)
        return false;

    std::string rest = uri.substr(6);
    size_t colon;
    if (!rest.empty() && rest[0] == '[')
    {
        size_t close = rest.find(']');
        if (close == std::string::npos || close + 1 >= rest.size() || rest[close + 1] != ':')
            return false;
        out.host = rest.substr(1, close - 1);
        colon = close + 1;
    }
    else
    {
        colon = rest.rfind(':');
        if (colon == std::string::npos)
            return false;
        out.host = rest.substr(0, colon);
    }

    std::string port = rest.substr(colon + 1);
    if (port.empty() || port.find_first_not_of("0123456789") != std::string::npos || port.size() > 5)
        return false;
    out.port = std::stoi(port);
    out.kind = Tcp;
    return out.port <= 65535;
}

GatewayServer::GatewayServer(const std::string &uri, int maxConnections, const CodecLimits &limits,
                             const SessionContext &ctx)
    : max_connections_(maxConnections), limits_(limits), ctx_(ctx)
{
    if (!Endpoint::parse(uri, endpoint_))
        throw TransportError("invalid server uri: " + uri);
}

GatewayServer::~GatewayServer() { stop(); }

int GatewayServer::open_listener()
{
    if (endpoint_.kind == Endpoint::Unix)
    {
        ::unlink(endpoint_.path.c_str());

        int s = socket(AF_UNIX, SOCK_STREAM, 0);
        if (s < 0)
            throw TransportError(std::string("socket() failed: ") + strerror(errno));
        set_cloexec(s);

        sockaddr_un sa{};
        sa.sun_family = AF_UNIX;
        std::strncpy(sa.sun_path, endpoint_.path.c_str(), sizeof(sa.sun_path) - 1);
        if (bind(s, (sockaddr *)&sa, sizeof(sa)) < 0)
        {
            int err = errno;
            close(s);
            throw TransportError("bind(" + endpoint_.path + ") failed: " + strerror(err));
        }
        ::chmod(endpoint_.path.c_str(), 0660);
        return s;
    }

    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_flags = AI_PASSIVE | AI_NUMERICSERV;

    addrinfo *res = nullptr;
    std::string port = std::to_string(endpoint_.port);
    const char *host = endpoint_.host.empty() ? nullptr : endpoint_.host.c_str();
    int rc = getaddrinfo(host, port.c_str(), &hints, &res);
    if (rc != 0)
        throw TransportError("cannot resolve " + endpoint_.host + ": " + gai_strerror(rc));

    int s = -1;
    std::string lastError = "no usable address";
    for (addrinfo *ai = res; ai; ai = ai->ai_next)
    {
        s = socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (s < 0)
        {
            lastError = strerror(errno);
            continue;
        }
        set_cloexec(s);
        int one = 1;
        setsockopt(s, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));
        if (bind(s, ai->ai_addr, ai->ai_addrlen) == 0)
            break;
        lastError = strerror(errno);
        close(s);
        s = -1;
    }
    freeaddrinfo(res);

    if (s < 0)
        throw TransportError("bind(" + endpoint_.host + ":" + port + ") failed: " + lastError);

    sockaddr_storage bound{};
    socklen_t len = sizeof(bound);
    if (getsockname(s, (sockaddr *)&bound, &len) == 0)
    {
        if (bound.ss_family == AF_INET)
            port_ = ntohs(((sockaddr_in *)&bound)->sin_port);
        else if (bound.ss_family == AF_INET6)
            port_ = ntohs(((sockaddr_in6 *)&bound)->sin6_port);
    }
    return s;
}

void GatewayServer::start()
{
    bool expected = false;
    if (!running_.compare_exchange_strong(expected, true))
        return;

    try
    {
        listen_fd_ = open_listener();
        if (listen(listen_fd_, LISTEN_BACKLOG) < 0)
        {
            int err = errno;
            close(listen_fd_);
            listen_fd_ = -1;
            throw TransportError(std::string("listen failed: ") + strerror(err));
        }
    }
    catch (const TransportError &)
    {
        running_ = false;
        throw;
    }

    if (endpoint_.kind == Endpoint::Unix)
    {
        LOG_INFO("listening on unix://" << endpoint_.path);
    }
    else
    {
        LOG_INFO("listening on tcp://" << endpoint_.host << ":" << port_);
    }

    th_ = std::thread(&GatewayServer::server_loop, this);
}

void GatewayServer::stop()
{
    bool expected = true;
    if (!running_.compare_exchange_strong(expected, false))
        return;

    // Wakes the blocked accept(); unix listeners also get a connection of our own
    ::shutdown(listen_fd_, SHUT_RDWR);
    if (endpoint_.kind == Endpoint::Unix)
    {
        int fd = socket(AF_UNIX, SOCK_STREAM, 0);
        if (fd >= 0)
        {
            sockaddr_un sa{};
            sa.sun_family = AF_UNIX;
            std::strncpy(sa.sun_path, endpoint_.path.c_str(), sizeof(sa.sun_path) - 1);
            connect(fd, (sockaddr *)&sa, sizeof(sa));
            close(fd);
        }
    }
    if (th_.joinable())
        th_.join();
    close(listen_fd_);
    listen_fd_ = -1;
    if (endpoint_.kind == Endpoint::Unix)
        ::unlink(endpoint_.path.c_str());

    std::map<uint64_t, std::thread> threads;
    {
        std::unique_lock<std::mutex> lock(clients_mutex_);
        if (!clients_.empty())
            LOG_INFO("closing " << clients_.size() << " client connection(s)");
        for (int fd : clients_)
            ::shutdown(fd, SHUT_RDWR);
        clients_done_.wait(lock, [this] { return clients_.empty(); });
        threads.swap(client_threads_);
        finished_clients_.clear();
    }
    // The accept thread is gone, nothing adds clients any more
    for (auto &entry : threads)
    {
        if (entry.second.joinable())
            entry.second.join();
    }

    LOG_INFO("server stopped");
}

size_t GatewayServer::activeConnections() const
{
    std::lock_guard<std::mutex> lock(clients_mutex_);
    return clients_.size();
}

void GatewayServer::server_loop()
{
    while (running_)
    {
        sockaddr_storage ss{};
        socklen_t len = sizeof(ss);
        int c = accept(listen_fd_, (sockaddr *)&ss, &len);
        if (c < 0)
        {
            if (errno == EINTR)
                continue;
            if (!running_)
                break;
            LOG_ERROR("accept failed: " << strerror(errno));
            usleep(100 * 1000);
            continue;
        }
        if (!running_)
        {
            close(c);
            break;
        }
        set_cloexec(c);

        if (ss.ss_family == AF_INET || ss.ss_family == AF_INET6)
        {
            int one = 1;
            setsockopt(c, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));
        }

        std::string peer = peer_name(ss, len);
        std::lock_guard<std::mutex> lock(clients_mutex_);
        reap_clients();
        if (!running_ || (int)clients_.size() >= max_connections_)
        {
            LOG_WARN("rejecting " << peer << ": " << clients_.size() << " connections active");
            close(c);
            continue;
        }
        clients_.insert(c);

        // One thread per client; it registers as finished under clients_mutex_,
        // so it cannot run ahead of its own entry in client_threads_
        uint64_t id = next_client_id_++;
        client_threads_.emplace(id, std::thread([this, c, id, peer]() {
            handle_client(c, peer);
            release_client(c, id);
        }));
    }
}

void GatewayServer::release_client(int fd, uint64_t id)
{
    std::lock_guard<std::mutex> lock(clients_mutex_);
    close(fd);
    clients_.erase(fd);
    finished_clients_.push_back(id);
    clients_done_.notify_all();
}

// Joins client threads that have released their connection. Caller holds clients_mutex_.
void GatewayServer::reap_clients()
{
    for (uint64_t id : finished_clients_)
    {
        auto it = client_threads_.find(id);
        if (it == client_threads_.end())
            continue;
        if (it->second.joinable())
            it->second.join();
        client_threads_.erase(it);
    }
    finished_clients_.clear();
}

void GatewayServer::handle_client(int fd, const std::string &peer)
{
    LOG_INFO(peer << ": connected");

    SocketTransport transport(fd);
    EventReader reader(transport, limits_);
    EventWriter writer(transport);
    Session session(writer, ctx_, peer);

    try
    {
        while (std::optional<Event> event = reader.next())
        {
            LOG_DDEBUG(peer << ": <- " << eventTypeName(*event));
            session.handle(*event);
        }
        LOG_INFO(peer << ": disconnected after " << session.requestsHandled() << " request(s)");
    }
    catch (const ProtocolError &e)
    {
        LOG_WARN(peer << ": protocol error, closing connection: " << e.what());
    }
    catch (const TransportError &e)
    {
        LOG_INFO(peer << ": connection lost: " << e.what());
    }
    catch (const std::exception &e)
    {
        LOG_ERROR(peer << ": session aborted: " << e.what());
    }
}
