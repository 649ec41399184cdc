// src/linux_epoll_proxy.cpp
// Linux epoll TCP proxy that intercepts WebSocket sessions.
//
// Each accepted client gets one upstream connection. The HTTP Upgrade
// handshake passes through verbatim while both heads are recorded on the
// flow; a 101 response hands the connection pair to a WebSocketLayer and
// every later byte is relayed through it. Anything that is not a
// WebSocket upgrade is piped through untouched.
//
// Notes:
// - Uses epoll.data.fd everywhere (no ptr/fd mixing).
// - Handles nonblocking upstream connect (EINPROGRESS).
// - EPOLLOUT is enabled whenever outq has data.
// - A peer the layer asked to close is closed once its outq drains.
// - Closes fds with epoll DEL + fdctx cleanup before close().

#include "net/proxy.hpp"
#include "net/http_head.hpp"
#include "net/stream_buffer.hpp"
#include "relay/websocket_layer.hpp"

#include <sys/epoll.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <arpa/inet.h>
#include <netdb.h>
#include <fcntl.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <cstdio>

#include <deque>
#include <memory>
#include <string>
#include <unordered_map>

// ---------- utils ----------
static std::string last_err() { return std::string(std::strerror(errno)); }

static int set_nonblocking(int fd) {
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags < 0) return -1;
    return fcntl(fd, F_SETFL, flags | O_NONBLOCK);
}

static void close_quiet(int fd) {
    if (fd >= 0) ::close(fd);
}

static uint32_t base_events(bool want_write) {
    uint32_t ev = EPOLLIN | EPOLLRDHUP | EPOLLERR;
    if (want_write) ev |= EPOLLOUT;
    return ev;
}

static addrinfo* resolve(const std::string& host, uint16_t port, bool passive) {
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    if (passive) hints.ai_flags = AI_PASSIVE;

    char portbuf[16];
    std::snprintf(portbuf, sizeof(portbuf), "%u", port);

    addrinfo* res = nullptr;
    int rc = getaddrinfo(host.c_str(), portbuf, &hints, &res);
    if (rc != 0) {
        std::fprintf(stderr, "getaddrinfo(%s) failed: %s\n", host.c_str(), gai_strerror(rc));
        return nullptr;
    }
    return res;
}

// ---------- accept/connect ----------
static int create_listen_socket(const std::string& host, uint16_t port) {
    addrinfo* res = resolve(host, port, true);
    if (!res) return -1;

    int listen_fd = -1;
    for (addrinfo* p = res; p; p = p->ai_next) {
        int fd = ::socket(p->ai_family, p->ai_socktype, p->ai_protocol);
        if (fd < 0) continue;

        int yes = 1;
        setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &yes, sizeof(yes));

        if (::bind(fd, p->ai_addr, p->ai_addrlen) == 0 && ::listen(fd, 256) == 0) {
            listen_fd = fd;
            break;
        }
        close_quiet(fd);
    }
    freeaddrinfo(res);

    if (listen_fd < 0) {
        std::fprintf(stderr, "Failed to bind/listen on %s:%u\n", host.c_str(), port);
        return -1;
    }
    if (set_nonblocking(listen_fd) != 0) {
        std::fprintf(stderr, "Failed to set nonblocking listen fd: %s\n", last_err().c_str());
        close_quiet(listen_fd);
        return -1;
    }
    return listen_fd;
}

static int connect_upstream(const std::string& host, uint16_t port, bool& in_progress) {
    in_progress = false;

    addrinfo* res = resolve(host, port, false);
    if (!res) return -1;

    int fd = -1;
    for (addrinfo* p = res; p; p = p->ai_next) {
        int s = ::socket(p->ai_family, p->ai_socktype, p->ai_protocol);
        if (s < 0) continue;

        if (set_nonblocking(s) != 0) {
            close_quiet(s);
            continue;
        }

        int c = ::connect(s, p->ai_addr, p->ai_addrlen);
        if (c == 0 || errno == EINPROGRESS) {
            fd = s;
            in_progress = c != 0;
            break;
        }
        close_quiet(s);
    }

    freeaddrinfo(res);
    return fd;
}

// ---------- proxy state ----------
struct Peer {
    int fd = -1;
    bool want_write = false;
    bool connecting = false;          // only relevant for upstream side
    bool closing = false;             // close once outq drains
    std::deque<ByteVec> outq;
    StreamBuffer head;                // handshake bytes not yet forwarded
};

enum class Phase {
    Handshake,     // waiting for request/response heads
    WebSocket,     // upgraded; bytes go through the layer
    Passthrough    // not a WebSocket; raw pipe
};

struct Session {
    uint32_t id = 0;
    Peer client;
    Peer upstream;

    // fds at accept time; the layer keeps addressing legs by these
    ConnId client_conn = -1;
    ConnId upstream_conn = -1;

    Phase phase = Phase::Handshake;
    bool request_forwarded = false;

    Flow flow;
    std::unique_ptr<WebSocketLayer> layer;
};

struct FdCtx {
    uint32_t flow_id;
    bool is_client; // true => client socket, false => upstream socket
};

struct ProxyState {
    int ep = -1;
    std::unordered_map<uint32_t, std::unique_ptr<Session>> sessions;
    std::unordered_map<int, FdCtx> fdctx;
};

static void update_events(ProxyState& st, Peer& p) {
    epoll_event mod{};
    mod.events = base_events(p.want_write || p.connecting);
    mod.data.fd = p.fd;
    epoll_ctl(st.ep, EPOLL_CTL_MOD, p.fd, &mod);
}

static void close_peer(ProxyState& st, Peer& p) {
    if (p.fd < 0) return;
    epoll_ctl(st.ep, EPOLL_CTL_DEL, p.fd, nullptr);
    st.fdctx.erase(p.fd);
    close_quiet(p.fd);
    p.fd = -1;
    p.outq.clear();
    p.want_write = false;
}

static void queue_to(ProxyState& st, Peer& p, ByteVec data) {
    if (p.fd < 0 || p.closing || data.empty()) return;
    p.outq.push_back(std::move(data));
    if (!p.want_write) {
        p.want_write = true;
        update_events(st, p);
    }
}

// Close after pending writes are flushed.
static void request_close(ProxyState& st, Peer& p) {
    if (p.fd < 0) return;
    p.closing = true;
    if (p.outq.empty() && !p.connecting)
        close_peer(st, p);
}

// ---------- write flushing ----------
enum class FlushResult { Drained, Pending, Failed };

static FlushResult flush_outq(int fd, std::deque<ByteVec>& outq) {
    while (!outq.empty()) {
        ByteVec& front = outq.front();
        if (front.empty()) { outq.pop_front(); continue; }

        ssize_t n = ::send(fd, front.data(), front.size(), MSG_NOSIGNAL);
        if (n > 0) {
            front.erase(front.begin(), front.begin() + n);
            if (!front.empty()) return FlushResult::Pending;
            outq.pop_front();
            continue;
        }

        if (n < 0 && (errno == EWOULDBLOCK || errno == EAGAIN))
            return FlushResult::Pending;

        return FlushResult::Failed;
    }
    return FlushResult::Drained;
}

// ---------- layer bridge ----------
static Peer* peer_for(Session& s, ConnId conn) {
    if (conn == s.client_conn) return &s.client;
    if (conn == s.upstream_conn) return &s.upstream;
    return nullptr;
}

static void execute(ProxyState& st, Session& s, std::vector<Command>& cmds) {
    for (auto& cmd : cmds) {
        if (auto* out = std::get_if<SendData>(&cmd)) {
            if (Peer* p = peer_for(s, out->conn))
                queue_to(st, *p, std::move(out->data));
        } else if (auto* shut = std::get_if<CloseConnection>(&cmd)) {
            if (Peer* p = peer_for(s, shut->conn))
                request_close(st, *p);
        } else if (auto* line = std::get_if<Log>(&cmd)) {
            std::fprintf(stderr, "[flow %u] %s\n", s.id, line->message.c_str());
        }
    }
}

static void dispatch(ProxyState& st, Session& s, const Event& ev) {
    if (!s.layer) return;
    std::vector<Command> cmds = s.layer->handle_event(ev);
    execute(st, s, cmds);
}

// ---------- handshake ----------
static bool is_websocket_upgrade(const HttpHead& req) {
    return header_has_token(req.headers.get("Connection"), "upgrade") &&
           iequals(req.headers.get("Upgrade"), "websocket");
}

static void enter_passthrough(ProxyState& st, Session& s) {
    s.phase = Phase::Passthrough;
    if (s.request_forwarded)
        queue_to(st, s.upstream, s.client.head.take_all());
    queue_to(st, s.client, s.upstream.head.take_all());
}

static void enter_websocket(ProxyState& st, Session& s, Addon& hooks) {
    s.phase = Phase::WebSocket;
    s.layer.reset(new WebSocketLayer(Context{s.client_conn, s.upstream_conn}, s.flow, hooks));
    dispatch(st, s, Start{});

    // frames that arrived in the same segments as the heads
    if (!s.upstream.head.empty())
        dispatch(st, s, DataReceived{s.upstream_conn, s.upstream.head.take_all()});
    if (!s.client.head.empty())
        dispatch(st, s, DataReceived{s.client_conn, s.client.head.take_all()});
}

// Returns false if the session must be dropped.
static bool on_handshake_bytes(ProxyState& st, Session& s, bool from_client,
                               const byte* data, size_t len,
                               const ProxyConfig& cfg, Addon& hooks) {
    Peer& src = from_client ? s.client : s.upstream;
    src.head.append(data, len);

    if (from_client && s.request_forwarded) {
        // early frames; hold them until the upgrade is answered
        return src.head.size() <= cfg.max_head;
    }

    size_t end = src.head.find_head_end();
    if (end == 0) {
        if (src.head.size() > cfg.max_head) {
            std::fprintf(stderr, "[flow %u] %s head exceeds %zu bytes\n",
                         s.id, from_client ? "request" : "response", cfg.max_head);
            return false;
        }
        return true;
    }

    ByteVec raw = src.head.take(end);
    std::string text(raw.begin(), raw.end());

    if (from_client) {
        if (!parse_request_head(text, s.flow.request)) {
            std::fprintf(stderr, "[flow %u] malformed request head\n", s.id);
            return false;
        }
        queue_to(st, s.upstream, std::move(raw));
        s.request_forwarded = true;
        std::fprintf(stderr, "[flow %u] %s\n", s.id, s.flow.request.start_line.c_str());

        if (!is_websocket_upgrade(s.flow.request))
            enter_passthrough(st, s);
        return true;
    }

    if (!parse_response_head(text, s.flow.response)) {
        std::fprintf(stderr, "[flow %u] malformed response head\n", s.id);
        return false;
    }
    queue_to(st, s.client, std::move(raw));
    std::fprintf(stderr, "[flow %u] %s\n", s.id, s.flow.response.start_line.c_str());

    if (s.flow.response.status_code == 101 && is_websocket_upgrade(s.flow.request))
        enter_websocket(st, s, hooks);
    else
        enter_passthrough(st, s);
    return true;
}

// ---------- peer events ----------
static void on_peer_gone(ProxyState& st, Session& s, bool is_client) {
    Peer& p = is_client ? s.client : s.upstream;
    Peer& other = is_client ? s.upstream : s.client;

    close_peer(st, p);
    if (s.phase == Phase::WebSocket)
        dispatch(st, s, ConnectionClosed{is_client ? s.client_conn : s.upstream_conn});
    else
        request_close(st, other);
}

static void on_readable(ProxyState& st, Session& s, bool is_client, const byte* data, size_t len,
                        const ProxyConfig& cfg, Addon& hooks) {
    Peer& dst = is_client ? s.upstream : s.client;

    switch (s.phase) {
        case Phase::Handshake:
            if (!on_handshake_bytes(st, s, is_client, data, len, cfg, hooks)) {
                close_peer(st, s.client);
                close_peer(st, s.upstream);
            }
            break;
        case Phase::WebSocket:
            dispatch(st, s, DataReceived{is_client ? s.client_conn : s.upstream_conn,
                                         ByteVec(data, data + len)});
            break;
        case Phase::Passthrough:
            queue_to(st, dst, ByteVec(data, data + len));
            break;
    }
}

// ---------- main ----------
int run_epoll_proxy(const ProxyConfig& cfg, AddonChain& chain) {
    int listen_fd = create_listen_socket(cfg.listen_host, cfg.listen_port);
    if (listen_fd < 0) return 1;

    ProxyState st;
    st.ep = epoll_create1(0);
    if (st.ep < 0) {
        std::fprintf(stderr, "epoll_create1 failed: %s\n", last_err().c_str());
        close_quiet(listen_fd);
        return 1;
    }

    {
        epoll_event ev{};
        ev.events = EPOLLIN | EPOLLERR;
        ev.data.fd = listen_fd;
        if (epoll_ctl(st.ep, EPOLL_CTL_ADD, listen_fd, &ev) != 0) {
            std::fprintf(stderr, "epoll ADD listen failed: %s\n", last_err().c_str());
            close_quiet(listen_fd);
            close_quiet(st.ep);
            return 1;
        }
    }

    uint32_t next_flow_id = 1;
    ByteVec readbuf(cfg.max_chunk);

    const int MAX_EVENTS = 64;
    epoll_event events[MAX_EVENTS];

    while (true) {
        int n = epoll_wait(st.ep, events, MAX_EVENTS, -1);
        if (n < 0) {
            if (errno == EINTR) continue;
            std::fprintf(stderr, "epoll_wait failed: %s\n", last_err().c_str());
            break;
        }

        for (int i = 0; i < n; ++i) {
            int fd = events[i].data.fd;
            uint32_t ev = events[i].events;

            // ---- listen accept ----
            if (fd == listen_fd) {
                if (ev & (EPOLLERR | EPOLLHUP)) {
                    std::fprintf(stderr, "listen fd error/hup\n");
                    continue;
                }

                while (true) {
                    sockaddr_storage ss{};
                    socklen_t slen = sizeof(ss);
                    int cfd = ::accept(listen_fd, (sockaddr*)&ss, &slen);
                    if (cfd < 0) {
                        if (errno != EAGAIN && errno != EWOULDBLOCK)
                            std::fprintf(stderr, "accept failed: %s\n", last_err().c_str());
                        break;
                    }

                    if (set_nonblocking(cfd) != 0) {
                        std::fprintf(stderr, "set_nonblocking(client) failed: %s\n", last_err().c_str());
                        close_quiet(cfd);
                        continue;
                    }

                    bool inprog = false;
                    int sfd = connect_upstream(cfg.upstream_host, cfg.upstream_port, inprog);
                    if (sfd < 0) {
                        std::fprintf(stderr, "connect_upstream %s:%u failed\n",
                                     cfg.upstream_host.c_str(), cfg.upstream_port);
                        close_quiet(cfd);
                        continue;
                    }

                    std::unique_ptr<Session> s(new Session());
                    s->id = next_flow_id++;
                    s->flow.id = s->id;
                    s->client.fd = cfd;
                    s->upstream.fd = sfd;
                    s->upstream.connecting = inprog;
                    s->client_conn = cfd;
                    s->upstream_conn = sfd;

                    st.fdctx[cfd] = FdCtx{s->id, true};
                    st.fdctx[sfd] = FdCtx{s->id, false};

                    epoll_event evc{};
                    evc.events = base_events(false);
                    evc.data.fd = cfd;
                    epoll_ctl(st.ep, EPOLL_CTL_ADD, cfd, &evc);

                    // EPOLLOUT completes a pending connect
                    epoll_event evs{};
                    evs.events = base_events(inprog);
                    evs.data.fd = sfd;
                    epoll_ctl(st.ep, EPOLL_CTL_ADD, sfd, &evs);

                    std::fprintf(stderr, "[flow %u] client fd=%d upstream fd=%d (connecting=%s)\n",
                                 s->id, cfd, sfd, inprog ? "yes" : "no");
                    st.sessions.emplace(s->id, std::move(s));
                }
                continue;
            }

            // ---- peer event ----
            auto itctx = st.fdctx.find(fd);
            if (itctx == st.fdctx.end()) {
                // late event for an fd closed earlier in this batch
                continue;
            }

            FdCtx ctx = itctx->second;
            auto its = st.sessions.find(ctx.flow_id);
            if (its == st.sessions.end()) continue;

            Session& s = *its->second;
            Peer& src = ctx.is_client ? s.client : s.upstream;

            if (ev & EPOLLERR) {
                std::fprintf(stderr, "[flow %u] fd=%d error\n", s.id, fd);
                on_peer_gone(st, s, ctx.is_client);
            }

            // ---- writable ----
            if (src.fd >= 0 && (ev & EPOLLOUT)) {
                if (src.connecting) {
                    int err = 0;
                    socklen_t elen = sizeof(err);
                    if (getsockopt(src.fd, SOL_SOCKET, SO_ERROR, &err, &elen) != 0 || err != 0) {
                        std::fprintf(stderr, "[flow %u] upstream connect failed: %s\n",
                                     s.id, (err != 0 ? std::strerror(err) : last_err().c_str()));
                        close_peer(st, s.client);
                        close_peer(st, s.upstream);
                    } else {
                        src.connecting = false;
                    }
                }

                if (src.fd >= 0) {
                    FlushResult r = flush_outq(src.fd, src.outq);
                    if (r == FlushResult::Failed) {
                        std::fprintf(stderr, "[flow %u] send error: %s\n", s.id, last_err().c_str());
                        on_peer_gone(st, s, ctx.is_client);
                    } else if (r == FlushResult::Drained && src.closing) {
                        close_peer(st, src);
                    } else {
                        src.want_write = r == FlushResult::Pending;
                        update_events(st, src);
                    }
                }
            }

            // ---- readable ----
            if (src.fd >= 0 && !src.connecting && (ev & (EPOLLIN | EPOLLRDHUP | EPOLLHUP))) {
                while (src.fd >= 0) {
                    ssize_t r = ::recv(src.fd, readbuf.data(), readbuf.size(), 0);
                    if (r > 0) {
                        on_readable(st, s, ctx.is_client, readbuf.data(), static_cast<size_t>(r),
                                    cfg, chain);
                        continue;
                    }

                    if (r == 0) {
                        std::fprintf(stderr, "[flow %u] fd=%d EOF\n", s.id, src.fd);
                        on_peer_gone(st, s, ctx.is_client);
                        break;
                    }

                    if (errno == EWOULDBLOCK || errno == EAGAIN) break;

                    std::fprintf(stderr, "[flow %u] recv error: %s\n", s.id, last_err().c_str());
                    on_peer_gone(st, s, ctx.is_client);
                    break;
                }
            }

            if (s.client.fd < 0 && s.upstream.fd < 0) {
                std::fprintf(stderr, "[flow %u] closed\n", s.id);
                st.sessions.erase(its);
            }
        }
    }

    close_quiet(listen_fd);
    close_quiet(st.ep);
    return 1;
}
