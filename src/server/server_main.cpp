#include "tempo_cache/commands.hpp"
#include "tempo_cache/config.hpp"
#include "tempo_cache/engine.hpp"
#include "tempo_cache/log.hpp"
#include "tempo_cache/resp.hpp"

#include <algorithm>
#include <arpa/inet.h>
#include <csignal>
#include <cstdlib>
#include <netinet/in.h>
#include <string>
#include <sys/prctl.h>
#include <sys/select.h>
#include <sys/socket.h>
#include <unistd.h>
#include <unordered_map>
#include <vector>

namespace {
volatile std::sig_atomic_t running = 1;
void on_signal(int) { running = 0; }

struct ClientState {
  tempo_cache::RespParser parser;
  tempo_cache::Session session;
  std::string out;
};

} // namespace

int main(int argc, char **argv) {
  tempo_cache::ServerConfig cfg;
  std::string err;
  if (!tempo_cache::load_server_config(
          argc, argv, [](const char *name) { return std::getenv(name); },
          &cfg, &err)) {
    tempo_cache::log::error("config: ", err);
    return 2;
  }
  tempo_cache::log::set_level(cfg.log_level);
  if (!cfg.title.empty())
    prctl(PR_SET_NAME, cfg.title.substr(0, 15).c_str(), 0, 0, 0);

  tempo_cache::Engine engine(tempo_cache::to_engine_config(cfg));
  tempo_cache::CommandHandler handler(engine);

  int server_fd = socket(AF_INET, SOCK_STREAM, 0);
  if (server_fd < 0) {
    tempo_cache::log::error("socket failed");
    return 1;
  }
  int one = 1;
  setsockopt(server_fd, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));
  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_addr.s_addr = INADDR_ANY;
  addr.sin_port = htons(static_cast<std::uint16_t>(cfg.port));
  if (bind(server_fd, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) < 0) {
    tempo_cache::log::error("bind failed on port ", cfg.port);
    close(server_fd);
    return 1;
  }
  if (listen(server_fd, 128) < 0) {
    tempo_cache::log::error("listen failed");
    close(server_fd);
    return 1;
  }

  std::signal(SIGINT, on_signal);
  std::signal(SIGTERM, on_signal);
  std::signal(SIGPIPE, SIG_IGN);
  engine.start_background();
  std::unordered_map<int, ClientState> clients;
  tempo_cache::log::info(cfg.title, " listening on ", cfg.port,
                         engine.durable_available() ? " (durable tier on)"
                                                    : " (memory only)");

  while (running) {
    fd_set readfds, writefds;
    FD_ZERO(&readfds);
    FD_ZERO(&writefds);
    FD_SET(server_fd, &readfds);
    int maxfd = server_fd;
    for (const auto &[fd, st] : clients) {
      FD_SET(fd, &readfds);
      if (!st.out.empty())
        FD_SET(fd, &writefds);
      maxfd = std::max(maxfd, fd);
    }
    timeval tv{0, 20000};
    int n = select(maxfd + 1, &readfds, &writefds, nullptr, &tv);
    if (n < 0)
      continue;

    if (FD_ISSET(server_fd, &readfds)) {
      int cfd = accept(server_fd, nullptr, nullptr);
      if (cfd >= 0) {
        if (clients.size() >= cfg.max_connections || cfd >= FD_SETSIZE) {
          const auto msg = tempo_cache::resp_error("connection limit reached");
          send(cfd, msg.data(), msg.size(), 0);
          close(cfd);
        } else {
          clients[cfd] = {};
        }
      }
    }
    handler.set_connected_clients(clients.size());

    std::vector<int> to_close;
    for (auto &[fd, st] : clients) {
      if (FD_ISSET(fd, &readfds)) {
        char buf[4096];
        ssize_t r = recv(fd, buf, sizeof(buf), 0);
        if (r <= 0) {
          to_close.push_back(fd);
          continue;
        }
        st.parser.feed(std::string(buf, static_cast<std::size_t>(r)));
        std::size_t processed = 0;
        while (processed < cfg.max_cmds_per_iteration) {
          auto cmd = st.parser.next_command();
          if (!cmd.has_value())
            break;
          ++processed;
          st.out += handler.execute(st.session, *cmd);
          if (st.out.size() > cfg.max_pending_out) {
            tempo_cache::log::warn("closing client ", fd,
                                   ": output buffer over limit");
            to_close.push_back(fd);
            break;
          }
        }
      }

      if (FD_ISSET(fd, &writefds) && !st.out.empty()) {
        const std::size_t send_bytes = std::min<std::size_t>(st.out.size(), 8192);
        ssize_t w = send(fd, st.out.data(), send_bytes, 0);
        if (w <= 0)
          to_close.push_back(fd);
        else
          st.out.erase(0, static_cast<std::size_t>(w));
      }
    }

    std::sort(to_close.begin(), to_close.end());
    to_close.erase(std::unique(to_close.begin(), to_close.end()), to_close.end());
    for (int fd : to_close) {
      close(fd);
      clients.erase(fd);
    }
  }

  tempo_cache::log::info("shutting down");
  for (auto &[fd, _] : clients)
    close(fd);
  close(server_fd);
  engine.stop_background();
  engine.flush_now();
  return 0;
}
