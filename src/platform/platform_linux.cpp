#include "../platform.hpp"
#include <iostream>
#include <sys/inotify.h>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>
#include <poll.h>
#include <map>
#include <list>
#include <vector>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <atomic>
#include <thread>

namespace cadence::platform {

    namespace {
        constexpr size_t kMaxRequestBytes = 1 << 20;

        bool write_all(int fd, const std::string& data) {
            size_t sent = 0;
            while (sent < data.size()) {
                ssize_t n = ::send(fd, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
                if (n < 0) {
                    if (errno == EINTR) continue;
                    return false;
                }
                sent += static_cast<size_t>(n);
            }
            return true;
        }

        std::string socket_path(const std::string& name) {
            return "/tmp/" + name;
        }
    }

    class LinuxSentry : public Sentry {
    public:
        LinuxSentry() {
            m_fd = inotify_init1(IN_NONBLOCK);
            if (m_fd < 0) {
                std::cerr << "[LinuxSentry] Failed to initialize inotify.\n";
            }
        }

        ~LinuxSentry() {
            stop();
            if (m_fd >= 0) close(m_fd);
        }

        bool add_watch(const std::filesystem::path& directory) override {
            if (m_fd < 0) return false;
            int wd = inotify_add_watch(m_fd, directory.c_str(),
                                       IN_CLOSE_WRITE | IN_CREATE | IN_DELETE | IN_MOVED_FROM | IN_MOVED_TO);
            if (wd < 0) {
                std::cerr << "[LinuxSentry] Failed to watch " << directory << ": " << strerror(errno) << "\n";
                return false;
            }
            m_watches[wd] = directory;
            return true;
        }

        void set_callback(EventCallback callback) override {
            m_callback = callback;
        }

        void start() override {
            if (m_fd < 0) return;
            m_running = true;
            std::cout << "[LinuxSentry] Starting watcher loop...\n";

            struct pollfd pfd = { m_fd, POLLIN, 0 };
            char buffer[4096] __attribute__ ((aligned(__alignof__(struct inotify_event))));

            while (m_running) {
                int poll_num = poll(&pfd, 1, 500); // 500ms timeout
                if (poll_num <= 0 || !(pfd.revents & POLLIN)) continue;

                ssize_t len = read(m_fd, buffer, sizeof(buffer));
                if (len <= 0) {
                    if (len < 0 && errno != EAGAIN) std::cerr << "[LinuxSentry] read error\n";
                    continue;
                }

                const struct inotify_event* event;
                for (char* ptr = buffer; ptr < buffer + len; ptr += sizeof(struct inotify_event) + event->len) {
                    event = (const struct inotify_event*) ptr;
                    handle_event(event);
                }
            }
        }

        void stop() override {
            m_running = false;
        }

    private:
        int m_fd = -1;
        std::atomic<bool> m_running{false};
        std::map<int, std::filesystem::path> m_watches; // wd -> directory
        EventCallback m_callback;

        void handle_event(const struct inotify_event* event) {
            if (event->mask & IN_Q_OVERFLOW) {
                std::cerr << "[LinuxSentry] Event queue overflow.\n";
                return;
            }

            auto it = m_watches.find(event->wd);
            if (it == m_watches.end() || !m_callback || event->len == 0) return;

            FileEvent fe;
            fe.path = it->second / event->name;

            if (event->mask & (IN_CREATE | IN_MOVED_TO)) fe.type = FileEvent::Type::Created;
            else if (event->mask & IN_DELETE) fe.type = FileEvent::Type::Deleted;
            else if (event->mask & IN_CLOSE_WRITE) fe.type = FileEvent::Type::Modified;
            else if (event->mask & IN_MOVED_FROM) fe.type = FileEvent::Type::Renamed;
            else return;

            m_callback(fe);
        }
    };

    class LinuxBridge : public Bridge {
    public:
        LinuxBridge() = default;
        ~LinuxBridge() {
            stop();
            reap(true);
        }

        bool listen(const std::string& name) override {
            m_socket_path = socket_path(name);
            unlink(m_socket_path.c_str());

            m_server_fd = socket(AF_UNIX, SOCK_STREAM, 0);
            if (m_server_fd < 0) {
                std::cerr << "[LinuxBridge] Failed to create socket.\n";
                return false;
            }

            struct sockaddr_un addr;
            memset(&addr, 0, sizeof(addr));
            addr.sun_family = AF_UNIX;
            strncpy(addr.sun_path, m_socket_path.c_str(), sizeof(addr.sun_path) - 1);

            if (bind(m_server_fd, (struct sockaddr*)&addr, sizeof(addr)) < 0) {
                std::cerr << "[LinuxBridge] Failed to bind socket: " << strerror(errno) << "\n";
                close(m_server_fd);
                m_server_fd = -1;
                return false;
            }

            if (::listen(m_server_fd, 16) < 0) {
                std::cerr << "[LinuxBridge] Failed to listen on socket.\n";
                close(m_server_fd);
                m_server_fd = -1;
                return false;
            }

            std::cout << "[LinuxBridge] Listening on " << m_socket_path << "\n";
            return true;
        }

        void set_handler(MessageCallback handler) override {
            m_handler = handler;
        }

        void run() override {
            if (m_server_fd < 0) return;
            m_running = true;

            struct pollfd pfd = { m_server_fd, POLLIN, 0 };

            while (m_running) {
                int poll_num = poll(&pfd, 1, 500);
                if (poll_num > 0 && (pfd.revents & POLLIN)) {
                    int client_fd = accept(m_server_fd, nullptr, nullptr);
                    if (client_fd >= 0) {
                        auto done = std::make_shared<std::atomic<bool>>(false);
                        std::thread worker([this, client_fd, done]() {
                            handle_client(client_fd);
                            *done = true;
                        });
                        m_workers.push_back({std::move(worker), done});
                    }
                }
                reap(false);
            }
            reap(true);
        }

        void stop() override {
            m_running = false;
            if (m_server_fd >= 0) {
                close(m_server_fd);
                unlink(m_socket_path.c_str());
                m_server_fd = -1;
            }
        }

    private:
        struct Worker {
            std::thread thread;
            std::shared_ptr<std::atomic<bool>> done;
        };

        int m_server_fd = -1;
        std::string m_socket_path;
        MessageCallback m_handler;
        std::atomic<bool> m_running{false};
        std::list<Worker> m_workers; // touched only by the run() thread

        void reap(bool all) {
            for (auto it = m_workers.begin(); it != m_workers.end();) {
                if (all || *it->done) {
                    if (it->thread.joinable()) it->thread.join();
                    it = m_workers.erase(it);
                } else {
                    ++it;
                }
            }
        }

        void handle_client(int client_fd) {
            std::string request;
            char buffer[4096];
            while (request.size() < kMaxRequestBytes) {
                ssize_t len = read(client_fd, buffer, sizeof(buffer));
                if (len < 0 && errno == EINTR) continue;
                if (len <= 0) break;
                request.append(buffer, static_cast<size_t>(len));
                if (request.find('\n') != std::string::npos) break;
            }

            auto newline = request.find('\n');
            if (newline != std::string::npos) request.resize(newline);

            if (!request.empty()) {
                std::string response = m_handler ? m_handler(request) : "{}";
                if (!write_all(client_fd, response + "\n")) {
                    std::cerr << "[LinuxBridge] Failed to write response: " << strerror(errno) << "\n";
                }
            }
            close(client_fd);
        }
    };

    class LinuxClient : public Client {
    public:
        bool connect(const std::string& name) override {
            m_socket_path = socket_path(name);
            m_fd = socket(AF_UNIX, SOCK_STREAM, 0);
            if (m_fd < 0) return false;

            struct sockaddr_un addr;
            memset(&addr, 0, sizeof(addr));
            addr.sun_family = AF_UNIX;
            strncpy(addr.sun_path, m_socket_path.c_str(), sizeof(addr.sun_path) - 1);

            if (::connect(m_fd, (struct sockaddr*)&addr, sizeof(addr)) < 0) {
                close(m_fd);
                m_fd = -1;
                return false;
            }
            return true;
        }

        std::string send(const std::string& message) override {
            if (m_fd < 0) return "";
            if (!write_all(m_fd, message + "\n")) return "";

            std::string response;
            char buffer[4096];
            while (true) {
                ssize_t len = read(m_fd, buffer, sizeof(buffer));
                if (len < 0 && errno == EINTR) continue;
                if (len <= 0) break;
                response.append(buffer, static_cast<size_t>(len));
            }
            while (!response.empty() && response.back() == '\n') response.pop_back();
            return response;
        }

        ~LinuxClient() {
            if (m_fd >= 0) close(m_fd);
        }

    private:
        int m_fd = -1;
        std::string m_socket_path;
    };

    std::unique_ptr<Sentry> Sentry::create() {
        return std::make_unique<LinuxSentry>();
    }

    std::unique_ptr<Bridge> Bridge::create() {
        return std::make_unique<LinuxBridge>();
    }

    std::unique_ptr<Client> Client::create() {
        return std::make_unique<LinuxClient>();
    }

    namespace system {
        std::filesystem::path get_config_dir() {
            const char* home = std::getenv("HOME");
            return home ? std::filesystem::path(home) / ".config/cadence" : "";
        }
        std::filesystem::path get_data_dir() {
            const char* home = std::getenv("HOME");
            return home ? std::filesystem::path(home) / ".local/share/cadence" : "";
        }
    }

}
