#pragma once

#include <string>
#include <vector>
#include <functional>
#include <memory>
#include <filesystem>

namespace cadence::platform {

    /**
     * @brief Platform-agnostic file system event types.
     */
    struct FileEvent {
        enum class Type {
            Modified,
            Created,
            Deleted,
            Renamed
        };

        std::filesystem::path path;
        Type type;
    };

    /**
     * @brief Abstract base class for the file watcher (Sentry).
     * Used to notice new revisions of the catalog file.
     */
    class Sentry {
    public:
        using EventCallback = std::function<void(const FileEvent&)>;

        virtual ~Sentry() = default;

        /**
         * @brief Watches the entries of a directory (not recursive).
         * Editors usually replace a file by renaming over it, so watching the
         * parent directory is the reliable way to follow a single file.
         */
        virtual bool add_watch(const std::filesystem::path& directory) = 0;

        virtual void set_callback(EventCallback callback) = 0;

        /**
         * @brief Runs the watcher loop until stop() is called.
         */
        virtual void start() = 0;

        virtual void stop() = 0;

        static std::unique_ptr<Sentry> create();
    };

    /**
     * @brief Abstract base class for the IPC server (The Bridge).
     * One newline-terminated request per connection, answered with one response.
     */
    class Bridge {
    public:
        using MessageCallback = std::function<std::string(const std::string&)>;

        virtual ~Bridge() = default;

        /**
         * @brief Initializes the IPC endpoint.
         * @param name The name of the socket (e.g., "cadence.sock").
         * @return false if the endpoint could not be created.
         */
        virtual bool listen(const std::string& name) = 0;

        /**
         * @brief Sets the handler for incoming messages. It is called from several threads at once.
         */
        virtual void set_handler(MessageCallback handler) = 0;

        /**
         * @brief Runs the accept loop until stop() is called.
         */
        virtual void run() = 0;

        virtual void stop() = 0;

        static std::unique_ptr<Bridge> create();
    };

    /**
     * @brief Abstract base class for the IPC client.
     */
    class Client {
    public:
        virtual ~Client() = default;

        /**
         * @brief Connects to the IPC endpoint.
         * @return true if connected successfully.
         */
        virtual bool connect(const std::string& name) = 0;

        /**
         * @brief Sends a message and waits for the complete response.
         * @return The response, or an empty string on I/O failure.
         */
        virtual std::string send(const std::string& message) = 0;

        static std::unique_ptr<Client> create();
    };

    namespace system {
        std::filesystem::path get_config_dir();
        std::filesystem::path get_data_dir();
    }

}
