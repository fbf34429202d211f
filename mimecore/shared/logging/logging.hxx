/**
 * @file logging.hxx
 * @brief Synchronous, level-filtered logging with an optional capture sink.
 */

#ifndef MIMECORE_SHARED_LOGGING_HXX
#define MIMECORE_SHARED_LOGGING_HXX

#define MIMECORE_HAS_LOGGING_IMPL

namespace shared {
#ifdef MIMECORE_USE_LOGGING_IMPL
    /**
     * @brief Log severity levels.
     */
    enum struct e_log_level : std::int16_t {
        debug,    ///< Debug-level messages.
        info,     ///< Informational messages.
        warning,  ///< Warning conditions.
        error,    ///< Error conditions.
        critical, ///< Critical conditions.
        none = -1 ///< Logging disabled.
    };

    /**
     * @brief Represents a single log message with metadata.
     */
    struct log_message_t {
        /** @brief Severity level of the log message. */
        e_log_level m_level{};

        /** @brief Log message text. */
        std::string m_message{};

        /** @brief Timestamp when the message was created. */
        std::chrono::system_clock::time_point m_timestamp{};
    };

    /**
     * @brief Logger writing formatted lines to stdout, or to a user supplied sink.
     *
     * Messages are emitted on the calling thread. Registry construction and lookups
     * are short and never block, so there is no background worker.
     */
    class c_logging {
      public:
        /** @brief Callback receiving every message that passes the level filter. */
        using sink_t = std::function<void(const log_message_t&)>;

        /**
         * @brief Construct a logger with optional log level and flush behavior.
         * @param log_level Minimum severity level to log.
         * @param force_flush Whether to flush output immediately.
         */
        MIMECORE_INLINE c_logging(const e_log_level& log_level = e_log_level::none, bool force_flush = false)
            : m_log_level(log_level), m_force_flush(force_flush) {
        }

      public:
        /**
         * @brief Initialize the logger with configuration options.
         * @param log_level Minimum severity level to log.
         * @param force_flush Whether to flush output immediately.
         */
        MIMECORE_INLINE void init(const e_log_level& log_level, bool force_flush = false) {
            std::lock_guard<std::mutex> lock(m_mutex);

            m_log_level = log_level;
            m_force_flush = force_flush;
        }

        /**
         * @brief Redirect messages to a sink instead of stdout.
         * @param sink Callback to receive messages, or an empty function to restore stdout.
         */
        MIMECORE_INLINE void set_sink(sink_t sink) {
            std::lock_guard<std::mutex> lock(m_mutex);

            m_sink = std::move(sink);
        }

        /**
         * @brief Convert a log level enum to a string representation.
         * @param level Log level to convert.
         * @return String representation of the log level.
         */
        MIMECORE_INLINE const char* lvl_to_str(const e_log_level& level) const {
            switch (level) {
                case e_log_level::info:
                    return "INFO";
                case e_log_level::debug:
                    return "DEBUG";
                case e_log_level::warning:
                    return "WARNING";
                case e_log_level::error:
                    return "ERROR";
                case e_log_level::critical:
                    return "CRITICAL";
                default:
                    return "UNKNOWN";
            }
        }

        /**
         * @brief Check whether a message of the given level would be emitted.
         * @param log_level Level to test.
         * @return True if enabled.
         */
        [[nodiscard]] MIMECORE_INLINE bool enabled(const e_log_level& log_level) const {
            std::lock_guard<std::mutex> lock(m_mutex);

            return m_log_level != e_log_level::none
                && log_level != e_log_level::none
                && log_level >= m_log_level;
        }

        /**
         * @brief Log a formatted message.
         * @tparam _args_t Variadic format argument types.
         * @param log_level Severity level of the message.
         * @param message Format string.
         * @param args Format arguments.
         */
        template <typename... _args_t>
        MIMECORE_INLINE void log(const e_log_level& log_level, fmt::format_string<_args_t...> message, _args_t&&... args) {
            if (!enabled(log_level))
                return;

            log_message_t msg{log_level, fmt::format(message, std::forward<_args_t>(args)...), std::chrono::system_clock::now()};

            sink_t sink{};

            {
                std::lock_guard<std::mutex> lock(m_mutex);

                sink = m_sink;
            }

            // Called unlocked, a sink may log again or replace itself.
            if (sink) {
                sink(msg);

                return;
            }

            std::lock_guard<std::mutex> lock(m_mutex);

            print(msg);

            if (!m_force_flush)
                return;

            std::fflush(stdout);
        }

      private:
        /**
         * @brief Print a message to stdout with colour styling.
         * @param msg Message to print.
         */
        MIMECORE_INLINE void print(const log_message_t& msg) const {
            auto in_time_t = std::chrono::system_clock::to_time_t(msg.m_timestamp);

            fmt::print(
                "[{:%Y-%m-%d %H:%M:%S}] {} - {}\n",

                fmt::styled(
                    std::chrono::system_clock::time_point(std::chrono::system_clock::from_time_t(in_time_t)),
                    fmt::emphasis::bold | fg(fmt::rgb(245, 245, 184))
                ),

                fmt::styled(
                    lvl_to_str(msg.m_level),
                    fmt::emphasis::bold
                ),

                fmt::styled(
                    msg.m_message,
                    fg(fmt::rgb(255, 255, 230))
                )
            );
        }

      private:
        /** @brief Minimum severity level to log. */
        e_log_level m_log_level{e_log_level::none};

        /** @brief Whether to flush output immediately after each message. */
        bool m_force_flush{};

        /** @brief Optional capture sink. */
        sink_t m_sink{};

        /** @brief Mutex for synchronizing access to logger state. */
        mutable std::mutex m_mutex;
    };
#endif // MIMECORE_USE_LOGGING_IMPL
}

#endif // MIMECORE_SHARED_LOGGING_HXX
