/**
 * @file exception.hxx
 * @brief Defines the exception hierarchy used throughout the mimecore.
 *
 * Provides a base exception class (`base_exception_t`) derived from `std::runtime_error`,
 * as well as the specialized exception types raised for invalid arguments, malformed
 * media type strings and purifier failures. All exceptions support custom message
 * prefixes and full error formatting.
 */

#ifndef MIMECORE_EXCEPTION_HXX
#define MIMECORE_EXCEPTION_HXX

namespace mimecore {
    /**
     * @brief Base exception type for all errors in mimecore.
     */
    struct base_exception_t : public std::runtime_error {
        /**
         * @brief Construct a base exception with a plain message.
         * @param str Error message.
         */
        MIMECORE_INLINE base_exception_t(const std::string& str)
            : std::runtime_error(str), m_message(str), m_what(str) {
        }

        /**
         * @brief Construct a base exception with a message and prefix.
         * @param str Error message.
         * @param prefix Prefix to include in the formatted message.
         */
        MIMECORE_INLINE base_exception_t(const std::string& str, const std::string_view& prefix)
            : std::runtime_error(str), m_prefix(prefix), m_message(str) {
            if (!m_prefix.empty()) {
                m_what = fmt::format("[{}] {}", m_prefix, m_message);
            }
            else
                m_what = m_message;
        }

      public:
        /**
         * @brief Get the prefix of the message used in the exception.
         * @return Const reference to the message prefix.
         */
        MIMECORE_INLINE const auto& prefix() const { return m_prefix; }

        /**
         * @brief Get the message used in the exception.
         * @return Const reference to the message.
         */
        MIMECORE_INLINE const auto& message() const { return m_message; }

        /**
         * @brief Get the full formatted error message.
         * @return Pointer to a null-terminated C-string with the exception message.
         */
        MIMECORE_INLINE const char* what() const noexcept override { return m_what.c_str(); }

      private:
        /** @brief Optional prefix used to qualify the error message. */
        std::string_view m_prefix{};

        /** @brief Raw message content (without prefix). */
        std::string m_message{};

        /** @brief Cached full message string used in what(). */
        std::string m_what{};
    };

    namespace exceptions {
        /**
         * @brief Raised when a required argument is missing or empty.
         *
         * Automatically sets the prefix to "Invalid-Argument".
         */
        struct invalid_argument_exception_t : public base_exception_t {
            /**
             * @brief Construct a new invalid_argument_exception_t.
             * @param str Error message.
             * @param prefix Prefix to prepend to the error message.
             */
            MIMECORE_INLINE invalid_argument_exception_t(
                const std::string& str,

                const std::string_view& prefix = "Invalid-Argument"
            )
                : base_exception_t(str, prefix) {
            }
        };

        /**
         * @brief Raised when a media type string can't be parsed.
         *
         * Automatically sets the prefix to "Mime-Type".
         */
        struct mime_type_exception_t : public base_exception_t {
            /**
             * @brief Construct a new mime_type_exception_t.
             * @param str Error message, including the offending input.
             * @param prefix Prefix to prepend to the error message.
             */
            MIMECORE_INLINE mime_type_exception_t(
                const std::string& str,

                const std::string_view& prefix = "Mime-Type"
            )
                : base_exception_t(str, prefix) {
            }
        };

        /**
         * @brief Raised by purifier implementations on I/O failure.
         *
         * Automatically sets the prefix to "Purifier".
         */
        struct purifier_exception_t : public base_exception_t {
            /**
             * @brief Construct a new purifier_exception_t.
             * @param str Error message.
             * @param prefix Prefix to prepend to the error message.
             */
            MIMECORE_INLINE purifier_exception_t(
                const std::string& str,

                const std::string_view& prefix = "Purifier"
            )
                : base_exception_t(str, prefix) {
            }
        };
    }
}

#endif // MIMECORE_EXCEPTION_HXX
