/**
 * @file mimecore.hxx
 * @brief Main public API and configuration structures for the mimecore.
 */

#ifndef MIMECORE_HXX
#define MIMECORE_HXX

#include "shared/shared.hxx"

/**
 * @namespace mimecore
 * @brief Main namespace for the mimecore.
 */
namespace mimecore {
#ifdef MIMECORE_USE_LOGGING_IMPL
    /** @brief Alias for the shared logging implementation. */
    using c_logging = shared::c_logging;

    /** @brief Alias for the shared logging level enumeration. */
    using e_log_level = shared::e_log_level;

    /** @brief Global logger instance for mimecore. */
    inline const auto g_logging = std::make_unique<shared::c_logging>();
#endif // MIMECORE_USE_LOGGING_IMPL
}

#include "exception/exception.hxx"

#include "media_type/media_type.hxx"

#include "magic/magic.hxx"

#include "mime_type/mime_type.hxx"

#include "purifier/purifier.hxx"

namespace mimecore {
    /**
     * @brief Configuration parameters for the mimecore.
     */
    struct mimecore_cfg_t {
#ifdef MIMECORE_HAS_LOGGING_IMPL
        /**
         * @brief Configuration for the internal mimecore logger.
         */
        struct logger_t {
            /** @brief Minimum severity level to log. (default: info) */
            e_log_level m_level{e_log_level::info};

            /** @brief Whether to flush output immediately after each message. (default: false) */
            bool m_force_flush{false};
        };

        /** @brief Logger configuration for mimecore. */
        logger_t m_logger{};
#endif // MIMECORE_HAS_LOGGING_IMPL
    };

    /**
     * @brief Applies a configuration to the library-wide state.
     * @param cfg Configuration settings.
     */
    void init(const mimecore_cfg_t& cfg);
}

#endif // MIMECORE_HXX
