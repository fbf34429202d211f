#include <mimecore.hxx>

namespace mimecore {
    void init([[maybe_unused]] const mimecore_cfg_t& cfg) {
#ifdef MIMECORE_USE_LOGGING_IMPL
        g_logging->init(cfg.m_logger.m_level, cfg.m_logger.m_force_flush);

        g_logging->log(e_log_level::info, "[Core] Logger initialized at level {}", g_logging->lvl_to_str(cfg.m_logger.m_level));
#endif // MIMECORE_USE_LOGGING_IMPL
    }
}
