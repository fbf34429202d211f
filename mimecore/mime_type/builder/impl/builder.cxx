#include <mimecore.hxx>

namespace mimecore {
    mime_type_builder_t& mime_type_builder_t::add_extension(std::string extension) {
        auto& extensions = m_mime_type.m_extensions;

        if (std::find(extensions.begin(), extensions.end(), extension) != extensions.end()) {
#ifdef MIMECORE_USE_LOGGING_IMPL
            g_logging->log(e_log_level::debug, "[MimeType] Ignoring duplicate extension '{}' for {}", extension, m_mime_type);
#endif // MIMECORE_USE_LOGGING_IMPL

            return *this;
        }

        extensions.push_back(std::move(extension));

        return *this;
    }

    mime_type_builder_t& mime_type_builder_t::add_magic(magic_t magic) {
        if (!magic) {
#ifdef MIMECORE_USE_LOGGING_IMPL
            g_logging->log(e_log_level::debug, "[MimeType] Ignoring null magic for {}", m_mime_type);
#endif // MIMECORE_USE_LOGGING_IMPL

            return *this;
        }

        const auto needed = static_cast<std::int32_t>(std::min<std::size_t>(magic->min_length(), std::numeric_limits<std::int32_t>::max()));

        if (needed > m_mime_type.m_min_length)
            m_mime_type.m_min_length = needed;

        m_mime_type.m_magics.push_back(std::move(magic));

        return *this;
    }

    mime_type_builder_t& mime_type_builder_t::add_root_xml(std::string namespace_uri, std::string local_name) {
        m_mime_type.m_root_xmls.emplace_back(m_mime_type.name(), std::move(namespace_uri), std::move(local_name));

        return *this;
    }

    mime_type_builder_t& mime_type_builder_t::add_link(uri_t link) {
        if (link.empty())
            throw exceptions::invalid_argument_exception_t("Missing Link");

        m_mime_type.m_links.push_back(std::move(link));

        return *this;
    }

    mime_type_builder_t& mime_type_builder_t::set_acronym(std::string acronym) {
        m_mime_type.m_acronym = std::move(acronym);

        return *this;
    }

    mime_type_builder_t& mime_type_builder_t::set_description(std::string description) {
        m_mime_type.m_description = std::move(description);

        return *this;
    }

    mime_type_builder_t& mime_type_builder_t::set_uniform_type_identifier(std::string uti) {
        m_mime_type.m_uti = std::move(uti);

        return *this;
    }

    mime_type_builder_t& mime_type_builder_t::set_min_length(std::int32_t min_length) {
        if (min_length < 0)
            throw exceptions::invalid_argument_exception_t(fmt::format("Minimum length can't be negative: {}", min_length));

        m_mime_type.m_min_length = min_length;

        return *this;
    }
}
