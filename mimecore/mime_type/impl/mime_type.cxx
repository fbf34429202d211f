#include <mimecore.hxx>

namespace mimecore {
    namespace {
        constexpr std::string_view k_parse_error = "Cannot parse MIME type (expected type/subtype[;q=x.y] format): ";

        /**
         * @brief Characters that may not appear in a media type token.
         *
         * The '/' tspecial is handled separately as the type/subtype separator.
         */
        constexpr std::string_view k_tspecials = "()<>@,;:\\\"[]?=";

        /**
         * @brief Parse the `q` value of a parameter block.
         * @param params Everything after the first ';'.
         * @param mime_type Full input, for diagnostics.
         * @return Last valid quality, normalized to 1.0 when out of (0, 1).
         */
        double parse_quality(const std::string_view& params, [[maybe_unused]] const std::string_view& mime_type) {
            double ret = 1.0;

            std::vector<std::string> parts{};

            boost::split(parts, std::string(params), boost::is_any_of(";"));

            for (const auto& part : parts) {
                const auto eq = part.find('=');

                if (eq == std::string::npos)
                    continue;

                if (boost::algorithm::to_lower_copy(boost::algorithm::trim_copy(part.substr(0u, eq))) != "q")
                    continue;

                const auto value = boost::algorithm::trim_copy(part.substr(eq + 1u));

                double q{};

                if (!boost::conversion::try_lexical_convert(value, q)) {
#ifdef MIMECORE_USE_LOGGING_IMPL
                    g_logging->log(e_log_level::debug, "[MimeType] Skipping unparsable quality '{}' in '{}'", value, mime_type);
#endif // MIMECORE_USE_LOGGING_IMPL

                    continue;
                }

                if (!std::isfinite(q)
                    || q <= 0.0
                    || q >= 1.0)
                    q = 1.0;

                ret = q;
            }

            return ret;
        }
    }

    c_mime_type::c_mime_type(media_type_t type)
        : m_type(std::move(type)) {
        if (m_type->empty())
            throw exceptions::invalid_argument_exception_t("Media type name is missing");
    }

    c_mime_type::c_mime_type(media_type_t type, std::optional<std::string> subtype, double quality)
        : m_type(std::move(type)), m_subtype(std::move(subtype)), m_quality(quality) {
        if (m_type->empty())
            throw exceptions::invalid_argument_exception_t("Media type name is missing");
    }

    bool c_mime_type::is_valid(const std::string_view& name) {
        bool slash{};

        for (std::size_t i{}; i < name.size(); i++) {
            const auto ch = static_cast<unsigned char>(name[i]);

            if (ch <= ' '
                || ch >= 127u
                || k_tspecials.find(static_cast<char>(ch)) != std::string_view::npos)
                return false;

            if (ch != '/')
                continue;

            if (slash
                || i == 0u
                || i + 1u == name.size())
                return false;

            slash = true;
        }

        return slash;
    }

    bool c_mime_type::is_valid(const char* name) {
        if (name == nullptr)
            throw exceptions::invalid_argument_exception_t("Name is missing");

        return is_valid(std::string_view(name));
    }

    c_mime_type c_mime_type::parse(const std::string_view& mime_type) {
        auto type_end = mime_type.find(';');

        double quality = 1.0;

        if (type_end != std::string_view::npos) {
            quality = parse_quality(mime_type.substr(type_end + 1u), mime_type);
        }
        else
            type_end = mime_type.size();

        const auto type = mime_type.substr(0u, type_end);

        const auto slash = type.find('/');

        if (slash == std::string_view::npos)
            throw exceptions::mime_type_exception_t(fmt::format("{}{}", k_parse_error, mime_type));

        auto major = boost::algorithm::to_lower_copy(boost::algorithm::trim_copy(std::string(type.substr(0u, slash))));
        auto minor = boost::algorithm::to_lower_copy(boost::algorithm::trim_copy(std::string(type.substr(slash + 1u))));

        if (major.empty())
            throw exceptions::mime_type_exception_t(fmt::format("{}{}", k_parse_error, mime_type));

        if (major == "*") {
            if (minor != "*")
                throw exceptions::mime_type_exception_t(fmt::format("{}{}", k_parse_error, mime_type));

            return c_mime_type(std::nullopt, quality);
        }

        if (minor == "*")
            return c_mime_type(media_type_t::parse(major), std::nullopt, quality);

        return c_mime_type(media_type_t::parse(major), std::move(minor), quality);
    }

    std::optional<c_mime_type> c_mime_type::parse_nullable(const char* mime_type) {
        if (mime_type == nullptr)
            return std::nullopt;

        return parse(std::string_view(mime_type));
    }

    bool c_mime_type::matches_magic(magic::bytes_t data) const {
        for (const auto& magic : m_magics) {
            if (magic->eval(data))
                return true;
        }

        return false;
    }

    bool c_mime_type::matches_xml(const std::string_view& namespace_uri, const std::string_view& local_name) const {
        return std::any_of(m_root_xmls.begin(), m_root_xmls.end(), [&](const root_xml_t& root_xml) {
            return root_xml.matches(namespace_uri, local_name);
        });
    }

    std::string c_mime_type::name() const {
        return m_type.has_value() ? m_type->name() : std::string("*");
    }

    int c_mime_type::compare(const c_mime_type& other) const {
        if (!m_type.has_value()
            || !other.m_type.has_value())
            return static_cast<int>(m_type.has_value()) - static_cast<int>(other.m_type.has_value());

        return m_type->compare(*other.m_type);
    }

    std::size_t hash_value(const c_mime_type& mime_type) {
        if (!mime_type.m_type.has_value())
            return 0u;

        return hash_value(*mime_type.m_type);
    }
}
