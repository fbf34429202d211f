#include <mimecore.hxx>

namespace mimecore {
    root_xml_t::root_xml_t(std::string type_name, std::string namespace_uri, std::string local_name)
        : m_type_name(std::move(type_name)), m_namespace_uri(std::move(namespace_uri)), m_local_name(std::move(local_name)) {
        if (m_namespace_uri.empty()
            && m_local_name.empty())
            throw exceptions::invalid_argument_exception_t("Both namespaceURI and localName cannot be empty");
    }

    bool root_xml_t::matches(const std::string_view& namespace_uri, const std::string_view& local_name) const {
        // An absent field only accepts an absent candidate.
        if (m_namespace_uri != namespace_uri)
            return false;

        return m_local_name == local_name;
    }

    std::string root_xml_t::to_string() const {
        return fmt::format("{}, {}, {}", m_type_name, m_namespace_uri, m_local_name);
    }
}
