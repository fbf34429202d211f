/**
 * @file root_xml.hxx
 * @brief Root element association used to recognize XML documents.
 */

#ifndef MIMECORE_MIME_TYPE_ROOT_XML_HXX
#define MIMECORE_MIME_TYPE_ROOT_XML_HXX

namespace mimecore {
    /**
     * @brief Namespace URI and/or local name of the root element of an XML document type.
     *
     * An empty string stands for an absent value. At least one of the two must be set.
     */
    struct root_xml_t {
        /**
         * @brief Construct a root element association.
         * @param type_name Name of the owning media type (diagnostics only).
         * @param namespace_uri Namespace URI of the root element, may be empty.
         * @param local_name Local name of the root element, may be empty.
         * @throws exceptions::invalid_argument_exception_t if both are empty.
         */
        root_xml_t(std::string type_name, std::string namespace_uri, std::string local_name);

      public:
        /**
         * @brief Check a root element against this association.
         * @param namespace_uri Namespace URI of the candidate root element.
         * @param local_name Local name of the candidate root element.
         * @return True if every field matches, empty fields requiring an empty candidate.
         */
        [[nodiscard]] bool matches(const std::string_view& namespace_uri, const std::string_view& local_name) const;

        /**
         * @brief Render as "<type>, <namespace>, <local name>".
         * @return Description string.
         */
        [[nodiscard]] std::string to_string() const;

      public:
        /**
         * @brief Get the owning media type name.
         * @return Const reference to the name.
         */
        [[nodiscard]] MIMECORE_INLINE const auto& type_name() const { return m_type_name; }

        /**
         * @brief Get the namespace URI.
         * @return Const reference to the namespace URI, empty if absent.
         */
        [[nodiscard]] MIMECORE_INLINE const auto& namespace_uri() const { return m_namespace_uri; }

        /**
         * @brief Get the local name.
         * @return Const reference to the local name, empty if absent.
         */
        [[nodiscard]] MIMECORE_INLINE const auto& local_name() const { return m_local_name; }

      private:
        /** @brief Owning media type name. */
        std::string m_type_name{};

        /** @brief Root element namespace URI. */
        std::string m_namespace_uri{};

        /** @brief Root element local name. */
        std::string m_local_name{};
    };
}

template <>
struct fmt::formatter<mimecore::root_xml_t> : fmt::formatter<std::string_view> {
    template <typename _ctx_t>
    MIMECORE_INLINE auto format(const mimecore::root_xml_t& root_xml, _ctx_t& ctx) const {
        return fmt::formatter<std::string_view>::format(root_xml.to_string(), ctx);
    }
};

#endif // MIMECORE_MIME_TYPE_ROOT_XML_HXX
