/**
 * @file mime_type.hxx
 * @brief Registered media type entry: name, quality, extensions and detection evidence.
 */

#ifndef MIMECORE_MIME_TYPE_HXX
#define MIMECORE_MIME_TYPE_HXX

#include "root_xml/root_xml.hxx"

namespace mimecore {
    /** @brief Type alias for documentation links. */
    using uri_t = std::string;

    struct mime_type_builder_t;

    /**
     * @brief Internet media type entry of a type registry.
     *
     * Entries are populated through mime_type_builder_t and are read-only afterwards.
     * Equality, ordering and hashing only look at the media type name: entries that
     * differ by subtype or quality compare equal.
     */
    class c_mime_type {
      public:
        /**
         * @brief Construct an entry for a normalized media type.
         * @param type Normalized media type name.
         * @throws exceptions::invalid_argument_exception_t if the name is empty.
         */
        explicit c_mime_type(media_type_t type);

        /**
         * @brief Construct an entry with subtype and quality.
         * @param type Normalized media type name.
         * @param subtype Normalized subtype, nullopt for any subtype.
         * @param quality Quality value.
         * @throws exceptions::invalid_argument_exception_t if the name is empty.
         */
        c_mime_type(media_type_t type, std::optional<std::string> subtype, double quality);

      public:
        /**
         * @brief Check that a string is a valid `type/subtype` name.
         *
         * Simplified RFC 2045 grammar: `token "/" token`, where a token is any
         * US-ASCII character except space, controls and tspecials.
         *
         * @param name Name to check.
         * @return True if valid.
         */
        [[nodiscard]] static bool is_valid(const std::string_view& name);

        /**
         * @brief Null-checking overload of is_valid.
         * @param name Name to check.
         * @return True if valid.
         * @throws exceptions::invalid_argument_exception_t if name is null.
         */
        [[nodiscard]] static bool is_valid(const char* name);

        /**
         * @brief Parse `type/subtype[;q=x.y]`.
         *
         * Unparsable or out-of-range `q` parameters fall back to 1.0.
         *
         * @param mime_type Media type string.
         * @return Parsed entry.
         * @throws exceptions::mime_type_exception_t if the string is malformed.
         */
        [[nodiscard]] static c_mime_type parse(const std::string_view& mime_type);

        /**
         * @brief Null-tolerant variant of parse for C strings.
         * @param mime_type Media type string, may be null.
         * @return Parsed entry, or nullopt for a null input.
         * @throws exceptions::mime_type_exception_t if the string is malformed.
         */
        [[nodiscard]] static std::optional<c_mime_type> parse_nullable(const char* mime_type);

      public:
        /**
         * @brief Check whether any magic matches the given bytes.
         * @param data Bytes to sniff.
         * @return True on the first matching magic.
         */
        [[nodiscard]] bool matches_magic(magic::bytes_t data) const;

        /**
         * @brief Check the given bytes against this entry.
         * @param data Bytes to sniff.
         * @return Same as matches_magic.
         */
        [[nodiscard]] MIMECORE_INLINE bool matches(magic::bytes_t data) const { return matches_magic(data); }

        /**
         * @brief Check an XML root element against this entry.
         * @param namespace_uri Namespace URI of the root element.
         * @param local_name Local name of the root element.
         * @return True if any root XML association matches.
         */
        [[nodiscard]] bool matches_xml(const std::string_view& namespace_uri, const std::string_view& local_name) const;

      public:
        /**
         * @brief Get the normalized media type.
         * @return Media type, nullopt for the `*` / `*` wildcard.
         */
        [[nodiscard]] MIMECORE_INLINE const auto& type() const { return m_type; }

        /**
         * @brief Get the media type name.
         * @return Lower case name, "*" for the wildcard.
         */
        [[nodiscard]] std::string name() const;

        /**
         * @brief Get the string form of the entry.
         * @return Same as name().
         */
        [[nodiscard]] MIMECORE_INLINE std::string to_string() const { return name(); }

        /**
         * @brief Get the major type name.
         * @return Same as name(), "*" for any major type.
         */
        [[nodiscard]] MIMECORE_INLINE std::string major_type() const { return name(); }

        /**
         * @brief Get the subtype name.
         * @return Lower case subtype, "*" for any subtype.
         */
        [[nodiscard]] MIMECORE_INLINE std::string subtype() const { return m_subtype.value_or("*"); }

        /**
         * @brief Get the `major/subtype` pair.
         * @return Full type string.
         */
        [[nodiscard]] MIMECORE_INLINE std::string full_type() const { return fmt::format("{}/{}", major_type(), subtype()); }

        /**
         * @brief Get the quality value.
         * @return Parsed `q`, 1.0 by default when parsed.
         */
        [[nodiscard]] MIMECORE_INLINE double quality() const { return m_quality; }

        /**
         * @brief Check for the `*` / `*` wildcard.
         * @return True if the major type is any.
         */
        [[nodiscard]] MIMECORE_INLINE bool is_any_major_type() const { return !m_type.has_value(); }

        /**
         * @brief Check for a `type/*` entry.
         * @return True if the subtype is any.
         */
        [[nodiscard]] MIMECORE_INLINE bool is_any_subtype() const { return !m_subtype.has_value(); }

        /**
         * @brief Get the description.
         * @return Const reference to the description, empty if unknown.
         */
        [[nodiscard]] MIMECORE_INLINE const auto& description() const { return m_description; }

        /**
         * @brief Get the acronym.
         * @return Const reference to the acronym, empty if unknown.
         */
        [[nodiscard]] MIMECORE_INLINE const auto& acronym() const { return m_acronym; }

        /**
         * @brief Get the Uniform Type Identifier (Apple UTI).
         * @return Const reference to the identifier, empty if unknown.
         */
        [[nodiscard]] MIMECORE_INLINE const auto& uniform_type_identifier() const { return m_uti; }

        /**
         * @brief Get the documentation links.
         * @return Const reference to the links, in insertion order.
         */
        [[nodiscard]] MIMECORE_INLINE const auto& links() const { return m_links; }

        /**
         * @brief Get the preferred file extension.
         * @return First known extension, or an empty string.
         */
        [[nodiscard]] MIMECORE_INLINE std::string extension() const { return m_extensions.empty() ? std::string{} : m_extensions.front(); }

        /**
         * @brief Get all known file extensions.
         * @return Const reference to the extensions, best first.
         */
        [[nodiscard]] MIMECORE_INLINE const auto& extensions() const { return m_extensions; }

        /**
         * @brief Get the magic predicates.
         * @return Const reference to the magics, in insertion order.
         */
        [[nodiscard]] MIMECORE_INLINE const auto& magics() const { return m_magics; }

        /**
         * @brief Check whether any magic is configured.
         * @return True if at least one magic was added.
         */
        [[nodiscard]] MIMECORE_INLINE bool has_magic() const { return !m_magics.empty(); }

        /**
         * @brief Get the root XML associations.
         * @return Const reference to the associations, in insertion order.
         */
        [[nodiscard]] MIMECORE_INLINE const auto& root_xmls() const { return m_root_xmls; }

        /**
         * @brief Check whether any root XML association is configured.
         * @return True if at least one association was added.
         */
        [[nodiscard]] MIMECORE_INLINE bool has_root_xml() const { return !m_root_xmls.empty(); }

        /**
         * @brief Get the minimum buffer length the magics need.
         * @return Length in bytes.
         */
        [[nodiscard]] MIMECORE_INLINE std::int32_t min_length() const { return m_min_length; }

      public:
        /**
         * @brief Order by media type name only.
         * @param other Entry to compare with.
         * @return Negative, zero or positive; the wildcard sorts first.
         */
        [[nodiscard]] int compare(const c_mime_type& other) const;

        /**
         * @brief Equality operator, media type only.
         * @param other Entry to compare with.
         * @return True if both media types are equal.
         */
        MIMECORE_INLINE bool operator==(const c_mime_type& other) const { return m_type == other.m_type; }

        /**
         * @brief Inequality operator.
         * @param other Entry to compare with.
         * @return True if the media types differ.
         */
        MIMECORE_INLINE bool operator!=(const c_mime_type& other) const { return !(*this == other); }

        /**
         * @brief Less-than operator, see compare().
         * @param other Entry to compare with.
         * @return True if this entry orders first.
         */
        MIMECORE_INLINE bool operator<(const c_mime_type& other) const { return compare(other) < 0; }

        /**
         * @brief Hash support for boost containers.
         * @param mime_type Entry to hash.
         * @return Hash of the media type name, 0 for the wildcard.
         */
        friend std::size_t hash_value(const c_mime_type& mime_type);

      private:
        friend struct mime_type_builder_t;

        /**
         * @brief Construct the `*` / `*` wildcard entry.
         * @param quality Quality value.
         */
        MIMECORE_INLINE c_mime_type(std::nullopt_t, double quality)
            : m_quality(quality) {}

      private:
        /** @brief Normalized media type, nullopt for any major type. */
        std::optional<media_type_t> m_type{};

        /** @brief Normalized subtype, nullopt for any subtype. */
        std::optional<std::string> m_subtype{};

        /** @brief Quality value. */
        double m_quality{};

        /** @brief Acronym, e.g. "PDF". */
        std::string m_acronym{};

        /** @brief Uniform Type Identifier. */
        std::string m_uti{};

        /** @brief Documentation links. */
        std::vector<uri_t> m_links{};

        /** @brief Description of this media type. */
        std::string m_description{};

        /** @brief Magic predicates. */
        std::vector<magic_t> m_magics{};

        /** @brief Root XML associations. */
        std::vector<root_xml_t> m_root_xmls{};

        /** @brief Minimum length of data for magic analysis. */
        std::int32_t m_min_length{};

        /** @brief Known file extensions, best first. */
        std::vector<std::string> m_extensions{};
    };
}

template <>
struct std::hash<mimecore::c_mime_type> {
    MIMECORE_INLINE std::size_t operator()(const mimecore::c_mime_type& mime_type) const { return hash_value(mime_type); }
};

template <>
struct fmt::formatter<mimecore::c_mime_type> : fmt::formatter<std::string_view> {
    template <typename _ctx_t>
    MIMECORE_INLINE auto format(const mimecore::c_mime_type& mime_type, _ctx_t& ctx) const {
        return fmt::formatter<std::string_view>::format(mime_type.to_string(), ctx);
    }
};

#include "builder/builder.hxx"

#endif // MIMECORE_MIME_TYPE_HXX
