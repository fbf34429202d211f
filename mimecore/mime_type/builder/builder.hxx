/**
 * @file builder.hxx
 * @brief Mutating access to a c_mime_type while a registry is being populated.
 */

#ifndef MIMECORE_MIME_TYPE_BUILDER_HXX
#define MIMECORE_MIME_TYPE_BUILDER_HXX

namespace mimecore {
    /**
     * @brief Builds a c_mime_type step by step.
     *
     * Only the registry-building code should hold a builder. Once build() is called,
     * the returned entry can't be modified anymore.
     */
    struct mime_type_builder_t {
        /**
         * @brief Start an entry for a normalized media type.
         * @param type Normalized media type name.
         * @throws exceptions::invalid_argument_exception_t if the name is empty.
         */
        MIMECORE_INLINE explicit mime_type_builder_t(media_type_t type)
            : m_mime_type(std::move(type)) {}

        /**
         * @brief Start an entry with subtype and quality.
         * @param type Normalized media type name.
         * @param subtype Normalized subtype, nullopt for any subtype.
         * @param quality Quality value.
         * @throws exceptions::invalid_argument_exception_t if the name is empty.
         */
        MIMECORE_INLINE mime_type_builder_t(media_type_t type, std::optional<std::string> subtype, double quality)
            : m_mime_type(std::move(type), std::move(subtype), quality) {}

        /**
         * @brief Continue from an existing entry, e.g. one returned by c_mime_type::parse.
         * @param mime_type Entry to copy.
         */
        MIMECORE_INLINE explicit mime_type_builder_t(c_mime_type mime_type)
            : m_mime_type(std::move(mime_type)) {}

      public:
        /**
         * @brief Add a known file extension; duplicates are ignored.
         * @param extension File extension, e.g. ".pdf".
         * @return Reference to this builder.
         */
        mime_type_builder_t& add_extension(std::string extension);

        /**
         * @brief Add a magic predicate; null pointers are ignored.
         *
         * Raises min_length to the magic's own minimum length when larger.
         *
         * @param magic Magic to add.
         * @return Reference to this builder.
         */
        mime_type_builder_t& add_magic(magic_t magic);

        /**
         * @brief Add a root XML association.
         * @param namespace_uri Namespace URI of the root element, may be empty.
         * @param local_name Local name of the root element, may be empty.
         * @return Reference to this builder.
         * @throws exceptions::invalid_argument_exception_t if both are empty.
         */
        mime_type_builder_t& add_root_xml(std::string namespace_uri, std::string local_name);

        /**
         * @brief Add a documentation link.
         * @param link Link to add.
         * @return Reference to this builder.
         * @throws exceptions::invalid_argument_exception_t if the link is empty.
         */
        mime_type_builder_t& add_link(uri_t link);

        /**
         * @brief Set the acronym.
         * @param acronym New value, may be empty.
         * @return Reference to this builder.
         */
        mime_type_builder_t& set_acronym(std::string acronym);

        /**
         * @brief Set the description.
         * @param description New value, may be empty.
         * @return Reference to this builder.
         */
        mime_type_builder_t& set_description(std::string description);

        /**
         * @brief Set the Uniform Type Identifier.
         * @param uti New value, may be empty.
         * @return Reference to this builder.
         */
        mime_type_builder_t& set_uniform_type_identifier(std::string uti);

        /**
         * @brief Set the minimum buffer length the magics need.
         * @param min_length Length in bytes.
         * @return Reference to this builder.
         * @throws exceptions::invalid_argument_exception_t if negative.
         */
        mime_type_builder_t& set_min_length(std::int32_t min_length);

      public:
        /**
         * @brief Inspect the entry being built.
         * @return Const reference to the entry.
         */
        [[nodiscard]] MIMECORE_INLINE const c_mime_type& peek() const { return m_mime_type; }

        /**
         * @brief Publish the entry.
         * @return The finished entry.
         */
        [[nodiscard]] MIMECORE_INLINE c_mime_type build() && { return std::move(m_mime_type); }

        /** @brief Publish a copy of the entry, keeping the builder usable. */
        [[nodiscard]] MIMECORE_INLINE c_mime_type build() const& { return m_mime_type; }

      private:
        /** @brief Entry under construction. */
        c_mime_type m_mime_type;
    };
}

#endif // MIMECORE_MIME_TYPE_BUILDER_HXX
