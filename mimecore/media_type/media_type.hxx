/**
 * @file media_type.hxx
 * @brief Normalized media type name value.
 */

#ifndef MIMECORE_MEDIA_TYPE_HXX
#define MIMECORE_MEDIA_TYPE_HXX

namespace mimecore {
    /**
     * @brief Immutable, normalized (trimmed, lower case) media type name.
     *
     * Holds whatever name the registry keys an entry on: a full `type/subtype`
     * pair for registered types, or only the major type for entries built by
     * c_mime_type::parse.
     */
    struct media_type_t {
        /**
         * @brief Default constructor. Creates an empty name.
         */
        MIMECORE_INLINE media_type_t() = default;

        /**
         * @brief Construct from a raw name, normalizing it.
         * @param name Raw media type name.
         */
        explicit media_type_t(const std::string_view& name);

      public:
        /**
         * @brief Parse a raw name into a normalized media type.
         * @param name Raw media type name.
         * @return Normalized media type.
         */
        MIMECORE_INLINE static media_type_t parse(const std::string_view& name) { return media_type_t(name); }

      public:
        /**
         * @brief Get the normalized name.
         * @return Const reference to the name.
         */
        [[nodiscard]] MIMECORE_INLINE const std::string& name() const { return m_name; }

        /**
         * @brief Check whether the name is empty.
         * @return True if no name is held.
         */
        [[nodiscard]] MIMECORE_INLINE bool empty() const { return m_name.empty(); }

        /**
         * @brief Three-way comparison on the normalized name.
         * @param other Media type to compare with.
         * @return Negative, zero or positive.
         */
        [[nodiscard]] MIMECORE_INLINE int compare(const media_type_t& other) const { return m_name.compare(other.m_name); }

      public:
        /**
         * @brief Equality operator.
         * @param other Media type to compare with.
         * @return True if the names are equal.
         */
        MIMECORE_INLINE bool operator==(const media_type_t& other) const { return m_name == other.m_name; }

        /**
         * @brief Inequality operator.
         * @param other Media type to compare with.
         * @return True if the names differ.
         */
        MIMECORE_INLINE bool operator!=(const media_type_t& other) const { return m_name != other.m_name; }

        /**
         * @brief Less-than operator.
         * @param other Media type to compare with.
         * @return True if this name orders first.
         */
        MIMECORE_INLINE bool operator<(const media_type_t& other) const { return m_name < other.m_name; }

        /**
         * @brief Hash support for boost containers.
         * @param type Media type to hash.
         * @return Hash of the normalized name.
         */
        friend MIMECORE_INLINE std::size_t hash_value(const media_type_t& type) { return boost::hash<std::string>{}(type.m_name); }

      private:
        /** @brief Normalized name. */
        std::string m_name{};
    };
}

template <>
struct std::hash<mimecore::media_type_t> {
    MIMECORE_INLINE std::size_t operator()(const mimecore::media_type_t& type) const { return hash_value(type); }
};

template <>
struct fmt::formatter<mimecore::media_type_t> : fmt::formatter<std::string_view> {
    template <typename _ctx_t>
    MIMECORE_INLINE auto format(const mimecore::media_type_t& type, _ctx_t& ctx) const {
        return fmt::formatter<std::string_view>::format(type.name(), ctx);
    }
};

#endif // MIMECORE_MEDIA_TYPE_HXX
