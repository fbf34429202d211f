/**
 * @file magic.hxx
 * @brief Byte-pattern predicates used to recognize content by its leading bytes.
 */

#ifndef MIMECORE_MAGIC_HXX
#define MIMECORE_MAGIC_HXX

namespace mimecore::magic {
    /** @brief Type alias for a read-only view of the sniffed bytes. */
    using bytes_t = std::span<const std::uint8_t>;

    /**
     * @brief Function concept for magic predicates.
     * @tparam _fn_t Candidate callable type.
     */
    template <typename _fn_t>
    concept predicate_c = requires(const _fn_t& fn, bytes_t data) {
        { fn(data) } -> std::convertible_to<bool>;
    };

    /**
     * @brief Base interface for magic predicates.
     *
     * A magic only answers whether a buffer looks like its type. Checking that the
     * buffer is long enough is the predicate's own job.
     */
    class c_base_magic {
      public:
        /**
         * @brief Evaluate the predicate against a byte buffer.
         * @param data Bytes to test.
         * @return True if the bytes match.
         */
        virtual bool eval(bytes_t data) const = 0;

        /**
         * @brief Minimum number of bytes the predicate needs to see.
         * @return Buffer length, 0 if unknown.
         */
        virtual std::size_t min_length() const { return 0u; }

        /**
         * @brief Virtual destructor.
         */
        virtual ~c_base_magic() = default;
    };

    /**
     * @brief Magic backed by an arbitrary callable.
     * @tparam _fn_t Type of the predicate function.
     */
    template <predicate_c _fn_t>
    class fn_magic_t : public c_base_magic {
      public:
        /**
         * @brief Construct a magic from a predicate.
         * @param fn Predicate to invoke.
         * @param min_length Minimum buffer length the predicate needs.
         */
        MIMECORE_INLINE fn_magic_t(_fn_t&& fn, std::size_t min_length = 0u)
            : m_fn(std::move(fn)), m_min_length(min_length) {}

      public:
        MIMECORE_INLINE bool eval(bytes_t data) const override { return static_cast<bool>(m_fn(data)); }

        MIMECORE_INLINE std::size_t min_length() const override { return m_min_length; }

      private:
        /** @brief Predicate function. */
        _fn_t m_fn;

        /** @brief Minimum buffer length. */
        std::size_t m_min_length{};
    };

    /**
     * @brief Magic matching a literal byte sequence at a fixed offset.
     */
    class bytes_magic_t : public c_base_magic {
      public:
        /**
         * @brief Construct a literal byte magic.
         * @param offset Offset of the pattern in the buffer.
         * @param pattern Bytes expected at the offset.
         */
        bytes_magic_t(std::size_t offset, std::vector<std::uint8_t> pattern);

        /**
         * @brief Construct a literal byte magic from a string.
         * @param offset Offset of the pattern in the buffer.
         * @param pattern Characters expected at the offset.
         */
        bytes_magic_t(std::size_t offset, const std::string_view& pattern);

      public:
        /**
         * @brief Check the pattern at the configured offset.
         * @param data Bytes to test.
         * @return False if the buffer is too short or differs.
         */
        bool eval(bytes_t data) const override;

        MIMECORE_INLINE std::size_t min_length() const override { return m_offset + m_pattern.size(); }

      public:
        /**
         * @brief Get the pattern offset.
         * @return Offset in bytes.
         */
        [[nodiscard]] MIMECORE_INLINE std::size_t offset() const { return m_offset; }

        /**
         * @brief Get the expected bytes.
         * @return Const reference to the pattern.
         */
        [[nodiscard]] MIMECORE_INLINE const auto& pattern() const { return m_pattern; }

      private:
        /** @brief Offset of the pattern. */
        std::size_t m_offset{};

        /** @brief Expected bytes. */
        std::vector<std::uint8_t> m_pattern{};
    };

    /**
     * @brief Shared pointer type for magic predicates.
     */
    using magic_t = std::shared_ptr<const c_base_magic>;

    /**
     * @brief Wrap a callable into a shared magic.
     * @tparam _fn_t Type of the predicate function.
     * @param fn Predicate to wrap.
     * @param min_length Minimum buffer length the predicate needs.
     * @return Shared magic instance.
     */
    template <typename _fn_t>
    MIMECORE_INLINE magic_t make_magic(_fn_t&& fn, std::size_t min_length = 0u) {
        return std::make_shared<fn_magic_t<std::decay_t<_fn_t>>>(std::decay_t<_fn_t>(std::forward<_fn_t>(fn)), min_length);
    }
}

namespace mimecore {
    using magic::magic_t;
}

#endif // MIMECORE_MAGIC_HXX
