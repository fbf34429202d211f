#include <mimecore.hxx>

namespace mimecore::magic {
    bytes_magic_t::bytes_magic_t(std::size_t offset, std::vector<std::uint8_t> pattern)
        : m_offset(offset), m_pattern(std::move(pattern)) {
        if (m_pattern.empty())
            throw exceptions::invalid_argument_exception_t("Magic pattern is missing");

        if (m_offset > std::numeric_limits<std::size_t>::max() - m_pattern.size())
            throw exceptions::invalid_argument_exception_t("Magic offset is out of range");
    }

    bytes_magic_t::bytes_magic_t(std::size_t offset, const std::string_view& pattern)
        : bytes_magic_t(offset, std::vector<std::uint8_t>(pattern.begin(), pattern.end())) {
    }

    bool bytes_magic_t::eval(bytes_t data) const {
        if (m_offset > data.size()
            || data.size() - m_offset < m_pattern.size())
            return false;

        return std::equal(m_pattern.begin(), m_pattern.end(), data.begin() + m_offset);
    }
}
