#include <mimecore.hxx>

namespace mimecore {
    media_type_t::media_type_t(const std::string_view& name)
        : m_name(boost::algorithm::to_lower_copy(boost::algorithm::trim_copy(std::string(name)))) {
    }
}
