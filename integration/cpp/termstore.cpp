#include "termstore.hpp"

namespace termstore {

    termstore_t::termstore_t(const configuration::config& config)
        : base_termstore_t(config) {}

    termstore_ptr make_termstore(const configuration::config& config) { return std::make_unique<termstore_t>(config); }

} // namespace termstore
