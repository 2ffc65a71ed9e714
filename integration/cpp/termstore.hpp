#pragma once

#include "bag.hpp"
#include "base_spaces.hpp"
#include "key_value_set.hpp"
#include "set.hpp"
#include "table_handle.hpp"

#include <memory>

namespace termstore {

    class termstore_t final : public base_termstore_t {
    public:
        explicit termstore_t(const configuration::config& config);
    };

    using termstore_ptr = std::unique_ptr<termstore_t>;

    termstore_ptr make_termstore(const configuration::config& config);

} // namespace termstore
