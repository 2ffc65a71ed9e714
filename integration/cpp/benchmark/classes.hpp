#pragma once

#include <benchmark/benchmark.h>
#include <integration/cpp/base_spaces.hpp>
#include <integration/cpp/bag.hpp>
#include <integration/cpp/set.hpp>

using namespace components::expressions;
using components::types::atom;
using components::types::make_tuple;

static const std::string table_name_without_key = "testtable_scan";
static const std::string table_name_with_key = "testtable_lookup";
constexpr int size_table = 10000;
constexpr int groups = 100;

inline configuration::config create_config() {
    auto config = configuration::config::default_config();
    config.log.level = log_t::level::off;
    config.main_path = std::filesystem::temp_directory_path() / "termstore_benchmark";
    config.log.path.clear();
    return config;
}

class test_spaces final : public termstore::base_termstore_t {
public:
    static test_spaces& get() {
        static test_spaces spaces_;
        return spaces_;
    }

    termstore::actor_id_t actor() const noexcept { return actor_; }

private:
    test_spaces()
        : termstore::base_termstore_t(create_config())
        , actor_(registry()->spawn_actor()) {}

    termstore::actor_id_t actor_;
};

// records {group, id, payload}; the scan table is keyed on id, the lookup table on group
inline void init_table(const std::string& name, std::size_t keypos) {
    auto& spaces = test_spaces::get();
    components::options::bag_options_t options;
    options.name = name;
    options.keypos = keypos;
    options.duplicate = true;
    auto bag = termstore::bag_t::create_or_throw(spaces.registry(), spaces.actor(), options);
    termstore::records_t records;
    records.reserve(size_table);
    for (int i = 0; i < size_table; ++i) {
        records.push_back(make_tuple(i % groups, i, atom("payload")));
    }
    bag.add_or_throw(spaces.actor(), records);
}

inline void init_spaces() {
    init_table(table_name_without_key, 2);
    init_table(table_name_with_key, 1);
}

template<bool on_key>
std::string get_table_name() {
    if constexpr (on_key) {
        return table_name_with_key;
    } else {
        return table_name_without_key;
    }
}
