#pragma once

#include "../io/log.hpp"
#include <odestep/core/types.hpp>

#define TOML_EXCEPTIONS 0
#define TOML_ENABLE_FORMATTERS 0
// the two define's that follow are require to work around a known toml++ bug (see https://github.com/marzer/tomlplusplus/issues/213)
#define TOML_RETURN_BOOL_FROM_FOR_EACH_BROKEN 1
#define TOML_RETURN_BOOL_FROM_FOR_EACH_BROKEN_ACKNOWLEDGED 1
#include <toml++/toml.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <typeinfo>
#include <vector>

namespace odestep {

inline const toml::table* as_table_ptr(const toml::node_view<const toml::node>& nv) {
    if(!nv) return nullptr;
    return nv.as_table();
}

template <class T>
std::optional<T> value_or_die(const toml::table& tbl, std::string_view key_path) {
    // Resolve dotted path (e.g. "grid.h")
    toml::node_view<const toml::node> nv = tbl.at_path(key_path);

    if(!nv) {
        ODESTEP_CRITICAL("Missing key '{}'", key_path);
        throw ConfigError(fmt::format("missing key '{}'", key_path));
    }

    if(auto v = nv.value<T>()) {
        return *v;
    }

    ODESTEP_CRITICAL("Key '{}' has incompatible type (expected something convertible to {})", key_path, typeid(T).name());
    throw ConfigError(fmt::format("key '{}' has an incompatible type", key_path));
}

template <class T>
std::optional<T> value_or_die(const toml::table* tbl, std::string_view key_path) {
    if(!tbl) {
        throw ConfigError(fmt::format("missing table holding key '{}'", key_path));
    }
    return value_or_die<T>(*tbl, key_path);
}

// Returns T or a default; logs when the default is used. A key that is
// present with the wrong type is an error, not a default.
template <class T>
T value_or(const toml::table& tbl, std::string_view key_path, T default_value) {
    toml::node_view<const toml::node> nv = tbl.at_path(key_path);
    if(!nv) {
        ODESTEP_DEBUG("Using default for {} ({})", key_path, default_value);
        return default_value;
    }
    if(auto v = nv.value<T>()) {
        return *v;
    }

    ODESTEP_CRITICAL("Key '{}' has incompatible type (expected something convertible to {})", key_path, typeid(T).name());
    throw ConfigError(fmt::format("key '{}' has an incompatible type", key_path));
}

template <typename T>
T value_or(const toml::table* tp, std::string_view key_path, T default_value) {
    if(!tp) {
        return default_value;
    }

    return value_or<T>(*tp, key_path, default_value);
}

template<typename T>
std::vector<T> vector_or(const toml::array* a, const std::vector<T>& def) {
    if(!a) {
        return def;
    }
    std::vector<T> out;
    out.reserve(a->size());
    for(auto& n : *a) {
        if(auto v = n.template value<T>()) {
            out.push_back(*v);
        }
        else {
            throw ConfigError("array contains an element of incompatible type");
        }
    }
    return out.empty() ? def : out;
}

template<typename T>
std::vector<std::vector<T>> matrix_or(const toml::array* a, const std::vector<std::vector<T>>& def) {
    if(!a) {
        return def;
    }
    std::vector<std::vector<T>> M;
    M.reserve(a->size());
    for(auto& row : *a) {
        if(auto ra = row.as_array()) {
            std::vector<T> r;
            r.reserve(ra->size());
            for(auto& c : *ra) {
                if(auto x = c.template value<T>()) {
                    r.push_back(*x);
                }
                else {
                    throw ConfigError("matrix contains an element of incompatible type");
                }
            }
            if(!r.empty()) {
                M.emplace_back(std::move(r));
            }
        }
        else {
            throw ConfigError("matrix rows must be arrays");
        }
    }
    return M.empty() ? def : M;
}

}  // namespace odestep
