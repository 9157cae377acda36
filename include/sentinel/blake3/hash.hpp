#pragma once
#include <sentinel/schema/primitives.hpp>
#include <cstdint>
#include <initializer_list>
#include <span>
#include <string_view>

namespace sentinel::blake3 {

sentinel::schema::hash32_t hash(const std::string_view& str);
sentinel::schema::hash32_t hash(const sentinel::schema::bytes_view_t& bytes);

/// Hash of several byte ranges fed in order, without concatenating them.
sentinel::schema::hash32_t hash(
    std::initializer_list<sentinel::schema::bytes_view_t> parts);

}  // namespace sentinel::blake3
