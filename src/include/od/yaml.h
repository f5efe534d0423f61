#pragma once

#include <od/dict.h>

#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>

namespace od {
namespace yaml {

// One mapping entry of a YAML document. Keys are typed like any other
// scalar, so `1: x` has an integer key.
struct MapItem {
    Value key;
    Value value;
};

// A YAML mapping with its entries in document order.
using MapSlice = std::vector<MapItem>;

struct YamlError : public std::runtime_error {
    size_t line;
    YamlError(const std::string& msg, size_t l)
        : std::runtime_error("YAML parse error: " + msg + " (line " + std::to_string(l) + ")"), line(l) {}
};

// set() every pair of `pairs` into `out` in order. Pairs with a key that is
// not a string are skipped.
void from_pairs(const MapSlice& pairs, Dict& out);
// Live items of `dict` in order. Values are passed through untouched.
MapSlice to_pairs(const Dict& dict);

// Read a block-style YAML mapping. Nested mappings become Dict values.
MapSlice parse_pairs(const std::string& text);
// Write `pairs` as block-style YAML. Dict values are expanded through
// to_pairs(); a Dict found inside itself is skipped.
std::string dump_pairs(const MapSlice& pairs);

void parse_yaml(const std::string& text, Dict& out);
DictPtr parse_yaml(const std::string& text);
std::string dump_yaml(const Dict& dict);

} // namespace yaml
} // namespace od
