#include <od/yaml.h>

namespace od {
namespace yaml {

void from_pairs(const MapSlice& pairs, Dict& out) {
    for (auto const& item : pairs) {
        if (!item.key.is_string()) continue;
        out.set(item.key.as_string(), item.value);
    }
}

MapSlice to_pairs(const Dict& dict) {
    MapSlice out;
    for (auto& item : dict.items()) out.push_back(MapItem{Value(std::move(item.key)), std::move(item.value)});
    return out;
}

void parse_yaml(const std::string& text, Dict& out) {
    from_pairs(parse_pairs(text), out);
}

DictPtr parse_yaml(const std::string& text) {
    auto d = make_dict();
    parse_yaml(text, *d);
    return d;
}

} // namespace yaml
} // namespace od
