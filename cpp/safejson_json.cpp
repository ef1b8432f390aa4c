// safejson_json.cpp
#include "safejson.hpp"
#include <algorithm>
#include <cmath>

namespace safejson {
    std::string SafeSerializer::dumps(const Value &value) {
        ordered_json j = serialize(value);
        // Strings coming from foreign objects are not guaranteed to be UTF-8;
        // replace invalid sequences instead of letting dump() throw.
        return j.dump(-1, ' ', false, ordered_json::error_handler_t::replace);
    }

    std::string safe_dumps(const Value &value, int max_depth) {
        SafeSerializer serializer(max_depth);
        return serializer.dumps(value);
    }

    ordered_json safe_serialize(const Value &value, int max_depth) {
        SafeSerializer serializer(max_depth);
        return serializer.serialize(value);
    }

    void sort_set_items(ordered_json &items) {
        if (!items.is_array() || items.size() < 2) {
            return;
        }
        bool all_numbers = true;
        bool all_strings = true;
        for (const auto &item: items) {
            bool nan = item.is_number_float() && std::isnan(item.get<double>());
            all_numbers = all_numbers && item.is_number() && !nan;
            all_strings = all_strings && item.is_string();
        }
        auto &elements = items.get_ref<ordered_json::array_t &>();
        if (all_numbers) {
            std::stable_sort(elements.begin(), elements.end(),
                             [](const ordered_json &a, const ordered_json &b) {
                                 return a < b;
                             });
            return;
        }
        if (all_strings) {
            std::stable_sort(elements.begin(), elements.end(),
                             [](const ordered_json &a, const ordered_json &b) {
                                 return a.get_ref<const std::string &>() < b.get_ref<const std::string &>();
                             });
            return;
        }
        // Mixed element kinds have no natural order; fall back to their JSON text.
        std::vector<std::pair<std::string, ordered_json> > keyed;
        keyed.reserve(elements.size());
        for (auto &element: elements) {
            keyed.emplace_back(element.dump(-1, ' ', false, ordered_json::error_handler_t::replace),
                               std::move(element));
        }
        std::stable_sort(keyed.begin(), keyed.end(),
                         [](const auto &a, const auto &b) { return a.first < b.first; });
        for (size_t i = 0; i < keyed.size(); i++) {
            elements[i] = std::move(keyed[i].second);
        }
    }
} // namespace safejson
