// safejson_value.cpp
#include "safejson.hpp"
#include <cmath>

namespace safejson {
    const char *type_name(ValueType type) {
        switch (type) {
            case ValueType::NONE: return "none";
            case ValueType::BOOL: return "bool";
            case ValueType::INT: return "int";
            case ValueType::FLOAT: return "float";
            case ValueType::STRING: return "str";
            case ValueType::LIST: return "list";
            case ValueType::TUPLE: return "tuple";
            case ValueType::DICT: return "dict";
            case ValueType::SET: return "set";
            case ValueType::FROZENSET: return "frozenset";
            case ValueType::OBJECT: return "object";
        }
        return "object";
    }

    ValueType Value::type() const {
        switch (data_.index()) {
            case 0: return ValueType::NONE;
            case 1: return ValueType::BOOL;
            case 2: return ValueType::INT;
            case 3: return ValueType::FLOAT;
            case 4: return ValueType::STRING;
            case 5: return ValueType::LIST;
            case 6: return ValueType::TUPLE;
            case 7: {
                const auto &set = as_set();
                return (set && set->frozen) ? ValueType::FROZENSET : ValueType::SET;
            }
            case 8: return ValueType::DICT;
            default: return ValueType::OBJECT;
        }
    }

    bool Value::is_container() const {
        // A null container handle carries no children and is treated like an opaque value.
        switch (data_.index()) {
            case 5: return as_list() != nullptr;
            case 6: return as_tuple() != nullptr;
            case 7: return as_set() != nullptr;
            case 8: return as_dict() != nullptr;
            default: return false;
        }
    }

    const void *Value::identity() const {
        return std::visit([](const auto &alt) -> const void * {
            using T = std::decay_t<decltype(alt)>;
            if constexpr (std::is_same_v<T, std::shared_ptr<List> > ||
                          std::is_same_v<T, std::shared_ptr<Tuple> > ||
                          std::is_same_v<T, std::shared_ptr<Set> > ||
                          std::is_same_v<T, std::shared_ptr<Dict> > ||
                          std::is_same_v<T, std::shared_ptr<Object> >) {
                return alt.get();
            } else {
                return nullptr;
            }
        }, data_);
    }

    bool identical(const Value &a, const Value &b) {
        if (a.storage().index() != b.storage().index()) {
            return false;
        }
        if (a.is_primitive()) {
            return a.storage() == b.storage();
        }
        return a.identity() == b.identity();
    }

    std::string Key::to_string() const {
        switch (data_.index()) {
            case 0: return "None";
            case 1: return std::get<bool>(data_) ? "True" : "False";
            case 2: return std::to_string(std::get<int64_t>(data_));
            case 3: {
                double d = std::get<double>(data_);
                if (std::isnan(d)) {
                    return "nan";
                }
                if (std::isinf(d)) {
                    return d < 0 ? "-inf" : "inf";
                }
                return ordered_json(d).dump();
            }
            default: return std::get<std::string>(data_);
        }
    }

    bool Set::add(Value value) {
        for (const auto &item: items) {
            if (identical(item, value)) {
                return false;
            }
        }
        items.push_back(std::move(value));
        return true;
    }

    void Dict::set(Key key, Value value) {
        for (auto &entry: entries) {
            if (entry.first == key) {
                entry.second = std::move(value);
                return;
            }
        }
        entries.emplace_back(std::move(key), std::move(value));
    }

    const Value *Dict::find(const Key &key) const {
        for (const auto &entry: entries) {
            if (entry.first == key) {
                return &entry.second;
            }
        }
        return nullptr;
    }

    std::shared_ptr<List> new_list(std::initializer_list<Value> items) {
        auto list = std::make_shared<List>();
        list->items.assign(items.begin(), items.end());
        return list;
    }

    std::shared_ptr<Tuple> new_tuple(std::initializer_list<Value> items) {
        auto tuple = std::make_shared<Tuple>();
        tuple->items.assign(items.begin(), items.end());
        return tuple;
    }

    std::shared_ptr<Set> new_set(std::initializer_list<Value> items) {
        auto set = std::make_shared<Set>();
        for (const auto &item: items) {
            set->add(item);
        }
        return set;
    }

    std::shared_ptr<Set> new_frozenset(std::initializer_list<Value> items) {
        auto set = new_set(items);
        set->frozen = true;
        return set;
    }

    std::shared_ptr<Dict> new_dict(std::initializer_list<std::pair<Key, Value> > entries) {
        auto dict = std::make_shared<Dict>();
        for (const auto &entry: entries) {
            dict->set(entry.first, entry.second);
        }
        return dict;
    }

    void clear_graph(const Value &value) {
        // Collect first, clear afterwards: the copies in `reachable` keep every
        // container alive until all of them have been emptied.
        std::vector<Value> reachable;
        std::unordered_set<const void *> seen;
        if (value.is_container()) {
            reachable.push_back(value);
            seen.insert(value.identity());
        }
        auto visit = [&](const Value &child) {
            if (child.is_container() && seen.insert(child.identity()).second) {
                reachable.push_back(child);
            }
        };
        for (size_t i = 0; i < reachable.size(); i++) {
            const Value current = reachable[i];
            switch (current.type()) {
                case ValueType::LIST:
                    for (const auto &item: current.as_list()->items) visit(item);
                    break;
                case ValueType::TUPLE:
                    for (const auto &item: current.as_tuple()->items) visit(item);
                    break;
                case ValueType::SET:
                case ValueType::FROZENSET:
                    for (const auto &item: current.as_set()->items) visit(item);
                    break;
                case ValueType::DICT:
                    for (const auto &entry: current.as_dict()->entries) visit(entry.second);
                    break;
                default:
                    break;
            }
        }
        for (const auto &container: reachable) {
            switch (container.type()) {
                case ValueType::LIST: container.as_list()->items.clear(); break;
                case ValueType::TUPLE: container.as_tuple()->items.clear(); break;
                case ValueType::SET:
                case ValueType::FROZENSET: container.as_set()->items.clear(); break;
                case ValueType::DICT: container.as_dict()->entries.clear(); break;
                default: break;
            }
        }
    }
} // namespace safejson
