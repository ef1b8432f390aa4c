// safejson_sanitize.cpp
#include "safejson.hpp"
#include <cstdio>

namespace safejson {
    namespace {
        Dict sanitize_dict(const Dict &dict, int depth, std::unordered_set<const void *> &ancestors);

        std::shared_ptr<Object> clone_object(const std::shared_ptr<Object> &object, std::string &reason) {
            if (!object) {
                reason = "null object";
                return nullptr;
            }
            if (object->is_callable()) {
                reason = "callable " + object->type_name();
                return nullptr;
            }
            try {
                std::shared_ptr<Object> copy = object->clone();
                if (!copy) {
                    reason = object->type_name() + " produced no copy";
                }
                return copy;
            } catch (const std::exception &ex) {
                reason = ex.what();
            } catch (...) {
                reason = "clone of " + object->type_name() + " failed";
            }
            return nullptr;
        }

        // Duplicates value into copy. Returns false with a reason when the entry
        // has to be dropped.
        bool copy_value(
            const Value &value,
            Value &copy,
            int depth,
            std::unordered_set<const void *> &ancestors,
            std::string &reason
        ) {
            if (value.is_primitive() || (!value.is_container() && value.type() != ValueType::OBJECT)) {
                copy = value;
                return true;
            }
            switch (value.type()) {
                case ValueType::LIST: {
                    auto list = std::make_shared<List>(*value.as_list());
                    copy = Value(list);
                    return true;
                }
                case ValueType::TUPLE: {
                    auto tuple = std::make_shared<Tuple>(*value.as_tuple());
                    copy = Value(tuple);
                    return true;
                }
                case ValueType::SET:
                case ValueType::FROZENSET: {
                    auto set = std::make_shared<Set>(*value.as_set());
                    copy = Value(set);
                    return true;
                }
                case ValueType::DICT: {
                    const void *identity = value.identity();
                    if (ancestors.count(identity) != 0) {
                        reason = "mapping contains itself";
                        return false;
                    }
                    if (depth >= DEFAULT_MAX_DEPTH) {
                        reason = "mapping nested too deep";
                        return false;
                    }
                    ancestors.insert(identity);
                    auto dict = std::make_shared<Dict>(sanitize_dict(*value.as_dict(), depth + 1, ancestors));
                    ancestors.erase(identity);
                    copy = Value(dict);
                    return true;
                }
                default:
                    break;
            }
            std::shared_ptr<Object> object = clone_object(value.as_object(), reason);
            if (!object) {
                return false;
            }
            copy = Value(object);
            return true;
        }

        Dict sanitize_dict(const Dict &dict, int depth, std::unordered_set<const void *> &ancestors) {
            Dict result;
            result.entries.reserve(dict.entries.size());
            for (const auto &entry: dict.entries) {
                Value copy;
                std::string reason;
                if (copy_value(entry.second, copy, depth, ancestors, reason)) {
                    result.entries.emplace_back(entry.first, std::move(copy));
                    continue;
                }
#ifdef SAFEJSON_ENABLE_DEBUG_PRINTS
                fprintf(stderr, "safejson: dropping metadata key '%s': %s\n",
                        entry.first.to_string().c_str(), reason.c_str());
#endif
            }
            return result;
        }
    } // namespace

    Dict sanitize(const Dict &metadata) {
        std::unordered_set<const void *> ancestors{&metadata};
        return sanitize_dict(metadata, 0, ancestors);
    }

    std::shared_ptr<Dict> sanitize(const std::shared_ptr<Dict> &metadata) {
        if (!metadata) {
            return metadata;
        }
        return std::make_shared<Dict>(sanitize(*metadata));
    }
} // namespace safejson
