// safejson.cpp
#include "safejson.hpp"
#include <cstdio>

namespace safejson {
    ordered_json SafeSerializer::serialize(const Value &value) {
        ordered_json root;
        std::unordered_set<const void *> ancestors;
        std::vector<Frame> stack;
        if (serialize_node(value, root, 0, ancestors)) {
            stack.push_back(Frame{&value, 0, &root, 0});
        }
        // Explicit frame stack instead of recursion: native stack usage stays flat
        // regardless of max_depth. Each out pointer refers to the last element of its
        // parent, which is not resized until the child frame has been popped.
        while (!stack.empty()) {
            Frame &frame = stack.back();
            const Value *child = nullptr;
            ordered_json *child_out = nullptr;
            if (!advance_frame(frame, child, child_out)) {
                finish_frame(frame);
                ancestors.erase(frame.container->identity());
                stack.pop_back();
                continue;
            }
            int child_depth = frame.depth + 1;
            if (serialize_node(*child, *child_out, child_depth, ancestors)) {
                stack.push_back(Frame{child, 0, child_out, child_depth});
            }
        }
        return root;
    }

    bool SafeSerializer::serialize_node(
        const Value &value,
        ordered_json &out,
        int depth,
        std::unordered_set<const void *> &ancestors
    ) {
        const auto &data = value.storage();
        switch (value.type()) {
            case ValueType::NONE:
                out = nullptr;
                return false;
            // Check bool before int so true/false never become 1/0
            case ValueType::BOOL:
                out = std::get<bool>(data);
                return false;
            case ValueType::INT:
                out = std::get<int64_t>(data);
                return false;
            case ValueType::FLOAT:
                out = std::get<double>(data);
                return false;
            case ValueType::STRING:
                out = std::get<std::string>(data);
                return false;
            default:
                break;
        }
        if (value.type() != ValueType::OBJECT && !value.is_container()) {
            // empty container handle
            out = nullptr;
            return false;
        }
        if (value.is_container() && ancestors.count(value.identity()) != 0) {
#ifdef SAFEJSON_ENABLE_DEBUG_PRINTS
            fprintf(stderr, "safejson: circular reference to %s at depth %d\n",
                    type_name(value.type()), depth);
#endif
            out = CIRCULAR_REFERENCE_SENTINEL;
            return false;
        }
        if (depth >= max_depth_) {
#ifdef SAFEJSON_ENABLE_DEBUG_PRINTS
            fprintf(stderr, "safejson: %s truncated at depth %d (max_depth=%d)\n",
                    type_name(value.type()), depth, max_depth_);
#endif
            out = MAX_DEPTH_SENTINEL;
            return false;
        }
        switch (value.type()) {
            case ValueType::DICT:
                out = ordered_json::object();
                break;
            case ValueType::LIST:
            case ValueType::TUPLE:
            case ValueType::SET:
            case ValueType::FROZENSET:
                out = ordered_json::array();
                break;
            default:
                serialize_object(value.as_object(), out);
                return false;
        }
        ancestors.insert(value.identity());
        return true;
    }

    void SafeSerializer::serialize_object(const std::shared_ptr<Object> &object, ordered_json &out) {
        if (!object) {
            out = UNSERIALIZABLE_SENTINEL;
            return;
        }
        try {
            out = object->to_string();
        } catch (const std::exception &ex) {
#ifdef SAFEJSON_ENABLE_DEBUG_PRINTS
            fprintf(stderr, "safejson: to_string failed: %s\n", ex.what());
#endif
            (void) ex;
            out = UNSERIALIZABLE_SENTINEL;
        } catch (...) {
#ifdef SAFEJSON_ENABLE_DEBUG_PRINTS
            fprintf(stderr, "safejson: to_string failed with a non-standard exception\n");
#endif
            out = UNSERIALIZABLE_SENTINEL;
        }
    }

    bool SafeSerializer::advance_frame(Frame &frame, const Value *&child, ordered_json *&child_out) {
        const Value &container = *frame.container;
        const std::vector<Value> *items = nullptr;
        switch (container.type()) {
            case ValueType::LIST:
                items = &container.as_list()->items;
                break;
            case ValueType::TUPLE:
                items = &container.as_tuple()->items;
                break;
            case ValueType::SET:
            case ValueType::FROZENSET:
                items = &container.as_set()->items;
                break;
            case ValueType::DICT: {
                const auto &entries = container.as_dict()->entries;
                if (frame.next_index >= entries.size()) {
                    return false;
                }
                const auto &entry = entries[frame.next_index++];
                ordered_json &slot = (*frame.out)[entry.first.to_string()];
                slot = nullptr;
                child = &entry.second;
                child_out = &slot;
                return true;
            }
            default:
                return false;
        }
        if (frame.next_index >= items->size()) {
            return false;
        }
        child = &(*items)[frame.next_index++];
        frame.out->push_back(nullptr);
        child_out = &frame.out->back();
        return true;
    }

    void SafeSerializer::finish_frame(const Frame &frame) {
        ValueType type = frame.container->type();
        if (type == ValueType::SET || type == ValueType::FROZENSET) {
            sort_set_items(*frame.out);
        }
    }
} // namespace safejson
