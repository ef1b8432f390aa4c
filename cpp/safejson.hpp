// safejson.hpp
// Public types and declarations for the safejson serializer and metadata sanitizer.
//
// Notes:
// - Value is a closed variant over primitives, reference-counted containers and
//   opaque objects. Containers are shared handles, so a Value graph may contain
//   the same container more than once and may contain cycles.
// - SafeSerializer turns any Value graph into valid JSON text. It never throws:
//   cycles, excessive depth and objects without a usable text form are replaced
//   with sentinel strings.
// - sanitize() copies a metadata mapping, dropping entries whose values cannot be
//   duplicated safely (locks, callables, handles whose clone() fails).
// - The PyObject bridge used by the Python extension lives in python_value.hpp.

#pragma once
#include <cstdint>
#include <initializer_list>
#include <memory>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <unordered_set>
#include <utility>
#include <variant>
#include <vector>
#include <nlohmann/json.hpp>

namespace safejson {
    constexpr int DEFAULT_MAX_DEPTH = 100;

    constexpr const char *CIRCULAR_REFERENCE_SENTINEL = "CircularReference Detected";
    constexpr const char *MAX_DEPTH_SENTINEL = "MaxDepthExceeded";
    constexpr const char *UNSERIALIZABLE_SENTINEL = "Unserializable Object";

    enum class ValueType : uint8_t {
        NONE = 0,
        BOOL = 1,
        INT = 2,
        FLOAT = 3,
        STRING = 5,
        LIST = 6,
        TUPLE = 7,
        DICT = 8,
        SET = 9,
        FROZENSET = 10,
        OBJECT = 99
    };

    const char *type_name(ValueType type);

    // Thrown by Object::clone() for objects that cannot be duplicated.
    class NotCopyableError : public std::runtime_error {
    public:
        explicit NotCopyableError(const std::string &type_name)
            : std::runtime_error("object of type '" + type_name + "' cannot be copied") {}
    };

    // Anything that is not a primitive or a container: handles, locks, callables,
    // foreign objects. Only its text form and its copy behaviour are observable.
    class Object {
    public:
        virtual ~Object() = default;

        virtual std::string type_name() const = 0;

        // Human readable form. Implementations may throw.
        virtual std::string to_string() const = 0;

        virtual std::shared_ptr<Object> clone() const {
            throw NotCopyableError(type_name());
        }

        virtual bool is_callable() const { return false; }
    };

    struct List;
    struct Tuple;
    struct Set;
    struct Dict;

    class Value {
    public:
        using Storage = std::variant<
            std::nullptr_t,
            bool,
            int64_t,
            double,
            std::string,
            std::shared_ptr<List>,
            std::shared_ptr<Tuple>,
            std::shared_ptr<Set>,
            std::shared_ptr<Dict>,
            std::shared_ptr<Object> >;

        Value() : data_(nullptr) {}
        Value(std::nullptr_t) : data_(nullptr) {}
        Value(bool b) : data_(std::in_place_type<bool>, b) {}
        Value(int i) : data_(std::in_place_type<int64_t>, i) {}
        Value(long i) : data_(std::in_place_type<int64_t>, i) {}
        Value(long long i) : data_(std::in_place_type<int64_t>, i) {}
        Value(double d) : data_(std::in_place_type<double>, d) {}
        Value(const char *s) : data_(std::in_place_type<std::string>, s) {}
        Value(std::string s) : data_(std::in_place_type<std::string>, std::move(s)) {}
        Value(std::shared_ptr<List> list) : data_(std::move(list)) {}
        Value(std::shared_ptr<Tuple> tuple) : data_(std::move(tuple)) {}
        Value(std::shared_ptr<Set> set) : data_(std::move(set)) {}
        Value(std::shared_ptr<Dict> dict) : data_(std::move(dict)) {}

        template<typename T, std::enable_if_t<std::is_base_of_v<Object, T>, int>  = 0>
        Value(std::shared_ptr<T> object) : data_(std::shared_ptr<Object>(std::move(object))) {}

        ValueType type() const;

        bool is_none() const { return std::holds_alternative<std::nullptr_t>(data_); }
        bool is_primitive() const { return data_.index() <= 4; }
        bool is_container() const;

        // Address of the shared container or object; nullptr for primitives.
        const void *identity() const;

        bool as_bool() const { return std::get<bool>(data_); }
        int64_t as_int() const { return std::get<int64_t>(data_); }
        double as_float() const { return std::get<double>(data_); }
        const std::string &as_string() const { return std::get<std::string>(data_); }
        const std::shared_ptr<List> &as_list() const { return std::get<std::shared_ptr<List> >(data_); }
        const std::shared_ptr<Tuple> &as_tuple() const { return std::get<std::shared_ptr<Tuple> >(data_); }
        const std::shared_ptr<Set> &as_set() const { return std::get<std::shared_ptr<Set> >(data_); }
        const std::shared_ptr<Dict> &as_dict() const { return std::get<std::shared_ptr<Dict> >(data_); }
        const std::shared_ptr<Object> &as_object() const { return std::get<std::shared_ptr<Object> >(data_); }

        const Storage &storage() const { return data_; }

    private:
        Storage data_;
    };

    // Primitives compare by value, containers and objects by identity.
    bool identical(const Value &a, const Value &b);

    class Key {
    public:
        using Storage = std::variant<std::nullptr_t, bool, int64_t, double, std::string>;

        Key() : data_(nullptr) {}
        Key(std::nullptr_t) : data_(nullptr) {}
        Key(bool b) : data_(std::in_place_type<bool>, b) {}
        Key(int i) : data_(std::in_place_type<int64_t>, i) {}
        Key(long i) : data_(std::in_place_type<int64_t>, i) {}
        Key(long long i) : data_(std::in_place_type<int64_t>, i) {}
        Key(double d) : data_(std::in_place_type<double>, d) {}
        Key(const char *s) : data_(std::in_place_type<std::string>, s) {}
        Key(std::string s) : data_(std::in_place_type<std::string>, std::move(s)) {}

        // Key text used for JSON object members.
        std::string to_string() const;

        const Storage &storage() const { return data_; }

        bool operator==(const Key &other) const { return data_ == other.data_; }
        bool operator!=(const Key &other) const { return !(*this == other); }

    private:
        Storage data_;
    };

    struct List {
        std::vector<Value> items;
    };

    struct Tuple {
        std::vector<Value> items;
    };

    struct Set {
        std::vector<Value> items;
        bool frozen = false;

        // Returns false when an identical element is already present.
        bool add(Value value);
    };

    struct Dict {
        std::vector<std::pair<Key, Value> > entries;

        void set(Key key, Value value);

        const Value *find(const Key &key) const;

        size_t size() const { return entries.size(); }
        bool empty() const { return entries.empty(); }
    };

    std::shared_ptr<List> new_list(std::initializer_list<Value> items = {});

    std::shared_ptr<Tuple> new_tuple(std::initializer_list<Value> items = {});

    std::shared_ptr<Set> new_set(std::initializer_list<Value> items = {});

    std::shared_ptr<Set> new_frozenset(std::initializer_list<Value> items = {});

    std::shared_ptr<Dict> new_dict(std::initializer_list<std::pair<Key, Value> > entries = {});

    // Empties every container reachable from value. Reference cycles between
    // shared containers are never reclaimed otherwise.
    void clear_graph(const Value &value);

    using ordered_json = nlohmann::ordered_json;

    class SafeSerializer {
    public:
        explicit SafeSerializer(int max_depth = DEFAULT_MAX_DEPTH)
            : max_depth_(max_depth < 0 ? 0 : max_depth) {
        }

        ordered_json serialize(const Value &value);

        // serialize() followed by a dump that cannot fail on bad UTF-8.
        std::string dumps(const Value &value);

        int max_depth() const { return max_depth_; }

    private:
        struct Frame {
            const Value *container;
            size_t next_index;
            ordered_json *out;
            int depth;
        };

        // Writes the output for value into out. Returns true when value is a
        // container whose children still have to be visited.
        bool serialize_node(const Value &value, ordered_json &out, int depth,
                            std::unordered_set<const void *> &ancestors);

        void serialize_object(const std::shared_ptr<Object> &object, ordered_json &out);

        static bool advance_frame(Frame &frame, const Value *&child, ordered_json *&child_out);

        static void finish_frame(const Frame &frame);

        int max_depth_;
    };

    // Compact JSON text for any value. Never throws for data-dependent reasons.
    std::string safe_dumps(const Value &value, int max_depth = DEFAULT_MAX_DEPTH);

    ordered_json safe_serialize(const Value &value, int max_depth = DEFAULT_MAX_DEPTH);

    // Sorts serialized set elements into a deterministic order.
    void sort_set_items(ordered_json &items);

    // Copy of metadata without the entries that cannot be duplicated safely.
    // A null mapping is returned unchanged.
    std::shared_ptr<Dict> sanitize(const std::shared_ptr<Dict> &metadata);

    Dict sanitize(const Dict &metadata);
} // namespace safejson
