// python_value.cpp
#include "python_value.hpp"
#include <cstdio>
#include <stdexcept>

namespace safejson::python {
    namespace {
        // Stands in for a container the interpreter's recursion limit kept us from entering.
        class TruncatedValue : public Object {
        public:
            std::string type_name() const override { return "truncated"; }

            std::string to_string() const override { return MAX_DEPTH_SENTINEL; }
        };
    } // namespace

    std::string fetch_error_message() {
        PyObject *type = nullptr, *value = nullptr, *traceback = nullptr;
        PyErr_Fetch(&type, &value, &traceback);
        if (!type) {
            return "unknown error";
        }
        PyErr_NormalizeException(&type, &value, &traceback);
        std::string message = reinterpret_cast<PyTypeObject *>(type)->tp_name;
        if (value) {
            PyObject *text = PyObject_Str(value);
            if (text) {
                Py_ssize_t size = 0;
                const char *data = PyUnicode_AsUTF8AndSize(text, &size);
                if (data && size > 0) {
                    message += ": ";
                    message.append(data, static_cast<size_t>(size));
                }
                Py_DECREF(text);
            }
            // str() of the exception may itself have failed
            PyErr_Clear();
        }
        Py_XDECREF(type);
        Py_XDECREF(value);
        Py_XDECREF(traceback);
        return message;
    }

    PyObjectValue::PyObjectValue(PyObject *obj, bool steal) : obj_(obj) {
        if (!steal) {
            Py_XINCREF(obj_);
        }
    }

    PyObjectValue::~PyObjectValue() {
        Py_XDECREF(obj_);
    }

    std::string PyObjectValue::type_name() const {
        return obj_ ? Py_TYPE(obj_)->tp_name : "NULL";
    }

    std::string PyObjectValue::to_string() const {
        if (!obj_) {
            throw std::runtime_error("no Python object");
        }
        PyObject *text = PyObject_Str(obj_);
        if (!text) {
            throw std::runtime_error("str() raised " + fetch_error_message());
        }
        Py_ssize_t size = 0;
        const char *data = PyUnicode_AsUTF8AndSize(text, &size);
        if (!data) {
            Py_DECREF(text);
            throw std::runtime_error("str() is not UTF-8 encodable: " + fetch_error_message());
        }
        std::string result(data, static_cast<size_t>(size));
        Py_DECREF(text);
        return result;
    }

    std::shared_ptr<Object> PyObjectValue::clone() const {
        PyObject *copy_module = PyImport_ImportModule("copy");
        if (!copy_module) {
            PyErr_Clear();
            throw NotCopyableError(type_name());
        }
        PyObject *copied = PyObject_CallMethod(copy_module, "deepcopy", "O", obj_);
        Py_DECREF(copy_module);
        if (!copied) {
            std::string message = fetch_error_message();
#ifdef SAFEJSON_ENABLE_DEBUG_PRINTS
            fprintf(stderr, "safejson: deepcopy of %s failed: %s\n", type_name().c_str(), message.c_str());
#endif
            (void) message;
            throw NotCopyableError(type_name());
        }
        return std::make_shared<PyObjectValue>(copied, true);
    }

    bool PyObjectValue::is_callable() const {
        return obj_ && PyCallable_Check(obj_);
    }

    PyValueConverter::~PyValueConverter() {
        // Every container created here is in visited_, so emptying them one by one
        // breaks all cycles while the map still keeps them alive.
        for (auto &entry: visited_) {
            const Value &container = entry.second;
            switch (container.type()) {
                case ValueType::DICT: container.as_dict()->entries.clear(); break;
                case ValueType::LIST: container.as_list()->items.clear(); break;
                case ValueType::TUPLE: container.as_tuple()->items.clear(); break;
                default: container.as_set()->items.clear(); break;
            }
        }
        visited_.clear();
        for (PyObject *obj: owned_) {
            Py_DECREF(obj);
        }
        for (PyObject *key: metadata_keys_) {
            Py_DECREF(key);
        }
        Py_XDECREF(memo_);
    }

    Value PyValueConverter::from_python(PyObject *obj) {
        return convert_recursive(obj, 0);
    }

    Value PyValueConverter::convert_primitive(PyObject *obj, bool &handled) {
        handled = true;
        if (obj == nullptr || obj == Py_None) {
            return Value();
        }
        // Check bool before int because Python bool is a subclass of int
        if (PyBool_Check(obj)) {
            return Value(obj == Py_True);
        }
        if (PyLong_Check(obj)) {
            int overflow = 0;
            long long value = PyLong_AsLongLongAndOverflow(obj, &overflow);
            if (overflow == 0 && !(value == -1 && PyErr_Occurred())) {
                return Value(value);
            }
            PyErr_Clear();
            // Out of int64 range: keep it as an object, str() gives the digits
            return Value(std::make_shared<PyObjectValue>(obj));
        }
        if (PyFloat_Check(obj)) {
            return Value(PyFloat_AsDouble(obj));
        }
        if (PyUnicode_Check(obj)) {
            Py_ssize_t size = 0;
            const char *data = PyUnicode_AsUTF8AndSize(obj, &size);
            if (data) {
                return Value(std::string(data, static_cast<size_t>(size)));
            }
            // lone surrogates
            PyErr_Clear();
            return Value(std::make_shared<PyObjectValue>(obj));
        }
        handled = false;
        return Value();
    }

    Value PyValueConverter::convert_recursive(PyObject *obj, int depth) {
        if (PyLong_Check(obj) && !PyBool_Check(obj)) {
            int overflow = 0;
            long long value = PyLong_AsLongLongAndOverflow(obj, &overflow);
            if (overflow == 0 && !(value == -1 && PyErr_Occurred())) {
                return Value(value);
            }
            PyErr_Clear();
            // Out of int64 range: still a JSON number, at double precision
            double approx = PyLong_AsDouble(obj);
            if (!(approx == -1.0 && PyErr_Occurred())) {
                return Value(approx);
            }
            // Beyond double range: str() gives the digits
            PyErr_Clear();
            return Value(std::make_shared<PyObjectValue>(obj));
        }
        bool handled = false;
        Value primitive = convert_primitive(obj, handled);
        if (handled) {
            return primitive;
        }
        if (PyDict_Check(obj) || PyList_Check(obj) || PyTuple_Check(obj) || PyAnySet_Check(obj)) {
            return convert_container(obj, depth);
        }
        return Value(std::make_shared<PyObjectValue>(obj));
    }

    Value PyValueConverter::remember(PyObject *obj, Value container) {
        Py_INCREF(obj);
        owned_.push_back(obj);
        visited_.emplace(obj, container);
        return container;
    }

    Value PyValueConverter::convert_container(PyObject *obj, int depth) {
        Value container;
        auto it = visited_.find(obj);
        if (it != visited_.end()) {
            container = it->second;
        } else if (PyDict_Check(obj)) {
            container = remember(obj, Value(std::make_shared<Dict>()));
        } else if (PyList_Check(obj)) {
            container = remember(obj, Value(std::make_shared<List>()));
        } else if (PyTuple_Check(obj)) {
            container = remember(obj, Value(std::make_shared<Tuple>()));
        } else {
            auto set = std::make_shared<Set>();
            set->frozen = PyFrozenSet_Check(obj);
            container = remember(obj, Value(set));
        }
        if (depth >= max_depth_) {
            return container;
        }
        // A container first reached on a deeper path is refilled when a shallower
        // path reaches it, so its contents match what the serializer will read.
        auto filled = filled_depth_.find(obj);
        if (filled != filled_depth_.end() && filled->second <= depth) {
            return container;
        }
        if (depth >= MAX_CONVERSION_DEPTH ||
            Py_EnterRecursiveCall(" while converting an object for safejson") != 0) {
            PyErr_Clear();
#ifdef SAFEJSON_ENABLE_DEBUG_PRINTS
            fprintf(stderr, "safejson: recursion limit reached at depth %d\n", depth);
#endif
            return Value(std::make_shared<TruncatedValue>());
        }
        filled_depth_[obj] = depth;
        fill_container(obj, container, depth);
        Py_LeaveRecursiveCall();
        return container;
    }

    void PyValueConverter::fill_container(PyObject *obj, const Value &container, int depth) {
        if (container.type() == ValueType::DICT) {
            auto &entries = container.as_dict()->entries;
            entries.clear();
            // Snapshot of the items: key conversion may run arbitrary __str__ code
            PyObject *items = PyDict_Items(obj);
            if (!items) {
                PyErr_Clear();
                return;
            }
            Py_ssize_t n = PyList_GET_SIZE(items);
            entries.reserve(static_cast<size_t>(n));
            for (Py_ssize_t i = 0; i < n; i++) {
                PyObject *pair = PyList_GET_ITEM(items, i); // borrowed
                Key key = convert_key(PyTuple_GET_ITEM(pair, 0));
                Value value = convert_recursive(PyTuple_GET_ITEM(pair, 1), depth + 1);
                entries.emplace_back(std::move(key), std::move(value));
            }
            Py_DECREF(items);
            return;
        }
        std::vector<Value> *target = nullptr;
        switch (container.type()) {
            case ValueType::LIST: target = &container.as_list()->items; break;
            case ValueType::TUPLE: target = &container.as_tuple()->items; break;
            default: target = &container.as_set()->items; break;
        }
        target->clear();
        PyObject *items = PySequence_List(obj);
        if (!items) {
            PyErr_Clear();
            return;
        }
        Py_ssize_t n = PyList_GET_SIZE(items);
        target->reserve(static_cast<size_t>(n));
        for (Py_ssize_t i = 0; i < n; i++) {
            target->push_back(convert_recursive(PyList_GET_ITEM(items, i), depth + 1));
        }
        Py_DECREF(items);
    }

    Key PyValueConverter::convert_key(PyObject *key) {
        if (key == Py_None) {
            return Key();
        }
        if (PyBool_Check(key)) {
            return Key(key == Py_True);
        }
        if (PyLong_Check(key)) {
            int overflow = 0;
            long long value = PyLong_AsLongLongAndOverflow(key, &overflow);
            if (overflow == 0 && !(value == -1 && PyErr_Occurred())) {
                return Key(value);
            }
            PyErr_Clear();
        } else if (PyFloat_Check(key)) {
            return Key(PyFloat_AsDouble(key));
        }
        PyObject *text = PyUnicode_Check(key) ? (Py_INCREF(key), key) : PyObject_Str(key);
        if (!text) {
            PyErr_Clear();
            return Key(UNSERIALIZABLE_SENTINEL);
        }
        Py_ssize_t size = 0;
        const char *data = PyUnicode_AsUTF8AndSize(text, &size);
        if (!data) {
            PyErr_Clear();
            Py_DECREF(text);
            return Key(UNSERIALIZABLE_SENTINEL);
        }
        Key result(std::string(data, static_cast<size_t>(size)));
        Py_DECREF(text);
        return result;
    }

    std::shared_ptr<Dict> PyValueConverter::metadata_from_python(PyObject *metadata) {
        if (metadata == nullptr || metadata == Py_None) {
            return nullptr;
        }
        if (!PyDict_Check(metadata)) {
#ifdef SAFEJSON_ENABLE_DEBUG_PRINTS
            fprintf(stderr, "safejson: metadata of type %s is not a dict, using {}\n",
                    Py_TYPE(metadata)->tp_name);
#endif
            return std::make_shared<Dict>();
        }
        return convert_metadata(metadata, 0);
    }

    std::shared_ptr<Dict> PyValueConverter::convert_metadata(PyObject *dict, int depth) {
        auto it = visited_.find(dict);
        if (it != visited_.end()) {
            return it->second.as_dict();
        }
        auto result = std::make_shared<Dict>();
        remember(dict, Value(result));
        // The sanitizer stops at DEFAULT_MAX_DEPTH; deeper dicts stay empty.
        if (depth > DEFAULT_MAX_DEPTH) {
            return result;
        }
        PyObject *items = PyDict_Items(dict);
        if (!items) {
            PyErr_Clear();
            return result;
        }
        Py_ssize_t n = PyList_GET_SIZE(items);
        for (Py_ssize_t i = 0; i < n; i++) {
            PyObject *pair = PyList_GET_ITEM(items, i); // borrowed
            PyObject *value = PyTuple_GET_ITEM(pair, 1);
            Key key = remember_key(PyTuple_GET_ITEM(pair, 0));
            if (PyDict_Check(value)) {
                result->entries.emplace_back(std::move(key), Value(convert_metadata(value, depth + 1)));
            } else {
                result->entries.emplace_back(std::move(key), convert_shallow(value));
            }
        }
        Py_DECREF(items);
        return result;
    }

    Value PyValueConverter::convert_shallow(PyObject *obj) {
        bool handled = false;
        Value primitive = convert_primitive(obj, handled);
        if (handled) {
            return primitive;
        }
        bool is_list = PyList_Check(obj), is_tuple = PyTuple_Check(obj), is_set = PyAnySet_Check(obj);
        if (!is_list && !is_tuple && !is_set) {
            return Value(std::make_shared<PyObjectValue>(obj));
        }
        PyObject *items = PySequence_List(obj);
        if (!items) {
            PyErr_Clear();
            return Value(std::make_shared<PyObjectValue>(obj));
        }
        std::vector<Value> elements;
        Py_ssize_t n = PyList_GET_SIZE(items);
        elements.reserve(static_cast<size_t>(n));
        for (Py_ssize_t i = 0; i < n; i++) {
            elements.emplace_back(std::make_shared<PyObjectValue>(copy_element(PyList_GET_ITEM(items, i)), true));
        }
        Py_DECREF(items);
        if (is_list) {
            auto list = std::make_shared<List>();
            list->items = std::move(elements);
            return Value(list);
        }
        if (is_tuple) {
            auto tuple = std::make_shared<Tuple>();
            tuple->items = std::move(elements);
            return Value(tuple);
        }
        auto set = std::make_shared<Set>();
        set->items = std::move(elements);
        set->frozen = PyFrozenSet_Check(obj);
        return Value(set);
    }

    Key PyValueConverter::remember_key(PyObject *key) {
        Py_INCREF(key);
        metadata_keys_.push_back(key);
        return Key(static_cast<long long>(metadata_keys_.size() - 1));
    }

    PyObject *PyValueConverter::copy_element(PyObject *obj) {
        PyObject *copy_module = PyImport_ImportModule("copy");
        if (copy_module && !memo_) {
            memo_ = PyDict_New();
        }
        PyObject *copied = nullptr;
        if (copy_module && memo_) {
            copied = PyObject_CallMethod(copy_module, "deepcopy", "OO", obj, memo_);
        }
        Py_XDECREF(copy_module);
        if (copied) {
            return copied;
        }
        std::string message = fetch_error_message();
#ifdef SAFEJSON_ENABLE_DEBUG_PRINTS
        fprintf(stderr, "safejson: keeping uncopyable %s element as is: %s\n",
                Py_TYPE(obj)->tp_name, message.c_str());
#endif
        (void) message;
        Py_INCREF(obj);
        return obj;
    }

    PyObject *PyValueConverter::metadata_to_python(const std::shared_ptr<Dict> &metadata) const {
        if (!metadata) {
            Py_RETURN_NONE;
        }
        PyObject *result = PyDict_New();
        for (const auto &entry: metadata->entries) {
            if (!result) break;
            const auto &data = entry.first.storage();
            PyObject *key = nullptr;
            if (data.index() == 2 && std::get<int64_t>(data) >= 0 &&
                static_cast<size_t>(std::get<int64_t>(data)) < metadata_keys_.size()) {
                key = metadata_keys_[static_cast<size_t>(std::get<int64_t>(data))];
                Py_INCREF(key);
            } else {
                key = key_to_python(entry.first);
            }
            PyObject *item = nullptr;
            if (key) {
                item = entry.second.type() == ValueType::DICT
                           ? metadata_to_python(entry.second.as_dict())
                           : to_python(entry.second);
            }
            if (!item || PyDict_SetItem(result, key, item) != 0) {
                Py_CLEAR(result);
            }
            Py_XDECREF(key);
            Py_XDECREF(item);
        }
        return result;
    }

    PyObject *PyValueConverter::key_to_python(const Key &key) {
        const auto &data = key.storage();
        switch (data.index()) {
            case 0: Py_RETURN_NONE;
            case 1: return PyBool_FromLong(std::get<bool>(data) ? 1 : 0);
            case 2: return PyLong_FromLongLong(std::get<int64_t>(data));
            case 3: return PyFloat_FromDouble(std::get<double>(data));
            default: {
                const std::string &s = std::get<std::string>(data);
                return PyUnicode_FromStringAndSize(s.data(), static_cast<Py_ssize_t>(s.size()));
            }
        }
    }

    PyObject *PyValueConverter::to_python(const Value &value) {
        switch (value.type()) {
            case ValueType::NONE: Py_RETURN_NONE;
            case ValueType::BOOL: return PyBool_FromLong(value.as_bool() ? 1 : 0);
            case ValueType::INT: return PyLong_FromLongLong(value.as_int());
            case ValueType::FLOAT: return PyFloat_FromDouble(value.as_float());
            case ValueType::STRING: {
                const std::string &s = value.as_string();
                return PyUnicode_DecodeUTF8(s.data(), static_cast<Py_ssize_t>(s.size()), "replace");
            }
            default:
                break;
        }
        if (value.type() == ValueType::OBJECT) {
            const auto &object = value.as_object();
            if (auto *py_object = dynamic_cast<const PyObjectValue *>(object.get())) {
                PyObject *result = py_object->get();
                Py_XINCREF(result);
                if (!result) {
                    Py_RETURN_NONE;
                }
                return result;
            }
            std::string text = UNSERIALIZABLE_SENTINEL;
            if (object) {
                try {
                    text = object->to_string();
                } catch (const std::exception &ex) {
                    (void) ex;
                }
            }
            return PyUnicode_DecodeUTF8(text.data(), static_cast<Py_ssize_t>(text.size()), "replace");
        }
        if (!value.is_container()) {
            Py_RETURN_NONE;
        }
        if (Py_EnterRecursiveCall(" while converting a safejson value to Python") != 0) {
            return nullptr;
        }
        PyObject *result = nullptr;
        if (value.type() == ValueType::DICT) {
            result = PyDict_New();
            for (const auto &entry: value.as_dict()->entries) {
                if (!result) break;
                PyObject *key = key_to_python(entry.first);
                PyObject *item = key ? to_python(entry.second) : nullptr;
                if (!item || PyDict_SetItem(result, key, item) != 0) {
                    Py_CLEAR(result);
                }
                Py_XDECREF(key);
                Py_XDECREF(item);
            }
        } else {
            const std::vector<Value> *items = nullptr;
            switch (value.type()) {
                case ValueType::LIST: items = &value.as_list()->items; break;
                case ValueType::TUPLE: items = &value.as_tuple()->items; break;
                default: items = &value.as_set()->items; break;
            }
            PyObject *list = PyList_New(static_cast<Py_ssize_t>(items->size()));
            for (size_t i = 0; list && i < items->size(); i++) {
                PyObject *item = to_python((*items)[i]);
                if (!item) {
                    Py_CLEAR(list);
                    break;
                }
                PyList_SET_ITEM(list, static_cast<Py_ssize_t>(i), item); // steals ref
            }
            if (list) {
                switch (value.type()) {
                    case ValueType::LIST: result = list; list = nullptr; break;
                    case ValueType::TUPLE: result = PyList_AsTuple(list); break;
                    case ValueType::SET: result = PySet_New(list); break;
                    default: result = PyFrozenSet_New(list); break;
                }
                Py_XDECREF(list);
            }
        }
        Py_LeaveRecursiveCall();
        return result;
    }
} // namespace safejson::python
