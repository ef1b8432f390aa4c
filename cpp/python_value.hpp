// python_value.hpp
// Bridge between Python object graphs and safejson::Value.
//
// Notes:
// - All functions here must be called with the GIL held.
// - Container identity is preserved: a Python container reachable through several
//   paths maps to a single shared safejson container, so Python cycles stay cycles
//   and the serializer can detect them.
// - Values produced by a converter borrow its bookkeeping: the converter empties
//   every container it created when it is destroyed, which releases cyclic graphs.

#pragma once
#include <Python.h>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>
#include "safejson.hpp"

namespace safejson::python {
    // Nesting bound for PyObject conversion, applied whatever max_depth is.
    // Containers below it serialize as MAX_DEPTH_SENTINEL.
    constexpr int MAX_CONVERSION_DEPTH = 1000;

    // Opaque wrapper around a Python object. Holds a strong reference.
    class PyObjectValue : public Object {
    public:
        // Takes a new reference when steal is false.
        explicit PyObjectValue(PyObject *obj, bool steal = false);

        ~PyObjectValue() override;

        PyObjectValue(const PyObjectValue &) = delete;
        PyObjectValue &operator=(const PyObjectValue &) = delete;

        std::string type_name() const override;

        // str(obj); throws std::runtime_error when str() raises.
        std::string to_string() const override;

        // copy.deepcopy(obj); throws NotCopyableError when deepcopy raises.
        std::shared_ptr<Object> clone() const override;

        bool is_callable() const override;

        PyObject *get() const { return obj_; }

    private:
        PyObject *obj_;
    };

    class PyValueConverter {
    public:
        explicit PyValueConverter(int max_depth = DEFAULT_MAX_DEPTH)
            : max_depth_(max_depth < 0 ? 0 : max_depth) {
        }

        ~PyValueConverter();

        PyValueConverter(const PyValueConverter &) = delete;
        PyValueConverter &operator=(const PyValueConverter &) = delete;

        // Full conversion for serialization. Containers at max_depth or deeper are
        // created empty because the serializer never looks inside them.
        Value from_python(PyObject *obj);

        // Conversion for the metadata sanitizer: nested dicts are converted,
        // elements of sequences and sets are deep copies of the Python objects
        // (the objects themselves when deepcopy raises). Keys are indices into
        // the converter's table of original keys.
        // Returns nullptr for None and an empty mapping for non-dict input.
        std::shared_ptr<Dict> metadata_from_python(PyObject *metadata);

        // Builds a Python dict from a mapping produced by metadata_from_python(),
        // restoring the original key objects. New reference, or nullptr with a
        // Python exception set.
        PyObject *metadata_to_python(const std::shared_ptr<Dict> &metadata) const;

        // New reference, or nullptr with a Python exception set.
        static PyObject *to_python(const Value &value);

    private:
        Value convert_recursive(PyObject *obj, int depth);

        Value convert_container(PyObject *obj, int depth);

        void fill_container(PyObject *obj, const Value &container, int depth);

        std::shared_ptr<Dict> convert_metadata(PyObject *dict, int depth);

        Value convert_shallow(PyObject *obj);

        PyObject *copy_element(PyObject *obj);

        Key remember_key(PyObject *key);

        Value remember(PyObject *obj, Value container);

        static Value convert_primitive(PyObject *obj, bool &handled);

        static Key convert_key(PyObject *key);

        static PyObject *key_to_python(const Key &key);

        int max_depth_;
        std::unordered_map<PyObject *, Value> visited_;
        std::unordered_map<PyObject *, int> filled_depth_;
        std::vector<PyObject *> owned_;
        std::vector<PyObject *> metadata_keys_;
        // deepcopy memo shared by all elements of one metadata conversion
        PyObject *memo_ = nullptr;
    };

    // Message of the pending Python exception; clears the error indicator.
    std::string fetch_error_message();
} // namespace safejson::python
