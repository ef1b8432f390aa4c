// python_binding.cpp
// Small C API wrappers to expose safejson to Python.
// This file defines two functions exposed to Python:
// - safe_dumps(obj, max_depth=100) -> str
// - prepare_metadata(metadata) -> dict | None
// The module name is 'safejson' and is registered via PyModuleDef.

#include <Python.h>
#include "safejson.hpp"
#include "python_value.hpp"

static PyObject *py_safe_dumps(PyObject *self, PyObject *args, PyObject *kwargs) {
    static const char *kwlist[] = {"obj", "max_depth", nullptr};
    PyObject *obj;
    int max_depth = safejson::DEFAULT_MAX_DEPTH;
    if (!PyArg_ParseTupleAndKeywords(args, kwargs, "O|i", const_cast<char **>(kwlist), &obj, &max_depth)) {
        return nullptr;
    }
    try {
        safejson::python::PyValueConverter converter(max_depth);
        safejson::Value value = converter.from_python(obj);
        std::string text = safejson::safe_dumps(value, max_depth);
        return PyUnicode_FromStringAndSize(text.data(), static_cast<Py_ssize_t>(text.size()));
    } catch (const std::exception &e) {
        PyErr_SetString(PyExc_RuntimeError, e.what());
        return nullptr;
    }
}

static PyObject *py_prepare_metadata(PyObject *self, PyObject *args) {
    PyObject *metadata;
    if (!PyArg_ParseTuple(args, "O", &metadata)) {
        return nullptr;
    }
    if (metadata == Py_None) {
        Py_RETURN_NONE;
    }
    try {
        safejson::python::PyValueConverter converter;
        std::shared_ptr<safejson::Dict> sanitized = safejson::sanitize(converter.metadata_from_python(metadata));
        return converter.metadata_to_python(sanitized);
    } catch (const std::exception &e) {
        PyErr_SetString(PyExc_RuntimeError, e.what());
        return nullptr;
    }
}

static PyMethodDef methods[] = {
    {
        "safe_dumps", reinterpret_cast<PyCFunction>(reinterpret_cast<void (*)(void)>(py_safe_dumps)),
        METH_VARARGS | METH_KEYWORDS,
        "Serialize any Python object to JSON text without raising"
    },
    {
        "prepare_metadata", py_prepare_metadata, METH_VARARGS,
        "Copy a metadata dict, dropping values that cannot be copied safely"
    },
    {nullptr, nullptr, 0, nullptr}
};

static struct PyModuleDef module = {
    PyModuleDef_HEAD_INIT,
    "safejson",
    "Fail-safe JSON serialization and metadata sanitizing for logging payloads",
    -1,
    methods
};

PyMODINIT_FUNC PyInit_safejson(void) {
    return PyModule_Create(&module);
}
