#include <Python.h>
#include "safejson.hpp"
#include "python_value.hpp"
#include <gtest/gtest.h>
#include <string>

PyMODINIT_FUNC PyInit_safejson(void);

using safejson::python::PyValueConverter;
using json = nlohmann::json;

namespace {

// Runs a snippet in a fresh namespace. Failing asserts are printed with their traceback.
class PythonTest : public ::testing::Test {
protected:
    void SetUp() override {
        globals_ = PyDict_New();
        PyDict_SetItemString(globals_, "__builtins__", PyEval_GetBuiltins());
    }

    void TearDown() override {
        Py_CLEAR(globals_);
    }

    bool run(const char *code) {
        PyObject *result = PyRun_String(code, Py_file_input, globals_, globals_);
        if (!result) {
            PyErr_Print();
            return false;
        }
        Py_DECREF(result);
        return true;
    }

    // Borrowed reference to a global defined by run().
    PyObject *global(const char *name) {
        return PyDict_GetItemString(globals_, name);
    }

    PyObject *globals_ = nullptr;
};

} // namespace

// ------------------------------------------------------------------
// 1. Converter
// ------------------------------------------------------------------

TEST_F(PythonTest, PrimitivesConvertWithBoolBeforeInt) {
    ASSERT_TRUE(run("values = [True, 1, 2.5, 'text', None]"));
    PyValueConverter converter;
    EXPECT_EQ(safejson::safe_dumps(converter.from_python(global("values"))), "[true,1,2.5,\"text\",null]");
}

TEST_F(PythonTest, CycleSurvivesConversion) {
    ASSERT_TRUE(run("d = {}\nd['self'] = d"));
    PyValueConverter converter;
    safejson::Value value = converter.from_python(global("d"));
    EXPECT_EQ(safejson::safe_dumps(value), "{\"self\":\"CircularReference Detected\"}");
}

TEST_F(PythonTest, SharedListReachedDeepFirstIsRefilled) {
    ASSERT_TRUE(run("x = [1]\nroot = {'deep': {'inner': x}, 'x': x}"));
    PyValueConverter converter(2);
    safejson::Value value = converter.from_python(global("root"));
    EXPECT_EQ(safejson::safe_dumps(value, 2), "{\"deep\":{\"inner\":\"MaxDepthExceeded\"},\"x\":[1]}");
}

TEST_F(PythonTest, BigIntegerIsANumber) {
    ASSERT_TRUE(run("big = 2 ** 100"));
    PyValueConverter converter;
    json out = json::parse(safejson::safe_dumps(converter.from_python(global("big"))));
    ASSERT_TRUE(out.is_number_float());
    EXPECT_DOUBLE_EQ(out.get<double>(), 1267650600228229401496703205376.0);
}

TEST_F(PythonTest, IntegerBeyondDoubleRangeUsesDecimalText) {
    ASSERT_TRUE(run("huge = 10 ** 400\ntext = str(huge)"));
    PyValueConverter converter;
    std::string expected = "\"" + std::string(PyUnicode_AsUTF8(global("text"))) + "\"";
    EXPECT_EQ(safejson::safe_dumps(converter.from_python(global("huge"))), expected);
}

TEST_F(PythonTest, ConversionBoundYieldsDepthSentinel) {
    ASSERT_TRUE(run(R"(
deep = {}
current = deep
for _ in range(3000):
    current["deeper"] = {}
    current = current["deeper"]
)"));
    PyValueConverter converter(100000);
    std::string out = safejson::safe_dumps(converter.from_python(global("deep")), 100000);
    EXPECT_NE(out.find("\"MaxDepthExceeded\""), std::string::npos);
    EXPECT_EQ(out.find("{\"deeper\":{}}"), std::string::npos);
    EXPECT_FALSE(PyErr_Occurred());
}

TEST_F(PythonTest, NonPrimitiveKeysUseStr) {
    ASSERT_TRUE(run("d = {(1, 2): 'pair', 3: 'three'}"));
    PyValueConverter converter;
    EXPECT_EQ(safejson::safe_dumps(converter.from_python(global("d"))), "{\"(1, 2)\":\"pair\",\"3\":\"three\"}");
}

TEST_F(PythonTest, MetadataConversionOfNoneAndNonMapping) {
    PyValueConverter converter;
    EXPECT_EQ(converter.metadata_from_python(Py_None), nullptr);
    ASSERT_TRUE(run("not_a_dict = ['a', 'b']"));
    auto result = converter.metadata_from_python(global("not_a_dict"));
    ASSERT_NE(result, nullptr);
    EXPECT_TRUE(result->empty());
}

TEST_F(PythonTest, ToPythonBuildsMatchingContainers) {
    auto value = safejson::new_dict({
        {"list", safejson::new_list({1, "a"})},
        {"tuple", safejson::new_tuple({true})},
        {"frozen", safejson::new_frozenset({2})},
        {3, nullptr},
    });
    PyObject *result = PyValueConverter::to_python(value);
    ASSERT_NE(result, nullptr);
    PyDict_SetItemString(globals_, "result", result);
    Py_DECREF(result);
    EXPECT_TRUE(run("assert result == {'list': [1, 'a'], 'tuple': (True,), 'frozen': frozenset({2}), 3: None}"));
}

TEST_F(PythonTest, ToPythonOfCycleRaisesRecursionError) {
    auto dict = safejson::new_dict();
    dict->set("self", dict);
    PyObject *result = PyValueConverter::to_python(dict);
    EXPECT_EQ(result, nullptr);
    EXPECT_TRUE(PyErr_ExceptionMatches(PyExc_RecursionError));
    PyErr_Clear();
    safejson::clear_graph(dict);
}

// ------------------------------------------------------------------
// 2. safejson.safe_dumps
// ------------------------------------------------------------------

TEST_F(PythonTest, SafeDumpsPrimitives) {
    EXPECT_TRUE(run(R"(
import safejson
assert safejson.safe_dumps("test") == '"test"'
assert safejson.safe_dumps(123) == "123"
assert safejson.safe_dumps(3.14) == "3.14"
assert safejson.safe_dumps(True) == "true"
assert safejson.safe_dumps(None) == "null"
)"));
}

TEST_F(PythonTest, SafeDumpsNestedAndComplexTypes) {
    EXPECT_TRUE(run(R"(
import json, safejson
data = {"name": "test", "numbers": [1, 2, 3], "nested": {"a": 1, "b": 2}}
assert json.loads(safejson.safe_dumps(data)) == data
result = json.loads(safejson.safe_dumps({"set": {3, 1, 2}, "tuple": (4, 5, 6)}))
assert result["set"] == [1, 2, 3]
assert result["tuple"] == [4, 5, 6]
)"));
}

TEST_F(PythonTest, SafeDumpsCircularReference) {
    EXPECT_TRUE(run(R"(
import json, safejson
d = {}
d["self"] = d
assert json.loads(safejson.safe_dumps(d))["self"] == "CircularReference Detected"
)"));
}

TEST_F(PythonTest, SafeDumpsMaxDepth) {
    EXPECT_TRUE(run(R"(
import json, safejson
deep = {}
current = deep
for _ in range(15):
    current["deeper"] = {}
    current = current["deeper"]
assert "MaxDepthExceeded" in str(json.loads(safejson.safe_dumps(deep, max_depth=5)))

deep = {}
current = deep
for _ in range(1000):
    current["deeper"] = {}
    current = current["deeper"]
assert "MaxDepthExceeded" in str(json.loads(safejson.safe_dumps(deep)))
)"));
}

TEST_F(PythonTest, SafeDumpsLimitAboveInterpreterRecursion) {
    EXPECT_TRUE(run(R"(
import safejson
deep = {}
current = deep
for _ in range(3000):
    current["deeper"] = {}
    current = current["deeper"]
s = safejson.safe_dumps(deep, max_depth=100000)
assert "MaxDepthExceeded" in s
assert s.count("{") < 3000
)"));
}

TEST_F(PythonTest, SafeDumpsBigIntegers) {
    EXPECT_TRUE(run(R"(
import json, safejson
assert json.loads(safejson.safe_dumps(2 ** 100)) == float(2 ** 100)
assert json.loads(safejson.safe_dumps([2 ** 64, -(2 ** 70)])) == [float(2 ** 64), float(-(2 ** 70))]
assert json.loads(safejson.safe_dumps(10 ** 400)) == str(10 ** 400)
)"));
}

TEST_F(PythonTest, SafeDumpsUnserializableObject) {
    EXPECT_TRUE(run(R"(
import json, safejson
class TestClass:
    def __str__(self):
        raise Exception("Cannot convert to string")
assert json.loads(safejson.safe_dumps(TestClass())) == "Unserializable Object"
assert json.loads(safejson.safe_dumps([TestClass(), 1])) == ["Unserializable Object", 1]
)"));
}

TEST_F(PythonTest, SafeDumpsHandlesAndBytes) {
    EXPECT_TRUE(run(R"(
import json, threading, safejson
lock = threading.Lock()
out = json.loads(safejson.safe_dumps({"lock": lock, "bytes": b"ab"}))
assert out["lock"] == str(lock)
assert out["bytes"] == "b'ab'"
)"));
}

TEST_F(PythonTest, SafeDumpsRejectsBadArguments) {
    EXPECT_TRUE(run(R"(
import safejson
try:
    safejson.safe_dumps({}, max_depth="deep")
except TypeError:
    pass
else:
    raise AssertionError("expected TypeError")
)"));
}

// ------------------------------------------------------------------
// 3. safejson.prepare_metadata
// ------------------------------------------------------------------

TEST_F(PythonTest, PrepareMetadataCases) {
    EXPECT_TRUE(run(R"(
import threading, safejson
cases = [
    ({"a": 1, "b": 2, "c": 3}, {"a": 1, "b": 2, "c": 3}),
    ({"a": {"nested_a": 1}, "b": {"nested_b": 2}}, {"a": {"nested_a": 1}, "b": {"nested_b": 2}}),
    ({"a": [1, 2, 3], "b": {4, 5, 6}}, {"a": [1, 2, 3], "b": {4, 5, 6}}),
    ({"a": (1, 2), "b": frozenset([3, 4]), "c": {"d": [5, 6]}},
     {"a": (1, 2), "b": frozenset([3, 4]), "c": {"d": [5, 6]}}),
    ({"lock": threading.Lock()}, {}),
    ({"func": lambda x: x + 1}, {}),
    ({"int": 42, "str": "hello", "list": [1, 2, 3], "set": {4, 5}, "dict": {"nested": "value"},
      "non_copyable": threading.Lock(), "function": print},
     {"int": 42, "str": "hello", "list": [1, 2, 3], "set": {4, 5}, "dict": {"nested": "value"}}),
    ({"list": ["list", "not", "a", "dict"]}, {"list": ["list", "not", "a", "dict"]}),
    ({}, {}),
    (None, None),
]
for metadata, expected in cases:
    result = safejson.prepare_metadata(metadata)
    assert result == expected, (metadata, result)
    assert type(result) is type(expected)
)"));
}

TEST_F(PythonTest, PrepareMetadataReturnsCopies) {
    EXPECT_TRUE(run(R"(
import safejson
class Payload:
    def __init__(self):
        self.items = [1]
nested = {"k": "v"}
items = [1, 2]
payload = Payload()
metadata = {"nested": nested, "items": items, "payload": payload}
result = safejson.prepare_metadata(metadata)
assert result["nested"] is not nested
assert result["items"] is not items and result["items"] == items
assert result["payload"] is not payload and result["payload"].items == [1]
assert result is not metadata
)"));
}

TEST_F(PythonTest, PrepareMetadataKeepsOriginalKeys) {
    EXPECT_TRUE(run(R"(
import threading, safejson
class BadStr:
    def __str__(self):
        raise ValueError("no text")
first, second = BadStr(), BadStr()
pair = (1, 2)
frozen = frozenset([3])
big = 10 ** 30
metadata = {pair: "t", frozen: "f", big: "big", first: "x", second: "y",
            True: 1, None: 2, 1.5: 3, "lock": threading.Lock(), "nested": {pair: [1]}}
result = safejson.prepare_metadata(metadata)
expected_keys = [pair, frozen, big, first, second, True, None, 1.5, "nested"]
assert list(result) == expected_keys, list(result)
assert all(a is b for a, b in zip(result, expected_keys))
assert result[first] == "x" and result[second] == "y"
assert result[big] == "big"
assert list(result["nested"]) == [pair] and next(iter(result["nested"])) is pair
assert "Unserializable Object" not in result
)"));
}

TEST_F(PythonTest, PrepareMetadataCopiesSequenceElements) {
    EXPECT_TRUE(run(R"(
import threading, safejson
inner = [1]
shared = {"k": 1}
lock = threading.Lock()
metadata = {"a": [inner, inner], "b": (shared,), "c": {frozenset([inner[0]])}, "d": [lock]}
result = safejson.prepare_metadata(metadata)
assert result["a"] == [[1], [1]]
assert result["a"][0] is not inner
assert result["a"][0] is result["a"][1]
assert result["b"][0] == shared and result["b"][0] is not shared
inner.append(2)
shared["k"] = 2
assert result["a"][0] == [1]
assert result["b"][0] == {"k": 1}
assert result["d"][0] is lock
)"));
}

TEST_F(PythonTest, PrepareMetadataSelfReferenceAndNonDict) {
    EXPECT_TRUE(run(R"(
import safejson
d = {"x": 1}
d["self"] = d
assert safejson.prepare_metadata(d) == {"x": 1}
assert safejson.prepare_metadata(["not", "a", "dict"]) == {}
)"));
}

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    PyImport_AppendInittab("safejson", PyInit_safejson);
    Py_Initialize();
    int result = RUN_ALL_TESTS();
    if (Py_FinalizeEx() < 0) {
        return 120;
    }
    return result;
}
