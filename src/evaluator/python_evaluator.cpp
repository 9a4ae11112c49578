#include "evaluator/python_evaluator.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <chrono>
#include <cstring>
#include <cmath>
#include <condition_variable>
#include <map>
#include <mutex>
#include <regex>
#include <set>
#include <thread>
#include <vector>
#include "common/exceptions.hpp"
#include "common/python.hpp"
#include "common/utils.hpp"

namespace arena::evaluator {
using namespace std;
using namespace nlohmann;

// clang-format off
static const char *ALLOWED_BUILTINS[] = {
    "abs", "all", "any", "bin", "bool", "callable", "chr", "dict", "divmod", "enumerate",
    "filter", "float", "format", "frozenset", "hash", "hex", "int", "isinstance", "issubclass",
    "iter", "len", "list", "map", "max", "min", "next", "object", "oct", "ord", "pow", "range",
    "repr", "reversed", "round", "set", "slice", "sorted", "str", "sum", "tuple", "zip",
    "staticmethod", "classmethod", "property", "super", "__build_class__",
    "Exception", "ArithmeticError", "AssertionError", "AttributeError", "IndexError", "KeyError",
    "LookupError", "NotImplementedError", "OverflowError", "RecursionError", "RuntimeError",
    "StopIteration", "TypeError", "ValueError", "ZeroDivisionError", "NotImplemented", "Ellipsis",
};

// 纯计算的扩展模块，可以整体导入
static const set<string> ALLOWED_MODULES = {
    "bisect", "heapq", "itertools", "math",
};

// 这些模块的全局变量能够到达 sys 和 os，只导出其中的部分对象
static const map<string, vector<const char *>> MODULE_SUBSETS = {
    {"collections", {"Counter", "OrderedDict", "defaultdict", "deque"}},
    {"functools", {"cache", "cmp_to_key", "lru_cache", "partial", "reduce", "total_ordering"}},
    {"string", {"ascii_letters", "ascii_lowercase", "ascii_uppercase", "digits", "hexdigits",
                "octdigits", "printable", "punctuation", "whitespace"}},
};

// 求值器中的代码永远不应该触发的审计事件
static const char *DENIED_AUDIT_EVENTS[] = {
    "os.system", "os.exec", "os.posix_spawn", "os.spawn", "os.fork", "os.forkpty", "os.kill",
    "os.killpg", "subprocess.Popen", "ctypes.dlopen", "ctypes.dlsym", "socket.connect",
    "socket.bind",
};

// 用户定义类时常用的特殊方法，其余双下划线属性一律拒绝
static const set<string> ALLOWED_DUNDERS = {
    "__init__", "__name__", "__main__", "__repr__", "__str__", "__eq__", "__ne__", "__lt__",
    "__le__", "__gt__", "__ge__", "__hash__", "__len__", "__iter__", "__next__", "__contains__",
    "__getitem__", "__setitem__", "__delitem__", "__call__", "__bool__", "__add__", "__sub__",
    "__mul__", "__slots__",
};
// clang-format on

// 在语法树上检查属性访问，字符串的 format 方法会在运行时按名字取属性，同样拒绝
static const char *ATTRIBUTE_CHECKER = R"(
import ast

def check(source, allowed):
    for node in ast.walk(ast.parse(source, '<solution>')):
        if isinstance(node, ast.Attribute):
            if node.attr in ('format', 'format_map'):
                return node.attr
            if node.attr.startswith('_') and node.attr not in allowed:
                return node.attr
        elif isinstance(node, ast.alias):
            if node.name.startswith('_'):
                return node.name
        elif isinstance(node, ast.Name):
            if node.id.startswith('__') and node.id not in allowed:
                return node.id
    return None
)";

static int deny_audit_event(const char *event, PyObject *, void *) {
    for (const char *denied : DENIED_AUDIT_EVENTS) {
        if (strcmp(event, denied) == 0) {
            PyErr_Format(PyExc_PermissionError, "%s is not allowed", event);
            return -1;
        }
    }
    return 0;
}

void install_audit_hook() {
    PySys_AddAuditHook(deny_audit_event, nullptr);
}

static PyObject *import_subset(const char *name, const vector<const char *> &attributes) {
    py_object real(PyImport_ImportModule(name));
    if (!real) return nullptr;
    py_object proxy(PyModule_New(name));
    if (!proxy) return nullptr;
    for (const char *attribute : attributes) {
        py_object item(PyObject_GetAttrString(real.get(), attribute));
        if (!item || PyModule_AddObjectRef(proxy.get(), attribute, item.get()) < 0)
            return nullptr;
    }
    return proxy.release();
}

static PyObject *restricted_import(PyObject *, PyObject *args, PyObject *kwargs) {
    static const char *keywords[] = {"name", "globals", "locals", "fromlist", "level", nullptr};
    const char *name = nullptr;
    PyObject *globals = nullptr, *locals = nullptr, *fromlist = nullptr;
    int level = 0;
    if (!PyArg_ParseTupleAndKeywords(args, kwargs, "s|OOOi", const_cast<char **>(keywords),
                                     &name, &globals, &locals, &fromlist, &level))
        return nullptr;
    if (level == 0) {
        if (auto it = MODULE_SUBSETS.find(name); it != MODULE_SUBSETS.end())
            return import_subset(name, it->second);
        if (ALLOWED_MODULES.count(name))
            return PyImport_ImportModuleLevel(name, nullptr, nullptr, fromlist, 0);
    }
    PyErr_Format(PyExc_ImportError, "import of module %s is not allowed", name);
    return nullptr;
}

static PyMethodDef restricted_import_def = {
    "__import__", reinterpret_cast<PyCFunction>(reinterpret_cast<void (*)(void)>(restricted_import)),
    METH_VARARGS | METH_KEYWORDS, nullptr};

/**
 * @brief 取出并清除当前的 Python 异常，格式化为 "类型: 信息"
 */
static string fetch_error() {
    PyObject *type = nullptr, *value = nullptr, *traceback = nullptr;
    PyErr_Fetch(&type, &value, &traceback);
    if (!type) return "unknown error";
    PyErr_NormalizeException(&type, &value, &traceback);
    py_object type_holder(type), value_holder(value), traceback_holder(traceback);

    string name = PyType_Check(type) ? reinterpret_cast<PyTypeObject *>(type)->tp_name : "Error";
    string message;
    if (value) {
        py_object str(PyObject_Str(value));
        if (str) {
            Py_ssize_t size;
            if (const char *data = PyUnicode_AsUTF8AndSize(str.get(), &size))
                message.assign(data, size);
        }
        PyErr_Clear();
    }
    return message.empty() ? name : name + ": " + message;
}

static py_object checked(PyObject *obj) {
    if (!obj) BOOST_THROW_EXCEPTION(evaluation_error(fetch_error()));
    return py_object(obj);
}

static py_object to_python(const json &value) {
    switch (value.type()) {
        case json::value_t::null:
            return py_object::borrow(Py_None);
        case json::value_t::boolean:
            return checked(PyBool_FromLong(value.get<bool>()));
        case json::value_t::number_integer:
            return checked(PyLong_FromLongLong(value.get<long long>()));
        case json::value_t::number_unsigned:
            return checked(PyLong_FromUnsignedLongLong(value.get<unsigned long long>()));
        case json::value_t::number_float:
            return checked(PyFloat_FromDouble(value.get<double>()));
        case json::value_t::string: {
            const string &str = value.get_ref<const string &>();
            return checked(PyUnicode_FromStringAndSize(str.data(), str.size()));
        }
        case json::value_t::array: {
            py_object list = checked(PyList_New(value.size()));
            for (size_t i = 0; i < value.size(); ++i)
                PyList_SET_ITEM(list.get(), i, to_python(value[i]).release());  // 偷取引用
            return list;
        }
        case json::value_t::object: {
            py_object dict = checked(PyDict_New());
            for (auto &[key, item] : value.items())
                if (PyDict_SetItemString(dict.get(), key.c_str(), to_python(item).get()) < 0)
                    BOOST_THROW_EXCEPTION(evaluation_error(fetch_error()));
            return dict;
        }
        default:
            BOOST_THROW_EXCEPTION(evaluation_error("unsupported argument type"));
    }
}

static string to_utf8(PyObject *str) {
    Py_ssize_t size;
    const char *data = PyUnicode_AsUTF8AndSize(str, &size);
    if (!data) BOOST_THROW_EXCEPTION(evaluation_error(fetch_error()));
    return string(data, size);
}

/**
 * @param budget 还允许转换多少个节点，防止巨大或者自引用的返回值
 */
static json from_python(PyObject *obj, size_t &budget) {
    if (budget == 0)
        BOOST_THROW_EXCEPTION(evaluation_error("result is too large"));
    --budget;

    if (obj == Py_None) return nullptr;
    // bool 是 int 的子类，必须先判断
    if (PyBool_Check(obj)) return obj == Py_True;
    if (PyLong_Check(obj)) {
        int overflow = 0;
        long long value = PyLong_AsLongLongAndOverflow(obj, &overflow);
        if (overflow)
            BOOST_THROW_EXCEPTION(evaluation_error("integer result out of range"));
        if (value == -1 && PyErr_Occurred())
            BOOST_THROW_EXCEPTION(evaluation_error(fetch_error()));
        return value;
    }
    if (PyFloat_Check(obj)) return PyFloat_AsDouble(obj);
    if (PyUnicode_Check(obj)) return to_utf8(obj);
    if (PyList_Check(obj) || PyTuple_Check(obj) || PyAnySet_Check(obj)) {
        py_object seq = checked(PySequence_List(obj));
        json array = json::array();
        Py_ssize_t size = PyList_GET_SIZE(seq.get());
        for (Py_ssize_t i = 0; i < size; ++i)
            array.push_back(from_python(PyList_GET_ITEM(seq.get(), i), budget));
        return array;
    }
    if (PyDict_Check(obj)) {
        json object = json::object();
        PyObject *key, *value;
        Py_ssize_t pos = 0;
        while (PyDict_Next(obj, &pos, &key, &value)) {
            string name;
            if (PyUnicode_Check(key)) {
                name = to_utf8(key);
            } else {
                py_object str = checked(PyObject_Str(key));
                name = to_utf8(str.get());
            }
            object[name] = from_python(value, budget);
        }
        return object;
    }
    BOOST_THROW_EXCEPTION(evaluation_error(fmt::format("unsupported result type {}", Py_TYPE(obj)->tp_name)));
}

static py_object build_globals() {
    py_object builtins_module = checked(PyImport_ImportModule("builtins"));
    PyObject *all_builtins = PyModule_GetDict(builtins_module.get());  // 借用引用

    py_object allowed = checked(PyDict_New());
    for (const char *name : ALLOWED_BUILTINS) {
        PyObject *item = PyDict_GetItemString(all_builtins, name);  // 借用引用
        if (item) PyDict_SetItemString(allowed.get(), name, item);
    }
    py_object import = checked(PyCFunction_New(&restricted_import_def, nullptr));
    PyDict_SetItemString(allowed.get(), "__import__", import.get());

    py_object globals = checked(PyDict_New());
    PyDict_SetItemString(globals.get(), "__builtins__", allowed.get());
    py_object name = checked(PyUnicode_FromString("__arena__"));
    PyDict_SetItemString(globals.get(), "__name__", name.get());

    // print 在求值器中没有输出的地方，替换为什么都不做的函数
    py_object print = checked(PyRun_String("lambda *args, **kwargs: None", Py_eval_input, globals.get(), globals.get()));
    PyDict_SetItemString(allowed.get(), "print", print.get());
    return globals;
}

static void check_dunders(const string &code) {
    static const regex dunder(R"(__\w+__)");
    for (sregex_iterator it(code.begin(), code.end(), dunder), end; it != end; ++it) {
        if (!ALLOWED_DUNDERS.count(it->str()))
            BOOST_THROW_EXCEPTION(validation_error(fmt::format("access to {} is not allowed", it->str())));
    }
}

/**
 * @brief 拒绝以下划线开头的属性和导入名，以及字符串的 format 方法
 * 必须持有 GIL。代码有语法错误时抛出 evaluation_error。
 */
static void check_attributes(const string &code) {
    py_object globals = checked(PyDict_New());
    if (PyDict_SetItemString(globals.get(), "__builtins__", PyEval_GetBuiltins()) < 0)
        BOOST_THROW_EXCEPTION(evaluation_error(fetch_error()));
    checked(PyRun_String(ATTRIBUTE_CHECKER, Py_file_input, globals.get(), globals.get()));
    PyObject *check = PyDict_GetItemString(globals.get(), "check");  // 借用引用

    py_object allowed = checked(PySet_New(nullptr));
    for (auto &name : ALLOWED_DUNDERS) {
        py_object item = checked(PyUnicode_FromString(name.c_str()));
        if (PySet_Add(allowed.get(), item.get()) < 0)
            BOOST_THROW_EXCEPTION(evaluation_error(fetch_error()));
    }
    py_object source = checked(PyUnicode_FromStringAndSize(code.data(), code.size()));
    py_object rejected = checked(PyObject_CallFunctionObjArgs(check, source.get(), allowed.get(), nullptr));
    if (rejected.get() != Py_None)
        BOOST_THROW_EXCEPTION(validation_error(fmt::format("access to {} is not allowed", to_utf8(rejected.get()))));
}

static py_object resolve_entry(PyObject *globals, const string &code, const string &entry_point) {
    PyObject *fn = PyDict_GetItemString(globals, entry_point.c_str());
    if (fn && PyCallable_Check(fn)) return py_object::borrow(fn);

    PyObject *solution = PyDict_GetItemString(globals, "Solution");
    if (solution && PyType_Check(solution)) {
        py_object instance(PyObject_CallNoArgs(solution));
        if (!instance) return py_object();
        py_object method(PyObject_GetAttrString(instance.get(), entry_point.c_str()));
        if (method && PyCallable_Check(method.get())) return method;
        PyErr_Clear();
    }

    static const regex first_def(R"((?:^|\n)def\s+([A-Za-z_]\w*)\s*\()");
    smatch match;
    if (regex_search(code, match, first_def)) {
        fn = PyDict_GetItemString(globals, match[1].str().c_str());
        if (fn && PyCallable_Check(fn)) return py_object::borrow(fn);
    }
    PyErr_Format(PyExc_NameError, "entry point %s is not defined", entry_point.c_str());
    return py_object();
}

/**
 * @brief 超时后向执行线程注入 TimeoutError 的看门狗
 * 构造和 finish 都必须在执行线程持有 GIL 时调用。
 * 用户代码可能捕获 TimeoutError，因此在执行结束之前会反复注入。
 */
class watchdog {
public:
    watchdog(unsigned long thread_id, int timeout_ms)
        : thread_id(thread_id), timeout(timeout_ms), worker([this] { run(); }) {}

    ~watchdog() {
        if (worker.joinable()) finish();
    }

    /**
     * @brief 停止看门狗，清除尚未触发的异步异常
     * @return 是否发生了超时
     */
    bool finish() {
        finished = true;  // 受 GIL 保护
        {
            lock_guard<mutex> lock(mut);
            stopped = true;
        }
        cond.notify_all();
        {
            // 看门狗可能正在等待 GIL
            PyThread_guard release;
            worker.join();
        }
        PyThreadState_SetAsyncExc(thread_id, nullptr);
        return fired;
    }

private:
    void run() {
        unique_lock<mutex> lock(mut);
        if (cond.wait_for(lock, timeout, [this] { return stopped; })) return;
        while (true) {
            lock.unlock();
            {
                GIL_guard gil;
                if (finished) return;
                PyThreadState_SetAsyncExc(thread_id, PyExc_TimeoutError);
                fired = true;
            }
            lock.lock();
            if (cond.wait_for(lock, chrono::milliseconds(10), [this] { return stopped; })) return;
        }
    }

    unsigned long thread_id;
    chrono::milliseconds timeout;
    mutex mut;
    condition_variable cond;
    bool stopped = false;
    bool finished = false;
    bool fired = false;
    thread worker;
};

python_evaluator::python_evaluator(const evaluator_config &config)
    : config(config) {}

json python_evaluator::run(const string &code, const string &entry_point, const json &args) const {
    return run(code, entry_point, args, config.timeout_ms);
}

json python_evaluator::run(const string &code, const string &entry_point, const json &args, int timeout_ms) const {
    if (!args.is_array())
        BOOST_THROW_EXCEPTION(validation_error("arguments must be an array"));
    for (auto &arg : args)
        if (arg.dump().size() > config.max_argument_size)
            BOOST_THROW_EXCEPTION(validation_error("Invalid or oversized input"));
    if (code.size() > config.max_code_size)
        BOOST_THROW_EXCEPTION(validation_error(fmt::format("code exceeds {} bytes", config.max_code_size)));
    check_dunders(code);

    elapsed_time timer;
    GIL_guard gil;
    check_attributes(code);
    py_object globals = build_globals();
    py_object compiled(Py_CompileString(code.c_str(), "<solution>", Py_file_input));
    if (!compiled)
        BOOST_THROW_EXCEPTION(evaluation_error(fetch_error()));

    py_object result;
    string error;
    bool timed_out;
    {
        watchdog guard(PyThread_get_thread_ident(), timeout_ms);
        py_object module(PyEval_EvalCode(compiled.get(), globals.get(), globals.get()));
        if (module) {
            py_object fn = resolve_entry(globals.get(), code, entry_point);
            if (fn) {
                py_object call_args(PyList_AsTuple(to_python(args).get()));
                if (call_args)
                    result = py_object(PyObject_CallObject(fn.get(), call_args.get()));
            }
        }
        if (!result) error = fetch_error();
        timed_out = guard.finish();
    }
    PyErr_Clear();

    if (timed_out) {
        DLOG(INFO) << "Evaluator: " << entry_point << " timed out after " << timer.duration<chrono::milliseconds>().count() << "ms";
        BOOST_THROW_EXCEPTION(evaluation_timeout(fmt::format("execution exceeded {} ms", timeout_ms)));
    }
    if (!result)
        BOOST_THROW_EXCEPTION(evaluation_error(error));

    size_t budget = config.max_result_size;
    json value = from_python(result.get(), budget);
    if (value.dump().size() > config.max_result_size) {
        // 过长的字符串截断后返回，其他过大的返回值直接拒绝
        if (!value.is_string())
            BOOST_THROW_EXCEPTION(evaluation_error(fmt::format("result exceeds {} bytes", config.max_result_size)));
        value = value.get<string>().substr(0, config.max_result_size) + "...";
    }
    return value;
}

}  // namespace arena::evaluator
