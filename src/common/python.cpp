#include "common/python.hpp"
#include <utility>

namespace arena {

GIL_guard::GIL_guard() {
    state = PyGILState_Ensure();
}

GIL_guard::~GIL_guard() {
    PyGILState_Release(state);
}

PyThread_guard::PyThread_guard() {
    state = PyEval_SaveThread();
}

PyThread_guard::~PyThread_guard() {
    PyEval_RestoreThread(state);
}

py_object::py_object() : ptr(nullptr) {}

py_object::py_object(PyObject *ptr) : ptr(ptr) {}

py_object::py_object(const py_object &other) : ptr(other.ptr) {
    Py_XINCREF(ptr);
}

py_object::py_object(py_object &&other) noexcept : ptr(other.ptr) {
    other.ptr = nullptr;
}

py_object::~py_object() {
    Py_XDECREF(ptr);
}

py_object &py_object::operator=(py_object other) noexcept {
    std::swap(ptr, other.ptr);
    return *this;
}

py_object py_object::borrow(PyObject *ptr) {
    Py_XINCREF(ptr);
    return py_object(ptr);
}

PyObject *py_object::get() const {
    return ptr;
}

PyObject *py_object::release() {
    PyObject *result = ptr;
    ptr = nullptr;
    return result;
}

py_object::operator bool() const {
    return ptr != nullptr;
}

}  // namespace arena
