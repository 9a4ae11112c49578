#pragma once

#include <Python.h>

namespace arena {

/**
 * @brief 在作用域内持有 GIL，可以在任意线程使用
 */
class GIL_guard {
public:
    GIL_guard();
    ~GIL_guard();

private:
    PyGILState_STATE state;
};

/**
 * @brief 在作用域内释放当前线程持有的 GIL
 */
class PyThread_guard {
public:
    PyThread_guard();
    ~PyThread_guard();

private:
    PyThreadState *state;
};

/**
 * @brief 持有一个 PyObject 的强引用，析构时自动 Py_XDECREF
 * 必须在持有 GIL 时构造和析构
 */
class py_object {
public:
    py_object();
    explicit py_object(PyObject *ptr);  // 接管一个新引用
    py_object(const py_object &other);
    py_object(py_object &&other) noexcept;
    ~py_object();

    py_object &operator=(py_object other) noexcept;

    /**
     * @brief 对借用引用增加计数后接管
     */
    static py_object borrow(PyObject *ptr);

    PyObject *get() const;
    PyObject *release();
    explicit operator bool() const;

private:
    PyObject *ptr;
};

}  // namespace arena
