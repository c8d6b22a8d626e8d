#pragma once

#include <Python.h>
#include <string>

namespace pysandbox {

/**
 * @brief owns the embedded CPython interpreter of the process
 * The interpreter is used by the validator to parse submissions, it never
 * runs student code. The constructor releases the GIL so any thread can
 * take it with GIL_guard. Create exactly one, in main.
 */
class python_runtime {
public:
    python_runtime();
    ~python_runtime();

    python_runtime(const python_runtime &) = delete;
    python_runtime &operator=(const python_runtime &) = delete;

private:
    PyThreadState *main_state;
};

/**
 * @brief holds the GIL for the current scope
 */
class GIL_guard {
public:
    GIL_guard();
    ~GIL_guard();

private:
    PyGILState_STATE state;
};

/**
 * @brief owned reference to a Python object, decremented on scope exit
 */
class py_ref {
public:
    py_ref() = default;
    explicit py_ref(PyObject *object);
    py_ref(py_ref &&other);
    ~py_ref();

    py_ref(const py_ref &) = delete;
    py_ref &operator=(const py_ref &) = delete;
    py_ref &operator=(py_ref &&other);

    PyObject *get() const;
    explicit operator bool() const;

private:
    PyObject *object = nullptr;
};

/**
 * @brief message of the pending Python exception, clears it
 * Must be called with the GIL held.
 */
std::string fetch_python_error();

}  // namespace pysandbox
