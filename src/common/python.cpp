#include "common/python.hpp"
#include <glog/logging.h>
#include <string>

namespace pysandbox {
using namespace std;

python_runtime::python_runtime() {
    // no signal handlers, the host process keeps SIGINT
    Py_InitializeEx(0);
    main_state = PyEval_SaveThread();
    LOG(INFO) << "Embedded Python " << Py_GetVersion() << " initialized";
}

python_runtime::~python_runtime() {
    PyEval_RestoreThread(main_state);
    if (Py_FinalizeEx() < 0)
        LOG(WARNING) << "Embedded Python finalization reported an error";
}

GIL_guard::GIL_guard() {
    state = PyGILState_Ensure();
}

GIL_guard::~GIL_guard() {
    PyGILState_Release(state);
}

py_ref::py_ref(PyObject *object)
    : object(object) {}

py_ref::py_ref(py_ref &&other)
    : object(other.object) {
    other.object = nullptr;
}

py_ref::~py_ref() {
    Py_XDECREF(object);
}

py_ref &py_ref::operator=(py_ref &&other) {
    if (this != &other) {
        Py_XDECREF(object);
        object = other.object;
        other.object = nullptr;
    }
    return *this;
}

PyObject *py_ref::get() const {
    return object;
}

py_ref::operator bool() const {
    return object != nullptr;
}

static string to_utf8(PyObject *object) {
    if (!object) return "";
    py_ref text(PyObject_Str(object));
    if (!text) {
        PyErr_Clear();
        return "";
    }
    const char *utf8 = PyUnicode_AsUTF8(text.get());
    if (!utf8) {
        PyErr_Clear();
        return "";
    }
    return utf8;
}

string fetch_python_error() {
    PyObject *type = nullptr, *value = nullptr, *traceback = nullptr;
    PyErr_Fetch(&type, &value, &traceback);
    PyErr_NormalizeException(&type, &value, &traceback);
    py_ref type_ref(type), value_ref(value), traceback_ref(traceback);

    string message = to_utf8(value);
    if (message.empty() && type)
        message = ((PyTypeObject *)type)->tp_name;
    return message;
}

}  // namespace pysandbox
