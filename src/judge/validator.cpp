#include "judge/validator.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <boost/algorithm/string/join.hpp>
#include <algorithm>
#include <optional>
#include "common/exceptions.hpp"
#include "common/python.hpp"

namespace pysandbox {
using namespace std;

bool validation_report::safe() const {
    return violations.empty();
}

validator::validator(validation_policy policy)
    : rules(move(policy)) {}

const validation_policy &validator::policy() const {
    return rules;
}

vector<violation> validator::validate(const string &source) const {
    return inspect(source).violations;
}

static optional<string> get_string_attr(PyObject *object, const char *name) {
    py_ref attr(PyObject_GetAttrString(object, name));
    if (!attr) throw sandbox_error(fmt::format("syntax tree node without {}: {}", name, fetch_python_error()));
    if (attr.get() == Py_None) return nullopt;
    const char *utf8 = PyUnicode_AsUTF8(attr.get());
    if (!utf8) throw sandbox_error(fmt::format("syntax tree attribute {} is not text: {}", name, fetch_python_error()));
    return string(utf8);
}

static long get_long_attr(PyObject *object, const char *name) {
    py_ref attr(PyObject_GetAttrString(object, name));
    if (!attr) {
        PyErr_Clear();
        return 0;
    }
    if (attr.get() == Py_None) return 0;
    long value = PyLong_AsLong(attr.get());
    if (value == -1 && PyErr_Occurred()) {
        PyErr_Clear();
        return 0;
    }
    return value;
}

static bool is_instance(PyObject *node, const py_ref &type) {
    int result = PyObject_IsInstance(node, type.get());
    if (result < 0) throw sandbox_error("isinstance failed: " + fetch_python_error());
    return result == 1;
}

static py_ref get_ast_type(const py_ref &ast, const char *name) {
    py_ref type(PyObject_GetAttrString(ast.get(), name));
    if (!type) throw sandbox_error(fmt::format("module ast has no {}: {}", name, fetch_python_error()));
    return type;
}

static string top_level_package(const string &module) {
    return module.substr(0, module.find('.'));
}

/**
 * @brief names bound by an import statement, e.g. ["a.b", "c"]
 */
static vector<string> alias_names(PyObject *node) {
    py_ref names(PyObject_GetAttrString(node, "names"));
    if (!names) throw sandbox_error("import without names: " + fetch_python_error());
    py_ref iterator(PyObject_GetIter(names.get()));
    if (!iterator) throw sandbox_error("import names are not iterable: " + fetch_python_error());

    vector<string> result;
    while (py_ref alias{PyIter_Next(iterator.get())}) {
        if (auto name = get_string_attr(alias.get(), "name"))
            result.push_back(*name);
    }
    if (PyErr_Occurred()) throw sandbox_error("cannot iterate import names: " + fetch_python_error());
    return result;
}

/**
 * @brief the source does not parse, report exactly one syntax error
 */
static validation_report syntax_error_report() {
    int line = 0;
    string message;
    if (PyErr_ExceptionMatches(PyExc_SyntaxError)) {
        PyObject *type = nullptr, *value = nullptr, *traceback = nullptr;
        PyErr_Fetch(&type, &value, &traceback);
        PyErr_NormalizeException(&type, &value, &traceback);
        py_ref type_ref(type), value_ref(value), traceback_ref(traceback);
        if (value) {
            line = get_long_attr(value, "lineno");
            py_ref msg(PyObject_GetAttrString(value, "msg"));
            if (msg && PyUnicode_Check(msg.get())) {
                if (const char *utf8 = PyUnicode_AsUTF8(msg.get())) message = utf8;
            }
            PyErr_Clear();
        }
        if (message.empty()) message = "invalid syntax";
    } else {
        message = fetch_python_error();
        if (message.empty()) message = "source cannot be parsed";
    }

    validation_report report;
    report.violations.push_back({violation_kind::SYNTAX_ERROR,
                                 line > 0 ? fmt::format("{} at line {}", message, line) : message,
                                 line});
    return report;
}

validation_report validator::inspect(const string &source) const {
    validation_report report;

    // the C parser stops at the first NUL, CPython refuses such sources too
    if (auto nul = source.find('\0'); nul != string::npos) {
        int line = 1 + (int)count(source.begin(), source.begin() + nul, '\n');
        report.violations.push_back({violation_kind::SYNTAX_ERROR,
                                     fmt::format("source code string cannot contain null bytes at line {}", line),
                                     line});
        return report;
    }

    GIL_guard gil;

    PyCompilerFlags flags;
    flags.cf_flags = PyCF_ONLY_AST;
    flags.cf_feature_version = PY_MINOR_VERSION;
    py_ref tree(Py_CompileStringExFlags(source.c_str(), "<submission>", Py_file_input, &flags, -1));
    if (!tree) return syntax_error_report();

    py_ref ast(PyImport_ImportModule("ast"));
    if (!ast) throw sandbox_error("cannot import ast: " + fetch_python_error());
    py_ref import_type = get_ast_type(ast, "Import");
    py_ref import_from_type = get_ast_type(ast, "ImportFrom");
    py_ref call_type = get_ast_type(ast, "Call");
    py_ref name_type = get_ast_type(ast, "Name");
    py_ref attribute_type = get_ast_type(ast, "Attribute");

    py_ref nodes(PyObject_CallMethod(ast.get(), "walk", "O", tree.get()));
    if (!nodes) throw sandbox_error("ast.walk failed: " + fetch_python_error());
    py_ref iterator(PyObject_GetIter(nodes.get()));
    if (!iterator) throw sandbox_error("ast.walk is not iterable: " + fetch_python_error());

    auto add = [&](violation_kind kind, string detail, int line) {
        report.violations.push_back({kind, move(detail), line});
    };

    while (py_ref node{PyIter_Next(iterator.get())}) {
        int line = get_long_attr(node.get(), "lineno");

        if (is_instance(node.get(), import_type)) {
            for (auto &module : alias_names(node.get())) {
                string package = top_level_package(module);
                if (rules.forbidden_modules.count(package)) {
                    add(violation_kind::FORBIDDEN_IMPORT, fmt::format("import {} at line {}", module, line), line);
                    report.blocked_imports.insert(package);
                }
            }
        } else if (is_instance(node.get(), import_from_type)) {
            long level = get_long_attr(node.get(), "level");
            string module = get_string_attr(node.get(), "module").value_or("");
            string names = boost::algorithm::join(alias_names(node.get()), ", ");
            if (level > 0) {
                // relative imports have no package to check against
                add(violation_kind::FORBIDDEN_IMPORT,
                    fmt::format("from {}{} import {} at line {}", string(level, '.'), module, names, line), line);
                report.blocked_imports.insert(string(level, '.') + module);
            } else if (rules.forbidden_modules.count(top_level_package(module))) {
                add(violation_kind::FORBIDDEN_IMPORT,
                    fmt::format("from {} import {} at line {}", module, names, line), line);
                report.blocked_imports.insert(top_level_package(module));
            }
        } else if (is_instance(node.get(), call_type)) {
            py_ref func(PyObject_GetAttrString(node.get(), "func"));
            if (!func) throw sandbox_error("call without func: " + fetch_python_error());
            if (is_instance(func.get(), name_type)) {
                auto callee = get_string_attr(func.get(), "id");
                if (callee && rules.forbidden_builtins.count(*callee)) {
                    add(violation_kind::FORBIDDEN_CALL, fmt::format("call to {}() at line {}", *callee, line), line);
                    report.blocked_operations.insert(*callee);
                }
            }
        } else if (is_instance(node.get(), attribute_type)) {
            auto attr = get_string_attr(node.get(), "attr");
            if (attr && rules.forbidden_attributes.count(*attr)) {
                add(violation_kind::FORBIDDEN_ATTRIBUTE_ACCESS, fmt::format("access to {} at line {}", *attr, line), line);
                report.blocked_operations.insert(*attr);
            }
        } else if (is_instance(node.get(), name_type)) {
            auto id = get_string_attr(node.get(), "id");
            if (id && id->rfind("__", 0) == 0 && rules.forbidden_attributes.count(*id)) {
                add(violation_kind::FORBIDDEN_ATTRIBUTE_ACCESS, fmt::format("access to {} at line {}", *id, line), line);
                report.blocked_operations.insert(*id);
            }
        }
    }
    if (PyErr_Occurred()) throw sandbox_error("ast.walk failed: " + fetch_python_error());

    sort(report.violations.begin(), report.violations.end());
    report.violations.erase(unique(report.violations.begin(), report.violations.end()), report.violations.end());

    if (!report.violations.empty())
        LOG(INFO) << "Validation rejected submission: " << report.violations.size() << " violation(s), first: "
                  << report.violations.front().detail;
    return report;
}

}  // namespace pysandbox
