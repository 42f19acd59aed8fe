// -----------------------------------------------------------------------------
// src/python_runtime.cpp
// Embedded CPython interpreter
// Owns the process-wide interpreter, the "deopkg" bridge module through which
// the package manager script reports progress back to the plugin, and the
// marshaling between RuntimeValue records and Python objects.
//
// Reference:
// https://docs.python.org/3/extending/embedding.html
// -----------------------------------------------------------------------------
#define PY_SSIZE_T_CLEAN
#include <Python.h> // must precede standard headers

#include "python_runtime.hpp"

#include <memory>
#include <sstream>

#include <glib.h>

// -----------------------------------------------------------------------------
// Reference and GIL helpers
// -----------------------------------------------------------------------------
struct PyObjectDeleter {
  void operator()(PyObject *obj) const { Py_XDECREF(obj); }
};
using PyObjectPtr = std::unique_ptr<PyObject, PyObjectDeleter>;

class GilGuard {
  public:
  GilGuard()
    : state_(PyGILState_Ensure())
  {
  }
  ~GilGuard() { PyGILState_Release(state_); }

  GilGuard(const GilGuard &) = delete;
  GilGuard &operator=(const GilGuard &) = delete;

  private:
  PyGILState_STATE state_;
};

// -----------------------------------------------------------------------------
// Bridge module state
// Only one call runs at a time, so a single observer slot is enough.
// -----------------------------------------------------------------------------
static RuntimeObserver *g_observer = nullptr;
static bool g_bridge_registered = false;

class ObserverScope {
  public:
  explicit ObserverScope(RuntimeObserver *observer)
    : previous_(g_observer)
  {
    g_observer = observer;
  }
  ~ObserverScope() { g_observer = previous_; }

  ObserverScope(const ObserverScope &) = delete;
  ObserverScope &operator=(const ObserverScope &) = delete;

  private:
  RuntimeObserver *previous_;
};

static PyObject *
bridge_percentage(PyObject *, PyObject *args)
{
  int percentage = 0;
  if (!PyArg_ParseTuple(args, "i", &percentage)) {
    return nullptr;
  }
  if (percentage < 0 || percentage > 100) {
    PyErr_Format(PyExc_ValueError, "percentage %d is outside 0..100", percentage);
    return nullptr;
  }

  try {
    if (g_observer) {
      g_observer->on_percentage(static_cast<unsigned>(percentage));
    }
  } catch (const std::exception &e) {
    PyErr_SetString(PyExc_ValueError, e.what());
    return nullptr;
  }
  Py_RETURN_NONE;
}

static PyObject *
bridge_status(PyObject *, PyObject *args)
{
  const char *status = nullptr;
  if (!PyArg_ParseTuple(args, "s", &status)) {
    return nullptr;
  }

  try {
    if (g_observer) {
      g_observer->on_status(status);
    }
  } catch (const std::exception &e) {
    PyErr_SetString(PyExc_ValueError, e.what());
    return nullptr;
  }
  Py_RETURN_NONE;
}

static PyObject *
bridge_package(PyObject *, PyObject *args)
{
  const char *info = nullptr;
  const char *package_id = nullptr;
  const char *summary = nullptr;
  if (!PyArg_ParseTuple(args, "sss", &info, &package_id, &summary)) {
    return nullptr;
  }

  try {
    if (g_observer) {
      g_observer->on_package(info, package_id, summary);
    }
  } catch (const std::exception &e) {
    PyErr_SetString(PyExc_ValueError, e.what());
    return nullptr;
  }
  Py_RETURN_NONE;
}

static PyMethodDef g_bridge_methods[] = {
  { "percentage", bridge_percentage, METH_VARARGS, "Report job progress (0..100)." },
  { "status", bridge_status, METH_VARARGS, "Report the job status by PackageKit name." },
  { "package", bridge_package, METH_VARARGS, "Emit a package (info, package_id, summary)." },
  { nullptr, nullptr, 0, nullptr },
};

static PyModuleDef g_bridge_module = {
  PyModuleDef_HEAD_INIT,
  k_bridge_module_name,
  "PackageKit bridge for eopkg",
  -1,
  g_bridge_methods,
  nullptr,
  nullptr,
  nullptr,
  nullptr,
};

static PyObject *
init_bridge_module()
{
  return PyModule_Create(&g_bridge_module);
}

// -----------------------------------------------------------------------------
// Helper: turn the pending Python exception into a RuntimeError
// The traceback is logged; the message keeps only "Type: text". A string
// "pk_error" attribute on the exception selects the PackageKit error code.
// -----------------------------------------------------------------------------
static std::string
format_traceback(PyObject *type, PyObject *value, PyObject *traceback)
{
  PyObjectPtr module(PyImport_ImportModule("traceback"));
  if (!module) {
    PyErr_Clear();
    return {};
  }

  PyObjectPtr lines(PyObject_CallMethod(module.get(), "format_exception", "OOO", type,
                                        value ? value : Py_None, traceback ? traceback : Py_None));
  if (!lines) {
    PyErr_Clear();
    return {};
  }

  PyObjectPtr empty(PyUnicode_FromString(""));
  PyObjectPtr joined(empty ? PyUnicode_Join(empty.get(), lines.get()) : nullptr);
  const char *text = joined ? PyUnicode_AsUTF8(joined.get()) : nullptr;
  if (!text) {
    PyErr_Clear();
    return {};
  }
  return text;
}

static RuntimeError
python_error(const std::string &context)
{
  PyObject *raw_type = nullptr;
  PyObject *raw_value = nullptr;
  PyObject *raw_traceback = nullptr;
  PyErr_Fetch(&raw_type, &raw_value, &raw_traceback);
  PyErr_NormalizeException(&raw_type, &raw_value, &raw_traceback);

  PyObjectPtr type(raw_type);
  PyObjectPtr value(raw_value);
  PyObjectPtr traceback(raw_traceback);

  if (!type) {
    return RuntimeError(context + ": unknown Python error");
  }

  std::string message = context + ": " + PyExceptionClass_Name(type.get());
  std::string error_code;

  if (value) {
    PyObjectPtr text(PyObject_Str(value.get()));
    const char *utf8 = text ? PyUnicode_AsUTF8(text.get()) : nullptr;
    if (utf8 && *utf8) {
      message += ": ";
      message += utf8;
    }
    PyErr_Clear();

    PyObjectPtr code(PyObject_GetAttrString(value.get(), "pk_error"));
    if (code && PyUnicode_Check(code.get())) {
      const char *code_utf8 = PyUnicode_AsUTF8(code.get());
      if (code_utf8) {
        error_code = code_utf8;
      }
    }
    PyErr_Clear();
  }

  std::string trace = format_traceback(type.get(), value.get(), traceback.get());
  if (!trace.empty()) {
    g_warning("%s\n%s", context.c_str(), trace.c_str());
  }

  return RuntimeError(message, error_code);
}

// -----------------------------------------------------------------------------
// Marshaling: RuntimeValue -> Python (new reference, nullptr on error)
// -----------------------------------------------------------------------------
static PyObject *
to_python(const RuntimeValue &value)
{
  if (const auto *text = std::get_if<std::string>(&value)) {
    return PyUnicode_FromStringAndSize(text->data(), static_cast<Py_ssize_t>(text->size()));
  }
  if (const auto *number = std::get_if<std::int64_t>(&value)) {
    return PyLong_FromLongLong(*number);
  }
  if (const auto *flag = std::get_if<bool>(&value)) {
    return PyBool_FromLong(*flag ? 1 : 0);
  }

  const auto &items = std::get<StringList>(value);
  PyObjectPtr list(PyList_New(static_cast<Py_ssize_t>(items.size())));
  if (!list) {
    return nullptr;
  }
  for (std::size_t i = 0; i < items.size(); i++) {
    PyObject *item = PyUnicode_FromStringAndSize(items[i].data(), static_cast<Py_ssize_t>(items[i].size()));
    if (!item) {
      return nullptr;
    }
    PyList_SET_ITEM(list.get(), static_cast<Py_ssize_t>(i), item);
  }
  return list.release();
}

// -----------------------------------------------------------------------------
// Marshaling: Python -> RuntimeValue
// bool is tested before int since Python's bool derives from int.
// -----------------------------------------------------------------------------
static std::string
utf8_string(PyObject *obj, const std::string &context)
{
  Py_ssize_t size = 0;
  const char *utf8 = PyUnicode_AsUTF8AndSize(obj, &size);
  if (!utf8) {
    throw python_error(context);
  }
  return std::string(utf8, static_cast<std::size_t>(size));
}

static RuntimeValue
from_python(PyObject *obj, const std::string &context)
{
  if (obj == Py_None) {
    return std::string();
  }
  if (PyBool_Check(obj)) {
    return obj == Py_True;
  }
  if (PyLong_Check(obj)) {
    long long number = PyLong_AsLongLong(obj);
    if (number == -1 && PyErr_Occurred()) {
      throw python_error(context);
    }
    return static_cast<std::int64_t>(number);
  }
  if (PyUnicode_Check(obj)) {
    return utf8_string(obj, context);
  }
  if (PyList_Check(obj) || PyTuple_Check(obj)) {
    PyObjectPtr seq(PySequence_Fast(obj, "expected a list of strings"));
    if (!seq) {
      throw python_error(context);
    }
    StringList items;
    Py_ssize_t count = PySequence_Fast_GET_SIZE(seq.get());
    items.reserve(static_cast<std::size_t>(count));
    for (Py_ssize_t i = 0; i < count; i++) {
      PyObject *item = PySequence_Fast_GET_ITEM(seq.get(), i);
      if (!PyUnicode_Check(item)) {
        throw RuntimeError(context + ": list item is a " + Py_TYPE(item)->tp_name + ", expected str");
      }
      items.push_back(utf8_string(item, context));
    }
    return items;
  }

  throw RuntimeError(context + ": unsupported field type " + Py_TYPE(obj)->tp_name);
}

static RuntimeRecords
records_from_python(PyObject *result, const std::string &function)
{
  RuntimeRecords records;
  if (result == Py_None) {
    return records;
  }

  if (PyUnicode_Check(result) || PyBytes_Check(result) || PyDict_Check(result)) {
    throw RuntimeError(function + " returned a " + Py_TYPE(result)->tp_name + ", expected a sequence of records");
  }

  PyObjectPtr seq(PySequence_Fast(result, "expected a sequence of records"));
  if (!seq) {
    throw python_error(function);
  }

  Py_ssize_t count = PySequence_Fast_GET_SIZE(seq.get());
  records.reserve(static_cast<std::size_t>(count));

  for (Py_ssize_t i = 0; i < count; i++) {
    PyObject *item = PySequence_Fast_GET_ITEM(seq.get(), i);
    if (!PyTuple_Check(item) && !PyList_Check(item)) {
      std::ostringstream oss;
      oss << function << ": record " << i << " is a " << Py_TYPE(item)->tp_name << ", expected a tuple";
      throw RuntimeError(oss.str());
    }

    PyObjectPtr fields(PySequence_Fast(item, "expected a tuple"));
    if (!fields) {
      throw python_error(function);
    }

    RuntimeRecord record;
    Py_ssize_t field_count = PySequence_Fast_GET_SIZE(fields.get());
    record.reserve(static_cast<std::size_t>(field_count));
    for (Py_ssize_t f = 0; f < field_count; f++) {
      record.push_back(from_python(PySequence_Fast_GET_ITEM(fields.get(), f), function));
    }
    records.push_back(std::move(record));
  }

  return records;
}

// -----------------------------------------------------------------------------
// PythonRuntime
// -----------------------------------------------------------------------------
PythonRuntime::~PythonRuntime()
{
  if (interpreter_started_) {
    g_warning("python interpreter was not stopped before the runtime was released");
  }
}

void
PythonRuntime::register_bridge_module()
{
  // The inittab is process-wide; a second registration would be a duplicate
  if (g_bridge_registered) {
    return;
  }
  if (Py_IsInitialized()) {
    throw RuntimeError("bridge module must be registered before the interpreter starts");
  }
  if (PyImport_AppendInittab(k_bridge_module_name, &init_bridge_module) == -1) {
    throw RuntimeError("failed to register the deopkg bridge module");
  }

  g_bridge_registered = true;
}

void
PythonRuntime::start(const std::string &script_path)
{
  if (interpreter_started_) {
    throw RuntimeError("python interpreter is already running");
  }
  if (Py_IsInitialized()) {
    throw RuntimeError("python interpreter was started outside of the deopkg runtime");
  }
  if (!g_bridge_registered) {
    throw RuntimeError("bridge module is not registered");
  }

  PyConfig config;
  // Isolated: PYTHON* variables and the user site directory of whoever
  // started packagekitd never reach the interpreter
  PyConfig_InitIsolatedConfig(&config);
  config.install_signal_handlers = 0;
  config.parse_argv = 0;

  PyStatus status = Py_InitializeFromConfig(&config);
  PyConfig_Clear(&config);
  if (PyStatus_Exception(status)) {
    throw RuntimeError(std::string("failed to start python: ") + (status.err_msg ? status.err_msg : "unknown error"));
  }

  interpreter_started_ = true;
  g_debug("python %s started", Py_GetVersion());

  try {
    load_script(script_path);
  } catch (const RuntimeError &) {
    main_thread_state_ = PyEval_SaveThread();
    throw;
  }

  // Release the GIL; calls take it back with PyGILState_Ensure()
  main_thread_state_ = PyEval_SaveThread();
}

// -----------------------------------------------------------------------------
// Executes the package manager script inside the bridge module namespace so
// its functions become deopkg.<name>. Called with the GIL held.
// -----------------------------------------------------------------------------
void
PythonRuntime::load_script(const std::string &script_path)
{
  PyObjectPtr module(PyImport_ImportModule(k_bridge_module_name));
  if (!module) {
    throw python_error("import deopkg");
  }

  g_autofree gchar *source = nullptr;
  g_autoptr(GError) error = nullptr;
  if (!g_file_get_contents(script_path.c_str(), &source, nullptr, &error)) {
    throw RuntimeError("cannot read " + script_path + ": " + error->message);
  }

  PyObject *globals = PyModule_GetDict(module.get());
  if (!PyDict_GetItemString(globals, "__builtins__")) {
    if (PyDict_SetItemString(globals, "__builtins__", PyEval_GetBuiltins()) < 0) {
      throw python_error("load " + script_path);
    }
  }

  PyObjectPtr code(Py_CompileString(source, script_path.c_str(), Py_file_input));
  if (!code) {
    throw python_error("compile " + script_path);
  }

  PyObjectPtr result(PyEval_EvalCode(code.get(), globals, globals));
  if (!result) {
    throw python_error("execute " + script_path);
  }

  module_ = module.release();
  g_debug("loaded %s into module %s", script_path.c_str(), k_bridge_module_name);
}

void
PythonRuntime::stop()
{
  if (!interpreter_started_) {
    return;
  }

  PyEval_RestoreThread(main_thread_state_);
  main_thread_state_ = nullptr;

  Py_CLEAR(module_);
  if (Py_FinalizeEx() < 0) {
    g_warning("python interpreter reported errors during finalization");
  }

  interpreter_started_ = false;
  g_debug("python stopped");
}

bool
PythonRuntime::running() const
{
  return interpreter_started_ && module_ != nullptr;
}

RuntimeRecords
PythonRuntime::call(const std::string &function, const std::vector<RuntimeValue> &args, RuntimeObserver *observer)
{
  if (!running()) {
    throw RuntimeError("python interpreter is not running");
  }

  GilGuard gil;
  ObserverScope scope(observer);

  PyObjectPtr callable(PyObject_GetAttrString(module_, function.c_str()));
  if (!callable) {
    throw python_error(std::string(k_bridge_module_name) + "." + function);
  }
  if (!PyCallable_Check(callable.get())) {
    throw RuntimeError(std::string(k_bridge_module_name) + "." + function + " is not callable");
  }

  PyObjectPtr py_args(PyTuple_New(static_cast<Py_ssize_t>(args.size())));
  if (!py_args) {
    throw python_error(function);
  }
  for (std::size_t i = 0; i < args.size(); i++) {
    PyObject *arg = to_python(args[i]);
    if (!arg) {
      throw python_error(function);
    }
    PyTuple_SET_ITEM(py_args.get(), static_cast<Py_ssize_t>(i), arg);
  }

  PyObjectPtr result(PyObject_CallObject(callable.get(), py_args.get()));
  if (!result) {
    throw python_error(function);
  }

  return records_from_python(result.get(), function);
}

// -----------------------------------------------------------------------------
// EOF
// -----------------------------------------------------------------------------
