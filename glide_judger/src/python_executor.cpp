/**
 * @file python_executor.cpp
 * @brief 嵌入式 CPython：每次运行一个沙箱子进程、受限环境、C 层追踪函数
 */

#define PY_SSIZE_T_CLEAN
#include <Python.h>
#include <frameobject.h>

#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <chrono>

#include "executor/python_executor.h"
#include "core/grader_logger.h"
#include "glide_env.h"

namespace glide {

namespace {

using Clock = std::chrono::steady_clock;

constexpr const char *BOOTSTRAP = R"PY(
import sys
import json
import traceback
import builtins as _builtins

_ALLOWED = frozenset((
    'math', 'cmath', 'collections', 'heapq', 'bisect', 'itertools', 'functools',
    'string', 're', 'json', 'typing', 'dataclasses', 'operator', 'random',
    'copy', 'decimal', 'fractions', 'statistics', 'array', 'enum',
))

_FORBIDDEN = frozenset((
    'open', 'exec', 'eval', 'compile', 'input', 'breakpoint', 'exit', 'quit',
    'help', 'globals', 'vars', 'memoryview', '__loader__', '__spec__',
))


class GlideDeadline(BaseException):
    pass


class _Capture:
    def __init__(self, limit):
        self._parts = []
        self._size = 0
        self._limit = limit
        self.truncated = False

    def write(self, s):
        if not isinstance(s, str):
            raise TypeError('write() argument must be str, not ' + type(s).__name__)
        room = self._limit - self._size
        if len(s) > room:
            self.truncated = True
            s = s[:max(room, 0)]
        if s:
            self._parts.append(s)
            self._size += len(s)
        return len(s)

    def writelines(self, lines):
        for line in lines:
            self.write(line)

    def flush(self):
        pass

    def isatty(self):
        return False

    def getvalue(self):
        return ''.join(self._parts)


_real_import = _builtins.__import__


def _guarded_import(name, globals=None, locals=None, fromlist=(), level=0):
    if level != 0 or name.partition('.')[0] not in _ALLOWED:
        raise ImportError("import of '%s' is not allowed" % name)
    return _real_import(name, globals, locals, fromlist, level)


_safe_builtins = {k: v for k, v in vars(_builtins).items() if k not in _FORBIDDEN}
_safe_builtins['__import__'] = _guarded_import


def _glide_setup(limit):
    out = _Capture(limit)
    err = _Capture(limit)
    sys.stdout = out
    sys.stderr = err
    return out, err


def _glide_load(source, entry, filename):
    code = compile(source, filename, 'exec')
    env = {'__builtins__': _safe_builtins, '__name__': 'solution'}
    exec(code, env)
    fn = env.get(entry)
    if callable(fn):
        return fn
    cls = env.get('Solution')
    if isinstance(cls, type) and callable(getattr(cls, entry, None)):
        return getattr(cls(), entry)
    raise NameError("function '%s' is not defined" % entry)


def _glide_args(text):
    value = json.loads(text)
    if not isinstance(value, list):
        raise TypeError('arguments must be a JSON array')
    return tuple(value)


def _glide_repr(obj, limit):
    try:
        s = repr(obj)
    except Exception as e:
        s = '<unreprable %s: %s>' % (type(obj).__name__, e)
    if len(s) > limit:
        s = s[:limit] + '…'
    return s


def _glide_encode(value):
    try:
        return json.dumps(value, allow_nan=False)
    except (TypeError, ValueError, RecursionError):
        return json.dumps(_glide_repr(value, 1 << 16))


def _glide_describe(exc, filename):
    frames = [f for f in traceback.extract_tb(exc.__traceback__) if f.filename == filename]
    lines = []
    if frames:
        lines.append('Traceback (most recent call last):\n')
        lines.extend(traceback.format_list(frames))
    lines.extend(traceback.format_exception_only(type(exc), exc))
    return ''.join(lines), '%s: %s' % (type(exc).__name__, exc)
)PY";

/**
 * @brief PyObject 引用的 RAII 持有者
 */
class PyRef {
private:
    PyObject *obj_ = nullptr;

public:
    PyRef() = default;
    explicit PyRef(PyObject *obj) : obj_(obj) {}
    ~PyRef() { Py_XDECREF(obj_); }

    PyRef(const PyRef&) = delete;
    PyRef& operator=(const PyRef&) = delete;

    PyRef& operator=(PyObject *obj) {
        Py_XDECREF(obj_);
        obj_ = obj;
        return *this;
    }

    PyObject* get() const { return obj_; }
    explicit operator bool() const { return obj_ != nullptr; }
};

std::string to_std_string(PyObject *obj) {
    if (!obj) return "";
    if (!PyUnicode_Check(obj)) {
        PyRef s(PyObject_Str(obj));
        if (!s) {
            PyErr_Clear();
            return "";
        }
        return to_std_string(s.get());
    }
    Py_ssize_t size = 0;
    const char *data = PyUnicode_AsUTF8AndSize(obj, &size);
    if (!data) {
        PyErr_Clear();
        return "";
    }
    return std::string(data, static_cast<size_t>(size));
}

/**
 * @brief 取出并清除当前异常，返回 "Type: message"
 */
std::string fetch_error_text() {
    PyObject *type = nullptr, *value = nullptr, *tb = nullptr;
    PyErr_Fetch(&type, &value, &tb);
    PyRef t(type), v(value), trace(tb);
    if (!t) return "unknown error";
    std::string name = PyExceptionClass_Check(t.get())
                           ? PyExceptionClass_Name(t.get()) : "Exception";
    std::string message = v ? to_std_string(v.get()) : "";
    return message.empty() ? name : name + ": " + message;
}

/**
 * @brief 追踪函数使用的状态
 */
struct TraceContext {
    Clock::time_point deadline;
    unsigned counter = 0;
    bool timed_out = false;

    bool record = false;
    bool active = false;
    bool stopped = false;
    const std::set<int> *breakpoints = nullptr;
    size_t max_steps = 500;
    int repr_limit = 200;
    std::vector<std::string> source_lines;

    PyObject *deadline_exc = nullptr;     ///< 借用引用
    PyObject *repr_fn = nullptr;          ///< 借用引用

    std::vector<TraceStep> steps;
    bool truncated = false;
};

TraceContext *t_trace = nullptr;

std::string safe_repr(TraceContext &ctx, PyObject *obj) {
    PyRef s(PyObject_CallFunction(ctx.repr_fn, "Oi", obj, ctx.repr_limit));
    if (!s) {
        PyErr_Clear();
        return "<unreprable>";
    }
    return to_std_string(s.get());
}

void snapshot_locals(TraceContext &ctx, PyFrameObject *frame, TraceStep &step) {
    PyRef locals(PyFrame_GetLocals(frame));
    if (!locals) {
        PyErr_Clear();
        return;
    }
    PyRef items(PyMapping_Items(locals.get()));
    if (!items) {
        PyErr_Clear();
        return;
    }
    Py_ssize_t n = PyList_Size(items.get());
    for (Py_ssize_t i = 0; i < n; i++) {
        PyObject *pair = PyList_GetItem(items.get(), i);
        if (!pair || !PyTuple_Check(pair) || PyTuple_Size(pair) != 2) continue;
        std::string name = to_std_string(PyTuple_GetItem(pair, 0));
        step.locals.emplace_back(name, safe_repr(ctx, PyTuple_GetItem(pair, 1)));
    }
}

int trace_callback(PyObject *, PyFrameObject *frame, int what, PyObject *arg) {
    TraceContext *ctx = t_trace;
    if (!ctx) return 0;

    if ((++ctx->counter & 31u) == 0 && Clock::now() >= ctx->deadline) {
        ctx->timed_out = true;
        PyErr_SetString(ctx->deadline_exc, "deadline exceeded");
        return -1;
    }

    if (!ctx->record || !ctx->active || ctx->stopped) return 0;
    if (what != PyTrace_CALL && what != PyTrace_LINE && what != PyTrace_RETURN) return 0;

    PyCodeObject *code = PyFrame_GetCode(frame);
    bool user_frame = PyUnicode_CompareWithASCIIString(code->co_filename, env::SUBMISSION_FILENAME) == 0;
    Py_DECREF(code);
    if (!user_frame) return 0;

    int line = PyFrame_GetLineNumber(frame);
    if (!ctx->breakpoints->empty() && ctx->breakpoints->count(line) == 0) return 0;

    TraceStep step;
    step.event = what == PyTrace_CALL ? "call" : (what == PyTrace_LINE ? "line" : "return");
    step.line = line;
    if (line >= 1 && static_cast<size_t>(line) <= ctx->source_lines.size()) {
        step.code = ctx->source_lines[static_cast<size_t>(line) - 1];
    }

    // 快照期间不能让已有的异常状态被覆盖
    PyObject *et = nullptr, *ev = nullptr, *etb = nullptr;
    PyErr_Fetch(&et, &ev, &etb);
    snapshot_locals(*ctx, frame, step);
    if (what == PyTrace_RETURN) {
        step.return_value = arg ? safe_repr(*ctx, arg) : std::string("None");
    }
    PyErr_Restore(et, ev, etb);

    ctx->steps.push_back(std::move(step));
    if (ctx->steps.size() >= ctx->max_steps) {
        ctx->truncated = true;
        ctx->stopped = true;
    }
    return 0;
}

/**
 * @brief 在子进程的主解释器中执行一次运行，GIL 已持有
 */
void guest_body(const GuestRun &in, Clock::time_point deadline, GuestRunResult &out,
                std::string &infra_error) {
    PyRef globals(PyDict_New());
    if (!globals || PyDict_SetItemString(globals.get(), "__builtins__", PyEval_GetBuiltins()) != 0) {
        infra_error = "cannot create bootstrap namespace: " + fetch_error_text();
        return;
    }
    PyRef boot(PyRun_String(BOOTSTRAP, Py_file_input, globals.get(), globals.get()));
    if (!boot) {
        infra_error = "bootstrap failed: " + fetch_error_text();
        return;
    }

    // 以下均为 globals 持有的借用引用
    PyObject *setup_fn = PyDict_GetItemString(globals.get(), "_glide_setup");
    PyObject *load_fn = PyDict_GetItemString(globals.get(), "_glide_load");
    PyObject *args_fn = PyDict_GetItemString(globals.get(), "_glide_args");
    PyObject *repr_fn = PyDict_GetItemString(globals.get(), "_glide_repr");
    PyObject *encode_fn = PyDict_GetItemString(globals.get(), "_glide_encode");
    PyObject *describe_fn = PyDict_GetItemString(globals.get(), "_glide_describe");
    PyObject *deadline_exc = PyDict_GetItemString(globals.get(), "GlideDeadline");
    if (!setup_fn || !load_fn || !args_fn || !repr_fn || !encode_fn || !describe_fn || !deadline_exc) {
        infra_error = "bootstrap helpers missing";
        return;
    }

    PyRef streams(PyObject_CallFunction(setup_fn, "n", static_cast<Py_ssize_t>(in.output_limit)));
    if (!streams) {
        infra_error = "cannot redirect output: " + fetch_error_text();
        return;
    }

    TraceContext ctx;
    ctx.deadline = deadline;
    ctx.record = in.record;
    ctx.breakpoints = &in.breakpoints;
    ctx.max_steps = static_cast<size_t>(std::max(in.max_steps, 1));
    ctx.repr_limit = in.repr_limit;
    ctx.deadline_exc = deadline_exc;
    ctx.repr_fn = repr_fn;
    if (in.record) {
        ctx.source_lines = split_lines(in.source);
    }
    t_trace = &ctx;
    PyEval_SetTrace(trace_callback, nullptr);

    PyRef result;
    PyRef fn(PyObject_CallFunction(load_fn, "sss", in.source.c_str(), in.entry_function.c_str(),
                                   env::SUBMISSION_FILENAME));
    PyRef args;
    if (fn) {
        args = PyObject_CallFunction(args_fn, "s", in.args_json.c_str());
    }
    if (args) {
        out.args_repr = safe_repr(ctx, args.get());
        ctx.active = true;
        result = PyObject_Call(fn.get(), args.get(), nullptr);
        ctx.active = false;
    }

    PyEval_SetTrace(nullptr, nullptr);
    t_trace = nullptr;

    if (result) {
        PyRef encoded(PyObject_CallFunctionObjArgs(encode_fn, result.get(), nullptr));
        if (encoded) {
            out.result_json = to_std_string(encoded.get());
            out.return_repr = safe_repr(ctx, result.get());
            out.completed = true;
        }
    }

    if (!out.completed && PyErr_Occurred()) {
        PyObject *type = nullptr, *value = nullptr, *tb = nullptr;
        PyErr_Fetch(&type, &value, &tb);
        PyErr_NormalizeException(&type, &value, &tb);
        if (tb && value) {
            PyException_SetTraceback(value, tb);
        }
        PyRef t(type), v(value), trace(tb);

        if (ctx.timed_out || (t && PyErr_GivenExceptionMatches(t.get(), deadline_exc))) {
            out.timed_out = true;
            out.error = "TimeoutError: exceeded " + std::to_string(in.timeout_ms) + " ms";
        } else if (v) {
            PyRef described(PyObject_CallFunction(describe_fn, "Os", v.get(), env::SUBMISSION_FILENAME));
            if (described && PyTuple_Check(described.get()) && PyTuple_Size(described.get()) == 2) {
                out.stderr_text = to_std_string(PyTuple_GetItem(described.get(), 0));
                out.error = to_std_string(PyTuple_GetItem(described.get(), 1));
            } else {
                PyErr_Clear();
                out.error = std::string(PyExceptionClass_Name(t.get()));
            }
        }
    } else if (!out.completed) {
        out.error = "no result produced";
    }
    if (ctx.timed_out) {
        // 用户代码吞掉了 GlideDeadline 也按超时处理
        out.timed_out = true;
        out.completed = false;
        out.error = "TimeoutError: exceeded " + std::to_string(in.timeout_ms) + " ms";
    }

    // 用户输出
    std::string traceback_text = std::move(out.stderr_text);
    PyObject *out_stream = PyTuple_GetItem(streams.get(), 0);
    PyObject *err_stream = PyTuple_GetItem(streams.get(), 1);
    PyRef out_text(PyObject_CallMethod(out_stream, "getvalue", nullptr));
    PyRef err_text(PyObject_CallMethod(err_stream, "getvalue", nullptr));
    out.stdout_text = to_std_string(out_text.get());
    out.stderr_text = to_std_string(err_text.get()) + traceback_text;
    for (PyObject *stream : {out_stream, err_stream}) {
        PyRef flag(PyObject_GetAttrString(stream, "truncated"));
        if (flag && PyObject_IsTrue(flag.get()) == 1) {
            out.output_truncated = true;
        }
    }
    PyErr_Clear();

    out.steps = std::move(ctx.steps);
    out.steps_truncated = ctx.truncated;
}

bool start_interpreter(std::string &error) {
    PyConfig config;
    PyConfig_InitIsolatedConfig(&config);
    config.install_signal_handlers = 0;
    config.parse_argv = 0;
    config.site_import = 0;
    config.write_bytecode = 0;
    PyStatus status = Py_InitializeFromConfig(&config);
    PyConfig_Clear(&config);
    if (PyStatus_Exception(status)) {
        error = status.err_msg ? status.err_msg : "Py_InitializeFromConfig failed";
        return false;
    }
    return true;
}

//------------------------------------------------------------------------------
// 子进程与父进程之间的结果文档
//------------------------------------------------------------------------------

Value optional_string(const std::optional<std::string> &s) {
    return s ? Value(*s) : Value(nullptr);
}

std::optional<std::string> optional_string(const Value &j, const char *key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return std::nullopt;
    return it->get<std::string>();
}

Value encode_result(const GuestRunResult &r) {
    Value steps = Value::array();
    for (const auto &s : r.steps) {
        Value locals = Value::array();
        for (const auto &kv : s.locals) {
            locals.push_back(Value::array({kv.first, kv.second}));
        }
        Value step = Value::object();
        step["event"] = s.event;
        step["line"] = s.line;
        step["code"] = s.code;
        step["locals"] = std::move(locals);
        step["return"] = optional_string(s.return_value);
        steps.push_back(std::move(step));
    }

    Value j = Value::object();
    j["completed"] = r.completed;
    j["timed_out"] = r.timed_out;
    j["result"] = optional_string(r.result_json);
    j["return_repr"] = optional_string(r.return_repr);
    j["args_repr"] = r.args_repr;
    j["stdout"] = r.stdout_text;
    j["stderr"] = r.stderr_text;
    j["output_truncated"] = r.output_truncated;
    j["error"] = optional_string(r.error);
    j["steps"] = std::move(steps);
    j["steps_truncated"] = r.steps_truncated;
    return j;
}

/**
 * @brief 解析子进程写回的文档，格式不对返回 false
 *
 * 文档经由客体进程写出，不能信任其结构。
 */
bool decode_result(const Value &doc, GuestRunResult &out) {
    if (!doc.is_object()) return false;
    try {
        out.completed = doc.at("completed").get<bool>();
        out.timed_out = doc.value("timed_out", false);
        out.result_json = optional_string(doc, "result");
        out.return_repr = optional_string(doc, "return_repr");
        out.args_repr = doc.value("args_repr", std::string());
        out.stdout_text = doc.value("stdout", std::string());
        out.stderr_text = doc.value("stderr", std::string());
        out.output_truncated = doc.value("output_truncated", false);
        out.error = optional_string(doc, "error");
        out.steps_truncated = doc.value("steps_truncated", false);
        for (const auto &j : doc.value("steps", Value::array())) {
            TraceStep step;
            step.event = j.at("event").get<std::string>();
            step.line = j.at("line").get<int>();
            step.code = j.value("code", std::string());
            for (const auto &kv : j.at("locals")) {
                step.locals.emplace_back(kv.at(0).get<std::string>(), kv.at(1).get<std::string>());
            }
            step.return_value = optional_string(j, "return");
            out.steps.push_back(std::move(step));
        }
    } catch (const Value::exception &e) {
        TLOG_WARN << "Malformed result document from Python child: " << e.what();
        out = GuestRunResult();
        return false;
    }
    return true;
}

bool write_all(int fd, const std::string &data) {
    size_t done = 0;
    while (done < data.size()) {
        ssize_t n = write(fd, data.data() + done, data.size() - done);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        done += static_cast<size_t>(n);
    }
    return true;
}

/**
 * @brief 沙箱子进程入口：初始化解释器、运行、把结果文档写入 channel_fd
 *
 * 在 fork 出的子进程中执行，不能写日志（日志锁可能在 fork 时被其他线程持有）。
 * 解释器不需要 Finalize，返回后沙箱直接 _exit。
 */
int python_child_main(const GuestRun &run, int channel_fd) {
    try {
        auto deadline = Clock::now() + std::chrono::milliseconds(run.timeout_ms);
        std::string infra_error;
        Value doc;
        if (start_interpreter(infra_error)) {
            GuestRunResult out;
            guest_body(run, deadline, out, infra_error);
            if (infra_error.empty()) {
                doc = encode_result(out);
            }
        }
        if (!infra_error.empty()) {
            doc = Value::object();
            doc["infra_error"] = infra_error;
        }
        std::string text = doc.dump(-1, ' ', false, Value::error_handler_t::replace);
        return write_all(channel_fd, text) ? 0 : 1;
    } catch (const std::exception &) {
        // 异常不能越过 fork 边界回到父进程的调用栈
        return 70;
    }
}

} // namespace

Result<GuestRunResult> run_guest_python(const GuestRun &run) {
    GLIDE_ENSURE(!run.work_dir.empty(), ErrorCode::SANDBOX_FAILURE,
                 "embedded Python run needs a work directory");

    sandbox::SandboxConfig cfg;
    cfg.argv = {"embedded-python"};
    cfg.work_dir = run.work_dir;
    cfg.workspace_dir = run.workspace_dir.empty() ? run.work_dir : run.workspace_dir;
    cfg.timeout_ms = run.timeout_ms + KILL_GRACE_MS;
    cfg.memory_limit_mb = run.memory_limit_mb;
    cfg.max_processes = run.max_processes;
    cfg.output_limit_kb = std::max(1, static_cast<int>(run.output_limit / 1024));
    cfg.use_namespace = run.use_namespace;
    cfg.child_main = [&run](int channel_fd) { return python_child_main(run, channel_fd); };

    sandbox::Sandbox box(std::move(cfg));
    GLIDE_TRY_UNWRAP(sr, box.run());

    std::optional<Value> doc;
    if (!sr.channel_truncated) {
        doc = parse_json(sr.channel_text);
    }
    if (doc && doc->is_object() && doc->contains("infra_error")) {
        const Value &msg = (*doc)["infra_error"];
        return Err<GuestRunResult>(ErrorCode::INTERPRETER_FAILURE,
                                   msg.is_string() ? msg.get<std::string>() : std::string("interpreter failure"));
    }

    GuestRunResult out;
    bool decoded = doc && decode_result(*doc, out);
    if (sr.status == ExitStatus::Timeout) {
        out.completed = false;
        out.timed_out = true;
        out.error = "TimeoutError: exceeded " + std::to_string(run.timeout_ms) + " ms";
        TLOG_DEBUG << "Python child killed at the hard deadline: " << sr.message;
    } else if (!decoded) {
        out.completed = false;
        out.term_signal = sr.term_signal;
        out.stdout_text = std::move(sr.stdout_text);
        out.stderr_text = std::move(sr.stderr_text);
        out.output_truncated = sr.output_truncated;
        out.error = "SystemError: interpreter exited without a result (" + sr.message + ")";
        TLOG_WARN << "Python child produced no result document: " << sr.message;
    }
    out.wall_time_ms = sr.wall_time_ms;
    return Ok(std::move(out));
}

//==============================================================================
// PythonExecutor
//==============================================================================

Result<BuildResult> PythonExecutor::build(sandbox::Workspace &, const Submission &submission) {
    GLIDE_ENSURE(is_valid_identifier(submission.entry_function), ErrorCode::INVALID_REQUEST,
                 "Invalid entry function name: '" + submission.entry_function + "'");
    return Ok(BuildResult::no_build());
}

GuestRun PythonExecutor::base_run(const sandbox::Workspace &ws, const std::string &work_dir,
                                  const Submission &submission) const {
    GuestRun run;
    run.source = submission.source_code;
    run.entry_function = submission.entry_function;
    run.timeout_ms = descriptor_.run_timeout_ms;
    run.output_limit = static_cast<size_t>(settings_.output_limit_kb) * 1024;
    run.work_dir = work_dir;
    run.workspace_dir = ws.path();
    run.use_namespace = settings_.use_namespace;
    run.memory_limit_mb = run_memory_mb();
    run.max_processes = run_max_processes();
    return run;
}

Result<ExecutionOutcome> PythonExecutor::execute(sandbox::Workspace &ws, const Submission &submission,
                                                 const TestCase &test_case) {
    GLIDE_TRY_UNWRAP(scratch, ws.make_case_dir(test_case.case_index));
    GuestRun run = base_run(ws, scratch.path(), submission);
    run.args_json = render(test_case.args);

    auto guest = run_guest_python(run);
    if (guest.is_error()) {
        return Err<ExecutionOutcome>(ErrorCode::SANDBOX_FAILURE, guest.error().message());
    }
    GuestRunResult &r = guest.value();

    ExecutionOutcome outcome;
    outcome.stdout_text = std::move(r.stdout_text);
    outcome.stderr_text = std::move(r.stderr_text);
    outcome.output_truncated = r.output_truncated;
    outcome.wall_time_ms = r.wall_time_ms;
    if (r.timed_out) {
        outcome.exit_status = ExitStatus::Timeout;
    } else if (r.term_signal != 0) {
        outcome.exit_status = ExitStatus::Crash;
        outcome.term_signal = r.term_signal;
        if (outcome.stderr_text.empty() && r.error) {
            outcome.stderr_text = *r.error;
        }
    } else if (r.completed) {
        outcome.exit_status = ExitStatus::Success;
        outcome.returned_value = std::move(r.result_json);
    } else {
        outcome.exit_status = ExitStatus::NonZero;
        outcome.exit_code = 1;
        if (outcome.stderr_text.empty() && r.error) {
            outcome.stderr_text = *r.error;
        }
    }
    return Ok(std::move(outcome));
}

Result<TraceReport> PythonExecutor::trace(sandbox::Workspace &ws, const Submission &submission,
                                          const TraceOptions &options) {
    GLIDE_ENSURE(is_valid_identifier(options.entry_function), ErrorCode::INVALID_REQUEST,
                 "Invalid entry function name: '" + options.entry_function + "'");
    GLIDE_TRY_UNWRAP(scratch, ws.make_case_dir(0));
    GuestRun run = base_run(ws, scratch.path(), submission);
    run.entry_function = options.entry_function;
    run.args_json = render(options.args);
    run.record = true;
    run.breakpoints.insert(options.breakpoints.begin(), options.breakpoints.end());
    run.max_steps = options.max_steps > 0 ? options.max_steps : settings_.trace_max_steps;
    run.repr_limit = settings_.trace_repr_limit;

    auto guest = run_guest_python(run);
    if (guest.is_error()) {
        return Err<TraceReport>(ErrorCode::SANDBOX_FAILURE, guest.error().message());
    }
    GuestRunResult &r = guest.value();

    TraceReport report;
    report.steps = std::move(r.steps);
    report.truncated = r.steps_truncated;
    report.stdout_text = std::move(r.stdout_text);
    report.stderr_text = std::move(r.stderr_text);
    report.return_value = std::move(r.return_repr);
    report.args_used = std::move(r.args_repr);
    report.error = std::move(r.error);
    report.timed_out = r.timed_out;
    TLOG_DEBUG << "Traced " << submission.id << ": " << report.steps.size() << " step(s)"
               << (report.truncated ? " (truncated)" : "");
    return Ok(std::move(report));
}

} // namespace glide
