/**
 * @file python_driver.cpp
 * @brief Driver source and request file writer.
 * @author CodeVerdict contributors
 */

#include "engine/python_driver.hpp"
#include "core/text.hpp"

#include <fstream>
#include <random>

namespace code_verdict {

namespace {

constexpr std::string_view kDriverSource = R"PY(
import _thread
import ast
import builtins
import linecache
import operator
import os
import posix
import queue
import sys
import time
import traceback

CHANNEL = 3
REQUEST_FILE = 'request.hex'
GUARDED_FILES = ('<candidate>', '<assertion>')
REPR_LIMIT = 200

# Audit events refused outside the driver's main thread: they would reach the
# main thread's frames or the report channel state held there.
SEALED_EVENTS = frozenset([
    'sys._current_frames', 'sys.addaudithook',
    'sys._setprofileallthreads', 'sys._settraceallthreads',
    'gc.get_objects', 'gc.get_referrers', 'gc.get_referents',
    'ctypes.string_at', 'ctypes.wstring_at', 'ctypes.cdata',
])

COMPARISONS = {
    ast.Eq: ('==', operator.eq),
    ast.NotEq: ('!=', operator.ne),
    ast.Lt: ('<', operator.lt),
    ast.LtE: ('<=', operator.le),
    ast.Gt: ('>', operator.gt),
    ast.GtE: ('>=', operator.ge),
    ast.Is: ('is', operator.is_),
    ast.IsNot: ('is not', operator.is_not),
    ast.In: ('in', lambda a, b: a in b),
    ast.NotIn: ('not in', lambda a, b: a not in b),
}

class EnvironmentViolation(BaseException):
    pass


def safe_str(value):
    try:
        return str.__str__(str(value))
    except Exception:
        return '<unprintable %s>' % type(value).__name__


def short_repr(value):
    try:
        text = str.__str__(repr(value))
    except Exception as exc:
        text = '<unrepresentable %s: %s>' % (type(value).__name__, type(exc).__name__)
    if len(text) > REPR_LIMIT:
        text = text[:REPR_LIMIT] + '...'
    return text


def read_request():
    with open(REQUEST_FILE, 'rb') as handle:
        lines = handle.read().decode('ascii').split('\n')[:-1]
    os.unlink(REQUEST_FILE)
    return [bytes.fromhex(line).decode('utf-8', 'replace') for line in lines]


def candidate_traceback(exc):
    frames = [frame for frame in traceback.extract_tb(exc.__traceback__)
              if frame.filename in GUARDED_FILES]
    return ''.join(traceback.format_list(frames))


def remember_source(filename, source):
    linecache.cache[filename] = (len(source), None, source.splitlines(True), filename)


def single_comparison(tree):
    if len(tree.body) != 1:
        return None
    node = tree.body[0]
    if isinstance(node, ast.Expr):
        test, message = node.value, None
    elif isinstance(node, ast.Assert):
        test, message = node.test, node.msg
    else:
        return None
    if isinstance(test, ast.Compare) and len(test.ops) == 1 and type(test.ops[0]) in COMPARISONS:
        return test, message
    return None


def evaluate_node(node, namespace):
    expression = ast.Expression(body=node)
    return eval(compile(expression, '<assertion>', 'eval', dont_inherit=True), namespace)


def compare(comparison, namespace):
    test, message = comparison
    symbol, op = COMPARISONS[type(test.ops[0])]
    left = evaluate_node(test.left, namespace)
    right = evaluate_node(test.comparators[0], namespace)
    left_repr, right_repr = short_repr(left), short_repr(right)
    if op(left, right):
        return 'passed', '', left_repr, right_repr
    detail = '%s %s %s is false' % (left_repr, symbol, right_repr)
    if message is not None:
        detail = '%s (%s)' % (safe_str(evaluate_node(message, namespace)), detail)
    return 'assertion_failure', detail, left_repr, right_repr


def evaluate(text, namespace):
    try:
        tree = ast.parse(text, '<assertion>', 'exec')
    except SyntaxError as exc:
        return 'evaluation_error', '%s: %s' % (type(exc).__name__, exc.msg), None, None
    except (ValueError, TypeError) as exc:
        return 'evaluation_error', '%s: %s' % (type(exc).__name__, safe_str(exc)), None, None
    if not tree.body:
        return 'evaluation_error', 'assertion is empty', None, None
    remember_source('<assertion>', text)
    try:
        comparison = single_comparison(tree)
        if comparison is not None:
            return compare(comparison, namespace)
        if len(tree.body) == 1 and isinstance(tree.body[0], ast.Expr):
            value = evaluate_node(tree.body[0].value, namespace)
            if value:
                return 'passed', '', None, None
            return 'assertion_failure', 'expression evaluated to %s' % short_repr(value), None, None
        exec(compile(tree, '<assertion>', 'exec', dont_inherit=True), namespace)
        return 'passed', '', None, None
    except NameError as exc:
        return 'evaluation_error', '%s: %s' % (type(exc).__name__, safe_str(exc)), None, None
    except AssertionError as exc:
        return 'assertion_failure', safe_str(exc) or 'assertion failed', None, None
    except Exception as exc:
        return 'assertion_failure', 'raised %s: %s' % (type(exc).__name__, safe_str(exc)), None, None


def run_guarded(post, violations, function, *args):
    try:
        result = function(*args)
    except EnvironmentViolation:
        return False, None
    except BaseException as exc:
        if not violations:
            post(('runtime_error', safe_str(type(exc).__name__), safe_str(exc),
                  candidate_traceback(exc)))
        return False, None
    return not violations, result


def evaluate_all(code, assertions, post, violations):
    try:
        remember_source('<candidate>', code)
        try:
            compiled = compile(code, '<candidate>', 'exec', dont_inherit=True)
        except SyntaxError as exc:
            post(('compile_error', '%s: %s (line %s)' % (type(exc).__name__, exc.msg, exc.lineno)))
            return
        except (ValueError, TypeError, RecursionError, MemoryError) as exc:
            post(('compile_error', '%s: %s' % (type(exc).__name__, safe_str(exc))))
            return

        namespace = {'__name__': '__main__', '__builtins__': builtins, '__doc__': None}
        ok, _ = run_guarded(post, violations, exec, compiled, namespace)
        if not ok:
            return
        post(('executed',))

        for index, text in enumerate(assertions):
            ok, outcome = run_guarded(post, violations, evaluate, text, namespace)
            if not ok:
                return
            post(('assertion', index) + tuple(outcome))
    finally:
        post(('finished',))


class DriverIsolationError(RuntimeError):
    pass


def seal_driver_thread(main_ident, get_ident=_thread.get_ident, sealed=SEALED_EVENTS,
                       refusal=DriverIsolationError):
    def hook(event, args):
        if event in sealed and get_ident() != main_ident:
            raise refusal('%s is not available to evaluated code' % event)
    sys.addaudithook(hook)


def main():
    items = read_request()
    token, guard, code, assertions = items[0], items[1] == '1', items[2], items[3:]
    del items
    count = len(assertions)
    inbox = queue.SimpleQueue()
    violations = []

    # Everything the main thread runs once the evaluation thread has started is
    # bound here, so that evaluated code cannot swap it out.
    write, exit_, sleep = os.write, os._exit, time.sleep
    running = sys._current_frames
    get, empty = inbox.get, inbox.empty
    flushes = (sys.stdout.flush, sys.stderr.flush)
    str_, int_, tuple_, type_, len_, error_ = str, int, tuple, type, len, Exception

    def emit(tag, *fields):
        parts = [token, tag]
        for field in fields:
            if field is None:
                parts.append('-')
            elif type_(field) is int_:
                parts.append(('%d' % field).encode('ascii').hex())
            else:
                parts.append(field.encode('utf-8', 'backslashreplace').hex())
        data = ('\t'.join(parts) + '\n').encode('ascii')
        while data:
            data = data[write(CHANNEL, data):]

    def finish():
        for flush in flushes:
            try:
                flush()
            except error_:
                pass
        emit('done')
        exit_(0)

    def tampered(reason):
        emit('runtime_error', 'ReportTampering', reason, None)
        finish()

    def relay(worker):
        stage = 'compile'
        next_index = 0
        while True:
            item = get()
            if type_(item) is not tuple_ or not item:
                tampered('malformed result from the evaluation thread')
            for field in item:
                kind = type_(field)
                if field is not None and kind is not str_ and kind is not int_:
                    tampered('malformed result from the evaluation thread')
            tag, fields = item[0], item[1:]
            width = len_(fields)
            if tag == 'capability' and width == 2 and type_(fields[0]) is str_:
                emit(tag, *fields)
                finish()
            elif tag == 'compile_error' and stage == 'compile' and width == 1:
                emit(tag, *fields)
                stage = 'over'
            elif tag == 'runtime_error' and stage != 'over' and width == 3:
                emit(tag, *fields)
                stage = 'over'
            elif tag == 'executed' and stage == 'compile' and width == 0:
                emit(tag)
                stage = 'assertions'
            elif (tag == 'assertion' and stage == 'assertions' and width == 5
                  and type_(fields[0]) is int_ and fields[0] == next_index and next_index < count):
                emit(tag, *fields)
                next_index += 1
            elif tag == 'finished' and width == 0 and (
                    stage == 'over' or (stage == 'assertions' and next_index == count)):
                break
            else:
                tampered('unexpected %s result from the evaluation thread' % (tag,))
        # Results only count once the thread that produced them is gone.
        while worker in running():
            sleep(0.001)
        if not empty():
            tampered('results posted after the evaluation finished')

    def touched(detail):
        caller = sys._getframe(2)
        if caller.f_code.co_filename not in GUARDED_FILES:
            return
        if not violations:
            violations.append(detail)
            inbox.put(('capability', 'environment_access', detail))
        raise EnvironmentViolation(detail)

    class GuardedEnviron(object):
        def __init__(self, data, name):
            self._data = data
            self._name = name

        def __getitem__(self, key):
            touched('%s[%r]' % (self._name, key))
            return self._data[key]

        def __setitem__(self, key, value):
            touched('%s[%r] = ...' % (self._name, key))
            self._data[key] = value

        def __delitem__(self, key):
            touched('del %s[%r]' % (self._name, key))
            del self._data[key]

        def __contains__(self, key):
            touched('%r in %s' % (key, self._name))
            return key in self._data

        def __iter__(self):
            touched('iter(%s)' % self._name)
            return iter(list(self._data))

        def __len__(self):
            touched('len(%s)' % self._name)
            return len(self._data)

        def __repr__(self):
            touched('repr(%s)' % self._name)
            return 'environ(%r)' % (self._data,)

        def get(self, key, default=None):
            touched('%s.get(%r)' % (self._name, key))
            return self._data.get(key, default)

        def keys(self):
            touched('%s.keys()' % self._name)
            return list(self._data.keys())

        def values(self):
            touched('%s.values()' % self._name)
            return list(self._data.values())

        def items(self):
            touched('%s.items()' % self._name)
            return list(self._data.items())

        def copy(self):
            touched('%s.copy()' % self._name)
            return dict(self._data)

        def setdefault(self, key, default=None):
            touched('%s.setdefault(%r)' % (self._name, key))
            return self._data.setdefault(key, default)

        def pop(self, key, *default):
            touched('%s.pop(%r)' % (self._name, key))
            return self._data.pop(key, *default)

        def update(self, *args, **kwargs):
            touched('%s.update()' % self._name)
            self._data.update(*args, **kwargs)

        def clear(self):
            touched('%s.clear()' % self._name)
            self._data.clear()

    if guard:
        # The interpreter was started without an environment; these stand in
        # for what a library would otherwise find there.
        scratch = os.getcwd()
        text_env = dict(os.environ, HOME=scratch, TMPDIR=scratch)
        bytes_env = dict(posix.environ)
        bytes_env[b'HOME'] = bytes_env[b'TMPDIR'] = os.fsencode(scratch)

        def getenv(key, default=None):
            touched('os.getenv(%r)' % (key,))
            return text_env.get(key, default)

        def getenvb(key, default=None):
            touched('os.getenvb(%r)' % (key,))
            return bytes_env.get(key, default)

        def putenv(key, value):
            touched('os.putenv(%r)' % (key,))

        def unsetenv(key):
            touched('os.unsetenv(%r)' % (key,))

        os.environ = GuardedEnviron(text_env, 'os.environ')
        posix.environ = GuardedEnviron(bytes_env, 'posix.environ')
        if hasattr(os, 'environb'):
            os.environb = GuardedEnviron(bytes_env, 'os.environb')
        if hasattr(os, 'getenvb'):
            os.getenvb = getenvb
        os.getenv = getenv
        os.putenv = posix.putenv = putenv
        os.unsetenv = posix.unsetenv = unsetenv

    seal_driver_thread(_thread.get_ident())
    emit('ready')
    worker = _thread.start_new_thread(evaluate_all, (code, assertions, inbox.put, violations))
    relay(worker)
    finish()


main()
)PY";

}  // namespace

std::string_view python_driver_source() noexcept {
    return kDriverSource;
}

Result<void> write_request_file(const std::filesystem::path& scratch_dir,
                                const DriverRequest& request) {
    const auto path = scratch_dir / kRequestFileName;
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) return Error{ErrorCode::Io, "Cannot create request file: " + path.string()};

    out << hex_encode(request.token) << '\n'
        << hex_encode(request.guard_environment ? "1" : "0") << '\n'
        << hex_encode(request.code) << '\n';
    for (const auto& assertion : request.assertions) {
        out << hex_encode(assertion) << '\n';
    }
    out.flush();
    if (!out) return Error{ErrorCode::Io, "Failed writing request file: " + path.string()};
    return {};
}

std::string make_session_token() {
    std::random_device device;
    std::string bytes;
    for (int i = 0; i < 4; ++i) {
        const uint32_t word = device();
        for (int shift = 0; shift < 32; shift += 8) {
            bytes += static_cast<char>((word >> shift) & 0xFF);
        }
    }
    return hex_encode(bytes);
}

}  // namespace code_verdict
