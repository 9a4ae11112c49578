#include "sandbox/language.hpp"
#include <boost/algorithm/string/replace.hpp>
#include <fmt/core.h>

namespace arena::sandbox {
using namespace std;

static denylist_entry deny(const string &pattern, const string &description) {
    return denylist_entry{regex(pattern, regex::ECMAScript), description};
}

static const char *python_harness = R"(
import json as _arena_json
import sys as _arena_sys
def _arena_entry(name):
    scope = globals()
    if callable(scope.get(name)):
        return scope[name]
    if 'Solution' in scope:
        return getattr(scope['Solution'](), name)
    raise NameError('entry point ' + name + ' is not defined')
_arena_args = _arena_json.loads(_arena_sys.stdin.read())
print()
print(_arena_json.dumps(_arena_entry('%ENTRY%')(*_arena_args)))
)";

static const char *javascript_harness = R"(
;(() => {
  const args = JSON.parse(require('fs').readFileSync(0, 'utf8'));
  if (typeof %ENTRY% !== 'function') throw new Error('entry point %ENTRY% is not defined');
  const result = %ENTRY%(...args);
  console.log();
  console.log(JSON.stringify(result === undefined ? null : result));
})();
)";

static vector<language> build_languages() {
    vector<language> languages;

    languages.push_back(language{
        "python", "Python 3", "python:3.11-alpine", "main.py", "", "python3 /tmp/main.py", {},
        {
            deny(R"(\bimport\s+(os|subprocess|sys|shutil|glob|pathlib|socket|ctypes|importlib|multiprocessing|threading|signal|pty)\b)", "importing system modules is not allowed"),
            deny(R"(\bfrom\s+(os|subprocess|sys|shutil|glob|pathlib|socket|ctypes|importlib|multiprocessing|threading|signal|pty)\b[\w.]*\s+import\b)", "importing system modules is not allowed"),
            deny(R"(__import__\s*\()", "dynamic import is not allowed"),
            deny(R"(\b(exec|eval|compile)\s*\()", "dynamic code execution is not allowed"),
            deny(R"(\b(open|file)\s*\()", "file access is not allowed"),
            deny(R"(\b(exit|quit|breakpoint)\s*\()", "process control is not allowed"),
            deny(R"(\b(subprocess|os|sys)\.)", "system module access is not allowed"),
            deny(R"(__(subclasses|globals|builtins|class|bases|base|mro|code|closure|dict|getattribute|loader|spec|import|reduce|reduce_ex)__)", "access to interpreter internals is not allowed"),
            deny(R"(\b(getattr|setattr|delattr|globals|locals|vars)\s*\()", "reflection is not allowed"),
        },
        python_harness});

    languages.push_back(language{
        "javascript", "JavaScript (Node.js)", "node:18-alpine", "main.js", "", "node /tmp/main.js", {},
        {
            deny(R"(require\s*\(\s*['"`](fs|child_process|process|os|path|net|http|https|vm|worker_threads|cluster|dgram|v8|inspector)['"`]\s*\))", "requiring system modules is not allowed"),
            deny(R"(\bimport\s*\()", "dynamic import is not allowed"),
            deny(R"(\beval\s*\()", "dynamic code execution is not allowed"),
            deny(R"(\bFunction\s*\()", "dynamic code execution is not allowed"),
            deny(R"(\b(setTimeout|setInterval|setImmediate)\s*\()", "timers are not allowed"),
            deny(R"(\bprocess\.(exit|kill|env|binding|dlopen|abort))", "process access is not allowed"),
            deny(R"(\b(__dirname|__filename)\b)", "file system probing is not allowed"),
            deny(R"(\b(global|globalThis)\s*[.\[])", "global object access is not allowed"),
            deny(R"(\bBuffer\b)", "Buffer is not allowed"),
        },
        javascript_harness});

    languages.push_back(language{
        "cpp", "C++ (GCC)", "gcc:latest", "main.cpp", "g++ -O2 -std=c++17 -o /tmp/main /tmp/main.cpp", "/tmp/main", {},
        {
            deny(R"(#\s*include\s*<\s*(unistd\.h|sys/[\w./]+|filesystem|thread|csignal|signal\.h|dlfcn\.h|spawn\.h|fcntl\.h)\s*>)", "including system headers is not allowed"),
            deny(R"(\b(system|popen|fork|vfork|execl|execlp|execle|execv|execvp|execve|kill|ptrace|dlopen)\s*\()", "process control is not allowed"),
            deny(R"(\b(asm|__asm__)\b)", "inline assembly is not allowed"),
            deny(R"(\b(fopen|freopen|remove|rename)\s*\()", "file access is not allowed"),
        },
        ""});

    languages.push_back(language{
        "java", "Java 17", "openjdk:17-alpine", "Main.java", "javac -d /tmp /tmp/Main.java", "java -Xss64m -cp /tmp Main", {},
        {
            deny(R"(\bRuntime\s*\.\s*getRuntime\b)", "process control is not allowed"),
            deny(R"(\bProcessBuilder\b)", "process control is not allowed"),
            deny(R"(\bjava\s*\.\s*(io\s*\.\s*File|nio\s*\.\s*file|net)\b)", "file and network access is not allowed"),
            deny(R"(\bSystem\s*\.\s*(exit|getenv|setProperty)\b)", "system access is not allowed"),
            deny(R"(\bClass\s*\.\s*forName\b|\bjava\s*\.\s*lang\s*\.\s*reflect\b)", "reflection is not allowed"),
            deny(R"(\bnew\s+Thread\s*\()", "threads are not allowed"),
        },
        ""});

    languages.push_back(language{
        "go", "Go 1.21", "golang:1.21-alpine", "main.go", "cd /tmp && go build -o /tmp/main /tmp/main.go", "/tmp/main",
        {{"GOCACHE", "/tmp/.gocache"}, {"HOME", "/tmp"}},
        {
            deny(R"re("(os/exec|syscall|unsafe|plugin|net|net/[\w/]+)")re","importing system packages is not allowed"),
            deny(R"(\bos\s*\.\s*(Remove|RemoveAll|Exit|Open|OpenFile|Create|Setenv|Getenv|Environ|Chdir)\b)", "system access is not allowed"),
        },
        ""});

    languages.push_back(language{
        "ruby", "Ruby 3.2", "ruby:3.2-alpine", "main.rb", "", "ruby /tmp/main.rb", {},
        {
            deny(R"(`)", "shell commands are not allowed"),
            deny(R"(%x)", "shell commands are not allowed"),
            deny(R"(\b(system|exec|spawn|fork|syscall|eval|instance_eval|class_eval|exit|abort)\b)", "process control is not allowed"),
            deny(R"(\b(File|IO|Dir|Process|Kernel|ObjectSpace|Signal)\s*\.)", "system access is not allowed"),
            deny(R"(\brequire(_relative)?\s*\(?\s*['"](socket|open3|fileutils|net/[\w/]+|pty|etc)['"])", "requiring system libraries is not allowed"),
        },
        ""});

    return languages;
}

const vector<language> &supported_languages() {
    static const vector<language> languages = build_languages();
    return languages;
}

const language *find_language(const string &id) {
    for (auto &lang : supported_languages())
        if (lang.id == id)
            return &lang;
    return nullptr;
}

string build_command(const language &lang) {
    string script = fmt::format("printf '%s' \"$ARENA_CODE\" > /tmp/{}", lang.source_file);
    if (!lang.compile_command.empty())
        script += " && " + lang.compile_command;
    script += " && printf '%s' \"$ARENA_INPUT\" | " + lang.run_command;
    return script;
}

string build_harness(const language &lang, const string &entry_point) {
    return boost::replace_all_copy(lang.harness, "%ENTRY%", entry_point);
}

}  // namespace arena::sandbox
