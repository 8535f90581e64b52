//
// Created by gregorian-rayne on 1/16/26.
//

#include "depmap/resolve/stdlib_table.hpp"
#include "depmap/utils/string_utils.hpp"

#include <utility>

namespace depmap::resolve {

    namespace {

        const char* const PYTHON_STDLIB[] = {
            "__future__", "_thread", "abc", "aifc", "argparse", "array", "ast",
            "asynchat", "asyncio", "asyncore", "atexit", "audioop", "base64",
            "bdb", "binascii", "bisect", "builtins", "bz2", "calendar", "cgi",
            "cgitb", "chunk", "cmath", "cmd", "code", "codecs", "codeop",
            "collections", "colorsys", "compileall", "concurrent",
            "configparser", "contextlib", "contextvars", "copy", "copyreg",
            "cProfile", "crypt", "csv", "ctypes", "curses", "dataclasses",
            "datetime", "dbm", "decimal", "difflib", "dis", "distutils",
            "doctest", "email", "encodings", "ensurepip", "enum", "errno",
            "faulthandler", "fcntl", "filecmp", "fileinput", "fnmatch",
            "fractions", "ftplib", "functools", "gc", "getopt", "getpass",
            "gettext", "glob", "graphlib", "grp", "gzip", "hashlib", "heapq",
            "hmac", "html", "http", "idlelib", "imaplib", "imghdr", "imp",
            "importlib", "inspect", "io", "ipaddress", "itertools", "json",
            "keyword", "lib2to3", "linecache", "locale", "logging", "lzma",
            "mailbox", "mailcap", "marshal", "math", "mimetypes", "mmap",
            "modulefinder", "msvcrt", "multiprocessing", "netrc", "nis",
            "nntplib", "numbers", "operator", "optparse", "os", "ossaudiodev",
            "pathlib", "pdb", "pickle", "pickletools", "pipes", "pkgutil",
            "platform", "plistlib", "poplib", "posix", "posixpath", "pprint",
            "profile", "pstats", "pty", "pwd", "py_compile", "pyclbr",
            "pydoc", "queue", "quopri", "random", "re", "readline", "reprlib",
            "resource", "rlcompleter", "runpy", "sched", "secrets", "select",
            "selectors", "shelve", "shlex", "shutil", "signal", "site",
            "smtpd", "smtplib", "sndhdr", "socket", "socketserver", "spwd",
            "sqlite3", "sre_compile", "sre_constants", "sre_parse", "ssl",
            "stat", "statistics", "string", "stringprep", "struct",
            "subprocess", "sunau", "symtable", "sys", "sysconfig", "syslog",
            "tabnanny", "tarfile", "telnetlib", "tempfile", "termios",
            "textwrap", "threading", "time", "timeit", "tkinter", "token",
            "tokenize", "tomllib", "trace", "traceback", "tracemalloc", "tty",
            "turtle", "turtledemo", "types", "typing",
            "unicodedata", "unittest", "urllib", "uu", "uuid", "venv",
            "warnings", "wave", "weakref", "webbrowser", "winreg", "winsound",
            "wsgiref", "xdrlib", "xml", "xmlrpc", "zipapp", "zipfile",
            "zipimport", "zlib", "zoneinfo", "ntpath", "nturl2path", "opcode",
            "genericpath", "_abc", "_collections_abc", "_io", "_weakref",
        };

    }  // namespace

    StdlibTable::StdlibTable(std::unordered_set<std::string> names)
        : names_(std::move(names))
    {}

    StdlibTable StdlibTable::python() {
        std::unordered_set<std::string> names;
        for (const char* name : PYTHON_STDLIB) {
            names.emplace(name);
        }
        return StdlibTable(std::move(names));
    }

    void StdlibTable::add(std::string name) {
        if (!name.empty()) {
            names_.insert(std::move(name));
        }
    }

    void StdlibTable::add_all(const std::vector<std::string>& names) {
        for (const auto& name : names) {
            add(name);
        }
    }

    bool StdlibTable::contains(const std::string_view dotted) const {
        return names_.contains(std::string(string_utils::first_component(dotted)));
    }

}  // namespace depmap::resolve
