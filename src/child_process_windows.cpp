#ifdef _WIN32
#include "child_process.hpp"
#include <initializer_list>
#include "logger.hpp"

namespace fs = std::filesystem;

namespace procutil {

namespace {

std::wstring widen(const std::string& s) {
    if (s.empty())
        return std::wstring();
    int len = MultiByteToWideChar(CP_UTF8, 0, s.c_str(), static_cast<int>(s.size()), nullptr, 0);
    std::wstring out(static_cast<size_t>(len), L'\0');
    MultiByteToWideChar(CP_UTF8, 0, s.c_str(), static_cast<int>(s.size()), &out[0], len);
    return out;
}

// Quote one argument following the CommandLineToArgvW rules.
std::wstring quote_arg(const std::wstring& arg) {
    if (!arg.empty() && arg.find_first_of(L" \t\n\v\"") == std::wstring::npos)
        return arg;
    std::wstring out = L"\"";
    size_t backslashes = 0;
    for (wchar_t c : arg) {
        if (c == L'\\') {
            ++backslashes;
        } else if (c == L'"') {
            out.append(backslashes * 2 + 1, L'\\');
            out.push_back(c);
            backslashes = 0;
        } else {
            out.append(backslashes, L'\\');
            out.push_back(c);
            backslashes = 0;
        }
    }
    out.append(backslashes * 2, L'\\');
    out.push_back(L'"');
    return out;
}

std::string last_error_text() {
    DWORD code = GetLastError();
    char* buf = nullptr;
    FormatMessageA(FORMAT_MESSAGE_ALLOCATE_BUFFER | FORMAT_MESSAGE_FROM_SYSTEM |
                       FORMAT_MESSAGE_IGNORE_INSERTS,
                   nullptr, code, 0, reinterpret_cast<LPSTR>(&buf), 0, nullptr);
    std::string text = buf ? std::string(buf) : "error " + std::to_string(code);
    if (buf)
        LocalFree(buf);
    while (!text.empty() && (text.back() == '\n' || text.back() == '\r'))
        text.pop_back();
    return text;
}

void fill_error(SpawnError* error, SpawnErrorKind kind, const std::string& message) {
    if (error) {
        error->kind = kind;
        error->message = message;
    }
}

bool make_inheritable_pipe(UniqueHandle& read_end, UniqueHandle& write_end) {
    SECURITY_ATTRIBUTES sa{sizeof(SECURITY_ATTRIBUTES), nullptr, TRUE};
    HANDLE r = nullptr;
    HANDLE w = nullptr;
    if (!CreatePipe(&r, &w, &sa, 0))
        return false;
    read_end.reset(r);
    write_end.reset(w);
    // Only the child's end is inherited.
    return SetHandleInformation(r, HANDLE_FLAG_INHERIT, 0) != 0;
}

// Attribute list naming the only handles a child may inherit. Without it
// CreateProcessW hands every inheritable handle to the child, including the
// pipe ends of agents spawned concurrently, whose readers then never see EOF.
class InheritList {
  public:
    explicit InheritList(std::vector<HANDLE> handles) : handles_(std::move(handles)) {
        SIZE_T size = 0;
        InitializeProcThreadAttributeList(nullptr, 1, 0, &size);
        storage_.resize(size);
        auto* list = reinterpret_cast<LPPROC_THREAD_ATTRIBUTE_LIST>(storage_.data());
        if (!InitializeProcThreadAttributeList(list, 1, 0, &size))
            return;
        list_ = list;
        if (!UpdateProcThreadAttribute(list_, 0, PROC_THREAD_ATTRIBUTE_HANDLE_LIST,
                                       handles_.data(), handles_.size() * sizeof(HANDLE),
                                       nullptr, nullptr)) {
            DeleteProcThreadAttributeList(list_);
            list_ = nullptr;
        }
    }
    ~InheritList() {
        if (list_)
            DeleteProcThreadAttributeList(list_);
    }
    InheritList(const InheritList&) = delete;
    InheritList& operator=(const InheritList&) = delete;

    LPPROC_THREAD_ATTRIBUTE_LIST get() const { return list_; }

  private:
    std::vector<HANDLE> handles_;
    std::vector<char> storage_;
    LPPROC_THREAD_ATTRIBUTE_LIST list_ = nullptr;
};

} // namespace

std::unique_ptr<ChildProcess> spawn_process(const fs::path& working_dir,
                                            const std::vector<std::string>& args,
                                            SpawnError* error) {
    if (args.empty()) {
        fill_error(error, SpawnErrorKind::FAILED, "No command given");
        return nullptr;
    }
    std::error_code ec;
    if (!fs::is_directory(working_dir, ec)) {
        fill_error(error, SpawnErrorKind::FAILED,
                   "Working directory does not exist: " + working_dir.string());
        return nullptr;
    }
    const std::string exe = find_executable(args[0]);
    if (exe.empty()) {
        fill_error(error, SpawnErrorKind::NOT_FOUND, args[0] + " not found in PATH");
        return nullptr;
    }

    UniqueHandle out_r, out_w, err_r, err_w;
    if (!make_inheritable_pipe(out_r, out_w) || !make_inheritable_pipe(err_r, err_w)) {
        fill_error(error, SpawnErrorKind::FAILED, "Failed to create pipe: " + last_error_text());
        return nullptr;
    }
    SECURITY_ATTRIBUTES sa{sizeof(SECURITY_ATTRIBUTES), nullptr, TRUE};
    UniqueHandle nul(CreateFileW(L"NUL", GENERIC_READ, FILE_SHARE_READ | FILE_SHARE_WRITE, &sa,
                                 OPEN_EXISTING, 0, nullptr));
    if (!nul) {
        fill_error(error, SpawnErrorKind::FAILED, "Failed to open NUL: " + last_error_text());
        return nullptr;
    }

    std::wstring cmdline = quote_arg(widen(exe));
    for (size_t i = 1; i < args.size(); ++i)
        cmdline += L" " + quote_arg(widen(args[i]));

    InheritList inherit({nul.get(), out_w.get(), err_w.get()});
    if (!inherit.get()) {
        fill_error(error, SpawnErrorKind::FAILED,
                   "Failed to prepare handle list: " + last_error_text());
        return nullptr;
    }
    STARTUPINFOEXW si{};
    si.StartupInfo.cb = sizeof(si);
    si.StartupInfo.dwFlags = STARTF_USESTDHANDLES;
    si.StartupInfo.hStdInput = nul.get();
    si.StartupInfo.hStdOutput = out_w.get();
    si.StartupInfo.hStdError = err_w.get();
    si.lpAttributeList = inherit.get();
    PROCESS_INFORMATION pi{};
    std::wstring wdir = working_dir.wstring();
    if (!CreateProcessW(nullptr, &cmdline[0], nullptr, nullptr, TRUE,
                        CREATE_NEW_PROCESS_GROUP | CREATE_NO_WINDOW | EXTENDED_STARTUPINFO_PRESENT,
                        nullptr, wdir.c_str(), &si.StartupInfo, &pi)) {
        DWORD code = GetLastError();
        if (code == ERROR_FILE_NOT_FOUND || code == ERROR_PATH_NOT_FOUND)
            fill_error(error, SpawnErrorKind::NOT_FOUND, args[0] + " not found in PATH");
        else
            fill_error(error, SpawnErrorKind::FAILED,
                       "Failed to start " + args[0] + ": " + last_error_text());
        return nullptr;
    }
    CloseHandle(pi.hThread);

    std::unique_ptr<ChildProcess> child(new ChildProcess());
    child->process_.reset(pi.hProcess);
    child->pid_ = pi.dwProcessId;
    child->out_.pipe = std::move(out_r);
    child->err_.pipe = std::move(err_r);
    return child;
}

ChildProcess::~ChildProcess() {
    std::lock_guard<std::mutex> lk(mtx_);
    if (reaped_ || !process_)
        return;
    TerminateProcess(process_.get(), 1);
    WaitForSingleObject(process_.get(), INFINITE);
}

long ChildProcess::read_some(StreamState& s, char* buf, size_t len) {
    if (!s.pipe || abandoned_)
        return 0;
    DWORD n = 0;
    if (!ReadFile(s.pipe.get(), buf, static_cast<DWORD>(len), &n, nullptr)) {
        DWORD code = GetLastError();
        return code == ERROR_BROKEN_PIPE || code == ERROR_OPERATION_ABORTED ? 0 : -1;
    }
    return static_cast<long>(n);
}

// A read that started before the flag was set is cancelled here; callers
// repeat the call until the readers are gone.
void ChildProcess::abandon_streams() {
    abandoned_ = true;
    for (StreamState* s : {&out_, &err_}) {
        if (s->pipe && !CancelIoEx(s->pipe.get(), nullptr) && GetLastError() != ERROR_NOT_FOUND)
            log_debug("CancelIoEx failed", {{"error", last_error_text()}});
    }
}

ExitOutcome ChildProcess::wait_for_exit() {
    ExitOutcome outcome;
    WaitForSingleObject(process_.get(), INFINITE);
    std::lock_guard<std::mutex> lk(mtx_);
    DWORD code = 0;
    if (GetExitCodeProcess(process_.get(), &code)) {
        outcome.exited = true;
        outcome.code = static_cast<int>(code);
    } else {
        log_warning("GetExitCodeProcess failed", {{"error", last_error_text()}});
    }
    reaped_ = true;
    return outcome;
}

// Windows has no process-group signals for arbitrary children; stopping
// falls back to terminating the direct child.
bool ChildProcess::request_graceful_stop() {
    std::lock_guard<std::mutex> lk(mtx_);
    if (reaped_ || !process_)
        return false;
    if (GenerateConsoleCtrlEvent(CTRL_BREAK_EVENT, pid_))
        return true;
    return TerminateProcess(process_.get(), 1) != 0;
}

bool ChildProcess::force_stop() {
    std::lock_guard<std::mutex> lk(mtx_);
    if (reaped_ || !process_)
        return false;
    if (!TerminateProcess(process_.get(), 1)) {
        log_warning("TerminateProcess failed", {{"error", last_error_text()}});
        return false;
    }
    return true;
}

} // namespace procutil
#endif // _WIN32
