#include "child_process.hpp"
#include "thread_utils.hpp"

namespace procutil {

bool ChildProcess::read_line(Stream stream, std::string& line) {
    StreamState& s = state(stream);
    char buf[4096];
    while (true) {
        auto pos = s.buffer.find('\n');
        if (pos != std::string::npos) {
            line.assign(s.buffer, 0, pos);
            s.buffer.erase(0, pos + 1);
            if (!line.empty() && line.back() == '\r')
                line.pop_back();
            return true;
        }
        if (s.eof) {
            if (s.buffer.empty())
                return false;
            line = std::move(s.buffer);
            s.buffer.clear();
            return true;
        }
        long n = read_some(s, buf, sizeof(buf));
        if (n <= 0) {
            s.eof = true;
            continue;
        }
        s.buffer.append(buf, static_cast<size_t>(n));
    }
}

std::string ChildProcess::drain(StreamState& s) {
    std::string rest = std::move(s.buffer);
    s.buffer.clear();
    return rest;
}

ExitOutcome ChildProcess::wait() {
    std::lock_guard<std::mutex> lk(wait_mtx_);
    if (!outcome_)
        outcome_ = wait_for_exit();
    ExitOutcome result = *outcome_;
    result.stdout_data = drain(out_);
    result.stderr_data = drain(err_);
    return result;
}

ExitOutcome ChildProcess::wait_with_output() {
    std::string out;
    std::string err;
    // Both pipes are drained concurrently so a chatty stderr cannot stall
    // the child while stdout is being read.
    ThreadGuard err_reader(std::thread([this, &err] {
        std::string line;
        while (read_line(Stream::STDERR, line))
            err += line + "\n";
    }));
    std::string line;
    while (read_line(Stream::STDOUT, line))
        out += line + "\n";
    err_reader.join();
    ExitOutcome result = wait();
    result.stdout_data = out + result.stdout_data;
    result.stderr_data = err + result.stderr_data;
    return result;
}

bool ChildProcess::reaped() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return reaped_;
}

long ChildProcess::pid() const { return static_cast<long>(pid_); }

} // namespace procutil
