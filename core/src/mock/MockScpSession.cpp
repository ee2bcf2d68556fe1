#include "scplite/MockScpSession.hpp"
#include "scplite/ScpProtocol.hpp"

#include <algorithm>
#include <chrono>
#include <cstring>
#include <thread>

namespace scplite {

namespace {

std::string joinRemotePath(const std::string& dir, const std::string& name) {
    if (dir.empty())
        return name;
    if (dir.back() == '/')
        return dir + name;
    return dir + "/" + name;
}

bool hasFlag(const std::vector<std::string>& argv, const char* flag) {
    return std::find(argv.begin() + 1, argv.end(), std::string(flag)) != argv.end();
}

} // namespace

struct MockScpSession::State {
    struct Exec {
        MockExecRecord rec;
        std::string stdout_data;
        bool sink = false;
        std::string sink_dir;
        std::size_t read_chunk = 0;
        bool hold_open = false;
        std::optional<std::size_t> fail_at;
        std::string fail_msg;
    };

    mutable std::mutex mtx;
    bool connected = false;
    SessionOptions lastOpt{};
    std::map<std::string, MockFile> fs;
    std::optional<std::string> scripted;
    std::size_t readChunk = 0;
    bool holdOpen = false;
    std::optional<std::size_t> failAt;
    std::string failMsg;
    std::optional<std::string> execFailure;
    std::vector<Exec> execs;

    // Lo que "scp -t" habría escrito en disco con lo recibido por stdin.
    void storeUpload(const Exec& e) {
        const std::string& in = e.rec.stdin_data;
        const std::size_t nl = in.find('\n');
        if (nl == std::string::npos)
            return;
        CopyDirective d;
        std::string perr;
        if (!parseCopyDirective(in.substr(0, nl + 1), d, perr))
            return;
        const std::size_t size = static_cast<std::size_t>(d.size);
        if (in.size() < nl + 1 + size)
            return;
        fs[joinRemotePath(e.sink_dir, d.name)] = MockFile{d.mode, in.substr(nl + 1, size)};
    }
};

class MockScpSession::Channel : public RemoteChannel {
public:
    Channel(std::shared_ptr<State> st, std::size_t idx) : st_(std::move(st)), idx_(idx) {}
    ~Channel() override { close(); }

    long read(char* buf, std::size_t len, std::string& err,
              const CancelCB& shouldCancel) override {
        for (;;) {
            {
                std::lock_guard<std::mutex> lk(st_->mtx);
                State::Exec& e = st_->execs[idx_];
                if (e.rec.closed) {
                    err = "canal cerrado";
                    return -1;
                }
                if (e.fail_at && e.rec.stdout_read >= *e.fail_at) {
                    err = e.fail_msg;
                    return -1;
                }
                if (e.rec.stdout_read < e.stdout_data.size()) {
                    std::size_t n = std::min(len, e.stdout_data.size() - e.rec.stdout_read);
                    if (e.read_chunk)
                        n = std::min(n, e.read_chunk);
                    if (e.fail_at)
                        n = std::min(n, *e.fail_at - e.rec.stdout_read);
                    std::memcpy(buf, e.stdout_data.data() + e.rec.stdout_read, n);
                    e.rec.stdout_read += n;
                    return static_cast<long>(n);
                }
                if (!e.hold_open)
                    return 0;
            }
            if (shouldCancel && shouldCancel()) {
                err = "cancelado";
                return -1;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(2));
        }
    }

    bool write(const char* data, std::size_t len, std::string& err) override {
        std::lock_guard<std::mutex> lk(st_->mtx);
        State::Exec& e = st_->execs[idx_];
        if (e.rec.closed) {
            err = "canal cerrado";
            return false;
        }
        e.rec.stdin_data.append(data, len);
        return true;
    }

    void close() override {
        std::lock_guard<std::mutex> lk(st_->mtx);
        State::Exec& e = st_->execs[idx_];
        if (e.rec.closed)
            return;
        e.rec.closed = true;
        if (e.sink)
            st_->storeUpload(e);
    }

private:
    std::shared_ptr<State> st_;
    std::size_t idx_;
};

MockScpSession::MockScpSession() : state_(std::make_shared<State>()) {}

MockScpSession::~MockScpSession() = default;

bool MockScpSession::connect(const SessionOptions& opt, std::string& err) {
    if (opt.host.empty() || opt.username.empty()) {
        err = "Host y usuario son obligatorios";
        return false;
    }
    std::lock_guard<std::mutex> lk(state_->mtx);
    state_->connected = true;
    state_->lastOpt = opt;
    return true;
}

void MockScpSession::disconnect() {
    std::lock_guard<std::mutex> lk(state_->mtx);
    state_->connected = false;
}

bool MockScpSession::isConnected() const {
    std::lock_guard<std::mutex> lk(state_->mtx);
    return state_->connected;
}

std::unique_ptr<RemoteChannel> MockScpSession::exec(const std::vector<std::string>& argv,
                                                    std::string& err) {
    std::lock_guard<std::mutex> lk(state_->mtx);
    if (!state_->connected) {
        err = "No conectado";
        return nullptr;
    }
    if (state_->execFailure) {
        err = *state_->execFailure;
        state_->execFailure.reset();
        return nullptr;
    }
    if (argv.size() < 2 || argv.front() != "scp") {
        err = "Mock solo ejecuta scp";
        return nullptr;
    }

    State::Exec e;
    e.rec.argv = argv;
    e.read_chunk = state_->readChunk;
    e.hold_open = state_->holdOpen;
    e.fail_at = state_->failAt;
    e.fail_msg = state_->failMsg;

    const std::string& target = argv.back();
    if (hasFlag(argv, "-t")) {
        e.sink = true;
        e.sink_dir = target;
        e.stdout_data = std::string(2, '\0');
    } else if (hasFlag(argv, "-f") || hasFlag(argv, "-qf")) {
        auto it = state_->fs.find(target);
        if (it == state_->fs.end()) {
            e.stdout_data = formatDiagnostic(
                DiagnosticLevel::Error, "scp: " + target + ": No such file or directory");
        } else {
            CopyDirective d;
            d.mode = it->second.mode;
            d.size = static_cast<std::int64_t>(it->second.content.size());
            const std::size_t slash = target.find_last_of('/');
            d.name = slash == std::string::npos ? target : target.substr(slash + 1);
            e.stdout_data = formatCopyDirective(d) + it->second.content + std::string(1, '\0');
        }
    } else {
        err = "Mock no soporta ese modo de scp";
        return nullptr;
    }

    if (state_->scripted) {
        e.stdout_data = *state_->scripted;
        state_->scripted.reset();
    }

    state_->execs.push_back(std::move(e));
    return std::make_unique<Channel>(state_, state_->execs.size() - 1);
}

void MockScpSession::addFile(const std::string& path, std::uint32_t mode, std::string content) {
    std::lock_guard<std::mutex> lk(state_->mtx);
    state_->fs[path] = MockFile{mode, std::move(content)};
}

std::optional<MockFile> MockScpSession::findFile(const std::string& path) const {
    std::lock_guard<std::mutex> lk(state_->mtx);
    auto it = state_->fs.find(path);
    if (it == state_->fs.end())
        return std::nullopt;
    return it->second;
}

void MockScpSession::queueStdout(std::string bytes) {
    std::lock_guard<std::mutex> lk(state_->mtx);
    state_->scripted = std::move(bytes);
}

void MockScpSession::setReadChunk(std::size_t n) {
    std::lock_guard<std::mutex> lk(state_->mtx);
    state_->readChunk = n;
}

void MockScpSession::setHoldOpen(bool hold) {
    std::lock_guard<std::mutex> lk(state_->mtx);
    state_->holdOpen = hold;
}

void MockScpSession::failReadsAfter(std::size_t offset, std::string msg) {
    std::lock_guard<std::mutex> lk(state_->mtx);
    state_->failAt = offset;
    state_->failMsg = std::move(msg);
}

void MockScpSession::failNextExec(std::string msg) {
    std::lock_guard<std::mutex> lk(state_->mtx);
    state_->execFailure = std::move(msg);
}

std::vector<MockExecRecord> MockScpSession::execs() const {
    std::lock_guard<std::mutex> lk(state_->mtx);
    std::vector<MockExecRecord> out;
    out.reserve(state_->execs.size());
    for (const auto& e : state_->execs)
        out.push_back(e.rec);
    return out;
}

} // namespace scplite
