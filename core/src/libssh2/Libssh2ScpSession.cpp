// Backend libssh2: socket TCP, sesión SSH autenticada y canales "exec" para
// correr scp en el remoto. Incluye validación de known_hosts.
#include "scplite/Libssh2ScpSession.hpp"
#include "scplite/Logging.hpp"
#include "scplite/RuntimeLogging.hpp"
#include <libssh2.h>

#include <QString>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <memory>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

// POSIX sockets
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

namespace scplite {

namespace {

// Cada espera sobre el socket dura como mucho esto, para poder observar
// cancelaciones entre reintentos.
constexpr int kWaitSliceMs = 50;
// Tope para cerrar un canal cuyo remoto no responde.
constexpr auto kCloseDeadline = std::chrono::seconds(10);

std::once_flag g_libssh2_init;

// Contexto para kbd-interactive: contraseña de SessionOptions o callback de UI.
struct KbdIntCtx {
    const char* user;
    const char* pass;
    const KbdIntPromptsCB* cb;
};

void setResponse(LIBSSH2_USERAUTH_KBDINT_RESPONSE& r, const char* text, std::size_t len) {
    r.text = nullptr;
    r.length = 0;
    if (!text || len == 0)
        return;
    char* buf = static_cast<char*>(std::malloc(len + 1));
    if (!buf)
        return;
    std::memcpy(buf, text, len);
    buf[len] = '\0';
    r.text = buf;
    r.length = static_cast<unsigned int>(len);
}

bool promptAsksForUser(const char* prompt) {
    std::string p(prompt ? prompt : "");
    for (char& c : p)
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return p.find("user") != std::string::npos || p.find("name") != std::string::npos;
}

void kbint_callback(const char* name, int name_len,
                    const char* instruction, int instruction_len,
                    int num_prompts,
                    const LIBSSH2_USERAUTH_KBDINT_PROMPT* prompts,
                    LIBSSH2_USERAUTH_KBDINT_RESPONSE* responses,
                    void** abstract) {
    if (!abstract || !*abstract || num_prompts <= 0)
        return;
    const KbdIntCtx* ctx = static_cast<const KbdIntCtx*>(*abstract);

    std::vector<std::string> texts;
    texts.reserve(static_cast<std::size_t>(num_prompts));
    for (int i = 0; i < num_prompts; ++i) {
        const char* pt = (prompts && prompts[i].text)
                             ? reinterpret_cast<const char*>(prompts[i].text)
                             : "";
        texts.emplace_back(pt);
    }

    if (ctx->cb && *(ctx->cb)) {
        std::vector<std::string> answers;
        const std::string nm = (name && name_len > 0) ? std::string(name, static_cast<std::size_t>(name_len)) : std::string();
        const std::string ins = (instruction && instruction_len > 0) ? std::string(instruction, static_cast<std::size_t>(instruction_len)) : std::string();
        if ((*(ctx->cb))(nm, ins, texts, answers) &&
            answers.size() >= static_cast<std::size_t>(num_prompts)) {
            for (int i = 0; i < num_prompts; ++i) {
                const std::string& a = answers[static_cast<std::size_t>(i)];
                setResponse(responses[i], a.data(), a.size());
            }
            return;
        }
        // si el callback no pudo responder, seguimos con usuario/contraseña
    }

    for (int i = 0; i < num_prompts; ++i) {
        const char* ans = promptAsksForUser(texts[static_cast<std::size_t>(i)].c_str()) ? ctx->user : ctx->pass;
        setResponse(responses[i], ans, ans ? std::strlen(ans) : 0);
    }
}

int knownHostKeyAlg(int keytype) {
    switch (keytype) {
    case LIBSSH2_HOSTKEY_TYPE_RSA:
        return LIBSSH2_KNOWNHOST_KEY_SSHRSA;
    case LIBSSH2_HOSTKEY_TYPE_DSS:
        return LIBSSH2_KNOWNHOST_KEY_SSHDSS;
#ifdef LIBSSH2_KNOWNHOST_KEY_ECDSA_256
    case LIBSSH2_HOSTKEY_TYPE_ECDSA_256:
        return LIBSSH2_KNOWNHOST_KEY_ECDSA_256;
    case LIBSSH2_HOSTKEY_TYPE_ECDSA_384:
        return LIBSSH2_KNOWNHOST_KEY_ECDSA_384;
    case LIBSSH2_HOSTKEY_TYPE_ECDSA_521:
        return LIBSSH2_KNOWNHOST_KEY_ECDSA_521;
#endif
#ifdef LIBSSH2_KNOWNHOST_KEY_ED25519
    case LIBSSH2_HOSTKEY_TYPE_ED25519:
        return LIBSSH2_KNOWNHOST_KEY_ED25519;
#endif
    default:
        return 0;
    }
}

const char* keyTypeName(int keytype) {
    switch (keytype) {
    case LIBSSH2_HOSTKEY_TYPE_RSA: return "RSA";
    case LIBSSH2_HOSTKEY_TYPE_DSS: return "DSA";
    case LIBSSH2_HOSTKEY_TYPE_ECDSA_256: return "ECDSA-256";
    case LIBSSH2_HOSTKEY_TYPE_ECDSA_384: return "ECDSA-384";
    case LIBSSH2_HOSTKEY_TYPE_ECDSA_521: return "ECDSA-521";
    case LIBSSH2_HOSTKEY_TYPE_ED25519: return "ED25519";
    default: return "DESCONOCIDO";
    }
}

// Huella de la host key en hex separado por ':'.
std::string hostKeyFingerprint(LIBSSH2_SESSION* s) {
#ifdef LIBSSH2_HOSTKEY_HASH_SHA256
    const int hashType = LIBSSH2_HOSTKEY_HASH_SHA256;
    const int hashLen = 32;
    const char* prefix = "SHA256:";
#else
    const int hashType = LIBSSH2_HOSTKEY_HASH_SHA1;
    const int hashLen = 20;
    const char* prefix = "SHA1:";
#endif
    const unsigned char* h =
        reinterpret_cast<const unsigned char*>(libssh2_hostkey_hash(s, hashType));
    if (!h)
        return {};
    std::ostringstream oss;
    oss << prefix;
    for (int i = 0; i < hashLen; ++i) {
        if (i)
            oss << ':';
        char b[4];
        std::snprintf(b, sizeof(b), "%02X", static_cast<unsigned>(h[i]));
        oss << b;
    }
    return oss.str();
}

QString q(const std::string& s) { return QString::fromStdString(s); }

} // namespace

// Canal "exec" de libssh2. No debe sobrevivir a la sesión que lo creó.
class Libssh2Channel final : public RemoteChannel {
public:
    Libssh2Channel(Libssh2ScpSession& owner, LIBSSH2_CHANNEL* ch)
        : owner_(owner), ch_(ch) {}
    ~Libssh2Channel() override { close(); }

    long read(char* buf, std::size_t len, std::string& err,
              const CancelCB& shouldCancel) override;
    bool write(const char* data, std::size_t len, std::string& err) override;
    void close() override;

private:
    Libssh2ScpSession& owner_;
    LIBSSH2_CHANNEL* ch_;
};

long Libssh2Channel::read(char* buf, std::size_t len, std::string& err,
                          const CancelCB& shouldCancel) {
    if (!ch_) {
        err = "Canal cerrado";
        return -1;
    }
    for (;;) {
        if (shouldCancel && shouldCancel()) {
            err = "Cancelado";
            return -1;
        }
        ssize_t n = 0;
        bool eof = false;
        {
            std::lock_guard<std::mutex> lk(owner_.mtx_);
            n = libssh2_channel_read(ch_, buf, len);
            eof = libssh2_channel_eof(ch_) != 0;
        }
        if (n > 0)
            return static_cast<long>(n);
        if (n == 0 || n == LIBSSH2_ERROR_EAGAIN) {
            if (eof)
                return 0;
            owner_.waitSocket(kWaitSliceMs);
            continue;
        }
        err = "Lectura remota falló: " + owner_.lastError();
        return -1;
    }
}

bool Libssh2Channel::write(const char* data, std::size_t len, std::string& err) {
    if (!ch_) {
        err = "Canal cerrado";
        return false;
    }
    std::size_t off = 0;
    while (off < len) {
        ssize_t w = 0;
        {
            std::lock_guard<std::mutex> lk(owner_.mtx_);
            w = libssh2_channel_write(ch_, data + off, len - off);
        }
        if (w > 0) {
            off += static_cast<std::size_t>(w);
        } else if (w == 0 || w == LIBSSH2_ERROR_EAGAIN) {
            owner_.waitSocket(kWaitSliceMs);
        } else {
            err = "Escritura remota falló: " + owner_.lastError();
            return false;
        }
    }
    return true;
}

void Libssh2Channel::close() {
    if (!ch_)
        return;
    LIBSSH2_CHANNEL* ch = ch_;
    ch_ = nullptr;

    const auto deadline = std::chrono::steady_clock::now() + kCloseDeadline;
    auto retry = [&](auto fn) {
        for (;;) {
            int rc = 0;
            {
                std::lock_guard<std::mutex> lk(owner_.mtx_);
                rc = fn();
            }
            if (rc != LIBSSH2_ERROR_EAGAIN || std::chrono::steady_clock::now() > deadline)
                return rc;
            owner_.waitSocket(kWaitSliceMs);
        }
    };

    retry([&] { return libssh2_channel_send_eof(ch); });
    if (retry([&] { return libssh2_channel_close(ch); }) == 0) {
        int status = 0;
        {
            std::lock_guard<std::mutex> lk(owner_.mtx_);
            status = libssh2_channel_get_exit_status(ch);
        }
        qCDebug(scpSsh) << "comando remoto terminó con estado" << status;
    }
    if (retry([&] { return libssh2_channel_free(ch); }) == LIBSSH2_ERROR_EAGAIN)
        qCWarning(scpSsh) << "canal no liberado tras" << kCloseDeadline.count()
                          << "s; queda pendiente hasta cerrar la sesión";
}

Libssh2ScpSession::Libssh2ScpSession() {
    std::call_once(g_libssh2_init, [] {
        if (libssh2_init(0) != 0)
            qCWarning(scpSsh) << "libssh2_init falló";
    });
}

Libssh2ScpSession::~Libssh2ScpSession() {
    disconnect();
}

bool Libssh2ScpSession::tcpConnect(const std::string& host, uint16_t port, std::string& err) {
    struct addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    const std::string portStr = std::to_string(static_cast<unsigned>(port));
    struct addrinfo* res = nullptr;
    const int gai = getaddrinfo(host.c_str(), portStr.c_str(), &hints, &res);
    if (gai != 0) {
        err = std::string("getaddrinfo: ") + gai_strerror(gai);
        return false;
    }

    for (auto rp = res; rp != nullptr; rp = rp->ai_next) {
        int s = ::socket(rp->ai_family, rp->ai_socktype, rp->ai_protocol);
        if (s == -1)
            continue;
        // Activar keepalive de TCP
        int opt = 1;
        ::setsockopt(s, SOL_SOCKET, SO_KEEPALIVE, &opt, sizeof(opt));
#ifdef __APPLE__
        int idle = 60;
        ::setsockopt(s, IPPROTO_TCP, TCP_KEEPALIVE, &idle, sizeof(idle));
#elif defined(__linux__)
        int idle = 60, intvl = 10, cnt = 3;
        ::setsockopt(s, IPPROTO_TCP, TCP_KEEPIDLE, &idle, sizeof(idle));
        ::setsockopt(s, IPPROTO_TCP, TCP_KEEPINTVL, &intvl, sizeof(intvl));
        ::setsockopt(s, IPPROTO_TCP, TCP_KEEPCNT, &cnt, sizeof(cnt));
#endif
        if (::connect(s, rp->ai_addr, rp->ai_addrlen) == 0) {
            sock_ = s;
            freeaddrinfo(res);
            return true;
        }
        ::close(s);
    }
    freeaddrinfo(res);
    err = "No se pudo conectar al host/puerto.";
    return false;
}

bool Libssh2ScpSession::verifyHostKey(const SessionOptions& opt, std::string& err) {
    if (opt.known_hosts_policy == KnownHostsPolicy::Off) {
        qCWarning(scpSsh) << "verificación de host key desactivada para" << q(opt.host);
        return true;
    }

    std::size_t keylen = 0;
    int keytype = 0;
    const char* hostkey = libssh2_session_hostkey(session_, &keylen, &keytype);
    if (!hostkey || keylen == 0) {
        err = "No se pudo obtener host key";
        return false;
    }

    std::unique_ptr<LIBSSH2_KNOWNHOSTS, void (*)(LIBSSH2_KNOWNHOSTS*)> nh(
        libssh2_knownhost_init(session_), &libssh2_knownhost_free);
    if (!nh) {
        err = "No se pudo inicializar known_hosts";
        return false;
    }

    std::string khPath;
    if (opt.known_hosts_path.has_value()) {
        khPath = *opt.known_hosts_path;
    } else if (const char* home = std::getenv("HOME")) {
        khPath = std::string(home) + "/.ssh/known_hosts";
    }
    const bool khLoaded = !khPath.empty() &&
        libssh2_knownhost_readfile(nh.get(), khPath.c_str(), LIBSSH2_KNOWNHOST_FILE_OPENSSH) >= 0;
    if (!khLoaded && opt.known_hosts_policy == KnownHostsPolicy::Strict) {
        err = "known_hosts no disponible o ilegible (política estricta)";
        return false;
    }

    const int alg = knownHostKeyAlg(keytype);
    struct libssh2_knownhost* found = nullptr;
    int check = libssh2_knownhost_checkp(nh.get(), opt.host.c_str(), opt.port, hostkey, keylen,
                                         LIBSSH2_KNOWNHOST_TYPE_PLAIN | LIBSSH2_KNOWNHOST_KEYENC_RAW | alg,
                                         &found);
    if (check != LIBSSH2_KNOWNHOST_CHECK_MATCH) {
        check = libssh2_knownhost_checkp(nh.get(), opt.host.c_str(), opt.port, hostkey, keylen,
                                         LIBSSH2_KNOWNHOST_TYPE_SHA1 | LIBSSH2_KNOWNHOST_KEYENC_RAW | alg,
                                         &found);
    }
    if (check == LIBSSH2_KNOWNHOST_CHECK_MATCH)
        return true;
    if (check == LIBSSH2_KNOWNHOST_CHECK_MISMATCH) {
        err = "Host key no coincide con known_hosts";
        return false;
    }
    if (opt.known_hosts_policy != KnownHostsPolicy::AcceptNew) {
        err = "Host desconocido en known_hosts";
        return false;
    }

    // TOFU: pedir confirmación antes de guardar
    const std::string fp = hostKeyFingerprint(session_);
    const bool confirmed = opt.hostkey_confirm_cb &&
                           opt.hostkey_confirm_cb(opt.host, opt.port, keyTypeName(keytype), fp);
    if (!confirmed) {
        err = "Host desconocido: huella no confirmada por el usuario";
        return false;
    }
    if (khPath.empty()) {
        err = "Ruta known_hosts no definida";
        return false;
    }
    const int addrc = libssh2_knownhost_addc(nh.get(), opt.host.c_str(), nullptr, hostkey, keylen,
                                             nullptr, 0,
                                             LIBSSH2_KNOWNHOST_TYPE_PLAIN | LIBSSH2_KNOWNHOST_KEYENC_RAW | alg,
                                             nullptr);
    if (addrc != 0 ||
        libssh2_knownhost_writefile(nh.get(), khPath.c_str(), LIBSSH2_KNOWNHOST_FILE_OPENSSH) != 0) {
        err = "No se pudo agregar/escribir host en known_hosts";
        return false;
    }
    qCInfo(scpSsh) << "host key guardada en known_hosts" << keyTypeName(keytype) << q(fp);
    return true;
}

bool Libssh2ScpSession::authWithAgent(const std::string& user) {
    LIBSSH2_AGENT* agent = libssh2_agent_init(session_);
    if (!agent)
        return false;
    bool authed = false;
    if (libssh2_agent_connect(agent) == 0 && libssh2_agent_list_identities(agent) == 0) {
        struct libssh2_agent_publickey* identity = nullptr;
        struct libssh2_agent_publickey* prev = nullptr;
        const int kMaxAgentTries = 3; // limite conservador
        for (int tries = 0; tries < kMaxAgentTries &&
                            libssh2_agent_get_identity(agent, &identity, prev) == 0;
             ++tries) {
            prev = identity;
            if (libssh2_agent_userauth(agent, user.c_str(), identity) == 0) {
                authed = true;
                break;
            }
        }
    }
    libssh2_agent_disconnect(agent);
    libssh2_agent_free(agent);
    return authed;
}

// Orden: clave privada explícita; si no, password (sin consultar métodos antes,
// para no gastar intentos), keyboard-interactive y por último ssh-agent.
bool Libssh2ScpSession::authenticate(const SessionOptions& opt, std::string& err) {
    const std::string& user = opt.username;

    if (opt.private_key_path.has_value()) {
        const char* passphrase = opt.private_key_passphrase ? opt.private_key_passphrase->c_str() : nullptr;
        if (libssh2_userauth_publickey_fromfile(session_, user.c_str(), nullptr,
                                                opt.private_key_path->c_str(), passphrase) != 0) {
            err = "Auth por clave falló: " + lastError();
            return false;
        }
        return true;
    }

    if (opt.password.has_value()) {
        const int rc = libssh2_userauth_password(session_, user.c_str(), opt.password->c_str());
        if (rc == 0)
            return true;
        if (rc == LIBSSH2_ERROR_SOCKET_DISCONNECT || rc == LIBSSH2_ERROR_SOCKET_SEND ||
            rc == LIBSSH2_ERROR_SOCKET_RECV) {
            err = "El servidor cerró la conexión tras el intento de password";
            return false;
        }
    }

    const char* listed = libssh2_userauth_list(session_, user.c_str(), static_cast<unsigned>(user.size()));
    if (!listed && libssh2_userauth_authenticated(session_))
        return true; // el servidor aceptó "none"
    const std::string methods = listed ? listed : "";
    auto offers = [&](const char* m) { return methods.find(m) != std::string::npos; };

    if (opt.password.has_value() && offers("keyboard-interactive")) {
        KbdIntCtx ctx{user.c_str(), opt.password->c_str(), &opt.keyboard_interactive_cb};
        void** abs = libssh2_session_abstract(session_);
        if (abs)
            *abs = &ctx;
        const int rc = libssh2_userauth_keyboard_interactive(session_, user.c_str(), kbint_callback);
        if (abs)
            *abs = nullptr;
        if (rc == 0)
            return true;
    }

    if (offers("publickey") && authWithAgent(user))
        return true;

    err = "Autenticación falló" +
          (methods.empty() ? std::string() : " (métodos: " + methods + ")");
    const std::string last = lastError();
    if (!last.empty())
        err += ": " + last;
    return false;
}

bool Libssh2ScpSession::connect(const SessionOptions& opt, std::string& err) {
    if (connected_) {
        err = "Ya conectado";
        return false;
    }
    if (!tcpConnect(opt.host, opt.port, err))
        return false;

    session_ = libssh2_session_init();
    if (!session_) {
        err = "libssh2_session_init falló";
        disconnect();
        return false;
    }
    // Handshake y autenticación en modo bloqueante
    libssh2_session_set_blocking(session_, 1);
#ifdef LIBSSH2_SESSION_TIMEOUT
    libssh2_session_set_timeout(session_, 20000); // 20s
#endif
    if (libssh2_session_handshake(session_, sock_) != 0) {
        err = "SSH handshake falló: " + lastError();
        disconnect();
        return false;
    }
    if (!verifyHostKey(opt, err) || !authenticate(opt, err)) {
        qCWarning(scpSsh) << "conexión rechazada" << q(opt.host) << q(err);
        disconnect();
        return false;
    }

    // Los canales reintentan sobre EAGAIN (ver waitSocket)
    libssh2_session_set_blocking(session_, 0);
    connected_ = true;
    qCInfo(scpSsh) << "conectado a" << q(opt.host) << "puerto" << opt.port
                   << "usuario" << q(sensitiveLoggingEnabled() ? opt.username : std::string("<oculto>"));
    return true;
}

void Libssh2ScpSession::disconnect() {
    if (session_) {
        libssh2_session_set_blocking(session_, 1);
        libssh2_session_disconnect(session_, "bye");
        libssh2_session_free(session_);
        session_ = nullptr;
    }
    if (sock_ != -1) {
        ::close(sock_);
        sock_ = -1;
    }
    connected_ = false;
}

std::unique_ptr<RemoteChannel> Libssh2ScpSession::exec(const std::vector<std::string>& argv,
                                                       std::string& err) {
    if (!connected_ || !session_) {
        err = "No conectado";
        return nullptr;
    }
    const std::string cmd = shellJoin(argv);

    LIBSSH2_CHANNEL* ch = nullptr;
    for (;;) {
        int errc = 0;
        {
            std::lock_guard<std::mutex> lk(mtx_);
            ch = libssh2_channel_open_session(session_);
            if (!ch)
                errc = libssh2_session_last_errno(session_);
        }
        if (ch)
            break;
        if (errc != LIBSSH2_ERROR_EAGAIN) {
            err = "No se pudo abrir canal SSH: " + lastError();
            return nullptr;
        }
        waitSocket(kWaitSliceMs);
    }

    // stderr del scp remoto no se usa; descartarlo evita llenar la ventana.
    auto channel = std::make_unique<Libssh2Channel>(*this, ch);
    int rc = 0;
    for (;;) {
        {
            std::lock_guard<std::mutex> lk(mtx_);
            rc = libssh2_channel_handle_extended_data2(ch, LIBSSH2_CHANNEL_EXTENDED_DATA_IGNORE);
        }
        if (rc != LIBSSH2_ERROR_EAGAIN)
            break;
        waitSocket(kWaitSliceMs);
    }
    for (;;) {
        {
            std::lock_guard<std::mutex> lk(mtx_);
            rc = libssh2_channel_exec(ch, cmd.c_str());
        }
        if (rc != LIBSSH2_ERROR_EAGAIN)
            break;
        waitSocket(kWaitSliceMs);
    }
    if (rc != 0) {
        err = "exec remoto falló: " + lastError();
        return nullptr; // el destructor del canal lo libera
    }
    qCDebug(scpSsh) << "exec" << q(sensitiveLoggingEnabled() ? cmd : argv.front());
    return channel;
}

std::string Libssh2ScpSession::lastError() {
    if (!session_)
        return {};
    std::lock_guard<std::mutex> lk(mtx_);
    char* msg = nullptr;
    int len = 0;
    (void)libssh2_session_last_error(session_, &msg, &len, 0);
    return (msg && len > 0) ? std::string(msg, static_cast<std::size_t>(len)) : std::string();
}

void Libssh2ScpSession::waitSocket(int timeoutMs) {
    if (sock_ == -1)
        return;
    int dir = 0;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        if (session_)
            dir = libssh2_session_block_directions(session_);
    }
    struct pollfd pfd{};
    pfd.fd = sock_;
    if (dir & LIBSSH2_SESSION_BLOCK_INBOUND)
        pfd.events |= POLLIN;
    if (dir & LIBSSH2_SESSION_BLOCK_OUTBOUND)
        pfd.events |= POLLOUT;
    if (pfd.events == 0)
        pfd.events = POLLIN;
    (void)::poll(&pfd, 1, timeoutMs);
}

} // namespace scplite
