#pragma once
#include "RemoteSession.hpp"
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

// Forward a los tipos INTERNOS (con guion bajo)
struct _LIBSSH2_SESSION;

namespace scplite {

class Libssh2Channel;

// Sesión SSH sobre libssh2 que ejecuta comandos remotos (scp -f / scp -t).
// Tras autenticar, la sesión queda en modo no bloqueante y un mutex serializa
// las llamadas a libssh2, de modo que varios canales pueden compartirla.
class Libssh2ScpSession : public RemoteSession {
public:
  Libssh2ScpSession();
  ~Libssh2ScpSession() override;
  Libssh2ScpSession(const Libssh2ScpSession&) = delete;
  Libssh2ScpSession& operator=(const Libssh2ScpSession&) = delete;

  bool connect(const SessionOptions& opt, std::string& err) override;
  void disconnect() override;
  bool isConnected() const override { return connected_; }

  std::unique_ptr<RemoteChannel> exec(const std::vector<std::string>& argv,
                                      std::string& err) override;

private:
  friend class Libssh2Channel;

  bool connected_ = false;
  int  sock_ = -1;
  _LIBSSH2_SESSION* session_ = nullptr; // <- usa los tipos internos
  std::mutex mtx_;                       // libssh2 no es thread-safe por sesión

  bool tcpConnect(const std::string& host, uint16_t port, std::string& err);
  bool verifyHostKey(const SessionOptions& opt, std::string& err);
  bool authenticate(const SessionOptions& opt, std::string& err);
  bool authWithAgent(const std::string& user);
  std::string lastError();
  // Espera a que el socket esté listo en la dirección que libssh2 necesita.
  void waitSocket(int timeoutMs);
};

} // namespace scplite
