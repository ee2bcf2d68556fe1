// Interfaz abstracta de la sesión remota sobre la que corre SCP. Las
// implementaciones concretas (libssh2, mock) deben respetar esta API para
// mantener los flujos de transferencia desacoplados del backend.
#pragma once
#include "ScpTypes.hpp"

#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace scplite {

// Entrada/salida estándar de un comando remoto en ejecución.
class RemoteChannel {
public:
    using CancelCB = std::function<bool()>;

    virtual ~RemoteChannel() = default;

    // Lee de la salida estándar remota.
    // >0 bytes leídos, 0 fin de flujo, -1 error (o cancelado vía shouldCancel).
    virtual long read(char* buf, std::size_t len, std::string& err,
                      const CancelCB& shouldCancel = {}) = 0;

    // Escribe todo el bloque en la entrada estándar remota.
    virtual bool write(const char* data, std::size_t len, std::string& err) = 0;

    // Libera el comando remoto. Idempotente.
    virtual void close() = 0;
};

class RemoteSession {
public:
    virtual ~RemoteSession() = default;

    // Conectar y desconectar
    virtual bool connect(const SessionOptions& opt, std::string& err) = 0;
    virtual void disconnect() = 0;
    virtual bool isConnected() const = 0;

    // Ejecuta argv en el host remoto. El quoting para el shell remoto es
    // responsabilidad de la implementación.
    virtual std::unique_ptr<RemoteChannel> exec(const std::vector<std::string>& argv,
                                                std::string& err) = 0;
};

// Une argv en una línea para un shell POSIX usando comillas simples.
std::string shellJoin(const std::vector<std::string>& argv);

} // namespace scplite
