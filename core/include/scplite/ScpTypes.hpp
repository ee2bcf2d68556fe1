// Tipos básicos compartidos entre el CLI y el core: sesión SSH, metadatos de
// archivo, opciones de transferencia y errores del protocolo SCP.
#pragma once
#include <string>
#include <vector>
#include <optional>
#include <cstdint>
#include <cstddef>
#include <functional>
#include <utility>

namespace scplite {

// Política de validación de known_hosts para la clave del servidor.
enum class KnownHostsPolicy {
    Strict,     // Requiere coincidencia exacta con known_hosts.
    AcceptNew,  // TOFU: acepta y guarda nuevos hosts; rechaza cambios de clave.
    Off         // Sin verificación (no recomendado).
};

struct FileInfo {
    std::string   name;     // nombre base
    bool          is_dir = false;
    std::uint64_t size  = 0;  // bytes
    std::uint64_t mtime = 0;  // epoch (segundos); SCP sin -p no lo transporta
    std::uint32_t mode  = 0;  // bits de permisos POSIX
};

// Callback para responder a prompts de keyboard-interactive.
// Debe devolver true y llenar "responses" con un elemento por prompt.
using KbdIntPromptsCB = std::function<bool(const std::string& name,
                                           const std::string& instruction,
                                           const std::vector<std::string>& prompts,
                                           std::vector<std::string>& responses)>;

struct SessionOptions {
    std::string host;
    std::uint16_t port = 22;
    std::string username;

    std::optional<std::string> password;
    std::optional<std::string> private_key_path;
    std::optional<std::string> private_key_passphrase;

    // Seguridad SSH
    std::optional<std::string> known_hosts_path; // por defecto: ~/.ssh/known_hosts
    KnownHostsPolicy known_hosts_policy = KnownHostsPolicy::Strict;

    // Confirmación de huella (TOFU) cuando known_hosts no tiene entrada.
    // Devuelve true para aceptar y guardar, false para rechazar.
    std::function<bool(const std::string& host,
                       std::uint16_t port,
                       const std::string& algorithm,
                       const std::string& fingerprint)> hostkey_confirm_cb;

    KbdIntPromptsCB keyboard_interactive_cb;
};

// Ajustes de las transferencias; no forman parte del protocolo.
struct TransferOptions {
    std::size_t chunk_size = 1024;         // máximo de bytes por lectura/escritura
    std::size_t pipe_capacity = 64 * 1024; // buffer entre la tarea de descarga y el lector
};

enum class ScpErrorKind {
    None,
    Transport,          // no se pudo abrir/ejecutar la sesión remota
    ProtocolViolation,  // directiva mal formada o byte inesperado
    RemoteWarning,      // estado 1 del remoto
    RemoteError,        // estado 2 del remoto
    IO                  // fallo de lectura/escritura a mitad de transferencia
};

const char* errorKindName(ScpErrorKind kind);

struct ScpError {
    ScpErrorKind kind = ScpErrorKind::None;
    std::string message; // texto remoto sin modificar en RemoteWarning/RemoteError

    bool ok() const { return kind == ScpErrorKind::None; }
    void set(ScpErrorKind k, std::string msg) {
        kind = k;
        message = std::move(msg);
    }
    void clear() {
        kind = ScpErrorKind::None;
        message.clear();
    }
    // "<tipo>: <mensaje>", para mostrar al usuario.
    std::string describe() const;
};

} // namespace scplite
