#pragma once
#include "RemoteSession.hpp"

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace scplite {

// Lo que quedó registrado de cada exec (para verificar en tests).
struct MockExecRecord {
    std::vector<std::string> argv;
    std::string stdin_data;     // bytes recibidos del cliente
    std::size_t stdout_read = 0; // bytes de stdout entregados al cliente
    bool closed = false;
};

struct MockFile {
    std::uint32_t mode = 0644;
    std::string content;
};

// Remoto simulado: emula "scp -f" y "scp -t" sobre un “FS remoto” en
// memoria, o reproduce una salida guionada.
class MockScpSession : public RemoteSession {
public:
    MockScpSession();
    ~MockScpSession() override;

    bool connect(const SessionOptions& opt, std::string& err) override;
    void disconnect() override;
    bool isConnected() const override;

    std::unique_ptr<RemoteChannel> exec(const std::vector<std::string>& argv,
                                        std::string& err) override;

    // “FS remoto”
    void addFile(const std::string& path, std::uint32_t mode, std::string content);
    std::optional<MockFile> findFile(const std::string& path) const;

    // Guion: la próxima ejecución entrega exactamente estos bytes por stdout
    // en lugar de emular scp.
    void queueStdout(std::string bytes);
    // Máximo de bytes por lectura (0 = sin límite).
    void setReadChunk(std::size_t n);
    // Tras agotar stdout, bloquear la lectura hasta cancelar/cerrar en vez de EOF.
    void setHoldOpen(bool hold);
    // Las lecturas fallan una vez entregados `offset` bytes de stdout.
    void failReadsAfter(std::size_t offset, std::string msg);
    void failNextExec(std::string msg);

    std::vector<MockExecRecord> execs() const;

private:
    struct State;
    class Channel;
    std::shared_ptr<State> state_;
};

} // namespace scplite
