#include "CliCommands.hpp"
#include "scplite/ScpTransfer.hpp"

#include <QFileInfo>
#include <QLoggingCategory>
#include <QTextStream>
#include <memory>
#include <sys/stat.h>
#include <vector>

Q_LOGGING_CATEGORY(scpCli, "scplite.cli")

namespace {

std::uint32_t processUmask() {
    const mode_t m = ::umask(0);
    ::umask(m);
    return static_cast<std::uint32_t>(m);
}

} // namespace

bool isSafeLocalName(const std::string& name, QString& why) {
    if (name.empty()) {
        why = QStringLiteral("el remoto envió un nombre vacío");
        return false;
    }
    if (name == "." || name == "..") {
        why = QStringLiteral("el remoto envió el nombre reservado \"%1\"")
                  .arg(QString::fromStdString(name));
        return false;
    }
    if (name.find('/') != std::string::npos) {
        why = QStringLiteral("el remoto envió un nombre con ruta: \"%1\"")
                  .arg(QString::fromStdString(name));
        return false;
    }
    return true;
}

std::uint32_t localFileMode(std::uint32_t remoteMode, std::uint32_t umask) {
    return remoteMode & 0777u & ~umask;
}

int runGet(scplite::RemoteSession& session, const CliRequest& req, QTextStream& err) {
    std::unique_ptr<scplite::RemoteFile> file;
    scplite::ScpError e;
    if (!scplite::readFile(session, req.source, file, e, req.transfer)) {
        err << "get: " << QString::fromStdString(e.describe()) << "\n";
        return kExitFailure;
    }

    // El nombre lo elige el remoto: nunca se usa sin validar, aunque el
    // destino sea un archivo explícito.
    QString why;
    if (!isSafeLocalName(file->name(), why)) {
        err << "get: " << why << "; descarga rechazada\n";
        return kExitFailure;
    }

    std::string local = req.destination;
    if (QFileInfo(QString::fromStdString(local)).isDir())
        local += "/" + file->name();

    if (!scplite::copyToFile(*file->content(), local,
                             static_cast<std::uint64_t>(file->size()), e)) {
        err << "get: " << QString::fromStdString(e.describe()) << "\n";
        return kExitFailure;
    }
    const std::uint32_t mode = localFileMode(file->mode(), processUmask());
    if (::chmod(local.c_str(), static_cast<mode_t>(mode)) != 0)
        qCWarning(scpCli) << "no se pudieron aplicar permisos a" << QString::fromStdString(local);
    qCInfo(scpCli) << "descargado" << QString::fromStdString(file->name())
                   << file->size() << "bytes";
    return 0;
}

int runPut(scplite::RemoteSession& session, const CliRequest& req, QTextStream& err) {
    struct stat st{};
    if (::stat(req.source.c_str(), &st) != 0 || !S_ISREG(st.st_mode)) {
        err << "put: " << QString::fromStdString(req.source) << " no es un archivo regular\n";
        return kExitFailure;
    }
    auto reader = std::make_unique<scplite::FileReader>();
    scplite::ScpError e;
    if (!reader->open(req.source, e)) {
        err << "put: " << QString::fromStdString(e.describe()) << "\n";
        return kExitFailure;
    }
    scplite::RemoteFile file(QFileInfo(QString::fromStdString(req.source)).fileName().toStdString(),
                             static_cast<std::int64_t>(st.st_size),
                             static_cast<std::uint32_t>(st.st_mode) & 07777u,
                             std::move(reader));

    std::vector<std::string> warnings;
    if (!scplite::writeFile(session, req.destination, file, warnings, e, req.transfer)) {
        err << "put: " << QString::fromStdString(e.describe()) << "\n";
        return kExitFailure;
    }
    for (const auto& w : warnings)
        err << "aviso remoto: " << QString::fromStdString(w) << "\n";
    err.flush();
    qCInfo(scpCli) << "subido" << QString::fromStdString(file.name()) << file.size() << "bytes";
    return 0;
}
