// scplite: cliente SCP de un solo archivo (get/put) sobre libssh2.
#include "CliCommands.hpp"
#include "CliConfig.hpp"
#include "scplite/Libssh2ScpSession.hpp"

#include <QCoreApplication>
#include <QSettings>
#include <QTextStream>
#include <cstdio>

namespace {

QTextStream& err() {
    static QTextStream s(stderr);
    return s;
}

// TOFU por terminal: muestra la huella y pide confirmación.
bool confirmHostKey(const std::string& host, std::uint16_t port,
                    const std::string& algorithm, const std::string& fingerprint) {
    err() << "Host desconocido " << QString::fromStdString(host) << ":" << port << "\n"
          << "  " << QString::fromStdString(algorithm) << " "
          << QString::fromStdString(fingerprint) << "\n"
          << "¿Aceptar y guardar en known_hosts? [s/N] " << Qt::flush;
    QTextStream in(stdin);
    const QString answer = in.readLine().trimmed().toLower();
    return answer == "s" || answer == "si" || answer == "sí" || answer == "y" || answer == "yes";
}

} // namespace

int main(int argc, char* argv[]) {
    QCoreApplication app(argc, argv);
    QCoreApplication::setOrganizationName("scplite");
    QCoreApplication::setApplicationName("scplite");
    QCoreApplication::setApplicationVersion(SCPLITE_VERSION);

    QSettings settings("scplite", "scplite");
    CliRequest req;
    QString message;
    switch (parseCommandLine(app.arguments(), settings, req, message)) {
    case CliParseResult::Help:
    case CliParseResult::Version:
        QTextStream(stdout) << message << "\n";
        return 0;
    case CliParseResult::Error:
        err() << "scplite: " << message << "\n" << Qt::flush;
        return kExitUsage;
    case CliParseResult::Ok:
        break;
    }
    req.session.hostkey_confirm_cb = confirmHostKey;

    scplite::Libssh2ScpSession session;
    std::string cerr;
    if (!session.connect(req.session, cerr)) {
        err() << "scplite: " << QString::fromStdString(cerr) << "\n" << Qt::flush;
        return kExitFailure;
    }

    const int rc = req.command == CliRequest::Command::Get ? runGet(session, req, err())
                                                           : runPut(session, req, err());
    err() << Qt::flush;
    session.disconnect();
    return rc;
}
