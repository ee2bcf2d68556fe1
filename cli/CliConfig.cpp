#include "CliConfig.hpp"

#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QSettings>
#include <cstdlib>

namespace {

std::optional<std::string> envValue(const char* key) {
    const char* raw = std::getenv(key);
    if (!raw || !*raw)
        return std::nullopt;
    return std::string(raw);
}

bool parseSize(const QString& text, std::size_t& out) {
    bool ok = false;
    const qulonglong v = text.trimmed().toULongLong(&ok);
    if (!ok || v == 0)
        return false;
    out = static_cast<std::size_t>(v);
    return true;
}

} // namespace

bool parseKnownHostsPolicy(const QString& text, scplite::KnownHostsPolicy& out) {
    const QString v = text.trimmed().toLower();
    if (v == "strict") {
        out = scplite::KnownHostsPolicy::Strict;
        return true;
    }
    if (v == "accept-new" || v == "acceptnew") {
        out = scplite::KnownHostsPolicy::AcceptNew;
        return true;
    }
    if (v == "off" || v == "no") {
        out = scplite::KnownHostsPolicy::Off;
        return true;
    }
    return false;
}

CliParseResult parseCommandLine(const QStringList& args, QSettings& settings,
                                CliRequest& out, QString& message) {
    QCommandLineParser parser;
    parser.setApplicationDescription(
        "Copia un único archivo por SCP.\n"
        "  get <ruta-remota> <archivo-local>\n"
        "  put <archivo-local> <directorio-remoto>");
    const QCommandLineOption helpOpt = parser.addHelpOption();
    const QCommandLineOption versionOpt = parser.addVersionOption();
    QCommandLineOption hostOpt({"H", "host"}, "Host remoto.", "host");
    QCommandLineOption portOpt({"p", "port"}, "Puerto SSH (22).", "port");
    QCommandLineOption userOpt({"u", "user"}, "Usuario remoto.", "user");
    QCommandLineOption identityOpt({"i", "identity"}, "Clave privada.", "file");
    QCommandLineOption knownHostsOpt("known-hosts", "Archivo known_hosts.", "file");
    QCommandLineOption policyOpt("known-hosts-policy",
                                 "strict | accept-new | off (strict).", "policy");
    QCommandLineOption chunkOpt("chunk-size", "Bytes por bloque (1024).", "bytes");
    parser.addOptions({hostOpt, portOpt, userOpt, identityOpt, knownHostsOpt, policyOpt, chunkOpt});
    parser.addPositionalArgument("command", "get | put");
    parser.addPositionalArgument("source", "Origen.");
    parser.addPositionalArgument("destination", "Destino.");

    if (!parser.parse(args)) {
        message = parser.errorText();
        return CliParseResult::Error;
    }
    if (parser.isSet(helpOpt)) {
        message = parser.helpText();
        return CliParseResult::Help;
    }
    if (parser.isSet(versionOpt)) {
        message = QCoreApplication::applicationName() + " " +
                  QCoreApplication::applicationVersion();
        return CliParseResult::Version;
    }

    const QStringList pos = parser.positionalArguments();
    if (pos.size() != 3) {
        message = "se esperan 3 argumentos: get|put <origen> <destino>";
        return CliParseResult::Error;
    }
    const QString cmd = pos.at(0).toLower();
    if (cmd == "get") {
        out.command = CliRequest::Command::Get;
    } else if (cmd == "put") {
        out.command = CliRequest::Command::Put;
    } else {
        message = "comando desconocido: " + pos.at(0);
        return CliParseResult::Error;
    }
    out.source = pos.at(1).toStdString();
    out.destination = pos.at(2).toStdString();

    scplite::SessionOptions& so = out.session;
    so.host = (parser.isSet(hostOpt) ? parser.value(hostOpt)
                                     : settings.value("Connection/host").toString())
                  .toStdString();
    so.username = (parser.isSet(userOpt) ? parser.value(userOpt)
                                         : settings.value("Connection/user").toString())
                      .toStdString();
    if (so.host.empty() || so.username.empty()) {
        message = "host y usuario son obligatorios (--host/--user o Connection/* en la configuración)";
        return CliParseResult::Error;
    }

    bool portOk = false;
    const int port = (parser.isSet(portOpt) ? parser.value(portOpt)
                                            : settings.value("Connection/port", 22).toString())
                         .toInt(&portOk);
    if (!portOk || port < 1 || port > 65535) {
        message = "puerto inválido";
        return CliParseResult::Error;
    }
    so.port = static_cast<std::uint16_t>(port);

    const QString identity = parser.isSet(identityOpt)
                                 ? parser.value(identityOpt)
                                 : settings.value("Connection/identity").toString();
    if (!identity.isEmpty())
        so.private_key_path = identity.toStdString();
    so.password = envValue("SCPLITE_PASSWORD");
    so.private_key_passphrase = envValue("SCPLITE_KEY_PASSPHRASE");

    const QString kh = parser.isSet(knownHostsOpt)
                           ? parser.value(knownHostsOpt)
                           : settings.value("Security/knownHostsPath").toString();
    if (!kh.isEmpty())
        so.known_hosts_path = kh.toStdString();
    const QString policy = parser.isSet(policyOpt)
                               ? parser.value(policyOpt)
                               : settings.value("Security/knownHostsPolicy", "strict").toString();
    if (!parseKnownHostsPolicy(policy, so.known_hosts_policy)) {
        message = "política known_hosts inválida: " + policy;
        return CliParseResult::Error;
    }

    const QString chunk = parser.isSet(chunkOpt)
                              ? parser.value(chunkOpt)
                              : settings.value("Transfer/chunkSize", 1024).toString();
    if (!parseSize(chunk, out.transfer.chunk_size)) {
        message = "tamaño de bloque inválido: " + chunk;
        return CliParseResult::Error;
    }
    const QString capacity = settings.value("Transfer/pipeCapacity", 64 * 1024).toString();
    if (!parseSize(capacity, out.transfer.pipe_capacity)) {
        message = "Transfer/pipeCapacity inválido: " + capacity;
        return CliParseResult::Error;
    }
    return CliParseResult::Ok;
}
