// Command-line / settings parsing of the scplite tool (no network).
#include "CliConfig.hpp"

#include <QCoreApplication>
#include <QSettings>
#include <QTemporaryDir>
#include <cstdlib>
#include <initializer_list>
#include <iostream>
#include <string>

namespace {

struct TestContext {
    int failures = 0;

    void check(bool cond, const std::string &msg) {
        if (!cond) {
            ++failures;
            std::cerr << "[FAIL] " << msg << "\n";
        }
    }
};

QStringList cmd(std::initializer_list<const char *> args) {
    QStringList out{"scplite"};
    for (const char *a : args)
        out << QString::fromUtf8(a);
    return out;
}

void test_policy_names(TestContext &t) {
    scplite::KnownHostsPolicy p = scplite::KnownHostsPolicy::Off;
    t.check(parseKnownHostsPolicy("strict", p) &&
                p == scplite::KnownHostsPolicy::Strict,
            "strict should parse");
    t.check(parseKnownHostsPolicy(" Accept-New ", p) &&
                p == scplite::KnownHostsPolicy::AcceptNew,
            "accept-new should parse case-insensitively");
    t.check(parseKnownHostsPolicy("acceptnew", p) &&
                p == scplite::KnownHostsPolicy::AcceptNew,
            "acceptnew should parse");
    t.check(parseKnownHostsPolicy("off", p) && p == scplite::KnownHostsPolicy::Off,
            "off should parse");
    t.check(!parseKnownHostsPolicy("maybe", p), "unknown policy should fail");
}

void test_get_from_options(TestContext &t, QSettings &settings) {
    CliRequest req;
    QString msg;
    const CliParseResult r = parseCommandLine(
        cmd({"--host", "example.test", "-u", "alice", "get", "/srv/a.txt", "out.txt"}),
        settings, req, msg);
    t.check(r == CliParseResult::Ok, "get should parse: " + msg.toStdString());
    t.check(req.command == CliRequest::Command::Get, "command should be get");
    t.check(req.source == "/srv/a.txt", "source should be the remote path");
    t.check(req.destination == "out.txt", "destination should be the local file");
    t.check(req.session.host == "example.test", "host from --host");
    t.check(req.session.username == "alice", "user from -u");
    t.check(req.session.port == 22, "port should default to 22");
    t.check(req.session.known_hosts_policy == scplite::KnownHostsPolicy::Strict,
            "policy should default to strict");
    t.check(!req.session.private_key_path.has_value(),
            "no identity unless configured");
    t.check(req.transfer.chunk_size == 1024, "chunk size should default to 1024");
    t.check(req.transfer.pipe_capacity == 64 * 1024,
            "pipe capacity should default to 64 KiB");
}

void test_put_with_overrides(TestContext &t, QSettings &settings) {
    CliRequest req;
    QString msg;
    const CliParseResult r = parseCommandLine(
        cmd({"-H", "h", "-u", "u", "-p", "2222", "-i", "/keys/id_ed25519",
              "--known-hosts", "/tmp/kh", "--known-hosts-policy", "accept-new",
              "--chunk-size", "8192", "PUT", "local.bin", "/srv/in"}),
        settings, req, msg);
    t.check(r == CliParseResult::Ok, "put should parse: " + msg.toStdString());
    t.check(req.command == CliRequest::Command::Put,
            "command should be case-insensitive");
    t.check(req.session.port == 2222, "port from -p");
    t.check(req.session.private_key_path.value_or("") == "/keys/id_ed25519",
            "identity from -i");
    t.check(req.session.known_hosts_path.value_or("") == "/tmp/kh",
            "known_hosts path from option");
    t.check(req.session.known_hosts_policy == scplite::KnownHostsPolicy::AcceptNew,
            "policy from option");
    t.check(req.transfer.chunk_size == 8192, "chunk size from option");
}

void test_settings_defaults(TestContext &t, QSettings &settings) {
    settings.setValue("Connection/host", "files.example.test");
    settings.setValue("Connection/user", "carol");
    settings.setValue("Connection/port", 2200);
    settings.setValue("Connection/identity", "/home/carol/.ssh/id_rsa");
    settings.setValue("Security/knownHostsPolicy", "off");
    settings.setValue("Transfer/chunkSize", 4096);
    settings.setValue("Transfer/pipeCapacity", 1024);

    CliRequest req;
    QString msg;
    CliParseResult r =
        parseCommandLine(cmd({"get", "/a", "b"}), settings, req, msg);
    t.check(r == CliParseResult::Ok,
            "settings should fill missing options: " + msg.toStdString());
    t.check(req.session.host == "files.example.test", "host from settings");
    t.check(req.session.username == "carol", "user from settings");
    t.check(req.session.port == 2200, "port from settings");
    t.check(req.session.private_key_path.value_or("") == "/home/carol/.ssh/id_rsa",
            "identity from settings");
    t.check(req.session.known_hosts_policy == scplite::KnownHostsPolicy::Off,
            "policy from settings");
    t.check(req.transfer.chunk_size == 4096, "chunk size from settings");
    t.check(req.transfer.pipe_capacity == 1024, "pipe capacity from settings");

    CliRequest over;
    r = parseCommandLine(cmd({"--host", "other", "--port", "22", "get", "/a", "b"}),
                         settings, over, msg);
    t.check(r == CliParseResult::Ok && over.session.host == "other" &&
                over.session.port == 22 && over.session.username == "carol",
            "options should override settings");

    settings.setValue("Transfer/pipeCapacity", "lots");
    CliRequest badCap;
    r = parseCommandLine(cmd({"get", "/a", "b"}), settings, badCap, msg);
    t.check(r == CliParseResult::Error, "invalid pipe capacity should fail");

    settings.clear();
}

void test_password_from_env(TestContext &t, QSettings &settings) {
    qputenv("SCPLITE_PASSWORD", "s3cret");
    CliRequest req;
    QString msg;
    t.check(parseCommandLine(cmd({"-H", "h", "-u", "u", "get", "/a", "b"}), settings,
                             req, msg) == CliParseResult::Ok,
            "request with env password should parse");
    t.check(req.session.password.value_or("") == "s3cret",
            "password should come from SCPLITE_PASSWORD");

    qunsetenv("SCPLITE_PASSWORD");
    CliRequest none;
    t.check(parseCommandLine(cmd({"-H", "h", "-u", "u", "get", "/a", "b"}), settings,
                             none, msg) == CliParseResult::Ok,
            "request without env password should parse");
    t.check(!none.session.password.has_value(), "no password without env");
}

void test_errors(TestContext &t, QSettings &settings) {
    CliRequest req;
    QString msg;

    t.check(parseCommandLine(cmd({"-H", "h", "-u", "u", "get", "/a"}), settings,
                             req, msg) == CliParseResult::Error,
            "missing destination should fail");
    t.check(!msg.isEmpty(), "error should carry a message");

    t.check(parseCommandLine(cmd({"-H", "h", "-u", "u", "mv", "/a", "b"}),
                             settings, req, msg) == CliParseResult::Error,
            "unknown command should fail");

    t.check(parseCommandLine(cmd({"-u", "u", "get", "/a", "b"}), settings, req,
                             msg) == CliParseResult::Error,
            "missing host should fail");

    t.check(parseCommandLine(cmd({"-H", "h", "-u", "u", "-p", "70000", "get",
                                   "/a", "b"}),
                             settings, req, msg) == CliParseResult::Error,
            "out of range port should fail");

    t.check(parseCommandLine(cmd({"-H", "h", "-u", "u", "--known-hosts-policy",
                                   "trust-all", "get", "/a", "b"}),
                             settings, req, msg) == CliParseResult::Error,
            "unknown policy should fail");

    t.check(parseCommandLine(cmd({"-H", "h", "-u", "u", "--chunk-size", "0",
                                   "get", "/a", "b"}),
                             settings, req, msg) == CliParseResult::Error,
            "zero chunk size should fail");

    t.check(parseCommandLine(cmd({"--bogus", "get", "/a", "b"}), settings, req,
                             msg) == CliParseResult::Error,
            "unknown option should fail");
}

void test_help_and_version(TestContext &t, QSettings &settings) {
    CliRequest req;
    QString msg;
    t.check(parseCommandLine(cmd({"--help"}), settings, req, msg) ==
                    CliParseResult::Help &&
                msg.contains("get"),
            "--help should return the usage text");
    t.check(parseCommandLine(cmd({"--version"}), settings, req, msg) ==
                    CliParseResult::Version &&
                msg.contains("0.0.0-test"),
            "--version should return the version");
}

} // namespace

int main(int argc, char *argv[]) {
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName("scplite");
    QCoreApplication::setApplicationVersion("0.0.0-test");
    qunsetenv("SCPLITE_PASSWORD");
    qunsetenv("SCPLITE_KEY_PASSPHRASE");

    QTemporaryDir dir;
    if (!dir.isValid()) {
        std::cerr << "[FAIL] could not create temp dir\n";
        return EXIT_FAILURE;
    }
    QSettings settings(dir.filePath("scplite.ini"), QSettings::IniFormat);

    TestContext t;
    test_policy_names(t);
    test_get_from_options(t, settings);
    test_put_with_overrides(t, settings);
    test_settings_defaults(t, settings);
    test_password_from_env(t, settings);
    test_errors(t, settings);
    test_help_and_version(t, settings);

    if (t.failures != 0) {
        std::cerr << "[FAILURES] " << t.failures << "\n";
        return EXIT_FAILURE;
    }
    std::cout << "[OK] scplite_cli_config_tests\n";
    return EXIT_SUCCESS;
}
