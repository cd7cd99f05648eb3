#define BOOST_TEST_MODULE TransferRequest

#include <boost/test/unit_test.hpp>

#include <QDir>
#include <QTemporaryDir>

#include <libssh/libssh.h>

#include "SshSession.h"
#include "TestHelpers.h"
#include "TransferRequest.h"

static
TransferRequest
valid_request()
{
  TransferRequest r;
  r.host = "example.org";
  r.username = "deploy";
  r.credential.password = "secret";
  r.sources << "/tmp";
  r.remoteDir = "/srv/www";
  return r;
}

BOOST_AUTO_TEST_CASE(defaults)
{
  TransferRequest r;
  BOOST_CHECK_EQUAL(r.port, 22);
  BOOST_CHECK(r.extract);
  BOOST_CHECK(r.removeArchiveAfterExtract);
  BOOST_CHECK(r.verifyUpload);
  BOOST_CHECK(r.credential.method == AuthMethod::Password);
}

BOOST_AUTO_TEST_CASE(validate)
{
  QString err;
  BOOST_CHECK(valid_request().validate(&err));
  BOOST_CHECK(err.isEmpty());

  auto r = valid_request();
  r.host = "  ";
  BOOST_CHECK(!r.validate(&err));
  BOOST_CHECK(err.contains("host"));

  r = valid_request();
  r.port = 0;
  BOOST_CHECK(!r.validate(&err));
  r.port = 65536;
  BOOST_CHECK(!r.validate(&err));

  r = valid_request();
  r.username.clear();
  BOOST_CHECK(!r.validate(&err));
  BOOST_CHECK(err.contains("username"));

  r = valid_request();
  r.credential.password.clear();
  BOOST_CHECK(!r.validate(&err));
  BOOST_CHECK(err.contains("password"));

  r = valid_request();
  r.sources.clear();
  BOOST_CHECK(!r.validate(&err));

  r = valid_request();
  r.remoteDir.clear();
  BOOST_CHECK(!r.validate(&err));
  BOOST_CHECK(err.contains("remote"));
}

BOOST_AUTO_TEST_CASE(validate_key)
{
  QTemporaryDir dir;
  auto r = valid_request();
  r.credential.method = AuthMethod::PrivateKey;
  r.credential.password.clear();

  QString err;
  BOOST_CHECK(!r.validate(&err));
  BOOST_CHECK(err.contains("private key"));

  r.credential.keyFile = dir.filePath("id_missing");
  BOOST_CHECK(!r.validate(&err));
  BOOST_CHECK(err.contains("does not exist"));

  r.credential.keyFile = write_file(QDir(dir.path()), "id_ed25519", "key");
  BOOST_CHECK(r.validate(&err));
}

BOOST_AUTO_TEST_CASE(key_file_expansion)
{
  auto r = valid_request();
  r.credential.keyFile = "~/.ssh/id_rsa";
  BOOST_CHECK_EQUAL(r.resolvedKeyFile(), QDir::homePath() + "/.ssh/id_rsa");
  r.credential.keyFile = "/etc/key";
  BOOST_CHECK_EQUAL(r.resolvedKeyFile(), "/etc/key");
}

BOOST_AUTO_TEST_CASE(target_has_no_secret)
{
  auto r = valid_request();
  r.port = 2222;
  BOOST_CHECK_EQUAL(r.target(), "deploy@example.org:2222");
  BOOST_CHECK(!r.target().contains("secret"));
}

BOOST_AUTO_TEST_CASE(auth_method_names)
{
  BOOST_CHECK_EQUAL(authMethodToString(AuthMethod::PrivateKey), "key");
  BOOST_CHECK_EQUAL(authMethodToString(AuthMethod::Password), "password");
  BOOST_CHECK(authMethodFromString(" Key ") == AuthMethod::PrivateKey);
  BOOST_CHECK(authMethodFromString("") == AuthMethod::Password);
}

BOOST_AUTO_TEST_CASE(auth_result_classification)
{
  BOOST_CHECK_EQUAL(SshSession::classifyAuthResult(SSH_AUTH_SUCCESS),
                    TransferErrorKind::None);
  BOOST_CHECK_EQUAL(SshSession::classifyAuthResult(SSH_AUTH_DENIED),
                    TransferErrorKind::AuthenticationError);
  BOOST_CHECK_EQUAL(SshSession::classifyAuthResult(SSH_AUTH_PARTIAL),
                    TransferErrorKind::AuthenticationError);
  BOOST_CHECK_EQUAL(SshSession::classifyAuthResult(SSH_AUTH_ERROR),
                    TransferErrorKind::ConnectError);
}

BOOST_AUTO_TEST_CASE(keyboard_interactive_fallback)
{
  BOOST_CHECK(SshSession::shouldTryKeyboardInteractive(
                SSH_AUTH_DENIED,
                SSH_AUTH_METHOD_PUBLICKEY | SSH_AUTH_METHOD_INTERACTIVE));
  BOOST_CHECK(!SshSession::shouldTryKeyboardInteractive(
                SSH_AUTH_DENIED, SSH_AUTH_METHOD_PUBLICKEY));
  BOOST_CHECK(!SshSession::shouldTryKeyboardInteractive(
                SSH_AUTH_SUCCESS, SSH_AUTH_METHOD_INTERACTIVE));
  BOOST_CHECK(!SshSession::shouldTryKeyboardInteractive(
                SSH_AUTH_ERROR, SSH_AUTH_METHOD_INTERACTIVE));

  BOOST_CHECK(SshSession::canAnswerWithPassword(0));
  BOOST_CHECK(SshSession::canAnswerWithPassword(1));
  BOOST_CHECK(!SshSession::canAnswerWithPassword(2));
  BOOST_CHECK(!SshSession::canAnswerWithPassword(-1));
}

BOOST_AUTO_TEST_CASE(status_helpers)
{
  TransferError e;
  BOOST_CHECK(!failWith(&e, TransferErrorKind::CleanupError, "x"));
  BOOST_CHECK(e.isSet());
  e.clear();
  BOOST_CHECK(!e.isSet());

  // An unset error still yields a failed status with a real kind.
  auto const failed = TransferStatus::failed("id", TransferError());
  BOOST_CHECK_EQUAL(failed.errorKind, TransferErrorKind::TransferError);
  BOOST_CHECK(failed.isTerminal());
  BOOST_CHECK(!TransferStatus::uploading("id", 1, 2).isTerminal());

  BOOST_CHECK_EQUAL(prettySize(0), "0 B");
  BOOST_CHECK_EQUAL(prettySize(1536), "1.5 KB");
  BOOST_CHECK_EQUAL(prettySize(5u * 1024 * 1024), "5.0 MB");
  BOOST_CHECK_EQUAL(describeStatus(TransferStatus::uploading("id", 1024, 2048)),
                    "Uploading: 1.0 KB / 2.0 KB");
}
