#define BOOST_TEST_MODULE RemoteCommand

#include <boost/test/unit_test.hpp>

#include <memory>

#include "FakeRemoteSession.h"
#include "RemoteCommand.h"
#include "TestHelpers.h"

BOOST_AUTO_TEST_CASE(quoting)
{
  BOOST_CHECK_EQUAL(RemoteCommand::shellQuote("plain"), "'plain'");
  BOOST_CHECK_EQUAL(RemoteCommand::shellQuote("it's"), "'it'\"'\"'s'");
  BOOST_CHECK_EQUAL(RemoteCommand::shellQuote("a b;rm -rf /"), "'a b;rm -rf /'");
  BOOST_CHECK_EQUAL(RemoteCommand::shellQuote("$(id)"), "'$(id)'");
}

BOOST_AUTO_TEST_CASE(quoting_paths)
{
  BOOST_CHECK_EQUAL(RemoteCommand::shellQuotePath("/var/www"), "'/var/www'");
  BOOST_CHECK_EQUAL(RemoteCommand::shellQuotePath("~"), "\"$HOME\"");
  BOOST_CHECK_EQUAL(RemoteCommand::shellQuotePath("~/up loads"), "\"$HOME\"/'up loads'");
  BOOST_CHECK_EQUAL(RemoteCommand::shellQuotePath("-rf"), "'./-rf'");
  // Only a leading "~/" expands.
  BOOST_CHECK_EQUAL(RemoteCommand::shellQuotePath("/srv/~/x"), "'/srv/~/x'");
}

BOOST_AUTO_TEST_CASE(extract_command)
{
  BOOST_CHECK_EQUAL(
    RemoteCommand::buildExtractCommand("/var/www/html", "a.tar.gz", true),
    "tar -xzf '/var/www/html/a.tar.gz' -C '/var/www/html'"
    " && rm -f '/var/www/html/a.tar.gz'");
  BOOST_CHECK_EQUAL(
    RemoteCommand::buildExtractCommand("/var/www/html/", "a.tar.gz", false),
    "tar -xzf '/var/www/html/a.tar.gz' -C '/var/www/html'");
  BOOST_CHECK_EQUAL(
    RemoteCommand::buildExtractCommand("~/site", "a.tar.gz", true),
    "tar -xzf \"$HOME\"/'site/a.tar.gz' -C \"$HOME\"/'site'"
    " && rm -f \"$HOME\"/'site/a.tar.gz'");
  BOOST_CHECK_EQUAL(
    RemoteCommand::buildExtractCommand("/", "a.tar.gz", false),
    "tar -xzf '/a.tar.gz' -C '/'");
}

BOOST_AUTO_TEST_CASE(extract_command_hostile_dir)
{
  QString const cmd =
    RemoteCommand::buildExtractCommand("/tmp/x'; reboot; '", "a.tar.gz", false);
  BOOST_CHECK_EQUAL(
    cmd,
    "tar -xzf '/tmp/x'\"'\"'; reboot; '\"'\"'/a.tar.gz'"
    " -C '/tmp/x'\"'\"'; reboot; '\"'\"''");
}

BOOST_AUTO_TEST_CASE(run_success)
{
  auto state = std::make_shared<FakeRemoteState>();
  state->exec_result = RemoteCommandResult{0, "ok\n", ""};
  FakeRemoteSession session(state);
  RemoteCommandResult res;
  TransferError err;
  BOOST_CHECK(RemoteCommand::run(session, "true", 1000, &res, &err));
  BOOST_CHECK(!err.isSet());
  BOOST_CHECK_EQUAL(res.exitCode, 0);
  BOOST_CHECK_EQUAL(res.stdoutText, "ok\n");
  BOOST_REQUIRE_EQUAL(state->commands.size(), 1);
  BOOST_CHECK_EQUAL(state->commands.first(), "true");
}

BOOST_AUTO_TEST_CASE(run_nonzero_exit)
{
  auto state = std::make_shared<FakeRemoteState>();
  state->exec_result =
    RemoteCommandResult{2, "", "tar: a.tar.gz: Cannot open: No such file\n"};
  FakeRemoteSession session(state);
  RemoteCommandResult res;
  TransferError err;
  BOOST_CHECK(!RemoteCommand::run(session, "tar -xzf a.tar.gz", 0, &res, &err));
  BOOST_CHECK_EQUAL(err.kind, TransferErrorKind::RemoteCommandError);
  BOOST_CHECK(err.message.contains("exit 2"));
  BOOST_CHECK(err.message.contains("Cannot open"));
  // The result is still reported when the command ran.
  BOOST_CHECK_EQUAL(res.exitCode, 2);
}

BOOST_AUTO_TEST_CASE(run_channel_failure)
{
  auto state = std::make_shared<FakeRemoteState>();
  state->exec_fails = true;
  FakeRemoteSession session(state);
  TransferError err;
  BOOST_CHECK(!RemoteCommand::run(session, "true", 0, nullptr, &err));
  BOOST_CHECK_EQUAL(err.kind, TransferErrorKind::RemoteCommandError);
  BOOST_CHECK(err.message.contains("channel refused"));
}

BOOST_AUTO_TEST_CASE(run_timeout)
{
  auto state = std::make_shared<FakeRemoteState>();
  state->exec_times_out = true;
  FakeRemoteSession session(state);
  RemoteCommandResult res;
  TransferError err;
  BOOST_CHECK(!RemoteCommand::run(session, "sleep 100", 1500, &res, &err));
  BOOST_CHECK_EQUAL(state->last_timeout_ms, 1500);
  BOOST_CHECK_EQUAL(err.kind, TransferErrorKind::RemoteCommandError);
  BOOST_CHECK(err.message.contains("1.5 s"));
  BOOST_CHECK(err.message.contains("may still be running"));
  BOOST_CHECK(res.timedOut);
}

BOOST_AUTO_TEST_CASE(run_without_timeout_waits)
{
  auto state = std::make_shared<FakeRemoteState>();
  state->exec_times_out = true;
  FakeRemoteSession session(state);
  TransferError err;
  BOOST_CHECK(RemoteCommand::run(session, "sleep 100", 0, nullptr, &err));
  BOOST_CHECK(!err.isSet());
  BOOST_CHECK_EQUAL(state->last_timeout_ms, 0);
}
