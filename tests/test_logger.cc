#define BOOST_TEST_MODULE Logger

#include <boost/test/unit_test.hpp>

#include <QDebug>
#include <QFile>
#include <QFileInfo>
#include <QRegularExpression>
#include <QTemporaryDir>

#include "Logger.h"
#include "TestHelpers.h"

static
QByteArray
read_all(QString const& path)
{
  QFile f(path);
  if (!f.open(QIODevice::ReadOnly))
    return QByteArray();
  return f.readAll();
}

BOOST_AUTO_TEST_CASE(record_format)
{
  QString const line = Logger::formatRecord(
    QtWarningMsg, "/build/src/Uploader.cpp", 42, "upload", "disk\nfull\t now");
  QRegularExpression const re(
    "^\\d{4}-\\d{2}-\\d{2} \\d{2}:\\d{2}:\\d{2}\\.\\d{3} "
    "\\[WARN\\] Uploader\\.cpp:42 upload - disk full now$");
  BOOST_CHECK_MESSAGE(re.match(line).hasMatch(), line.toStdString());
}

BOOST_AUTO_TEST_CASE(record_without_context)
{
  QString const line =
    Logger::formatRecord(QtCriticalMsg, nullptr, 0, nullptr, "boom");
  BOOST_CHECK(line.endsWith(" [ERROR] boom"));
  BOOST_CHECK(Logger::formatRecord(QtDebugMsg, nullptr, 0, nullptr, "x")
              .contains("[DEBUG]"));
  BOOST_CHECK(Logger::formatRecord(QtInfoMsg, nullptr, 0, nullptr, "x")
              .contains("[INFO]"));
}

BOOST_AUTO_TEST_CASE(rotation)
{
  QTemporaryDir dir;
  QDir const d(dir.path());
  QString const path = write_file(d, "app.log", QByteArray(100, 'c'));
  write_file(d, "app.log.1", "one");
  write_file(d, "app.log.2", "two");

  // Below the threshold nothing moves.
  Logger::rotateIfNeeded(path, 1000, 2);
  BOOST_CHECK_EQUAL(read_all(d.filePath("app.log.1")), QByteArray("one"));

  Logger::rotateIfNeeded(path, 50, 2);
  BOOST_CHECK(!QFileInfo::exists(path));
  BOOST_CHECK_EQUAL(read_all(d.filePath("app.log.1")), QByteArray(100, 'c'));
  BOOST_CHECK_EQUAL(read_all(d.filePath("app.log.2")), QByteArray("one"));
  BOOST_CHECK(!QFileInfo::exists(d.filePath("app.log.3")));
}

BOOST_AUTO_TEST_CASE(install_filters_by_level)
{
  QTemporaryDir dir;
  QString const path = dir.filePath("logs/test.log");

  Logger::setLogLevel(1);
  Logger::install("test", path);
  BOOST_CHECK_EQUAL(Logger::logFilePath(), path);

  qDebug() << "hidden-debug-record";
  qInfo() << "visible-info-record";
  qWarning() << "visible-warning-record";

  Logger::setLogLevel(0);
  qInfo() << "hidden-info-record";
  Logger::setLogLevel(7);
  BOOST_CHECK_EQUAL(Logger::logLevel(), 2);
  qDebug() << "visible-debug-record";

  Logger::uninstall();
  Logger::setLogLevel(1);
  BOOST_CHECK(Logger::logFilePath().isEmpty());

  QByteArray const content = read_all(path);
  BOOST_CHECK(content.contains("Logger initialized"));
  BOOST_CHECK(content.contains("visible-info-record"));
  BOOST_CHECK(content.contains("[WARN]"));
  BOOST_CHECK(content.contains("visible-warning-record"));
  BOOST_CHECK(content.contains("visible-debug-record"));
  BOOST_CHECK(!content.contains("hidden-debug-record"));
  BOOST_CHECK(!content.contains("hidden-info-record"));
}

BOOST_AUTO_TEST_CASE(unwritable_path_falls_back)
{
  QTemporaryDir dir;
  // A directory cannot be opened as the log file.
  QString const path = dir.filePath("blocked");
  BOOST_REQUIRE(QDir().mkpath(path));
  Logger::install("test", path);
  BOOST_CHECK(Logger::logFilePath().isEmpty());
  Logger::uninstall();
}
