#define BOOST_TEST_MODULE Archiver

#include <boost/test/unit_test.hpp>

#include <QDir>
#include <QMap>
#include <QRegularExpression>
#include <QTemporaryDir>

#include <unistd.h>

#include <archive.h>
#include <archive_entry.h>

#include "Archiver.h"
#include "TestHelpers.h"

// Entry name -> content ("" for directories), read back with libarchive.
static
QMap<QString, QByteArray>
read_archive(QString const& path)
{
  QMap<QString, QByteArray> res;
  struct archive* a = archive_read_new();
  archive_read_support_filter_gzip(a);
  archive_read_support_format_tar(a);
  if (archive_read_open_filename(a, QFile::encodeName(path).constData(), 10240)
      != ARCHIVE_OK)
  {
    archive_read_free(a);
    return res;
  }
  struct archive_entry* entry = nullptr;
  while (archive_read_next_header(a, &entry) == ARCHIVE_OK)
  {
    QString name = QString::fromUtf8(archive_entry_pathname(entry));
    if (name.endsWith('/'))
      name.chop(1);
    QByteArray content;
    char buf[4096];
    la_ssize_t n;
    while ((n = archive_read_data(a, buf, sizeof buf)) > 0)
      content.append(buf, int(n));
    res.insert(name, content);
  }
  archive_read_free(a);
  return res;
}

static
int
files_in(QString const& dir)
{
  return QDir(dir).entryList(QDir::Files | QDir::Hidden).size();
}

BOOST_AUTO_TEST_CASE(archive_name)
{
  QString const name = Archiver::makeArchiveName();
  QRegularExpression const re("^packdrop_\\d{8}_\\d{6}_[0-9a-f]{8}\\.tar\\.gz$");
  BOOST_CHECK_MESSAGE(re.match(name).hasMatch(), name.toStdString());
  BOOST_CHECK_NE(Archiver::makeArchiveName(), Archiver::makeArchiveName());
}

BOOST_AUTO_TEST_CASE(entry_names)
{
  BOOST_CHECK_EQUAL(Archiver::entryNameFor("/home/u/site/"), "site");
  BOOST_CHECK_EQUAL(Archiver::entryNameFor("/home/u/a.txt"), "a.txt");
  BOOST_CHECK_EQUAL(Archiver::entryNameFor("/"), "");
  BOOST_CHECK_EQUAL(Archiver::entryNameFor(""), "");
  BOOST_CHECK_EQUAL(Archiver::entryNameFor("/home/u/site/.."), "u");
}

// Restores the working directory when the test ends.
struct CurrentDir
{
  CurrentDir(QString const& path)
    : _previous(QDir::currentPath())
  {
    QDir::setCurrent(path);
  }

  ~CurrentDir()
  {
    QDir::setCurrent(this->_previous);
  }

private:
  QString _previous;
};

BOOST_AUTO_TEST_CASE(relative_dot_paths)
{
  QTemporaryDir src;
  QTemporaryDir tmp;
  QDir root(src.path());
  write_file(root, "site/index.html", "<html/>");
  write_file(root, "site/sub/page.html", "page");
  CurrentDir cwd(root.filePath("site/sub"));

  BOOST_CHECK_EQUAL(Archiver::entryNameFor("."), "sub");
  BOOST_CHECK_EQUAL(Archiver::entryNameFor(".."), "site");
  BOOST_CHECK_EQUAL(Archiver::entryNameFor("./"), "sub");

  ArchiveArtifact artifact;
  TransferError err;
  BOOST_REQUIRE(Archiver::createArchive({".."}, &artifact, &err, tmp.path()));
  auto entries = read_archive(artifact.path);
  BOOST_CHECK_EQUAL(entries.value("site/index.html"), QByteArray("<html/>"));
  BOOST_CHECK_EQUAL(entries.value("site/sub/page.html"), QByteArray("page"));
  for (auto const& name: entries.keys())
    BOOST_CHECK_MESSAGE(!name.startsWith(".."), name.toStdString());

  BOOST_REQUIRE(Archiver::createArchive({"."}, &artifact, &err, tmp.path()));
  entries = read_archive(artifact.path);
  BOOST_CHECK_EQUAL(entries.value("sub/page.html"), QByteArray("page"));
  BOOST_CHECK_EQUAL(entries.size(), 2);
}

BOOST_AUTO_TEST_CASE(files_and_folders)
{
  QTemporaryDir src;
  QTemporaryDir tmp;
  BOOST_REQUIRE(src.isValid() && tmp.isValid());
  QDir root(src.path());

  QString const file = write_file(root, "a.txt", "alpha");
  write_file(root, "site/index.html", "<html/>");
  write_file(root, "site/css/main.css", "body{}");
  write_file(root, "site/.htaccess", "deny");
  root.mkpath("site/empty");

  ArchiveArtifact artifact;
  TransferError err;
  BOOST_REQUIRE(Archiver::createArchive(
                  {file, root.filePath("site")}, &artifact, &err, tmp.path()));
  BOOST_CHECK(!err.isSet());
  BOOST_CHECK(artifact.isValid());
  BOOST_CHECK_EQUAL(QFileInfo(artifact.path).absolutePath(),
                    QFileInfo(tmp.path()).absoluteFilePath());
  BOOST_CHECK_EQUAL(artifact.size, quint64(QFileInfo(artifact.path).size()));

  auto const entries = read_archive(artifact.path);
  BOOST_CHECK_EQUAL(entries.value("a.txt"), QByteArray("alpha"));
  BOOST_CHECK_EQUAL(entries.value("site/index.html"), QByteArray("<html/>"));
  BOOST_CHECK_EQUAL(entries.value("site/css/main.css"), QByteArray("body{}"));
  BOOST_CHECK_EQUAL(entries.value("site/.htaccess"), QByteArray("deny"));
  BOOST_CHECK(entries.contains("site"));
  BOOST_CHECK(entries.contains("site/css"));
  BOOST_CHECK(entries.contains("site/empty"));
  BOOST_CHECK_EQUAL(entries.size(), 7);
}

BOOST_AUTO_TEST_CASE(empty_file)
{
  QTemporaryDir src;
  QTemporaryDir tmp;
  QString const file = write_file(QDir(src.path()), "empty.bin", QByteArray());
  ArchiveArtifact artifact;
  TransferError err;
  BOOST_REQUIRE(Archiver::createArchive({file}, &artifact, &err, tmp.path()));
  auto const entries = read_archive(artifact.path);
  BOOST_CHECK(entries.contains("empty.bin"));
  BOOST_CHECK(entries.value("empty.bin").isEmpty());
}

BOOST_AUTO_TEST_CASE(missing_path)
{
  QTemporaryDir src;
  QTemporaryDir tmp;
  QString const file = write_file(QDir(src.path()), "a.txt", "alpha");
  ArchiveArtifact artifact;
  TransferError err;
  BOOST_CHECK(!Archiver::createArchive(
                {file, src.filePath("nope")}, &artifact, &err, tmp.path()));
  BOOST_CHECK_EQUAL(err.kind, TransferErrorKind::InputError);
  BOOST_CHECK(err.message.contains("nope"));
  BOOST_CHECK(!artifact.isValid());
  BOOST_CHECK_EQUAL(files_in(tmp.path()), 0);
}

BOOST_AUTO_TEST_CASE(unreadable_file)
{
  if (::geteuid() == 0)
  {
    BOOST_TEST_MESSAGE("skipped: permissions are not enforced for root");
    return;
  }
  QTemporaryDir src;
  QTemporaryDir tmp;
  QString const file = write_file(QDir(src.path()), "secret.txt", "x");
  BOOST_REQUIRE(QFile::setPermissions(file, QFileDevice::Permissions()));
  ArchiveArtifact artifact;
  TransferError err;
  BOOST_CHECK(!Archiver::createArchive({file}, &artifact, &err, tmp.path()));
  QFile::setPermissions(file, QFileDevice::ReadOwner | QFileDevice::WriteOwner);
  BOOST_CHECK_EQUAL(err.kind, TransferErrorKind::InputError);
  BOOST_CHECK(err.message.contains("secret.txt"));
  BOOST_CHECK(!artifact.isValid());
  BOOST_CHECK_EQUAL(files_in(tmp.path()), 0);
}

BOOST_AUTO_TEST_CASE(unreadable_subfolder)
{
  if (::geteuid() == 0)
  {
    BOOST_TEST_MESSAGE("skipped: permissions are not enforced for root");
    return;
  }
  QTemporaryDir src;
  QTemporaryDir tmp;
  QDir root(src.path());
  write_file(root, "site/index.html", "<html/>");
  write_file(root, "site/private/key.pem", "k");
  QString const locked = root.filePath("site/private");
  BOOST_REQUIRE(QFile::setPermissions(locked, QFileDevice::Permissions()));
  ArchiveArtifact artifact;
  TransferError err;
  BOOST_CHECK(!Archiver::createArchive(
                {root.filePath("site")}, &artifact, &err, tmp.path()));
  QFile::setPermissions(locked, QFileDevice::ReadOwner | QFileDevice::WriteOwner |
                                QFileDevice::ExeOwner);
  BOOST_CHECK_EQUAL(err.kind, TransferErrorKind::InputError);
  BOOST_CHECK(err.message.contains("private"));
  BOOST_CHECK(!artifact.isValid());
  BOOST_CHECK_EQUAL(files_in(tmp.path()), 0);
}

BOOST_AUTO_TEST_CASE(no_paths)
{
  ArchiveArtifact artifact;
  TransferError err;
  BOOST_CHECK(!Archiver::createArchive({}, &artifact, &err));
  BOOST_CHECK_EQUAL(err.kind, TransferErrorKind::InputError);
}

BOOST_AUTO_TEST_CASE(duplicate_names)
{
  QTemporaryDir src;
  QTemporaryDir tmp;
  QDir root(src.path());
  QString const one = write_file(root, "x/readme.md", "1");
  QString const two = write_file(root, "y/readme.md", "2");
  ArchiveArtifact artifact;
  TransferError err;
  BOOST_CHECK(!Archiver::createArchive({one, two}, &artifact, &err, tmp.path()));
  BOOST_CHECK_EQUAL(err.kind, TransferErrorKind::InputError);
  BOOST_CHECK(err.message.contains("readme.md"));
  BOOST_CHECK_EQUAL(files_in(tmp.path()), 0);
}
