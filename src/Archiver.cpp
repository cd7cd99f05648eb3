// Archiver.cpp
//
// tar.gz writer on top of libarchive:
//   - pax_restricted format + gzip filter
//   - metadata (mode, mtime, link targets) comes from archive_read_disk
//   - file data is streamed in 64 KiB chunks

#include "Archiver.h"

#include <QDateTime>
#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QSet>
#include <QUuid>
#include <QVector>

#include <archive.h>
#include <archive_entry.h>

namespace {

QString archiveError(struct archive* a)
{
    const char* e = a ? archive_error_string(a) : nullptr;
    return e ? QString::fromLocal8Bit(e) : QStringLiteral("unknown libarchive error");
}

// Shared state for one archive build.
struct ArchiveWriter {
    struct archive* out  = nullptr;
    struct archive* disk = nullptr;
    QString archivePath;
    int entries = 0;

    bool addPath(const QFileInfo& fi, const QString& entryName, TransferError* err);
    bool addDirectory(const QFileInfo& dir, const QString& entryName, TransferError* err);
    bool writeFileData(const QString& localPath, TransferError* err);
};

bool ArchiveWriter::writeFileData(const QString& localPath, TransferError* err)
{
    QFile in(localPath);
    if (!in.open(QIODevice::ReadOnly)) {
        return failWith(err, TransferErrorKind::InputError,
                        QString("Cannot read '%1': %2").arg(localPath, in.errorString()));
    }

    QByteArray buf(64 * 1024, Qt::Uninitialized);
    while (!in.atEnd()) {
        const qint64 n = in.read(buf.data(), buf.size());
        if (n < 0) {
            return failWith(err, TransferErrorKind::InputError,
                            QString("Read failed for '%1': %2").arg(localPath, in.errorString()));
        }
        if (n == 0) break;

        const la_ssize_t w = archive_write_data(out, buf.constData(), (size_t)n);
        if (w < 0) {
            return failWith(err, TransferErrorKind::InputError,
                            QString("Cannot write archive data for '%1': %2")
                                .arg(localPath, archiveError(out)));
        }
    }
    return true;
}

bool ArchiveWriter::addPath(const QFileInfo& fi, const QString& entryName, TransferError* err)
{
    const QString localPath = fi.absoluteFilePath();

    if (!fi.isSymLink() && !fi.isReadable()) {
        return failWith(err, TransferErrorKind::InputError,
                        QString("Path is not readable: %1").arg(localPath));
    }

    struct archive_entry* entry = archive_entry_new();
    if (!entry)
        return failWith(err, TransferErrorKind::InputError, "archive_entry_new failed.");

    const QByteArray local8 = QFile::encodeName(localPath);
    archive_entry_copy_sourcepath(entry, local8.constData());

    if (archive_read_disk_entry_from_file(disk, entry, -1, nullptr) != ARCHIVE_OK) {
        const QString e = archiveError(disk);
        archive_entry_free(entry);
        return failWith(err, TransferErrorKind::InputError,
                        QString("Cannot stat '%1': %2").arg(localPath, e));
    }

    archive_entry_copy_pathname(entry, entryName.toUtf8().constData());

    if (archive_write_header(out, entry) < ARCHIVE_WARN) {
        const QString e = archiveError(out);
        archive_entry_free(entry);
        return failWith(err, TransferErrorKind::InputError,
                        QString("Cannot write archive header for '%1': %2").arg(localPath, e));
    }

    const bool isRegular = (archive_entry_filetype(entry) == AE_IFREG);
    const bool hasData = isRegular && archive_entry_size(entry) > 0;
    archive_entry_free(entry);

    ++entries;
    qDebug().noquote() << QString("[ARCHIVE] + %1").arg(entryName);

    if (hasData && !writeFileData(localPath, err))
        return false;

    if (fi.isDir() && !fi.isSymLink())
        return addDirectory(fi, entryName, err);

    return true;
}

bool ArchiveWriter::addDirectory(const QFileInfo& dirInfo, const QString& entryName, TransferError* err)
{
    QDir dir(dirInfo.absoluteFilePath());
    if (!dir.isReadable()) {
        return failWith(err, TransferErrorKind::InputError,
                        QString("Folder is not readable: %1").arg(dirInfo.absoluteFilePath()));
    }

    const QFileInfoList children = dir.entryInfoList(
        QDir::AllEntries | QDir::NoDotAndDotDot | QDir::Hidden | QDir::System,
        QDir::Name);

    for (const QFileInfo& child : children) {
        if (!addPath(child, entryName + "/" + child.fileName(), err))
            return false;
    }
    return true;
}

} // namespace

QString Archiver::makeArchiveName()
{
    const QString ts = QDateTime::currentDateTime().toString("yyyyMMdd_HHmmss");
    const QString rnd = QUuid::createUuid().toString(QUuid::Id128).left(8);
    return QString("packdrop_%1_%2.tar.gz").arg(ts, rnd);
}

QString Archiver::entryNameFor(const QString& path)
{
    const QString clean = QDir::cleanPath(path.trimmed());
    if (clean.isEmpty())
        return QString();

    // "." and ".." name the folder they resolve to, never a literal dot entry.
    const QString abs = QDir::cleanPath(QFileInfo(clean).absoluteFilePath());
    if (QDir(abs).isRoot())
        return QString();
    return QFileInfo(abs).fileName();
}

bool Archiver::createArchive(const QStringList& paths,
                             ArchiveArtifact* out,
                             TransferError* err,
                             const QString& tempDir)
{
    if (err) err->clear();
    if (!out)
        return failWith(err, TransferErrorKind::InputError, "createArchive: out is null.");
    *out = ArchiveArtifact{};

    if (paths.isEmpty())
        return failWith(err, TransferErrorKind::InputError, "No files or folders selected.");

    // Validate everything before touching the disk.
    QVector<QFileInfo> inputs;
    QStringList names;
    QSet<QString> seen;

    for (const QString& p : paths) {
        const QString clean = QDir::cleanPath(p.trimmed());
        const QFileInfo fi(QDir::cleanPath(QFileInfo(clean).absoluteFilePath()));

        if (!fi.exists() && !fi.isSymLink()) {
            return failWith(err, TransferErrorKind::InputError,
                            QString("Path does not exist: %1").arg(p));
        }
        if (!fi.isSymLink() && !fi.isReadable()) {
            return failWith(err, TransferErrorKind::InputError,
                            QString("Path is not readable: %1").arg(p));
        }

        const QString name = entryNameFor(clean);
        if (name.isEmpty()) {
            return failWith(err, TransferErrorKind::InputError,
                            QString("Cannot archive '%1': no usable name.").arg(p));
        }
        if (seen.contains(name)) {
            return failWith(err, TransferErrorKind::InputError,
                            QString("Two selections would both be stored as '%1'.").arg(name));
        }
        seen.insert(name);
        inputs.push_back(fi);
        names.push_back(name);
    }

    const QString dir = tempDir.trimmed().isEmpty() ? QDir::tempPath() : tempDir;
    QDir().mkpath(dir);

    ArchiveWriter w;
    w.archivePath = QDir(dir).filePath(makeArchiveName());

    qInfo().noquote() << QString("[ARCHIVE] creating %1 from %2 selection(s)")
                         .arg(w.archivePath).arg(inputs.size());

    w.out  = archive_write_new();
    w.disk = archive_read_disk_new();

    auto cleanup = [&](bool removeFile) {
        if (w.out) {
            archive_write_free(w.out);
            w.out = nullptr;
        }
        if (w.disk) {
            archive_read_free(w.disk);
            w.disk = nullptr;
        }
        if (removeFile && QFileInfo::exists(w.archivePath) && !QFile::remove(w.archivePath)) {
            qWarning().noquote() << QString("[ARCHIVE] could not remove partial archive %1")
                                    .arg(w.archivePath);
        }
    };

    if (!w.out || !w.disk) {
        cleanup(false);
        return failWith(err, TransferErrorKind::InputError, "libarchive allocation failed.");
    }

    archive_read_disk_set_standard_lookup(w.disk);
    archive_read_disk_set_symlink_physical(w.disk);

    archive_write_add_filter_gzip(w.out);
    archive_write_set_format_pax_restricted(w.out);

    const QByteArray archive8 = QFile::encodeName(w.archivePath);
    if (archive_write_open_filename(w.out, archive8.constData()) != ARCHIVE_OK) {
        const QString e = archiveError(w.out);
        cleanup(true);
        return failWith(err, TransferErrorKind::InputError,
                        QString("Cannot create archive '%1': %2").arg(w.archivePath, e));
    }

    for (int i = 0; i < inputs.size(); ++i) {
        if (!w.addPath(inputs[i], names[i], err)) {
            qWarning().noquote() << QString("[ARCHIVE] FAILED: %1").arg(err ? err->message : QString());
            cleanup(true);
            return false;
        }
    }

    if (archive_write_close(w.out) != ARCHIVE_OK) {
        const QString e = archiveError(w.out);
        cleanup(true);
        return failWith(err, TransferErrorKind::InputError,
                        QString("Cannot finalize archive: %1").arg(e));
    }
    cleanup(false);

    out->path = w.archivePath;
    out->size = (quint64)QFileInfo(w.archivePath).size();

    qInfo().noquote() << QString("[ARCHIVE] created %1 entries=%2 size=%3")
                         .arg(out->fileName())
                         .arg(w.entries)
                         .arg(prettySize(out->size));
    return true;
}
