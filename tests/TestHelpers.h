#ifndef PACKDROP_TESTS_TEST_HELPERS_H
# define PACKDROP_TESTS_TEST_HELPERS_H

# include <QByteArray>
# include <QDir>
# include <QFile>
# include <QFileInfo>
# include <QString>

# include <ostream>

# include "TransferStatus.h"

// Printers so BOOST_CHECK_EQUAL can report Qt and domain values.

inline
std::ostream&
operator <<(std::ostream& out, QString const& s)
{
  return out << s.toStdString();
}

inline
std::ostream&
operator <<(std::ostream& out, QByteArray const& b)
{
  return out << b.toStdString();
}

inline
std::ostream&
operator <<(std::ostream& out, TransferErrorKind k)
{
  return out << errorKindToString(k).toStdString();
}

inline
std::ostream&
operator <<(std::ostream& out, TransferStatus::Kind k)
{
  return out << statusKindToString(k).toStdString();
}

// Writes content to dir/relative, creating parent folders.
inline
QString
write_file(QDir const& dir, QString const& relative, QByteArray const& content)
{
  QString const path = dir.filePath(relative);
  QDir().mkpath(QFileInfo(path).absolutePath());
  QFile f(path);
  if (!f.open(QIODevice::WriteOnly))
    return QString();
  f.write(content);
  f.close();
  return path;
}

#endif
