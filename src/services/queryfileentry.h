#ifndef QUERYFILEENTRY_H
#define QUERYFILEENTRY_H

#include <QDateTime>
#include <QString>

/**
 * @brief Represents a single entry in a channel's file repository listing.
 */
struct QueryFileEntry {
    QString name;              ///< Name of the file or directory
    QString path;              ///< Directory the entry lives in
    int channelId = 0;         ///< Channel owning the repository
    bool isDirectory = false;  ///< True if this entry is a directory
    qint64 size = 0;           ///< Size in bytes (0 for directories)
    QDateTime modified;        ///< Last modification timestamp
};

#endif // QUERYFILEENTRY_H
