#pragma once

#include <QString>
#include <QStringList>
#include <QVector>

#include "sscope/instance_key.hpp"

namespace sscope {

struct SeedEntry {
    InstanceKey key;
    QString username;
    QString password;
    int lineNumber = 0;
};

// Values substituted for blank username, password and port cells.
struct SeedDefaults {
    QString username;
    QString password;
    int port = kDefaultManagementPort;
};

struct SeedListResult {
    QVector<SeedEntry> seeds;
    QStringList errors;
    QString path;

    [[nodiscard]] bool success() const { return errors.isEmpty(); }
};

// Reader for the address,port,username,password seed CSV. Any error rejects
// the whole list; entries are only returned for a clean file.
class SeedList {
public:
    static SeedListResult parse(const QString& text, const SeedDefaults& defaults);
    static SeedListResult loadFromFile(const QString& filePath, const SeedDefaults& defaults);

    // Quotes a CSV cell when it holds a comma, a quote or a line break.
    static QString quoteField(const QString& value);
};

}  // namespace sscope
