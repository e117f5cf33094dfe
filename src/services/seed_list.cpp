#include "sscope/seed_list.hpp"

#include <QFile>
#include <QMap>

#include "sscope/telemetry.hpp"

namespace sscope {

namespace {

struct CsvRecord {
    int lineNumber = 0;
    QStringList fields;
    bool quoted = false;
};

// Splits CSV text into records. Quoted fields may span lines; comment lines
// are dropped before field splitting.
QVector<CsvRecord> splitRecords(const QString& text, QStringList* errors) {
    QVector<CsvRecord> records;
    CsvRecord current;
    QString field;
    bool inQuotes = false;
    bool atRecordStart = true;
    int line = 1;
    current.lineNumber = line;

    const auto finishRecord = [&]() {
        current.fields.append(field);
        field.clear();
        const bool blank = !current.quoted && current.fields.size() == 1 && current.fields.first().trimmed().isEmpty();
        if (!blank) {
            records.append(current);
        }
        current = CsvRecord{};
        atRecordStart = true;
    };

    for (int i = 0; i < text.size(); ++i) {
        const QChar ch = text.at(i);
        if (inQuotes) {
            if (ch == '"') {
                if (i + 1 < text.size() && text.at(i + 1) == '"') {
                    field.append('"');
                    ++i;
                } else {
                    inQuotes = false;
                }
            } else {
                if (ch == '\n') {
                    ++line;
                }
                field.append(ch);
            }
            continue;
        }

        if (atRecordStart) {
            current.lineNumber = line;
            atRecordStart = false;
            if (ch == '#') {
                while (i < text.size() && text.at(i) != '\n') {
                    ++i;
                }
                ++line;
                atRecordStart = true;
                continue;
            }
        }

        if (ch == '"' && field.trimmed().isEmpty()) {
            field.clear();
            inQuotes = true;
            current.quoted = true;
        } else if (ch == ',') {
            current.fields.append(field);
            field.clear();
        } else if (ch == '\r') {
            continue;
        } else if (ch == '\n') {
            finishRecord();
            ++line;
        } else {
            field.append(ch);
        }
    }

    if (inQuotes) {
        errors->append(QString("line %1: unterminated quoted field").arg(current.lineNumber));
        return records;
    }
    if (!atRecordStart) {
        finishRecord();
    }
    return records;
}

QString stripBrackets(const QString& address) {
    if (address.startsWith('[') && address.endsWith(']')) {
        return address.mid(1, address.size() - 2);
    }
    return address;
}

}  // namespace

QString SeedList::quoteField(const QString& value) {
    if (!value.contains(',') && !value.contains('"') && !value.contains('\n') && !value.contains('\r')) {
        return value;
    }
    QString escaped = value;
    escaped.replace("\"", "\"\"");
    return QString("\"%1\"").arg(escaped);
}

SeedListResult SeedList::parse(const QString& text, const SeedDefaults& defaults) {
    SeedListResult result;
    const QVector<CsvRecord> records = splitRecords(text, &result.errors);
    if (!result.errors.isEmpty()) {
        return result;
    }
    if (records.isEmpty()) {
        result.errors.append("Seed list contains no header and no instances.");
        return result;
    }

    static const QStringList required = {"address", "port", "username", "password"};
    const CsvRecord& header = records.first();
    QMap<QString, int> columns;
    for (int i = 0; i < header.fields.size(); ++i) {
        columns.insert(header.fields.at(i).trimmed().toLower(), i);
    }
    QStringList missing;
    for (const QString& name : required) {
        if (!columns.contains(name)) {
            missing.append(name);
        }
    }
    if (!missing.isEmpty()) {
        result.errors.append(QString("line %1: header is missing column(s) %2")
                                 .arg(header.lineNumber)
                                 .arg(missing.join(", ")));
        return result;
    }

    for (int r = 1; r < records.size(); ++r) {
        const CsvRecord& record = records.at(r);
        if (record.fields.size() != header.fields.size()) {
            result.errors.append(QString("line %1: expected %2 fields, found %3")
                                     .arg(record.lineNumber)
                                     .arg(header.fields.size())
                                     .arg(record.fields.size()));
            continue;
        }

        SeedEntry entry;
        entry.lineNumber = record.lineNumber;
        const QString address = stripBrackets(record.fields.at(columns.value("address")).trimmed());
        if (address.isEmpty()) {
            result.errors.append(QString("line %1: address is empty").arg(record.lineNumber));
            continue;
        }

        int port = defaults.port;
        const QString portText = record.fields.at(columns.value("port")).trimmed();
        if (!portText.isEmpty()) {
            bool ok = false;
            port = portText.toInt(&ok);
            if (!ok || port < 1 || port > 65535) {
                result.errors.append(
                    QString("line %1: port '%2' is not between 1 and 65535").arg(record.lineNumber).arg(portText));
                continue;
            }
        }
        entry.key = InstanceKey(address, port);

        entry.username = record.fields.at(columns.value("username")).trimmed();
        if (entry.username.isEmpty()) {
            entry.username = defaults.username;
        }
        entry.password = record.fields.at(columns.value("password"));
        if (entry.password.isEmpty()) {
            entry.password = defaults.password;
        }
        result.seeds.append(entry);
    }

    if (result.errors.isEmpty() && result.seeds.isEmpty()) {
        result.errors.append("Seed list contains no instances.");
    }
    if (!result.errors.isEmpty()) {
        result.seeds.clear();
    }
    return result;
}

SeedListResult SeedList::loadFromFile(const QString& filePath, const SeedDefaults& defaults) {
    QFile file(filePath);
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        SeedListResult result;
        result.path = filePath;
        result.errors.append(QString("Failed to open seed list: %1").arg(file.errorString()));
        return result;
    }
    SeedListResult result = parse(QString::fromUtf8(file.readAll()), defaults);
    result.path = filePath;
    Telemetry::instance().recordEvent(
        result.success() ? "seed_list_loaded" : "seed_list_rejected",
        {
            {"path", filePath},
            {"seeds", result.seeds.size()},
            {"errors", result.errors.size()},
        });
    return result;
}

}  // namespace sscope
