#pragma once

#include <QByteArray>
#include <QDateTime>
#include <QFile>
#include <QLoggingCategory>
#include <QString>
#include <QUrl>

Q_DECLARE_LOGGING_CATEGORY(sketchsyncAppLog)

namespace sketchsync::ui {

struct LogOptions {
    QString path;                       // empty: default_log_file_path()
    qint64 max_bytes = 1024 * 1024;
    int max_backups = 3;
    bool echo_to_stderr = true;
};

/**
 * LogFile - Append-only log file with a size cap.
 *
 * When a write would push the file past max_bytes it is rotated: path.1
 * becomes path.2 and so on up to max_backups, the oldest is removed, and
 * the current file becomes path.1. A single line larger than the cap is
 * still written, to a fresh file.
 */
class LogFile {
public:
    LogFile(QString path, qint64 max_bytes, int max_backups);

    LogFile(const LogFile&) = delete;
    LogFile& operator=(const LogFile&) = delete;

    bool write(const QByteArray& line);

    [[nodiscard]] const QString& path() const { return path_; }
    [[nodiscard]] qint64 size() const { return file_.isOpen() ? file_.size() : 0; }

private:
    QString path_;
    qint64 max_bytes_;
    int max_backups_;
    QFile file_;
    bool unavailable_ = false;

    bool open();
    void rotate();
};

/**
 * One log line: UTC time, level letter, category, the first eight
 * characters of the local actor ("-" before it is known), message.
 */
[[nodiscard]] QString format_log_line(const QDateTime& when,
                                      QtMsgType type,
                                      const char* category,
                                      const QString& actor,
                                      const QString& message);

// Installs a Qt message handler writing to the rotating log file.
void install_file_logging(const LogOptions& options = {});

// Stamps subsequent lines with the actor and records the session start.
void set_log_context(const QString& actor, const QUrl& endpoint);

// Returns the default log file path (may be empty if unavailable).
QString default_log_file_path();

// Enables or silences debug output of the sketchsync.* categories.
void set_sync_debug_logging(bool enabled);

} // namespace sketchsync::ui
