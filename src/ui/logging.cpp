#include "ui/logging.hpp"

#include <QDir>
#include <QFileInfo>
#include <QMutex>
#include <QStandardPaths>
#include <QtGlobal>

#include <algorithm>
#include <cstdio>
#include <memory>

Q_LOGGING_CATEGORY(sketchsyncAppLog, "sketchsync.app")

namespace sketchsync::ui {
namespace {

constexpr int kActorTagLength = 8;

const char* level_tag(QtMsgType type) {
    switch (type) {
        case QtDebugMsg: return "D";
        case QtInfoMsg: return "I";
        case QtWarningMsg: return "W";
        case QtCriticalMsg: return "C";
        case QtFatalMsg: return "F";
    }
    return "?";
}

QString backup_path(const QString& path, int index) {
    return path + QLatin1Char('.') + QString::number(index);
}

struct HandlerState {
    QMutex mu;
    std::unique_ptr<LogFile> file;
    QString actor;
    bool echo_to_stderr = true;
};

HandlerState& handler_state() {
    static HandlerState s;
    return s;
}

void message_handler(QtMsgType type, const QMessageLogContext& ctx, const QString& msg) {
    auto& s = handler_state();
    QMutexLocker lock(&s.mu);

    const auto bytes = format_log_line(QDateTime::currentDateTimeUtc(), type, ctx.category, s.actor, msg)
                           .toUtf8();
    const bool written = s.file && s.file->write(bytes);
    if (s.echo_to_stderr || !written) {
        std::fputs(bytes.constData(), stderr);
    }
}

} // namespace

LogFile::LogFile(QString path, qint64 max_bytes, int max_backups)
    : path_(std::move(path))
    , max_bytes_(max_bytes)
    , max_backups_(std::max(0, max_backups))
{
}

bool LogFile::write(const QByteArray& line) {
    if (!file_.isOpen() && !open()) {
        return false;
    }
    if (max_bytes_ > 0 && file_.size() > 0 && file_.size() + line.size() > max_bytes_) {
        rotate();
        if (!open()) {
            return false;
        }
    }
    if (file_.write(line) != line.size()) {
        return false;
    }
    return file_.flush();
}

bool LogFile::open() {
    if (unavailable_ || path_.isEmpty()) {
        return false;
    }
    if (!QDir(QFileInfo(path_).absolutePath()).mkpath(QStringLiteral("."))) {
        unavailable_ = true;
        std::fprintf(stderr, "sketchsync: cannot create log directory for %s\n", qPrintable(path_));
        return false;
    }
    file_.setFileName(path_);
    if (!file_.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
        unavailable_ = true;
        std::fprintf(stderr, "sketchsync: cannot open log file %s\n", qPrintable(path_));
        return false;
    }
    return true;
}

void LogFile::rotate() {
    file_.close();
    if (max_backups_ == 0) {
        QFile::remove(path_);
        return;
    }
    QFile::remove(backup_path(path_, max_backups_));
    for (int i = max_backups_ - 1; i >= 1; --i) {
        const auto from = backup_path(path_, i);
        if (QFile::exists(from) && !QFile::rename(from, backup_path(path_, i + 1))) {
            QFile::remove(from);
        }
    }
    // The cap holds even when the backup cannot be kept.
    if (!QFile::rename(path_, backup_path(path_, 1))) {
        QFile::remove(path_);
    }
}

QString format_log_line(const QDateTime& when,
                        QtMsgType type,
                        const char* category,
                        const QString& actor,
                        const QString& message) {
    const auto tag = actor.isEmpty() ? QStringLiteral("-") : actor.left(kActorTagLength);
    const auto cat = category ? QString::fromLatin1(category) : QStringLiteral("default");
    return when.toUTC().toString(Qt::ISODateWithMs) + QLatin1Char(' ')
         + QLatin1String(level_tag(type)) + QLatin1Char(' ')
         + cat + QLatin1Char(' ')
         + tag + QLatin1Char(' ')
         + message + QLatin1Char('\n');
}

void install_file_logging(const LogOptions& options) {
    const auto path = options.path.isEmpty() ? default_log_file_path() : options.path;
    {
        auto& s = handler_state();
        QMutexLocker lock(&s.mu);
        s.file = path.isEmpty() ? nullptr
                                : std::make_unique<LogFile>(path, options.max_bytes, options.max_backups);
        s.echo_to_stderr = options.echo_to_stderr;
    }
    qInstallMessageHandler(message_handler);
}

void set_log_context(const QString& actor, const QUrl& endpoint) {
    {
        auto& s = handler_state();
        QMutexLocker lock(&s.mu);
        s.actor = actor;
    }
    qCInfo(sketchsyncAppLog).noquote() << "session started for actor" << actor
                                       << "endpoint" << endpoint.toString();
}

QString default_log_file_path() {
    const auto base = QStandardPaths::writableLocation(QStandardPaths::AppLocalDataLocation);
    if (base.isEmpty()) {
        return QString{};
    }
    return QDir(base).filePath(QStringLiteral("logs/sketchsync.log"));
}

void set_sync_debug_logging(bool enabled) {
    QLoggingCategory::setFilterRules(enabled
        ? QStringLiteral("sketchsync.*.debug=true\n")
        : QStringLiteral("sketchsync.*.debug=false\n"));
}

} // namespace sketchsync::ui
