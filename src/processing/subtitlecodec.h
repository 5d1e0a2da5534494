#ifndef SUBTITLECODEC_H
#define SUBTITLECODEC_H

#include "appsettings.h"
#include "subtitledocument.h"
#include "task.h"

#include <QList>
#include <QObject>
#include <QString>

/**
 * @brief Reads and writes subtitle files.
 *
 * Load: srt, vtt, ass, json. Save: srt, ass, json.
 * A cue with two text lines is read as original (first) + translation (second).
 */
class SubtitleCodec : public QObject
{
    Q_OBJECT
public:
    explicit SubtitleCodec(QObject* parent = nullptr);

    bool load(const QString& path, QList<SubtitleEntry>& entries);
    bool loadInto(const QString& path, SubtitleDocument* document);

    /**
     * @brief Write entries to disk.
     * @param style Optional ASS style block ("Format:" and "Style:" lines); ignored for other formats
     */
    bool save(const QList<SubtitleEntry>& entries, const QString& path, OutputSubtitleFormat format,
              SubtitleLayout layout, const QString& style = QString());

    QString lastError() const;

    static bool isSupportedSubtitleFile(const QString& path);
    static QStringList supportedSubtitleSuffixes();

signals:
    void logMessage(const QString&, LogCategory);

private:
    bool parseSrt(const QString& content, QList<SubtitleEntry>& entries);
    bool parseAss(const QString& content, QList<SubtitleEntry>& entries);
    bool parseJson(const QByteArray& content, QList<SubtitleEntry>& entries);

    static QString toSrt(const QList<SubtitleEntry>& entries, SubtitleLayout layout);
    static QString toAss(const QList<SubtitleEntry>& entries, SubtitleLayout layout, const QString& style);
    static QByteArray toJson(const QList<SubtitleEntry>& entries);

    static QStringList layoutLines(const SubtitleEntry& entry, SubtitleLayout layout);
    static void assignLines(const QStringList& lines, SubtitleEntry& entry);
    static bool parseCueTime(const QString& text, qint64* ms);
    static bool parseAssTime(const QString& text, qint64* ms);
    static QString formatSrtTime(qint64 ms);
    static QString formatAssTime(qint64 ms);
    static QString stripAssTags(const QString& text);

    bool fail(const QString& message);

    QString m_lastError;
};

#endif // SUBTITLECODEC_H
