#ifndef SUBTITLEDOCUMENT_H
#define SUBTITLEDOCUMENT_H

#include "coreerror.h"

#include <QList>
#include <QMap>
#include <QObject>
#include <QPair>
#include <QString>

struct SubtitleEntry
{
    qint64 startTime = 0; // ms
    qint64 endTime = 0;   // ms
    QString originalText;
    QString translatedText;

    bool operator==(const SubtitleEntry& other) const
    {
        return startTime == other.startTime && endTime == other.endTime && originalText == other.originalText &&
               translatedText == other.translatedText;
    }
    bool operator!=(const SubtitleEntry& other) const
    {
        return !(*this == other);
    }
};

// Sequence key -> entry. Keys are dense 1..N after every structural change.
using SubtitleEntries = QMap<int, SubtitleEntry>;

enum class SubtitleColumn
{
    StartTime,
    EndTime,
    OriginalText,
    TranslatedText
};

/**
 * @brief Editable, ordered collection of timed subtitle entries.
 *
 * Iteration order is presentation order. Point edits keep keys; merge and bulk
 * replacement re-issue them as 1..N. The document lives on the control thread
 * and is not safe for concurrent mutation.
 */
class SubtitleDocument : public QObject
{
    Q_OBJECT
    Q_DISABLE_COPY_MOVE(SubtitleDocument)

public:
    explicit SubtitleDocument(QObject* parent = nullptr);

    const SubtitleEntries& entries() const;
    QList<SubtitleEntry> entryList() const;
    int count() const;
    bool isEmpty() const;
    bool contains(int key) const;
    SubtitleEntry entry(int key) const;

    void replaceAll(const QList<SubtitleEntry>& entries);
    void replaceAll(const SubtitleEntries& entries);
    void clear();

    /**
     * @brief Merge the rows at the given 0-based positions into one entry.
     * @return true if the document changed
     *
     * Fewer than two valid rows is a no-op without a change event. The merged
     * entry spans from the first selected row's start to the last selected
     * row's end and joins both texts with a space, in document order. It takes
     * the position of the first selected row. For a non-contiguous selection the
     * unselected rows inside the span keep their relative order and follow the
     * merged entry.
     */
    bool mergeRows(const QList<int>& rows);

    /**
     * @brief Point edit of one cell. Keys are not re-issued.
     *
     * Time columns take "hh:mm:ss.zzz". An unparsable value or one that would
     * leave end <= start is rejected with MalformedTimestamp and the entry
     * stays unchanged.
     */
    CoreError setCell(int key, SubtitleColumn column, const QString& value);
    QString cell(int key, SubtitleColumn column) const;

    /**
     * @brief Apply a partial update from the optimizer.
     *
     * "original\ntranslated" replaces both texts, anything else only the
     * translation. Unknown keys are skipped.
     */
    void updateEntries(const QMap<int, QString>& updates);

    // Range to preview for a cue: stops 50 ms early when the cue is long enough.
    QPair<qint64, qint64> playbackRange(int key) const;

    static bool parseTimestamp(const QString& text, qint64* milliseconds);
    static QString formatTimestamp(qint64 milliseconds);

signals:
    void entriesChanged(const QList<int>& keys);
    void entriesReplaced();

private:
    static SubtitleEntries reindexed(const QList<SubtitleEntry>& entries);

    SubtitleEntries m_entries;
};

Q_DECLARE_METATYPE(SubtitleEntry)

#endif // SUBTITLEDOCUMENT_H
