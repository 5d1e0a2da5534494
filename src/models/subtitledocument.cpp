#include "subtitledocument.h"

#include <QRegularExpression>
#include <QSet>

#include <algorithm>

namespace
{
const qint64 kPreviewTailMs = 50;
} // namespace

SubtitleDocument::SubtitleDocument(QObject* parent) : QObject(parent)
{
}

const SubtitleEntries& SubtitleDocument::entries() const
{
    return m_entries;
}

QList<SubtitleEntry> SubtitleDocument::entryList() const
{
    return m_entries.values();
}

int SubtitleDocument::count() const
{
    return m_entries.size();
}

bool SubtitleDocument::isEmpty() const
{
    return m_entries.isEmpty();
}

bool SubtitleDocument::contains(int key) const
{
    return m_entries.contains(key);
}

SubtitleEntry SubtitleDocument::entry(int key) const
{
    return m_entries.value(key);
}

void SubtitleDocument::replaceAll(const QList<SubtitleEntry>& entries)
{
    m_entries = reindexed(entries);
    emit entriesReplaced();
}

void SubtitleDocument::replaceAll(const SubtitleEntries& entries)
{
    replaceAll(entries.values());
}

void SubtitleDocument::clear()
{
    if (m_entries.isEmpty())
        return;
    m_entries.clear();
    emit entriesReplaced();
}

bool SubtitleDocument::mergeRows(const QList<int>& rows)
{
    // Selection order is irrelevant, document order decides.
    QList<int> selected;
    for (int row : rows)
    {
        if (row >= 0 && row < m_entries.size() && !selected.contains(row))
            selected.append(row);
    }
    std::sort(selected.begin(), selected.end());

    if (selected.size() < 2)
        return false;

    const QList<SubtitleEntry> current = m_entries.values();
    const int firstRow = selected.first();
    const int lastRow = selected.last();

    SubtitleEntry merged;
    merged.startTime = current[firstRow].startTime;
    merged.endTime = current[lastRow].endTime;

    QStringList originals;
    QStringList translations;
    for (int row : selected)
    {
        originals.append(current[row].originalText);
        translations.append(current[row].translatedText);
    }
    merged.originalText = originals.join(' ');
    merged.translatedText = translations.join(' ');

    const QSet<int> selectedSet(selected.begin(), selected.end());
    QList<SubtitleEntry> result;
    result.reserve(current.size() - selected.size() + 1);
    for (int row = 0; row < current.size(); ++row)
    {
        if (row == firstRow)
        {
            result.append(merged);
            continue;
        }
        if (!selectedSet.contains(row))
            result.append(current[row]);
    }

    m_entries = reindexed(result);
    emit entriesReplaced();
    return true;
}

CoreError SubtitleDocument::setCell(int key, SubtitleColumn column, const QString& value)
{
    auto it = m_entries.find(key);
    if (it == m_entries.end())
        return CoreError::EntryNotFound;

    switch (column)
    {
    case SubtitleColumn::StartTime:
    case SubtitleColumn::EndTime:
    {
        qint64 ms = 0;
        if (!parseTimestamp(value, &ms))
            return CoreError::MalformedTimestamp;

        const qint64 start = column == SubtitleColumn::StartTime ? ms : it->startTime;
        const qint64 end = column == SubtitleColumn::EndTime ? ms : it->endTime;
        if (end <= start)
            return CoreError::MalformedTimestamp;

        it->startTime = start;
        it->endTime = end;
        break;
    }
    case SubtitleColumn::OriginalText:
        it->originalText = value;
        break;
    case SubtitleColumn::TranslatedText:
        it->translatedText = value;
        break;
    }

    emit entriesChanged({key});
    return CoreError::None;
}

QString SubtitleDocument::cell(int key, SubtitleColumn column) const
{
    const auto it = m_entries.constFind(key);
    if (it == m_entries.constEnd())
        return QString();

    switch (column)
    {
    case SubtitleColumn::StartTime:
        return formatTimestamp(it->startTime);
    case SubtitleColumn::EndTime:
        return formatTimestamp(it->endTime);
    case SubtitleColumn::OriginalText:
        return it->originalText;
    case SubtitleColumn::TranslatedText:
        return it->translatedText;
    }
    return QString();
}

void SubtitleDocument::updateEntries(const QMap<int, QString>& updates)
{
    QList<int> changed;
    for (auto it = updates.constBegin(); it != updates.constEnd(); ++it)
    {
        auto entryIt = m_entries.find(it.key());
        if (entryIt == m_entries.end())
            continue;

        const QString& value = it.value();
        const int newline = value.indexOf('\n');
        if (newline >= 0)
        {
            entryIt->originalText = value.left(newline);
            entryIt->translatedText = value.mid(newline + 1);
        }
        else
        {
            entryIt->translatedText = value;
        }
        changed.append(it.key());
    }

    if (!changed.isEmpty())
        emit entriesChanged(changed);
}

QPair<qint64, qint64> SubtitleDocument::playbackRange(int key) const
{
    const SubtitleEntry e = m_entries.value(key);
    const qint64 end = e.endTime - kPreviewTailMs > e.startTime ? e.endTime - kPreviewTailMs : e.endTime;
    return qMakePair(e.startTime, end);
}

// hh:mm:ss.zzz; hours are not limited to a day
bool SubtitleDocument::parseTimestamp(const QString& text, qint64* milliseconds)
{
    static const QRegularExpression re("^(\\d{2,}):(\\d{2}):(\\d{2})\\.(\\d{3})$");
    const QRegularExpressionMatch match = re.match(text.trimmed());
    if (!match.hasMatch())
        return false;

    bool ok = false;
    const qint64 hours = match.captured(1).toLongLong(&ok);
    if (!ok)
        return false;
    const int minutes = match.captured(2).toInt();
    const int seconds = match.captured(3).toInt();
    if (minutes >= 60 || seconds >= 60)
        return false;

    if (milliseconds)
        *milliseconds = ((hours * 60 + minutes) * 60 + seconds) * 1000 + match.captured(4).toInt();
    return true;
}

QString SubtitleDocument::formatTimestamp(qint64 milliseconds)
{
    const qint64 ms = qMax<qint64>(0, milliseconds);
    return QString("%1:%2:%3.%4")
        .arg(ms / 3600000, 2, 10, QChar('0'))
        .arg((ms / 60000) % 60, 2, 10, QChar('0'))
        .arg((ms / 1000) % 60, 2, 10, QChar('0'))
        .arg(ms % 1000, 3, 10, QChar('0'));
}

SubtitleEntries SubtitleDocument::reindexed(const QList<SubtitleEntry>& entries)
{
    SubtitleEntries result;
    int key = 1;
    for (const SubtitleEntry& e : entries)
        result.insert(key++, e);
    return result;
}
