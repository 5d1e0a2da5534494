#include "subtitlecodec.h"

#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonObject>
#include <QRegularExpression>
#include <QSaveFile>
#include <QTextStream>

#include <algorithm>

namespace
{
const char* const kDefaultAssStyle =
    "Format: Name, Fontname, Fontsize, PrimaryColour, SecondaryColour, OutlineColour, BackColour, Bold, Italic, "
    "Underline, StrikeOut, ScaleX, ScaleY, Spacing, Angle, BorderStyle, Outline, Shadow, Alignment, MarginL, "
    "MarginR, MarginV, Encoding\n"
    "Style: Default,Arial,48,&H00FFFFFF,&H000000FF,&H00000000,&H80000000,0,0,0,0,100,100,0,0,1,2,1,2,20,20,30,1";

// Stands in for an empty line of a two-line cue so the other line keeps its position
const QChar kEmptyLineMarker(0x00A0);
} // namespace

SubtitleCodec::SubtitleCodec(QObject* parent) : QObject(parent)
{
}

QStringList SubtitleCodec::supportedSubtitleSuffixes()
{
    return {"srt", "ass", "vtt", "json"};
}

bool SubtitleCodec::isSupportedSubtitleFile(const QString& path)
{
    return supportedSubtitleSuffixes().contains(QFileInfo(path).suffix().toLower());
}

bool SubtitleCodec::load(const QString& path, QList<SubtitleEntry>& entries)
{
    m_lastError.clear();
    entries.clear();

    QFile file(path);
    if (!file.open(QIODevice::ReadOnly))
        return fail("Cannot open subtitle file " + path + ": " + file.errorString());

    const QByteArray raw = file.readAll();
    file.close();

    const QString suffix = QFileInfo(path).suffix().toLower();
    bool ok = false;
    if (suffix == "json")
    {
        ok = parseJson(raw, entries);
    }
    else
    {
        QString content = QString::fromUtf8(raw);
        if (content.startsWith(QChar(0xFEFF)))
            content.remove(0, 1);

        if (suffix == "srt" || suffix == "vtt")
            ok = parseSrt(content, entries);
        else if (suffix == "ass" || suffix == "ssa")
            ok = parseAss(content, entries);
        else
            return fail("Unsupported subtitle format: " + suffix);
    }

    if (ok)
        emit logMessage(QString("Loaded %1 subtitle entries from %2").arg(entries.size()).arg(QFileInfo(path).fileName()),
                        LogCategory::APP);
    return ok;
}

bool SubtitleCodec::loadInto(const QString& path, SubtitleDocument* document)
{
    QList<SubtitleEntry> entries;
    if (!load(path, entries))
        return false;
    document->replaceAll(entries);
    return true;
}

bool SubtitleCodec::save(const QList<SubtitleEntry>& entries, const QString& path, OutputSubtitleFormat format,
                         SubtitleLayout layout, const QString& style)
{
    m_lastError.clear();

    QByteArray data;
    switch (format)
    {
    case OutputSubtitleFormat::Srt:
        data = toSrt(entries, layout).toUtf8();
        break;
    case OutputSubtitleFormat::Ass:
        data = toAss(entries, layout, style).toUtf8();
        break;
    case OutputSubtitleFormat::Json:
        data = toJson(entries);
        break;
    }

    QSaveFile file(path);
    if (!file.open(QIODevice::WriteOnly))
        return fail("Cannot write subtitle file " + path + ": " + file.errorString());
    file.write(data);
    if (!file.commit())
        return fail("Cannot write subtitle file " + path + ": " + file.errorString());

    emit logMessage("Subtitles saved to " + path, LogCategory::APP);
    return true;
}

QString SubtitleCodec::lastError() const
{
    return m_lastError;
}

bool SubtitleCodec::parseSrt(const QString& content, QList<SubtitleEntry>& entries)
{
    // Handles SRT and WebVTT: cue blocks separated by blank lines, "start --> end" timing line.
    static const QRegularExpression timingRegex(R"(^\s*(\S+)\s*-->\s*(\S+))");

    QString normalized = content;
    normalized.replace("\r\n", "\n");
    normalized.replace('\r', '\n');
    const QStringList blocks = normalized.split(QRegularExpression("\n\\s*\n"), Qt::SkipEmptyParts);

    for (const QString& block : blocks)
    {
        QStringList lines = block.split('\n');
        int timingIndex = -1;
        for (int i = 0; i < lines.size() && i < 3; ++i)
        {
            if (lines[i].contains("-->"))
            {
                timingIndex = i;
                break;
            }
        }
        if (timingIndex < 0)
            continue; // WEBVTT header, NOTE blocks, index-only garbage

        const QRegularExpressionMatch match = timingRegex.match(lines[timingIndex]);
        SubtitleEntry entry;
        if (!match.hasMatch() || !parseCueTime(match.captured(1), &entry.startTime) ||
            !parseCueTime(match.captured(2), &entry.endTime))
        {
            return fail("Malformed cue timing: " + lines[timingIndex].trimmed());
        }

        assignLines(lines.mid(timingIndex + 1), entry);
        entries.append(entry);
    }
    return true;
}

bool SubtitleCodec::parseAss(const QString& content, QList<SubtitleEntry>& entries)
{
    bool inEvents = false;
    int startIndex = 1;
    int endIndex = 2;
    int textIndex = 9;

    const QStringList lines = QString(content).replace("\r\n", "\n").split('\n');
    for (const QString& line : lines)
    {
        const QString trimmed = line.trimmed();
        if (trimmed.startsWith('['))
        {
            inEvents = trimmed.compare("[Events]", Qt::CaseInsensitive) == 0;
            continue;
        }
        if (!inEvents)
            continue;

        if (trimmed.startsWith("Format:"))
        {
            const QStringList fields = trimmed.mid(7).split(',');
            for (int i = 0; i < fields.size(); ++i)
            {
                const QString name = fields[i].trimmed();
                if (name == "Start")
                    startIndex = i;
                else if (name == "End")
                    endIndex = i;
                else if (name == "Text")
                    textIndex = i;
            }
            continue;
        }
        if (!trimmed.startsWith("Dialogue:"))
            continue;

        // Text is normally the last field and may itself contain commas
        const QStringList parts = trimmed.mid(9).split(',');
        const int lastIndex = qMax(textIndex, qMax(startIndex, endIndex));
        if (parts.size() <= lastIndex)
            continue;
        const QString text = textIndex == lastIndex ? parts.mid(textIndex).join(',') : parts[textIndex];

        SubtitleEntry entry;
        if (!parseAssTime(parts[startIndex].trimmed(), &entry.startTime) ||
            !parseAssTime(parts[endIndex].trimmed(), &entry.endTime))
        {
            return fail("Malformed dialogue timing: " + trimmed);
        }
        assignLines(stripAssTags(text).split("\\N"), entry);
        entries.append(entry);
    }
    return true;
}

bool SubtitleCodec::parseJson(const QByteArray& content, QList<SubtitleEntry>& entries)
{
    QJsonParseError error;
    const QJsonDocument doc = QJsonDocument::fromJson(content, &error);
    if (doc.isNull() || !doc.isObject())
        return fail("Invalid subtitle JSON: " + error.errorString());

    const QJsonObject root = doc.object();
    QList<int> keys;
    for (const QString& key : root.keys())
    {
        bool ok = false;
        const int number = key.toInt(&ok);
        if (!ok)
            return fail("Invalid subtitle JSON key: " + key);
        keys.append(number);
    }
    // Object keys come back in string order ("10" before "2")
    std::sort(keys.begin(), keys.end());

    for (int key : keys)
    {
        const QJsonObject item = root.value(QString::number(key)).toObject();
        SubtitleEntry entry;
        entry.startTime = static_cast<qint64>(item.value("start_time").toDouble());
        entry.endTime = static_cast<qint64>(item.value("end_time").toDouble());
        entry.originalText = item.value("original_subtitle").toString();
        entry.translatedText = item.value("translated_subtitle").toString();
        entries.append(entry);
    }
    return true;
}

QString SubtitleCodec::toSrt(const QList<SubtitleEntry>& entries, SubtitleLayout layout)
{
    QString out;
    QTextStream stream(&out);
    int index = 1;
    for (const SubtitleEntry& entry : entries)
    {
        stream << index++ << "\n";
        stream << formatSrtTime(entry.startTime) << " --> " << formatSrtTime(entry.endTime) << "\n";
        stream << layoutLines(entry, layout).join('\n') << "\n\n";
    }
    stream.flush();
    return out;
}

QString SubtitleCodec::toAss(const QList<SubtitleEntry>& entries, SubtitleLayout layout, const QString& style)
{
    QString out;
    QTextStream stream(&out);
    stream << "[Script Info]\n"
           << "ScriptType: v4.00+\n"
           << "PlayResX: 1920\n"
           << "PlayResY: 1080\n"
           << "WrapStyle: 0\n\n";
    stream << "[V4+ Styles]\n" << (style.trimmed().isEmpty() ? QString(kDefaultAssStyle) : style.trimmed()) << "\n\n";
    stream << "[Events]\n"
           << "Format: Layer, Start, End, Style, Name, MarginL, MarginR, MarginV, Effect, Text\n";
    for (const SubtitleEntry& entry : entries)
    {
        stream << "Dialogue: 0," << formatAssTime(entry.startTime) << "," << formatAssTime(entry.endTime)
               << ",Default,,0,0,0,," << layoutLines(entry, layout).join("\\N") << "\n";
    }
    stream.flush();
    return out;
}

QByteArray SubtitleCodec::toJson(const QList<SubtitleEntry>& entries)
{
    QJsonObject root;
    int key = 1;
    for (const SubtitleEntry& entry : entries)
    {
        QJsonObject item;
        item.insert("start_time", static_cast<double>(entry.startTime));
        item.insert("end_time", static_cast<double>(entry.endTime));
        item.insert("original_subtitle", entry.originalText);
        item.insert("translated_subtitle", entry.translatedText);
        root.insert(QString::number(key++), item);
    }
    return QJsonDocument(root).toJson(QJsonDocument::Indented);
}

QStringList SubtitleCodec::layoutLines(const SubtitleEntry& entry, SubtitleLayout layout)
{
    const QString original = entry.originalText;
    const QString translated = entry.translatedText;
    QStringList lines;
    switch (layout)
    {
    case SubtitleLayout::TranslationOnTop:
        if (!original.isEmpty() || !translated.isEmpty())
            lines << (translated.isEmpty() ? QString(kEmptyLineMarker) : translated)
                  << (original.isEmpty() ? QString(kEmptyLineMarker) : original);
        break;
    case SubtitleLayout::OriginalOnTop:
        if (!original.isEmpty() || !translated.isEmpty())
            lines << (original.isEmpty() ? QString(kEmptyLineMarker) : original)
                  << (translated.isEmpty() ? QString(kEmptyLineMarker) : translated);
        break;
    case SubtitleLayout::OriginalOnly:
        lines << original;
        break;
    case SubtitleLayout::TranslationOnly:
        lines << (translated.isEmpty() ? original : translated);
        break;
    }
    // An empty line would end the SRT cue early
    lines.removeAll(QString());
    if (lines.isEmpty())
        lines << QString(" ");
    return lines;
}

void SubtitleCodec::assignLines(const QStringList& lines, SubtitleEntry& entry)
{
    QStringList textLines;
    for (const QString& line : lines)
    {
        const QString trimmed = line.trimmed();
        if (!trimmed.isEmpty())
            textLines.append(trimmed);
        else if (line.contains(kEmptyLineMarker))
            textLines.append(QString());
    }
    if (textLines.isEmpty())
        return;
    entry.originalText = textLines.takeFirst();
    entry.translatedText = textLines.join(' ');
}

bool SubtitleCodec::parseCueTime(const QString& text, qint64* ms)
{
    // hh:mm:ss,zzz (SRT), hh:mm:ss.zzz or mm:ss.zzz (VTT)
    static const QRegularExpression regex(R"(^(?:(\d+):)?(\d{1,2}):(\d{1,2})[,.](\d{1,3})$)");
    const QRegularExpressionMatch match = regex.match(text.trimmed());
    if (!match.hasMatch())
        return false;

    const qint64 hours = match.captured(1).isEmpty() ? 0 : match.captured(1).toLongLong();
    const qint64 minutes = match.captured(2).toLongLong();
    const qint64 seconds = match.captured(3).toLongLong();
    QString fraction = match.captured(4);
    while (fraction.size() < 3)
        fraction.append('0');
    *ms = ((hours * 60 + minutes) * 60 + seconds) * 1000 + fraction.toLongLong();
    return true;
}

bool SubtitleCodec::parseAssTime(const QString& text, qint64* ms)
{
    static const QRegularExpression regex(R"(^(\d+):(\d{1,2}):(\d{1,2})\.(\d{1,2})$)");
    const QRegularExpressionMatch match = regex.match(text);
    if (!match.hasMatch())
        return false;

    QString centis = match.captured(4);
    if (centis.size() == 1)
        centis.append('0');
    *ms = ((match.captured(1).toLongLong() * 60 + match.captured(2).toLongLong()) * 60 +
           match.captured(3).toLongLong()) * 1000 +
          centis.toLongLong() * 10;
    return true;
}

QString SubtitleCodec::formatSrtTime(qint64 ms)
{
    return QString("%1:%2:%3,%4")
        .arg(ms / 3600000, 2, 10, QChar('0'))
        .arg((ms / 60000) % 60, 2, 10, QChar('0'))
        .arg((ms / 1000) % 60, 2, 10, QChar('0'))
        .arg(ms % 1000, 3, 10, QChar('0'));
}

QString SubtitleCodec::formatAssTime(qint64 ms)
{
    return QString("%1:%2:%3.%4")
        .arg(ms / 3600000)
        .arg((ms / 60000) % 60, 2, 10, QChar('0'))
        .arg((ms / 1000) % 60, 2, 10, QChar('0'))
        .arg((ms % 1000) / 10, 2, 10, QChar('0'));
}

QString SubtitleCodec::stripAssTags(const QString& text)
{
    static const QRegularExpression tagRegex(R"(\{[^}]*\})");
    QString result = text;
    result.remove(tagRegex);
    result.replace("\\n", "\\N");
    result.replace("\\h", " ");
    return result;
}

bool SubtitleCodec::fail(const QString& message)
{
    m_lastError = message;
    emit logMessage("Error: " + message, LogCategory::APP);
    return false;
}
