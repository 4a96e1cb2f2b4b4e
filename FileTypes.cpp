// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include <QHash>
#include <QSet>
#include <QStringList>
#include "FileTypes.h"

namespace {
    struct TypeRow {
        const char* extensions; // space separated
        const char* description;
    };

    constexpr TypeRow kTypeTable[] = {
        {"doc docm docx", "Word Document"},
        {"dot dotx dotm", "Word Template"},
        {"xls xlsx xlsm xlsb", "Excel Spreadsheet"},
        {"xlt xltx xltm xlw", "Excel Template"},
        {"ppt pptx pptm", "PowerPoint Presentation"},
        {"pot potx potm", "PowerPoint Template"},
        {"odt", "OpenDocument Text"},
        {"ods", "OpenDocument Spreadsheet"},
        {"odp", "OpenDocument Presentation"},
        {"pdf", "PDF Document"},
        {"fdf xfdf pdx xdp", "PDF Data File"},
        {"jpg jpeg", "JPEG Image"},
        {"png", "PNG Image"},
        {"gif", "GIF Image"},
        {"bmp", "Bitmap Image"},
        {"svg", "SVG Vector Image"},
        {"webp", "WebP Image"},
        {"tiff tif", "TIFF Image"},
        {"ico", "Icon File"},
        {"psd psb pdd", "Photoshop Document"},
        {"ai ait art aip", "Illustrator Document"},
        {"indd indl indt indb", "InDesign Document"},
        {"mp4 mpeg4", "MP4 Video"},
        {"webm", "WebM Video"},
        {"avi", "AVI Video"},
        {"mov qt", "QuickTime Video"},
        {"mkv", "Matroska Video"},
        {"flv", "Flash Video"},
        {"wmv", "Windows Media Video"},
        {"mpeg mpg", "MPEG Video"},
        {"m4v", "M4V Video"},
        {"3gp", "3GP Video"},
        {"ogv", "OGG Video"},
        {"mp3", "MP3 Audio"},
        {"wav", "WAV Audio"},
        {"ogg", "OGG Audio"},
        {"flac", "FLAC Audio"},
        {"aac", "AAC Audio"},
        {"m4a", "M4A Audio"},
        {"wma", "Windows Media Audio"},
        {"aiff", "AIFF Audio"},
        {"opus", "Opus Audio"},
        {"mid midi", "MIDI Audio"},
        {"html htm xhtml", "HTML Document"},
        {"css", "CSS Stylesheet"},
        {"scss sass", "Sass Stylesheet"},
        {"less", "Less Stylesheet"},
        {"js", "JavaScript File"},
        {"jsx", "React JSX File"},
        {"ts", "TypeScript File"},
        {"tsx", "React TSX File"},
        {"json", "JSON File"},
        {"jsonc json5", "JSON with Comments"},
        {"php", "PHP File"},
        {"asp aspx", "ASP.NET File"},
        {"jsp", "JSP File"},
        {"py", "Python File"},
        {"java", "Java File"},
        {"class", "Java Class File"},
        {"jar", "Java Archive"},
        {"c", "C File"},
        {"cpp cc cxx", "C++ File"},
        {"h hpp", "C/C++ Header"},
        {"cs", "C# File"},
        {"go", "Go File"},
        {"rs", "Rust File"},
        {"rb", "Ruby File"},
        {"swift", "Swift File"},
        {"kt kts", "Kotlin File"},
        {"zip", "ZIP Archive"},
        {"rar", "RAR Archive"},
        {"7z", "7-Zip Archive"},
        {"tar", "TAR Archive"},
        {"gz gzip", "GZip Archive"},
        {"bz2 bzip2", "BZip2 Archive"},
        {"xz", "XZ Archive"},
        {"tgz tar.gz", "Compressed TAR"},
        {"zst", "Zstandard Archive"},
        {"txt", "Text File"},
        {"md markdown", "Markdown Document"},
        {"rtf", "Rich Text Format"},
        {"csv", "CSV Spreadsheet"},
        {"xml", "XML Document"},
        {"yaml yml", "YAML File"},
        {"toml", "TOML File"},
        {"ini cfg conf", "Configuration File"},
        {"log", "Log File"},
        {"exe com", "Windows Executable"},
        {"msi", "Windows Installer"},
        {"app", "macOS Application"},
        {"dmg", "macOS Disk Image"},
        {"pkg", "macOS Package"},
        {"deb", "Debian Package"},
        {"rpm", "RPM Package"},
        {"appimage", "AppImage"},
        {"apk", "Android Package"},
        {"sh bash", "Shell Script"},
        {"bat cmd", "Batch File"},
        {"ps1", "PowerShell Script"},
        {"sql", "SQL Script"},
        {"sqlite db", "SQLite Database"},
        {"mdb accdb", "Access Database"},
        {"ttf", "TrueType Font"},
        {"otf", "OpenType Font"},
        {"woff", "Web Font"},
        {"woff2", "Web Font 2.0"},
        {"eot", "Embedded Font"},
        {"obj", "3D Object"},
        {"fbx", "FBX 3D Model"},
        {"glb gltf", "glTF 3D Model"},
        {"dll", "Windows Library"},
        {"so", "Shared Object"},
        {"o", "Object File"},
        {"lib", "C/C++ Library File"},
        {"dylib", "macOS Library"},
        {"iso", "Disk Image"},
        {"dat bin", "Binary Data"},
        {"properties prop", "Properties File"},
    };

    // extension -> description
    const QHash<QString, QString>& typeIndex() {
        static const QHash<QString, QString> index = [] {
            QHash<QString, QString> out;
            for (const TypeRow& row : kTypeTable) {
                const QString description = QString::fromLatin1(row.description);
                const QStringList exts = QString::fromLatin1(row.extensions).split(u' ', Qt::SkipEmptyParts);
                for (const QString& ext : exts) out.insert(ext, description);
            }
            return out;
        }();
        return index;
    }

    const QSet<QString>& textExtensions() {
        static const QSet<QString> exts = {
            "txt", "md", "json", "xml", "csv", "yaml", "yml", "toml", "properties", "ini", "cfg",
            "conf", "log", "sh", "bash", "bat", "cmd", "ps1", "sql", "html", "htm", "xhtml", "css",
            "scss", "sass", "less", "js", "jsx", "ts", "tsx", "php", "py", "java", "c", "cpp", "h",
            "hpp", "cs", "go", "rs", "rb", "swift", "kt", "kts",
        };
        return exts;
    }

    QString baseName(const QString& fileName) {
        QString normalized = fileName;
        normalized.replace(u'\\', u'/');
        return normalized.section(u'/', -1).trimmed().toLower();
    }
}

namespace FileTypes {
    std::optional<QString> knownExtension(const QString& fileName) {
        const QString name = baseName(fileName);
        const qsizetype firstDot = name.indexOf(u'.');
        if (name.isEmpty() || firstDot < 0) return std::nullopt;

        const QString multi = name.mid(firstDot + 1);
        if (typeIndex().contains(multi)) return multi;

        const QString single = name.section(u'.', -1);
        if (typeIndex().contains(single)) return single;

        return std::nullopt;
    }

    QString typeLabelFor(const QString& fileName) {
        const auto ext = knownExtension(fileName);
        if (!ext) return QStringLiteral("File");
        return typeIndex().value(*ext);
    }

    QString typeLabelFor(const QString& fileName, bool isDirectory) {
        if (isDirectory) return QStringLiteral("Folder");
        return typeLabelFor(fileName);
    }

    bool isTextFile(const QString& fileName) {
        const auto ext = knownExtension(fileName);
        if (!ext) return false;

        // Every extension sharing the row counts (".yml" is text because "yaml" is).
        const QString description = typeIndex().value(*ext);
        for (auto it = typeIndex().constBegin(); it != typeIndex().constEnd(); ++it) {
            if (it.value() == description && textExtensions().contains(it.key())) return true;
        }
        return false;
    }

    QString editorLanguage(const QString& fileName) {
        static const QHash<QString, QString> languages = {
            {QStringLiteral("JavaScript File"), QStringLiteral("javascript")},
            {QStringLiteral("TypeScript File"), QStringLiteral("typescript")},
            {QStringLiteral("JSON File"), QStringLiteral("json")},
            {QStringLiteral("HTML Document"), QStringLiteral("html")},
            {QStringLiteral("CSS Stylesheet"), QStringLiteral("css")},
            {QStringLiteral("Python File"), QStringLiteral("python")},
            {QStringLiteral("Java File"), QStringLiteral("java")},
            {QStringLiteral("C File"), QStringLiteral("c")},
            {QStringLiteral("C++ File"), QStringLiteral("cpp")},
            {QStringLiteral("C# File"), QStringLiteral("csharp")},
            {QStringLiteral("Go File"), QStringLiteral("go")},
            {QStringLiteral("Rust File"), QStringLiteral("rust")},
            {QStringLiteral("Ruby File"), QStringLiteral("ruby")},
            {QStringLiteral("Swift File"), QStringLiteral("swift")},
            {QStringLiteral("Kotlin File"), QStringLiteral("kotlin")},
            {QStringLiteral("Properties File"), QStringLiteral("properties")},
        };

        const auto ext = knownExtension(fileName);
        if (!ext) return {};
        return languages.value(typeIndex().value(*ext));
    }
}
