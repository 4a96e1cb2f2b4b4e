// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#ifndef REMOTEFS_FILETYPES_H
#define REMOTEFS_FILETYPES_H

#include <QString>
#include <optional>

namespace FileTypes {
    /**
     * Returns the extension of a file name that is known to the type table.
     *
     * The full multi-part extension ("tar.gz" for "world.tar.gz") is tried first,
     * then the last component ("gz"). Matching is case-insensitive and the result
     * is lowercase. Backslashes in the input are treated as path separators.
     *
     * @param fileName A bare file name or a path.
     * @return The matching extension, or std::nullopt if neither form is in the table.
     */
    [[nodiscard]] std::optional<QString> knownExtension(const QString& fileName);

    /**
     * Human-readable type of a file, e.g. "Java Archive" for "server.jar".
     * Falls back to "File" when the extension is not in the table.
     */
    [[nodiscard]] QString typeLabelFor(const QString& fileName);

    // "Folder" for directories, typeLabelFor(name) otherwise.
    [[nodiscard]] QString typeLabelFor(const QString& fileName, bool isDirectory);

    // True for files that can be opened in a plain text editor.
    [[nodiscard]] bool isTextFile(const QString& fileName);

    // Syntax id for an editor, e.g. "json" or "java". Empty when unknown.
    [[nodiscard]] QString editorLanguage(const QString& fileName);
}

#endif //REMOTEFS_FILETYPES_H
